#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace unistore::cloud::gdrive {

static constexpr const auto* DRIVE_SCOPE = "https://www.googleapis.com/auth/drive.file";
static constexpr const auto* DEFAULT_TOKEN_URI = "https://oauth2.googleapis.com/token";

struct AccessToken {
    std::string value;
    std::chrono::system_clock::time_point expires_at;
};

/**
 * OAuth2 bearer tokens for the Drive API.
 *
 * Built from a credential bundle (JSON): "service_account" keys sign an RS256
 * JWT assertion, "authorized_user" bundles use their refresh token. The token
 * is cached and renewed once it is within REFRESH_MARGIN of expiry.
 */
class TokenSource {
public:
    static constexpr std::chrono::seconds REFRESH_MARGIN{60};

    enum class Kind { ServiceAccount, AuthorizedUser };

    // Throws StorageError(InvalidArgument) for malformed or unsupported bundles.
    static std::unique_ptr<TokenSource> fromJson(const std::string& credentialJson, std::string scope = DRIVE_SCOPE);

    virtual ~TokenSource() = default;

    // Cached token, refreshed on demand. Thread-safe.
    std::string accessToken() const;

    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] const std::string& tokenUri() const { return tokenUri_; }

protected:
    TokenSource(Kind kind, std::string tokenUri, std::string scope);

    // Exchanges the credential for a fresh token at the token endpoint.
    virtual AccessToken fetch() const;

    // application/x-www-form-urlencoded body of the token request.
    [[nodiscard]] virtual std::string tokenRequestBody() const = 0;

    Kind kind_;
    std::string tokenUri_;
    std::string scope_;

private:
    mutable std::mutex mutex_;
    mutable AccessToken cached_;
};

class ServiceAccountTokenSource final : public TokenSource {
public:
    ServiceAccountTokenSource(std::string clientEmail, std::string privateKey, std::string privateKeyId,
                              std::string tokenUri, std::string scope);

    // Signed JWT bearer assertion valid for one hour from now.
    [[nodiscard]] std::string buildAssertion(std::chrono::system_clock::time_point now) const;

protected:
    [[nodiscard]] std::string tokenRequestBody() const override;

private:
    std::string clientEmail_;
    std::string privateKey_;
    std::string privateKeyId_;
};

class AuthorizedUserTokenSource final : public TokenSource {
public:
    AuthorizedUserTokenSource(std::string clientId, std::string clientSecret, std::string refreshToken,
                              std::string tokenUri, std::string scope);

protected:
    [[nodiscard]] std::string tokenRequestBody() const override;

private:
    std::string clientId_;
    std::string clientSecret_;
    std::string refreshToken_;
};

}
