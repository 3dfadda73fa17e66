#include <gtest/gtest.h>
#include "util/httpHelpers.hpp"

using namespace unistore::util;
using unistore::storage::ErrorKind;

TEST(HttpHelpersTest, StatusToErrorKind) {
    EXPECT_EQ(errorKindFromHttpStatus(400), ErrorKind::InvalidArgument);
    EXPECT_EQ(errorKindFromHttpStatus(403), ErrorKind::PermissionDenied);
    EXPECT_EQ(errorKindFromHttpStatus(404), ErrorKind::NotFound);
    EXPECT_EQ(errorKindFromHttpStatus(409), ErrorKind::AlreadyExists);
    EXPECT_EQ(errorKindFromHttpStatus(412), ErrorKind::AlreadyExists);
    EXPECT_EQ(errorKindFromHttpStatus(429), ErrorKind::BackendUnavailable);
    EXPECT_EQ(errorKindFromHttpStatus(503), ErrorKind::BackendUnavailable);
}

TEST(HttpHelpersTest, UrlEncoding) {
    EXPECT_EQ(urlEncode("a-b_c.d~e"), "a-b_c.d~e");
    EXPECT_EQ(urlEncode("a b/c?"), "a%20b%2Fc%3F");
    EXPECT_EQ(escapeKeyPreserveSlashes("dir one/file #1.txt"), "dir%20one/file%20%231.txt");
    EXPECT_EQ(formEncode({{"grant_type", "refresh_token"}, {"scope", "a b"}}), "grant_type=refresh_token&scope=a%20b");
}

TEST(HttpHelpersTest, FindHeaderIsCaseInsensitive) {
    const std::string raw = "HTTP/1.1 404 Not Found\r\nx-ms-error-code: BlobNotFound\r\nContent-Length: 0\r\n\r\n";
    EXPECT_EQ(findHeader(raw, "X-MS-Error-Code"), "BlobNotFound");
    EXPECT_EQ(findHeader(raw, "ETag"), "");
}
