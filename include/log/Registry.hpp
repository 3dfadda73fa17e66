#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace unistore::config {
struct LoggingConfig;
}

namespace unistore::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const config::LoggingConfig& cnf);

    // Generic access by name. Before init() this hands out loggers that discard everything.
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> unistore() { return get("unistore"); }
    static std::shared_ptr<spdlog::logger> storage()  { return get("storage"); }
    static std::shared_ptr<spdlog::logger> cloud()    { return get("cloud"); }
    static std::shared_ptr<spdlog::logger> secrets()  { return get("secrets"); }
    static std::shared_ptr<spdlog::logger> config()   { return get("config"); }

    [[nodiscard]] static bool isInitialized();

    // Drops every registered logger; the next get() falls back to null loggers.
    static void shutdown();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path main_log_path_;

    // stderr, so stdout stays clean for data piped out of the CLI
    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;

    static std::shared_ptr<spdlog::logger> nullLogger(const std::string& name);
};

}
