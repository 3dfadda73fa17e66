#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "secrets/Provider.hpp"
#include "storage/Error.hpp"
#include "storage/ProviderFactory.hpp"

#include <fmt/core.h>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace unistore;
using namespace unistore::config;
using namespace unistore::storage;
using namespace unistore::log;

namespace {

constexpr int EXIT_STORAGE_ERROR = 1;
constexpr int EXIT_USAGE = 2;

struct CliArgs {
    std::string config_path;
    std::string backend;
    std::string command;
    std::vector<std::string> positional;
    bool overwrite = false;
    bool help = false;
};

void printUsage(std::FILE* out) {
    fmt::print(out,
        "usage: unistore-cli [--config FILE] [--backend local|blob|drive] <command> <path> [args]\n"
        "\n"
        "commands:\n"
        "  add <path> <local-file> [--overwrite]   upload a local file, prints the locator\n"
        "  rm <path>                               delete a file or container\n"
        "  exists <path>                           prints true or false\n"
        "  ls <path>                               list the children of a container\n"
        "  cat <path>                              write a file's content to stdout\n");
}

// nullopt on a usage error, message already printed
std::optional<CliArgs> parseArgs(const int argc, char** argv) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }

        if (arg == "--config" || arg == "--backend") {
            if (i + 1 >= argc) {
                fmt::print(stderr, "{} requires a value\n", arg);
                return std::nullopt;
            }
            (arg == "--config" ? args.config_path : args.backend) = argv[++i];
            continue;
        }

        if (arg.rfind("--config=", 0) == 0) { args.config_path = arg.substr(9); continue; }
        if (arg.rfind("--backend=", 0) == 0) { args.backend = arg.substr(10); continue; }
        if (arg == "--overwrite" || arg == "-f") { args.overwrite = true; continue; }

        if (arg.size() > 1 && arg[0] == '-') {
            fmt::print(stderr, "unknown option: {}\n", arg);
            return std::nullopt;
        }

        if (args.command.empty()) args.command = arg;
        else args.positional.push_back(arg);
    }

    if (args.command.empty()) {
        fmt::print(stderr, "missing command\n");
        return std::nullopt;
    }

    const auto expected = args.command == "add" ? 2u : 1u;
    if (args.command != "add" && args.command != "rm" && args.command != "exists" &&
        args.command != "ls" && args.command != "cat") {
        fmt::print(stderr, "unknown command: {}\n", args.command);
        return std::nullopt;
    }
    if (args.positional.size() != expected) {
        fmt::print(stderr, "{} expects {} argument(s), got {}\n", args.command, expected, args.positional.size());
        return std::nullopt;
    }
    if (args.overwrite && args.command != "add") {
        fmt::print(stderr, "--overwrite only applies to add\n");
        return std::nullopt;
    }

    return args;
}

int run(const CliArgs& args, const Provider& provider) {
    const auto& path = args.positional.front();

    if (args.command == "add") {
        const auto& localFile = args.positional[1];
        std::ifstream in(localFile, std::ios::binary);
        if (!in) throwError(ErrorKind::NotFound, "Cannot open local file: " + localFile, localFile);
        fmt::print("{}\n", provider.add(path, in, args.overwrite));
    } else if (args.command == "rm") {
        provider.remove(path);
    } else if (args.command == "exists") {
        fmt::print("{}\n", provider.exists(path));
    } else if (args.command == "ls") {
        for (const auto& item : provider.list(path)) fmt::print("{}\n", model::to_string(*item));
    } else if (args.command == "cat") {
        provider.read(path, std::cout);
        std::cout.flush();
    }

    return 0;
}

}

int main(int argc, char** argv) {
    const auto args = parseArgs(argc, argv);
    if (!args) {
        printUsage(stderr);
        return EXIT_USAGE;
    }
    if (args->help) {
        printUsage(stdout);
        return 0;
    }

    try {
        ConfigRegistry::init(args->config_path.empty() ? Config{} : loadConfig(args->config_path));
        const auto& cfg = ConfigRegistry::get();
        Registry::init(cfg.logging);

        const auto backend = backend_type_from_string(args->backend.empty() ? cfg.storage.default_backend : args->backend);

        std::shared_ptr<secrets::Provider> secretProvider;
        if (backend != BackendType::LocalDisk) secretProvider = secrets::fromConfig(cfg.secrets);

        const ProviderFactory factory(cfg.storage, secretProvider);
        const auto provider = factory.create(backend);

        Registry::unistore()->debug("[cli] {} {} on {}", args->command, args->positional.front(), to_string(backend));
        const int rc = run(*args, *provider);
        Registry::shutdown();
        return rc;
    } catch (const StorageError& e) {
        fmt::print(stderr, "error: {} [{}]\n", e.what(), to_string(e.kind()));
    } catch (const std::exception& e) {
        fmt::print(stderr, "error: {}\n", e.what());
    }

    Registry::shutdown();
    return EXIT_STORAGE_ERROR;
}
