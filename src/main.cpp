#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "tagcache/core/cache/CacheConfig.hpp"
#include "tagcache/core/cache/CacheErrors.hpp"
#include "tagcache/core/cache/manager/CacheRegistry.hpp"

using namespace tagcache::core;

namespace {

constexpr const char* DEFAULT_CACHE = "default";

struct CliOptions {
    std::string configPath;
    std::string command;
    std::vector<std::string> args;
    bool dryRun = false;
    bool verbose = false;
};

void printUsage() {
    std::cerr << "Usage: tagcache-cli <config.json> <command> [args] [--dry-run] [--verbose]\n"
              << "Commands:\n"
              << "  clear                  Clear the configured store\n"
              << "  flush <tag> [tag...]   Invalidate every entry under the tags\n"
              << "  get <key>              Print a value\n"
              << "  set <key> <value> [ttl]\n"
              << "  stats                  Print configuration and counters as JSON\n";
}

// Initialize logging system
void initializeLogging(bool verbose) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    auto logger = std::make_shared<spdlog::logger>("tagcache_cli", console_sink);
    spdlog::set_default_logger(logger);
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

bool parseArguments(int argc, char** argv, CliOptions& options) {
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--dry-run") {
            options.dryRun = true;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.size() < 2) {
        return false;
    }
    options.configPath = positional[0];
    options.command = positional[1];
    options.args.assign(positional.begin() + 2, positional.end());
    return true;
}

int runCommand(const CliOptions& options, cache::CacheRegistry& registry) {
    auto manager = registry.store(DEFAULT_CACHE);
    const auto& config = manager->getConfiguration();

    if (options.command == "clear") {
        if (options.dryRun) {
            std::cout << "[DRY RUN] Would clear store " << manager->store()->name() << "\n";
            return 0;
        }
        if (!manager->clear()) {
            std::cerr << "Cache clear failed for store " << manager->store()->name() << "\n";
            return 1;
        }
        std::cout << "Cache cleared (" << manager->store()->name() << ")\n";
        return 0;
    }
    if (options.command == "flush") {
        if (options.args.empty()) {
            printUsage();
            return 2;
        }
        auto tagged = registry.tagged(DEFAULT_CACHE);
        int failures = 0;
        for (const auto& tag : options.args) {
            if (options.dryRun) {
                std::cout << "[DRY RUN] Would flush tag '" << tag << "'\n";
                continue;
            }
            if (tagged->flush(tag)) {
                std::cout << "Flushed tag '" << tag << "'\n";
            } else {
                std::cerr << "Failed to flush tag '" << tag << "'\n";
                ++failures;
            }
        }
        return failures == 0 ? 0 : 1;
    }
    if (options.command == "get") {
        if (options.args.size() != 1) {
            printUsage();
            return 2;
        }
        auto value = manager->tryGet(options.args[0]);
        if (!value) {
            std::cerr << "Not found: " << options.args[0] << "\n";
            return 1;
        }
        std::cout << std::string(value->begin(), value->end()) << "\n";
        return 0;
    }
    if (options.command == "set") {
        if (options.args.size() < 2 || options.args.size() > 3) {
            printUsage();
            return 2;
        }
        std::optional<std::chrono::seconds> ttl;
        if (options.args.size() == 3) {
            ttl = std::chrono::seconds(std::stoll(options.args[2]));
        }
        const auto& text = options.args[1];
        if (options.dryRun) {
            std::cout << "[DRY RUN] Would set '" << options.args[0] << "'\n";
            return 0;
        }
        return manager->set(options.args[0], cache::Bytes(text.begin(), text.end()), ttl) ? 0 : 1;
    }
    if (options.command == "stats") {
        nlohmann::json report = {
            {"config", config.toJson()},
            {"caches", registry.stats()}
        };
        std::cout << report.dump(2) << "\n";
        return 0;
    }
    std::cerr << "Unknown command: " << options.command << "\n";
    printUsage();
    return 2;
}

} // namespace

int main(int argc, char** argv) {
    CliOptions options;
    if (!parseArguments(argc, argv, options)) {
        printUsage();
        return 2;
    }
    try {
        initializeLogging(options.verbose);
        auto config = cache::CacheConfig::loadFromFile(options.configPath);
        cache::CacheRegistry registry;
        registry.create(DEFAULT_CACHE, config);
        int rc = runCommand(options, registry);
        spdlog::shutdown();
        return rc;
    } catch (const cache::CacheConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 3;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
