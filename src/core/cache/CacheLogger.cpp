#include "tagcache/core/cache/CacheLogger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <iostream>

namespace tagcache {
namespace core {
namespace cache {

std::shared_ptr<spdlog::logger> initializeLogger(const CacheConfig& config) {
    auto logger = spdlog::get(CACHE_LOGGER_NAME);
    if (logger) {
        return logger;
    }
    try {
        if (!config.logPath.empty()) {
            // Создаем директорию для логов, если её нет
            auto parent = std::filesystem::path(config.logPath).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }
            auto rotating_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.logPath, config.maxLogSize, config.maxLogFiles);
            logger = std::make_shared<spdlog::logger>(CACHE_LOGGER_NAME, rotating_sink);
        } else {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
            logger = std::make_shared<spdlog::logger>(CACHE_LOGGER_NAME, console_sink);
        }
        logger->set_level(spdlog::level::from_str(config.logLevel));
        spdlog::register_logger(logger);
        logger->info("Logger '{}' initialized (level={})", CACHE_LOGGER_NAME, config.logLevel);
    } catch (const spdlog::spdlog_ex& e) {
        // Логгер мог быть зарегистрирован параллельно
        std::cerr << "Ошибка инициализации логгера tagcache: " << e.what() << std::endl;
        logger = spdlog::get(CACHE_LOGGER_NAME);
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Ошибка создания директории логов: " << e.what() << std::endl;
        logger = nullptr;
    }
    return logger;
}

} // namespace cache
} // namespace core
} // namespace tagcache
