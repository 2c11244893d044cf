#include "foresight/logging.hpp"

#include <filesystem>
#include <mutex>
#include <vector>

#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fs = std::filesystem;

namespace foresight::log {

namespace {
std::mutex g_logger_mutex;
}

std::shared_ptr<spdlog::logger> get()
{
    auto logger = spdlog::get(LOGGER_NAME);
    if (logger) {
        return logger;
    }
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    logger = spdlog::get(LOGGER_NAME);
    if (!logger) {
        logger = spdlog::stderr_color_mt(LOGGER_NAME);
    }
    return logger;
}

void init(const std::string& log_file, const std::string& level)
{
    std::lock_guard<std::mutex> lock(g_logger_mutex);

    // 8K queue, 1 background thread
    spdlog::init_thread_pool(8192, 1);

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::info);

    std::vector<spdlog::sink_ptr> sinks{console_sink};
    if (!log_file.empty()) {
        fs::path parent = fs::path(log_file).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }
        // 10MB max, 5 rotated files
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file, 10 * 1024 * 1024, 5);
        file_sink->set_level(spdlog::level::debug);
        sinks.push_back(file_sink);
    }

    spdlog::drop(LOGGER_NAME);
    auto logger = std::make_shared<spdlog::async_logger>(
        LOGGER_NAME, sinks.begin(), sinks.end(),
        spdlog::thread_pool(),
        spdlog::async_overflow_policy::overrun_oldest);
    logger->set_level(spdlog::level::debug);
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    set_level(level);
}

void set_level(const std::string& level)
{
    auto logger = spdlog::get(LOGGER_NAME);
    if (!logger) {
        return;
    }
    if (level == "debug") logger->set_level(spdlog::level::debug);
    else if (level == "info") logger->set_level(spdlog::level::info);
    else if (level == "warn") logger->set_level(spdlog::level::warn);
    else if (level == "error") logger->set_level(spdlog::level::err);
}

}  // namespace foresight::log
