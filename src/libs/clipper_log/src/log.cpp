#include <clipper_log/log.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <mutex>

namespace clipper_log {

namespace {

const char* const logger_name = "clipper";
const char* const log_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

std::mutex& logger_mutex() {
    static std::mutex m;
    return m;
}

std::shared_ptr<spdlog::logger>& current_logger() {
    static std::shared_ptr<spdlog::logger> logger;
    return logger;
}

std::shared_ptr<spdlog::logger> make_logger(const LogOptions& options) {
    spdlog::drop(logger_name);
    std::shared_ptr<spdlog::logger> logger;
    if (!options.file.empty()) {
        try {
            const std::filesystem::path log_file(options.file);
            if (log_file.has_parent_path())
                std::filesystem::create_directories(log_file.parent_path());
            logger = spdlog::basic_logger_mt(logger_name, log_file.string(), true);
        } catch (const spdlog::spdlog_ex& ex) {
            spdlog::warn("clipper: cannot open log file {}: {}", options.file, ex.what());
        } catch (const std::filesystem::filesystem_error& ex) {
            spdlog::warn("clipper: cannot create log directory for {}: {}", options.file, ex.what());
        }
    }
    if (!logger)
        logger = spdlog::stderr_color_mt(logger_name);

    logger->set_pattern(log_pattern);
    logger->set_level(spdlog::level::from_str(options.level));
    logger->flush_on(spdlog::level::warn);
    return logger;
}

} // namespace

void configure(const LogOptions& options) {
    std::lock_guard<std::mutex> lock(logger_mutex());
    current_logger() = make_logger(options);
    current_logger()->debug("logger configured level={} file={}",
        options.level, options.file.empty() ? "<stderr>" : options.file);
}

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(logger_mutex());
    auto& logger = current_logger();
    if (!logger)
        logger = make_logger(LogOptions{});
    return logger;
}

} // namespace clipper_log
