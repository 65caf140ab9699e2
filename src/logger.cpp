#include "logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/fmt/fmt.h>
#include <iostream>
#include <filesystem>

namespace elector {

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;

namespace {

// Relative "logs/..." paths are resolved against the first of ., .. and ../..
// whose logs directory exists or can be created, so running from a build
// directory still writes next to the sources.
std::string resolve_log_path(const std::string& log_file) {
    if (log_file.find("logs/") != 0) {
        return log_file;
    }

    const std::vector<std::string> search_paths = {
        log_file,
        "../" + log_file,
        "../../" + log_file
    };

    for (const auto& path : search_paths) {
        std::filesystem::path log_dir = std::filesystem::path(path).parent_path();
        if (log_dir.empty() || std::filesystem::exists(log_dir)) {
            return path;
        }
    }

    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(log_file).parent_path(), ec);
    return log_file;
}

} // namespace

void Logger::init(const std::string& log_file, const std::string& log_level,
                 bool is_predictor, int predictor_port) {
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(spdlog::level::info);

        // Predictor stubs are short-lived helpers, keep their files small
        size_t max_size = is_predictor ? 5 * 1024 * 1024 : 10 * 1024 * 1024;
        size_t max_files = is_predictor ? 3 : 5;

        std::string actual_log_file = log_file;
        if (is_predictor && predictor_port > 0) {
            actual_log_file = fmt::format("logs/predictor_{}.log", predictor_port);
        }
        actual_log_file = resolve_log_path(actual_log_file);

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            actual_log_file, max_size, max_files);
        file_sink->set_level(string_to_level(log_level));

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        logger_ = std::make_shared<spdlog::logger>("elector", sinks.begin(), sinks.end());

        logger_->set_level(string_to_level(log_level));
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        logger_->flush_on(spdlog::level::info);

        spdlog::register_logger(logger_);

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::drop_all();
    }
}

void Logger::info(Component component, const std::string& message) {
    if (logger_) {
        logger_->info("[{}] {}", component_to_string(component), message);
    }
}

void Logger::warn(Component component, const std::string& message) {
    if (logger_) {
        logger_->warn("[{}] {}", component_to_string(component), message);
    }
}

void Logger::error(Component component, const std::string& message) {
    if (logger_) {
        logger_->error("[{}] {}", component_to_string(component), message);
    }
}

void Logger::debug(Component component, const std::string& message) {
    if (logger_) {
        logger_->debug("[{}] {}", component_to_string(component), message);
    }
}

std::string Logger::component_to_string(Component component) {
    switch (component) {
        case Component::Elector: return "Elector";
        case Component::Config: return "Config";
        case Component::Registry: return "Registry";
        case Component::Dispatch: return "Dispatch";
        case Component::Call: return "Call";
        case Component::Aggregate: return "Aggregate";
        case Component::Selection: return "Selection";
        case Component::Request: return "Request";
        case Component::Response: return "Response";
        case Component::Predictor: return "Predictor";
        default: return "Unknown";
    }
}

spdlog::level::level_enum Logger::string_to_level(const std::string& level) {
    if (level == "DEBUG") return spdlog::level::debug;
    if (level == "INFO") return spdlog::level::info;
    if (level == "WARN") return spdlog::level::warn;
    if (level == "ERROR") return spdlog::level::err;
    return spdlog::level::info;
}

} // namespace elector
