#include "msghistory/core/config.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace msghistory::core {

Result<void, Error> setup_logging(const ObservabilityConfig& config) {
    auto validation = config.validate();
    if (validation.is_err()) {
        return validation;
    }

    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

        if (!config.log_path.empty()) {
            fs::path log_file = config.log_path;
            if (log_file.has_parent_path()) {
                fs::create_directories(log_file.parent_path());
            }
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string()));
        }

        auto logger = std::make_shared<spdlog::logger>("msghistory", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::from_str(config.log_level));
        spdlog::set_default_logger(logger);

        return Result<void, Error>::ok();

    } catch (const spdlog::spdlog_ex& e) {
        return Result<void, Error>::err(
            ErrorCode::FileWriteFailed,
            std::string("Failed to initialize logging: ") + e.what(),
            config.log_path.string()
        );
    } catch (const std::exception& e) {
        return Result<void, Error>::err(
            ErrorCode::FileWriteFailed,
            e.what(),
            config.log_path.string()
        );
    }
}

}  // namespace msghistory::core
