#include "msghistory/core/config.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <fstream>
#include <regex>

namespace msghistory::core {

std::string expand_path(const std::string& path) {
    std::string result = path;

    // Expand ~
    if (!result.empty() && result[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            result = std::string(home) + result.substr(1);
        }
    }

    // Expand ${VAR} patterns
    std::regex env_regex(R"(\$\{([^}]+)\})");
    std::smatch match;
    while (std::regex_search(result, match, env_regex)) {
        std::string var_name = match[1].str();
        const char* var_value = std::getenv(var_name.c_str());
        std::string replacement = var_value ? var_value : "";
        result = match.prefix().str() + replacement + match.suffix().str();
    }

    return result;
}

Result<void, Error> HistoryConfig::validate() const {
    if (max_tokens <= 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "history.max_tokens must be positive"
        );
    }

    if (strategy != "sliding_window" && strategy != "compress") {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "history.strategy must be sliding_window or compress",
            strategy
        );
    }

    if (preserve_recent < 0 || compression_window < 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "history.preserve_recent and history.compression_window must not be negative"
        );
    }

    if (summary_limit < 0 || state_preview_chars < 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "history.summary_limit and history.state_preview_chars must not be negative"
        );
    }

    if (agent_output_tokens < 0 || tool_ack_tokens < 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "history token estimates must not be negative"
        );
    }

    return Result<void, Error>::ok();
}

Result<void, Error> ObservabilityConfig::validate() const {
    if (spdlog::level::from_str(log_level) == spdlog::level::off && log_level != "off") {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "observability.log_level is not a known level",
            log_level
        );
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Config::validate() const {
    MSGHISTORY_TRY_VOID(history.validate());
    MSGHISTORY_TRY_VOID(observability.validate());
    return Result<void, Error>::ok();
}

Result<Config, Error> Config::load(const fs::path& path) {
    fs::path expanded = fs::path(expand_path(path.string()));

    if (!fs::exists(expanded)) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigNotFound,
            "Configuration file not found",
            expanded.string()
        );
    }

    try {
        YAML::Node root = YAML::LoadFile(expanded.string());
        Config config;

        // Parse history config
        if (auto hist_node = root["history"]) {
            config.history.max_tokens = hist_node["max_tokens"].as<int>(config.history.max_tokens);
            config.history.strategy = hist_node["strategy"].as<std::string>(config.history.strategy);
            config.history.preserve_recent = hist_node["preserve_recent"].as<int>(config.history.preserve_recent);
            config.history.compression_window = hist_node["compression_window"].as<int>(config.history.compression_window);
            config.history.summary_limit = hist_node["summary_limit"].as<int>(config.history.summary_limit);
            config.history.state_preview_chars = hist_node["state_preview_chars"].as<int>(config.history.state_preview_chars);
            config.history.agent_output_tokens = hist_node["agent_output_tokens"].as<int>(config.history.agent_output_tokens);
            config.history.tool_ack_tokens = hist_node["tool_ack_tokens"].as<int>(config.history.tool_ack_tokens);
            config.history.reinsert_summary = hist_node["reinsert_summary"].as<bool>(config.history.reinsert_summary);
        }

        // Parse observability config
        if (auto obs_node = root["observability"]) {
            config.observability.log_level = obs_node["log_level"].as<std::string>(config.observability.log_level);
            std::string log_path = obs_node["log_path"].as<std::string>("");
            if (!log_path.empty()) {
                config.observability.log_path = expand_path(log_path);
            }
        }

        auto validation = config.validate();
        if (validation.is_err()) {
            return Result<Config, Error>::err(std::move(validation.error()));
        }

        return Result<Config, Error>::ok(std::move(config));

    } catch (const YAML::Exception& e) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigParseFailed,
            std::string("YAML parse error: ") + e.what(),
            expanded.string()
        );
    } catch (const std::exception& e) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigParseFailed,
            e.what(),
            expanded.string()
        );
    }
}

Config Config::load_or_default(const fs::path& path) {
    auto result = load(path);
    if (result.is_ok()) {
        return std::move(result).value();
    }

    if (result.error().code != ErrorCode::ConfigNotFound) {
        spdlog::warn("Using default configuration: {}", result.error().full_message());
    }
    return Config{};
}

Result<void, Error> Config::save(const fs::path& path) const {
    try {
        fs::path expanded = fs::path(expand_path(path.string()));

        // Create parent directories if needed
        if (expanded.has_parent_path()) {
            fs::create_directories(expanded.parent_path());
        }

        YAML::Emitter out;
        out << YAML::BeginMap;

        out << YAML::Key << "history" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "max_tokens" << YAML::Value << history.max_tokens;
        out << YAML::Key << "strategy" << YAML::Value << history.strategy;
        out << YAML::Key << "preserve_recent" << YAML::Value << history.preserve_recent;
        out << YAML::Key << "compression_window" << YAML::Value << history.compression_window;
        out << YAML::Key << "summary_limit" << YAML::Value << history.summary_limit;
        out << YAML::Key << "state_preview_chars" << YAML::Value << history.state_preview_chars;
        out << YAML::Key << "agent_output_tokens" << YAML::Value << history.agent_output_tokens;
        out << YAML::Key << "tool_ack_tokens" << YAML::Value << history.tool_ack_tokens;
        out << YAML::Key << "reinsert_summary" << YAML::Value << history.reinsert_summary;
        out << YAML::EndMap;

        out << YAML::Key << "observability" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "log_level" << YAML::Value << observability.log_level;
        out << YAML::Key << "log_path" << YAML::Value << observability.log_path.string();
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream file(expanded);
        if (!file) {
            return Result<void, Error>::err(
                ErrorCode::FileWriteFailed,
                "Failed to open config file for writing",
                expanded.string()
            );
        }

        file << out.c_str();
        return Result<void, Error>::ok();

    } catch (const std::exception& e) {
        return Result<void, Error>::err(
            ErrorCode::FileWriteFailed,
            e.what(),
            path.string()
        );
    }
}

}  // namespace msghistory::core
