#pragma once

#include "errors.hpp"
#include "result.hpp"

#include <filesystem>
#include <string>

namespace msghistory::core {

namespace fs = std::filesystem;

// Token budget and eviction configuration
struct HistoryConfig {
    int max_tokens = 128000;
    std::string strategy = "sliding_window";  // sliding_window | compress

    // Budget policy windows
    int preserve_recent = 3;
    int compression_window = 5;
    int summary_limit = 5;
    int state_preview_chars = 100;

    // Fixed estimates for synthesized agent turns
    int agent_output_tokens = 100;
    int tool_ack_tokens = 10;

    // Put the compression digest back into the ledger
    bool reinsert_summary = true;

    Result<void, Error> validate() const;
};

// Logging configuration
struct ObservabilityConfig {
    std::string log_level = "info";  // trace, debug, info, warn, error, critical, off
    fs::path log_path;               // empty: console only

    Result<void, Error> validate() const;
};

// Main configuration
struct Config {
    HistoryConfig history;
    ObservabilityConfig observability;

    // Load configuration from file
    static Result<Config, Error> load(const fs::path& path);

    // Load with defaults, falling back if file doesn't exist
    static Config load_or_default(const fs::path& path);

    // Save configuration to file
    Result<void, Error> save(const fs::path& path) const;

    // Validate configuration
    Result<void, Error> validate() const;
};

// Helper to expand ~ and environment variables in paths
std::string expand_path(const std::string& path);

// Configure the default spdlog logger from the observability settings
Result<void, Error> setup_logging(const ObservabilityConfig& config);

}  // namespace msghistory::core
