#include "msghistory/history/history_manager.hpp"

#include <spdlog/spdlog.h>

namespace msghistory::history {

namespace {

LedgerCosts costs_from(const HistoryConfig& config) {
    return LedgerCosts{
        .agent_output_tokens = config.agent_output_tokens,
        .tool_ack_tokens = config.tool_ack_tokens
    };
}

}  // namespace

std::string_view strategy_to_string(Strategy strategy) {
    switch (strategy) {
        case Strategy::None: return "none";
        case Strategy::SlidingWindow: return "sliding_window";
        case Strategy::Compress: return "compress";
    }
    return "unknown";
}

HistoryManager::HistoryManager(const HistoryConfig& config)
    : config_(config)
    , ledger_(costs_from(config))
    , policy_(BudgetConfig::from_config(config))
{
}

HistoryManager::HistoryManager(const HistoryConfig& config, MessageLedger ledger)
    : config_(config)
    , ledger_(std::move(ledger))
    , policy_(BudgetConfig::from_config(config))
{
}

Result<void, Error> HistoryManager::add(Message message, MessageMetadata metadata,
                                        std::optional<size_t> position) {
    return ledger_.add(std::move(message), std::move(metadata), position);
}

Result<void, Error> HistoryManager::add_system_message(std::string text, int tokens) {
    return ledger_.add(Message::system(std::move(text)), MessageMetadata{tokens, "system"});
}

Result<void, Error> HistoryManager::add_state_message(std::string text, int tokens) {
    return add_state_message(Message::human(std::move(text)), tokens);
}

Result<void, Error> HistoryManager::add_state_message(Message message, int tokens) {
    if (message.role != Role::Human) {
        return Result<void, Error>::err(
            ErrorCode::InvalidArgument,
            "State messages must have the human role",
            std::string(role_to_string(message.role))
        );
    }
    return ledger_.add(std::move(message), MessageMetadata{tokens, "state"});
}

ToolCallId HistoryManager::add_agent_turn(const Json& output) {
    return ledger_.add_agent_turn(output);
}

bool HistoryManager::remove_last_state() {
    return ledger_.remove_trailing_state_if_present();
}

int HistoryManager::estimate_tokens(const std::string& text) {
    return static_cast<int>(text.length() / 3.5);
}

BudgetOutcome HistoryManager::enforce_budget() {
    if (!over_budget()) {
        return BudgetOutcome{};
    }

    if (config_.strategy != "compress") {
        return run_sliding_window();
    }

    int before = ledger_.total_tokens();
    size_t count_before = ledger_.size();

    auto digest = policy_.compress_history(ledger_, config_.max_tokens);
    if (!digest) {
        // Everything left is system or recent; fall back to the window
        spdlog::debug("Nothing to compress, falling back to sliding window");
        return run_sliding_window();
    }

    BudgetOutcome outcome;
    outcome.strategy = Strategy::Compress;
    outcome.removed = count_before - ledger_.size();
    outcome.tokens_freed = before - ledger_.total_tokens();

    if (over_budget()) {
        auto window = policy_.apply_sliding_window(ledger_, config_.max_tokens);
        outcome.removed += window.removed;
        outcome.tokens_freed += window.tokens_freed;
    }

    if (config_.reinsert_summary) {
        reinsert_digest(*digest);
    }
    outcome.digest = std::move(digest);

    outcome.within_budget = !over_budget();
    spdlog::info("Compressed history: removed {} entries, {} tokens in use",
                 outcome.removed, ledger_.total_tokens());

    return outcome;
}

BudgetOutcome HistoryManager::run_sliding_window() {
    auto result = policy_.apply_sliding_window(ledger_, config_.max_tokens);

    BudgetOutcome outcome;
    outcome.strategy = Strategy::SlidingWindow;
    outcome.removed = result.removed;
    outcome.tokens_freed = result.tokens_freed;
    outcome.within_budget = result.within_budget();
    return outcome;
}

void HistoryManager::reinsert_digest(const std::string& digest) {
    // Directly after the leading system entries
    size_t position = 0;
    const auto& entries = ledger_.entries();
    while (position < entries.size() && entries[position].message.is_system()) {
        ++position;
    }

    auto added = ledger_.add(Message::human(digest),
                             MessageMetadata{estimate_tokens(digest), "history_summary"},
                             position);
    if (added.is_err()) {
        spdlog::error("Failed to reinsert history summary: {}", added.error().full_message());
    }
}

Result<void, Error> HistoryManager::save(const fs::path& path) const {
    auto result = ledger_.save(path);
    if (result.is_err()) {
        spdlog::error("Failed to save history: {}", result.error().full_message());
    }
    return result;
}

Result<HistoryManager, Error> HistoryManager::load(const fs::path& path, const HistoryConfig& config) {
    auto ledger = MessageLedger::load(path, costs_from(config));
    if (ledger.is_err()) {
        return Result<HistoryManager, Error>::err(std::move(ledger).error());
    }

    spdlog::info("Loaded {} history entries ({} tokens) from {}",
                 ledger.value().size(), ledger.value().total_tokens(), path.string());
    return Result<HistoryManager, Error>::ok(HistoryManager(config, std::move(ledger).value()));
}

}  // namespace msghistory::history
