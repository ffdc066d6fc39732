#pragma once

#include "msghistory/core/config.hpp"
#include "msghistory/core/result.hpp"
#include "msghistory/core/types.hpp"
#include "msghistory/history/budget_policy.hpp"
#include "msghistory/history/message_ledger.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace msghistory::history {

enum class Strategy {
    None,           // Already within budget
    SlidingWindow,
    Compress
};

std::string_view strategy_to_string(Strategy strategy);

// What enforce_budget() did
struct BudgetOutcome {
    Strategy strategy = Strategy::None;
    size_t removed = 0;
    int tokens_freed = 0;
    std::optional<std::string> digest;
    bool within_budget = true;
};

// History manager - owns the ledger and applies the configured budget policy
class HistoryManager {
public:
    explicit HistoryManager(const HistoryConfig& config);
    HistoryManager(const HistoryConfig& config, MessageLedger ledger);

    // Appending
    Result<void, Error> add(Message message, MessageMetadata metadata,
                            std::optional<size_t> position = std::nullopt);
    Result<void, Error> add_system_message(std::string text, int tokens);
    Result<void, Error> add_state_message(std::string text, int tokens);
    Result<void, Error> add_state_message(Message message, int tokens);
    ToolCallId add_agent_turn(const Json& output);

    // Drop the last state observation before retrying a step
    bool remove_last_state();

    // Bring the ledger under history.max_tokens using the configured strategy
    BudgetOutcome enforce_budget();

    // Rough token estimate (~3.5 characters per token)
    static int estimate_tokens(const std::string& text);

    // Accessors
    std::vector<Message> messages() const { return ledger_.snapshot_messages(); }
    int total_tokens() const { return ledger_.total_tokens(); }
    bool over_budget() const { return ledger_.total_tokens() > config_.max_tokens; }
    const MessageLedger& ledger() const { return ledger_; }
    const HistoryConfig& config() const { return config_; }

    // Persistence
    Result<void, Error> save(const fs::path& path) const;
    static Result<HistoryManager, Error> load(const fs::path& path, const HistoryConfig& config);

private:
    HistoryConfig config_;
    MessageLedger ledger_;
    BudgetPolicy policy_;

    BudgetOutcome run_sliding_window();
    void reinsert_digest(const std::string& digest);
};

}  // namespace msghistory::history
