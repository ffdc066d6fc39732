#pragma once

#include "msghistory/core/result.hpp"
#include "msghistory/core/types.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace msghistory::history {

using namespace msghistory::core;
namespace fs = std::filesystem;

// Accounting data attached to every stored message
struct MessageMetadata {
    int tokens = 0;
    std::optional<std::string> message_type;

    Json to_json() const;
    static MessageMetadata from_json(const Json& j);
};

// A message with its metadata; the unit of storage and removal
struct ManagedMessage {
    Message message;
    MessageMetadata metadata;

    Json to_json() const;
    static Result<ManagedMessage, Error> from_json(const Json& j);
};

// Estimated costs of the two entries synthesized for each agent turn
struct LedgerCosts {
    int agent_output_tokens = 100;
    int tool_ack_tokens = 10;
};

// Ordered, token-accounted message store.
//
// current_tokens() always equals the sum of the stored entries' token costs.
// The ledger never evicts on its own; see BudgetPolicy.
class MessageLedger {
public:
    MessageLedger() = default;
    explicit MessageLedger(LedgerCosts costs);

    // Insert at position (0..size) or append. Negative token costs and
    // positions past the end are rejected without touching the ledger.
    Result<void, Error> add(Message message, MessageMetadata metadata,
                            std::optional<size_t> position = std::nullopt);

    // Append an ai entry wrapping the decision as a single tool call, then the
    // matching empty tool acknowledgment. Returns the tool call id used.
    ToolCallId add_agent_turn(const Json& output);

    // Messages in conversation order, metadata stripped
    std::vector<Message> snapshot_messages() const;

    int total_tokens() const { return current_tokens_; }

    // Remove the first non-system entry. Returns false if none exists.
    bool remove_oldest_non_system();

    // Drop a just-added state observation (needs more than two entries)
    bool remove_trailing_state_if_present();

    // Remove the entry at index
    Result<ManagedMessage, Error> remove_at(size_t index);

    void clear();

    // Accessors
    const std::vector<ManagedMessage>& entries() const { return entries_; }
    const ManagedMessage& at(size_t index) const { return entries_.at(index); }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    int next_tool_id() const { return next_tool_id_; }
    const LedgerCosts& costs() const { return costs_; }

    // Serialization: {messages: [...], current_tokens, tool_id}
    Json to_json() const;
    static Result<MessageLedger, Error> from_json(const Json& j, LedgerCosts costs = {});

    Result<void, Error> save(const fs::path& path) const;
    static Result<MessageLedger, Error> load(const fs::path& path, LedgerCosts costs = {});

private:
    std::vector<ManagedMessage> entries_;
    int current_tokens_ = 0;
    int next_tool_id_ = 1;
    LedgerCosts costs_;
};

}  // namespace msghistory::history
