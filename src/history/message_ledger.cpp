#include "msghistory/history/message_ledger.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <fstream>
#include <limits>

namespace msghistory::history {

namespace {

constexpr int64_t kMaxTokens = std::numeric_limits<int>::max();

// Integer in [min, INT_MAX], checked before narrowing to int
bool int_in_range(const Json& value, int64_t min) {
    if (!value.is_number_integer()) {
        return false;
    }
    if (value.is_number_unsigned()) {
        auto v = value.get<uint64_t>();
        return v >= static_cast<uint64_t>(min) && v <= static_cast<uint64_t>(kMaxTokens);
    }
    auto v = value.get<int64_t>();
    return v >= min && v <= kMaxTokens;
}

}  // namespace

// MessageMetadata
Json MessageMetadata::to_json() const {
    Json j{
        {"tokens", tokens},
        {"message_type", nullptr}
    };
    if (message_type) {
        j["message_type"] = *message_type;
    }
    return j;
}

MessageMetadata MessageMetadata::from_json(const Json& j) {
    MessageMetadata md;
    md.tokens = j.value("tokens", 0);
    if (j.contains("message_type") && j["message_type"].is_string()) {
        md.message_type = j["message_type"].get<std::string>();
    }
    return md;
}

// ManagedMessage
Json ManagedMessage::to_json() const {
    return Json{
        {"message", message.to_json()},
        {"metadata", metadata.to_json()}
    };
}

Result<ManagedMessage, Error> ManagedMessage::from_json(const Json& j) {
    if (!j.is_object() || !j.contains("message")) {
        return Result<ManagedMessage, Error>::err(
            ErrorCode::MalformedState,
            "Entry is missing its message"
        );
    }

    auto message = Message::from_json(j["message"]);
    if (message.is_err()) {
        return Result<ManagedMessage, Error>::err(std::move(message).error());
    }

    MessageMetadata metadata;
    if (j.contains("metadata")) {
        const auto& md = j["metadata"];
        if (!md.is_object() || (md.contains("tokens") && !md["tokens"].is_number_integer())) {
            return Result<ManagedMessage, Error>::err(
                ErrorCode::MalformedState,
                "Entry metadata is malformed"
            );
        }
        if (md.contains("message_type") && !md["message_type"].is_null() &&
            !md["message_type"].is_string()) {
            return Result<ManagedMessage, Error>::err(
                ErrorCode::MalformedState,
                "Entry message_type must be a string"
            );
        }
        if (md.contains("tokens") && !int_in_range(md["tokens"], 0)) {
            return Result<ManagedMessage, Error>::err(
                ErrorCode::MalformedState,
                "Entry token cost must be in [0, INT_MAX]",
                md["tokens"].dump()
            );
        }
        metadata = MessageMetadata::from_json(md);
    }

    return Result<ManagedMessage, Error>::ok(ManagedMessage{
        .message = std::move(message).value(),
        .metadata = std::move(metadata)
    });
}

// MessageLedger
MessageLedger::MessageLedger(LedgerCosts costs)
    : costs_(costs)
{
}

Result<void, Error> MessageLedger::add(Message message, MessageMetadata metadata,
                                       std::optional<size_t> position) {
    if (metadata.tokens < 0) {
        return Result<void, Error>::err(
            ErrorCode::InvalidArgument,
            "Token cost must not be negative",
            std::to_string(metadata.tokens)
        );
    }

    if (position && *position > entries_.size()) {
        return Result<void, Error>::err(
            ErrorCode::InvalidArgument,
            "Insert position out of range",
            std::to_string(*position) + " > " + std::to_string(entries_.size())
        );
    }

    if (metadata.tokens > kMaxTokens - current_tokens_) {
        return Result<void, Error>::err(
            ErrorCode::InvalidArgument,
            "Token total would overflow",
            std::to_string(current_tokens_) + " + " + std::to_string(metadata.tokens)
        );
    }

    int tokens = metadata.tokens;
    ManagedMessage entry{std::move(message), std::move(metadata)};
    if (position) {
        entries_.insert(entries_.begin() + static_cast<std::ptrdiff_t>(*position), std::move(entry));
    } else {
        entries_.push_back(std::move(entry));
    }
    current_tokens_ += tokens;

    return Result<void, Error>::ok();
}

ToolCallId MessageLedger::add_agent_turn(const Json& output) {
    ToolCallId id = std::to_string(next_tool_id_++);

    ToolCall call{
        .id = id,
        .name = "AgentOutput",
        .arguments = output
    };

    entries_.push_back(ManagedMessage{
        Message::ai("", {std::move(call)}),
        MessageMetadata{costs_.agent_output_tokens, "agent_output"}
    });
    current_tokens_ += costs_.agent_output_tokens;

    entries_.push_back(ManagedMessage{
        Message::tool_result(id, ""),
        MessageMetadata{costs_.tool_ack_tokens, "tool_ack"}
    });
    current_tokens_ += costs_.tool_ack_tokens;

    return id;
}

std::vector<Message> MessageLedger::snapshot_messages() const {
    std::vector<Message> messages;
    messages.reserve(entries_.size());
    for (const auto& entry : entries_) {
        messages.push_back(entry.message);
    }
    return messages;
}

bool MessageLedger::remove_oldest_non_system() {
    for (size_t i = 0; i < entries_.size(); ++i) {
        if (!entries_[i].message.is_system()) {
            current_tokens_ -= entries_[i].metadata.tokens;
            entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(i));
            return true;
        }
    }
    return false;
}

bool MessageLedger::remove_trailing_state_if_present() {
    if (entries_.size() > 2 && entries_.back().message.role == Role::Human) {
        current_tokens_ -= entries_.back().metadata.tokens;
        entries_.pop_back();
        return true;
    }
    return false;
}

Result<ManagedMessage, Error> MessageLedger::remove_at(size_t index) {
    if (index >= entries_.size()) {
        return Result<ManagedMessage, Error>::err(
            ErrorCode::InvalidArgument,
            "Removal index out of range",
            std::to_string(index) + " >= " + std::to_string(entries_.size())
        );
    }

    ManagedMessage removed = std::move(entries_[index]);
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(index));
    current_tokens_ -= removed.metadata.tokens;

    return Result<ManagedMessage, Error>::ok(std::move(removed));
}

void MessageLedger::clear() {
    entries_.clear();
    current_tokens_ = 0;
}

Json MessageLedger::to_json() const {
    Json messages = Json::array();
    for (const auto& entry : entries_) {
        messages.push_back(entry.to_json());
    }

    return Json{
        {"messages", std::move(messages)},
        {"current_tokens", current_tokens_},
        {"tool_id", next_tool_id_}
    };
}

Result<MessageLedger, Error> MessageLedger::from_json(const Json& j, LedgerCosts costs) {
    if (!j.is_object() || !j.contains("messages") || !j["messages"].is_array()) {
        return Result<MessageLedger, Error>::err(
            ErrorCode::MalformedState,
            "Ledger snapshot has no messages array"
        );
    }

    if (!j.contains("current_tokens") || !j["current_tokens"].is_number_integer()) {
        return Result<MessageLedger, Error>::err(
            ErrorCode::MalformedState,
            "Ledger snapshot has no integer current_tokens"
        );
    }

    MessageLedger ledger(costs);
    int64_t sum = 0;
    const auto& messages = j["messages"];
    for (size_t i = 0; i < messages.size(); ++i) {
        auto entry = ManagedMessage::from_json(messages[i]);
        if (entry.is_err()) {
            Error error = std::move(entry).error();
            error.context = "messages[" + std::to_string(i) + "]";
            return Result<MessageLedger, Error>::err(std::move(error));
        }
        sum += entry.value().metadata.tokens;
        if (sum > kMaxTokens) {
            return Result<MessageLedger, Error>::err(
                ErrorCode::MalformedState,
                "Entry tokens sum past the supported range",
                "messages[" + std::to_string(i) + "]"
            );
        }
        ledger.entries_.push_back(std::move(entry).value());
    }
    ledger.current_tokens_ = static_cast<int>(sum);

    const auto& stored = j["current_tokens"];
    if (!int_in_range(stored, 0) || stored.get<int64_t>() != sum) {
        return Result<MessageLedger, Error>::err(
            ErrorCode::MalformedState,
            "current_tokens does not match the sum of entry tokens",
            stored.dump() + " != " + std::to_string(sum)
        );
    }

    if (j.contains("tool_id")) {
        const auto& tool_id = j["tool_id"];
        if (!int_in_range(tool_id, 1)) {
            return Result<MessageLedger, Error>::err(
                ErrorCode::MalformedState,
                "tool_id must be an integer in [1, INT_MAX]",
                tool_id.dump()
            );
        }
        ledger.next_tool_id_ = tool_id.get<int>();
    }

    return Result<MessageLedger, Error>::ok(std::move(ledger));
}

Result<void, Error> MessageLedger::save(const fs::path& path) const {
    try {
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }

        std::ofstream file(path);
        if (!file) {
            return Result<void, Error>::err(
                ErrorCode::FileWriteFailed,
                "Failed to open file for writing",
                path.string()
            );
        }

        file << to_json().dump(2);
        return Result<void, Error>::ok();

    } catch (const std::exception& e) {
        return Result<void, Error>::err(
            ErrorCode::FileWriteFailed,
            e.what(),
            path.string()
        );
    }
}

Result<MessageLedger, Error> MessageLedger::load(const fs::path& path, LedgerCosts costs) {
    try {
        if (!fs::exists(path)) {
            return Result<MessageLedger, Error>::err(
                ErrorCode::FileNotFound,
                "History file not found",
                path.string()
            );
        }

        std::ifstream file(path);
        if (!file) {
            return Result<MessageLedger, Error>::err(
                ErrorCode::FileReadFailed,
                "Failed to open file for reading",
                path.string()
            );
        }

        Json j = Json::parse(file);
        auto ledger = from_json(j, costs);
        if (ledger.is_err()) {
            spdlog::error("Rejected history snapshot {}: {}", path.string(),
                          ledger.error().full_message());
        }
        return ledger;

    } catch (const Json::exception& e) {
        return Result<MessageLedger, Error>::err(
            ErrorCode::MalformedState,
            std::string("JSON parse error: ") + e.what(),
            path.string()
        );
    } catch (const std::exception& e) {
        return Result<MessageLedger, Error>::err(
            ErrorCode::FileReadFailed,
            e.what(),
            path.string()
        );
    }
}

}  // namespace msghistory::history
