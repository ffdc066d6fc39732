#include "msghistory/history/budget_policy.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <sstream>
#include <vector>

namespace msghistory::history {

BudgetConfig BudgetConfig::from_config(const HistoryConfig& config) {
    return BudgetConfig{
        .preserve_recent = static_cast<size_t>(std::max(config.preserve_recent, 0)),
        .compression_window = static_cast<size_t>(std::max(config.compression_window, 0)),
        .summary_limit = static_cast<size_t>(std::max(config.summary_limit, 0)),
        .state_preview_chars = static_cast<size_t>(std::max(config.state_preview_chars, 0))
    };
}

BudgetPolicy::BudgetPolicy(BudgetConfig config)
    : config_(config)
{
}

bool BudgetPolicy::remove_oldest(MessageLedger& ledger) const {
    return ledger.remove_oldest_non_system();
}

EvictionResult BudgetPolicy::apply_sliding_window(MessageLedger& ledger, int max_tokens) const {
    return apply_sliding_window(ledger, max_tokens, config_.preserve_recent);
}

EvictionResult BudgetPolicy::apply_sliding_window(MessageLedger& ledger, int max_tokens,
                                                  size_t preserve_recent) const {
    EvictionResult result;
    if (ledger.total_tokens() <= max_tokens) {
        return result;
    }

    const auto& entries = ledger.entries();
    std::vector<bool> preserved(entries.size(), false);

    for (size_t i = 0; i < entries.size(); ++i) {
        if (entries[i].message.is_system()) {
            preserved[i] = true;
        }
    }

    // A ledger no longer than the window only protects its system entries
    if (entries.size() > preserve_recent) {
        for (size_t i = entries.size() - preserve_recent; i < entries.size(); ++i) {
            preserved[i] = true;
        }
    }

    // Oldest first; flags shift left with every removal
    size_t i = 0;
    while (ledger.total_tokens() > max_tokens && i < ledger.size()) {
        if (preserved[i]) {
            ++i;
            continue;
        }

        auto removed = ledger.remove_at(i);
        if (removed.is_err()) {
            spdlog::error("Sliding window stopped: {}", removed.error().full_message());
            break;
        }
        preserved.erase(preserved.begin() + static_cast<std::ptrdiff_t>(i));

        ++result.removed;
        result.tokens_freed += removed.value().metadata.tokens;
    }

    result.over_budget = ledger.total_tokens() > max_tokens;

    spdlog::debug("Sliding window removed {} entries ({} tokens), total {} / {}",
                  result.removed, result.tokens_freed, ledger.total_tokens(), max_tokens);
    if (result.over_budget) {
        spdlog::warn("History still over budget after eviction: {} > {} tokens",
                     ledger.total_tokens(), max_tokens);
    }

    return result;
}

std::optional<std::string> BudgetPolicy::compress_history(MessageLedger& ledger, int max_tokens) const {
    if (ledger.total_tokens() <= max_tokens) {
        return std::nullopt;
    }

    const auto& entries = ledger.entries();
    size_t end = entries.size() > config_.compression_window
        ? entries.size() - config_.compression_window
        : 0;

    std::vector<size_t> candidates;
    for (size_t i = 0; i < end; ++i) {
        if (!entries[i].message.is_system()) {
            candidates.push_back(i);
        }
    }

    if (candidates.empty()) {
        return std::nullopt;
    }

    std::vector<std::string> lines;
    size_t summarized = std::min(config_.summary_limit, candidates.size());
    for (size_t k = 0; k < summarized; ++k) {
        const auto& msg = entries[candidates[k]].message;
        switch (msg.role) {
            case Role::Ai:
                if (auto label = action_label(msg)) {
                    lines.push_back("• Executed: " + *label);
                }
                break;
            case Role::Human:
                lines.push_back("• State: " + truncate_preview(msg.content, config_.state_preview_chars));
                break;
            case Role::System:
            case Role::ToolResult:
                break;
        }
    }

    if (candidates.size() > config_.summary_limit) {
        lines.push_back("• ... and " + std::to_string(candidates.size() - config_.summary_limit) +
                        " more actions");
    }

    std::ostringstream summary;
    summary << "Previous actions summary:\n";
    for (size_t k = 0; k < lines.size(); ++k) {
        if (k > 0) summary << "\n";
        summary << lines[k];
    }

    // Highest index first so the remaining candidate indices stay valid
    int tokens_removed = 0;
    for (auto it = candidates.rbegin(); it != candidates.rend(); ++it) {
        auto removed = ledger.remove_at(*it);
        if (removed.is_err()) {
            spdlog::error("Compression stopped: {}", removed.error().full_message());
            break;
        }
        tokens_removed += removed.value().metadata.tokens;
    }

    spdlog::debug("Compressed {} entries ({} tokens) into a {}-line digest",
                  candidates.size(), tokens_removed, lines.size());

    return summary.str();
}

std::optional<std::string> BudgetPolicy::action_label(const Message& message) {
    if (message.role != Role::Ai || !message.has_tool_calls()) {
        return std::nullopt;
    }

    const Json& args = message.tool_calls.front().arguments;
    if (!args.is_object() || !args.contains("action")) {
        return std::nullopt;
    }

    const Json& actions = args["action"];
    if (!actions.is_array() || actions.empty()) {
        return std::nullopt;
    }

    const Json& first = actions.front();
    if (first.is_object()) {
        if (first.empty()) return std::nullopt;
        // First key as written by the producer
        return first.begin().key();
    }
    if (first.is_string()) {
        return first.get<std::string>();
    }
    return first.dump();
}

std::string BudgetPolicy::truncate_preview(const std::string& text, size_t max_chars) {
    size_t chars = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        // Count UTF-8 lead bytes only
        if ((static_cast<unsigned char>(text[i]) & 0xC0) == 0x80) {
            continue;
        }
        if (chars == max_chars) {
            return text.substr(0, i) + "...";
        }
        ++chars;
    }
    return text;
}

}  // namespace msghistory::history
