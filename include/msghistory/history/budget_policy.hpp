#pragma once

#include "msghistory/core/config.hpp"
#include "msghistory/history/message_ledger.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace msghistory::history {

// Windows used by the eviction and compression strategies
struct BudgetConfig {
    size_t preserve_recent = 3;       // Trailing entries kept by the sliding window
    size_t compression_window = 5;    // Trailing entries never compressed
    size_t summary_limit = 5;         // Candidates that get a digest line
    size_t state_preview_chars = 100; // Characters of state shown per digest line

    static BudgetConfig from_config(const HistoryConfig& config);
};

// Outcome of an eviction pass
struct EvictionResult {
    size_t removed = 0;
    int tokens_freed = 0;
    bool over_budget = false;  // Preserved entries alone exceed the ceiling

    bool within_budget() const { return !over_budget; }
};

// Eviction and compression strategies over a MessageLedger.
//
// Stateless between calls. Every strategy leaves the ledger untouched when
// it is already within max_tokens, and none of them ever removes a system
// entry.
class BudgetPolicy {
public:
    BudgetPolicy() = default;
    explicit BudgetPolicy(BudgetConfig config);

    const BudgetConfig& config() const { return config_; }

    // Remove the oldest non-system entry
    bool remove_oldest(MessageLedger& ledger) const;

    // Evict unpreserved entries oldest-first until the ledger fits.
    // Preserved: system entries and the last preserve_recent entries.
    EvictionResult apply_sliding_window(MessageLedger& ledger, int max_tokens) const;
    EvictionResult apply_sliding_window(MessageLedger& ledger, int max_tokens,
                                        size_t preserve_recent) const;

    // Replace older non-system entries with a short digest. Returns the digest,
    // or nullopt when within budget or there is nothing to compress. The digest
    // is not inserted into the ledger.
    std::optional<std::string> compress_history(MessageLedger& ledger, int max_tokens) const;

    // Label of the first structured action in an agent decision, if any
    static std::optional<std::string> action_label(const Message& message);

    // First max_chars UTF-8 characters, with "..." appended when cut
    static std::string truncate_preview(const std::string& text, size_t max_chars);

private:
    BudgetConfig config_;
};

}  // namespace msghistory::history
