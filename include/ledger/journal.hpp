#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>

namespace ledger {

struct LedgerChanges;

struct LedgerJournalConfig {
    std::filesystem::path storage_path;
    bool flush_each_commit = true;
};

// Append-only JSON-lines journal: one line per committed transaction.
class LedgerJournal {
public:
    explicit LedgerJournal(LedgerJournalConfig config);

    // Replays every readable line in order. Malformed lines are skipped.
    std::size_t load(const std::function<void(const LedgerChanges&)>& apply);

    // Throws std::runtime_error if the line cannot be written.
    void append(const LedgerChanges& changes);

    [[nodiscard]] const std::filesystem::path& path() const { return config_.storage_path; }
    [[nodiscard]] std::size_t skipped_lines() const { return skipped_lines_; }

private:
    void ensure_directory() const;

    LedgerJournalConfig config_;
    std::size_t skipped_lines_ = 0;
};

} // namespace ledger
