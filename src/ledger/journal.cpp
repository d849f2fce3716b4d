#include "ledger/journal.hpp"
#include "ledger/errors.hpp"
#include "ledger/serialization.hpp"
#include "ledger/store.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace ledger {

LedgerJournal::LedgerJournal(LedgerJournalConfig config)
    : config_(std::move(config)) {
    if (config_.storage_path.empty()) {
        throw std::invalid_argument("LedgerJournal storage path not set");
    }
}

std::size_t LedgerJournal::load(const std::function<void(const LedgerChanges&)>& apply) {
    skipped_lines_ = 0;
    ensure_directory();
    std::ifstream input(config_.storage_path);
    if (!input.good()) {
        return 0;
    }

    std::size_t applied = 0;
    std::size_t line_number = 0;
    std::string line;
    while (std::getline(input, line)) {
        ++line_number;
        if (line.empty()) {
            continue;
        }
        LedgerChanges changes;
        try {
            changes = nlohmann::json::parse(line).get<LedgerChanges>();
        } catch (const nlohmann::json::exception& ex) {
            std::cerr << "[Ledger] Skipping malformed journal line " << line_number
                      << ": " << ex.what() << std::endl;
            ++skipped_lines_;
            continue;
        } catch (const LedgerError& ex) {
            std::cerr << "[Ledger] Skipping journal line " << line_number
                      << ": " << ex.what() << std::endl;
            ++skipped_lines_;
            continue;
        }
        apply(changes);
        ++applied;
    }
    return applied;
}

void LedgerJournal::append(const LedgerChanges& changes) {
    ensure_directory();

    const nlohmann::json json = changes;

    std::ofstream output(config_.storage_path, std::ios::app);
    if (!output.good()) {
        throw std::runtime_error("Failed to append to ledger journal at " + config_.storage_path.string());
    }
    output << json.dump() << '\n';
    if (config_.flush_each_commit) {
        output.flush();
    }
    if (!output.good()) {
        throw std::runtime_error("Failed to write ledger journal at " + config_.storage_path.string());
    }
}

void LedgerJournal::ensure_directory() const {
    const auto dir = config_.storage_path.parent_path();
    if (!dir.empty() && !std::filesystem::exists(dir)) {
        std::filesystem::create_directories(dir);
    }
}

} // namespace ledger
