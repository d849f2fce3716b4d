#pragma once

#include "ledger/bot_tables.hpp"
#include "ledger/journal.hpp"
#include "ledger/types.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ledger {

// Every row written by one transaction. Also the unit the journal persists.
struct LedgerChanges {
    std::map<std::string, Account> accounts;
    std::map<std::string, Market> markets;
    std::map<std::string, Order> orders;
    std::map<std::string, Position> positions;
    std::map<std::string, MarketWeight> weights;
    std::map<std::string, CurveShape> shapes;
    std::vector<std::string> removed_shapes;
    std::map<std::string, MarketOverride> overrides;
    std::optional<ExposureSnapshot> exposure;
    std::vector<AuditEntry> audit;
    std::uint64_t sequence = 0;
    std::int64_t committed_at_ms = 0;

    [[nodiscard]] bool empty() const;
};

class LedgerTransaction;

// In-memory tables with an optional JSON-lines journal for durability.
// Writers are serialized by a reader-writer lock; readers share it.
class LedgerStore {
public:
    LedgerStore();
    // An empty path keeps the store in memory only.
    explicit LedgerStore(const std::filesystem::path& journal_path);
    ~LedgerStore();

    LedgerStore(const LedgerStore&) = delete;
    LedgerStore& operator=(const LedgerStore&) = delete;
    LedgerStore(LedgerStore&&) = delete;
    LedgerStore& operator=(LedgerStore&&) = delete;

    // Replays the journal into memory. Returns the number of transactions applied.
    std::size_t load();

    [[nodiscard]] std::uint64_t sequence() const;
    [[nodiscard]] std::vector<AuditEntry> audit_log(const std::string& account_id = {}) const;

private:
    friend class LedgerTransaction;

    void apply(const LedgerChanges& changes);

    std::map<std::string, Account> accounts_;
    std::map<std::string, Market> markets_;
    std::map<std::string, Order> orders_;
    std::map<std::string, Position> positions_;
    std::map<std::string, MarketWeight> weights_;
    std::map<std::string, CurveShape> shapes_;
    std::map<std::string, MarketOverride> overrides_;
    ExposureSnapshot exposure_;
    std::vector<AuditEntry> audit_;
    std::uint64_t sequence_ = 0;

    // Orders and positions are never deleted, so the indexes only grow.
    std::unordered_map<std::string, std::vector<std::string>> orders_by_market_;
    std::unordered_map<std::string, std::vector<std::string>> orders_by_account_;
    std::unordered_map<std::string, std::vector<std::string>> positions_by_market_;
    std::unordered_map<std::string, std::vector<std::string>> positions_by_account_;

    std::unique_ptr<LedgerJournal> journal_;
    mutable std::shared_mutex mutex_;
};

// Unit of work against the store. Reads see the store plus this
// transaction's own staged writes; nothing reaches the store until commit().
// Destroying an uncommitted transaction discards its writes.
class LedgerTransaction {
public:
    enum class Mode { ReadOnly, ReadWrite };

    explicit LedgerTransaction(LedgerStore& store, Mode mode = Mode::ReadWrite);
    ~LedgerTransaction() = default;

    LedgerTransaction(const LedgerTransaction&) = delete;
    LedgerTransaction& operator=(const LedgerTransaction&) = delete;
    LedgerTransaction(LedgerTransaction&&) = delete;
    LedgerTransaction& operator=(LedgerTransaction&&) = delete;

    [[nodiscard]] std::optional<Account> find_account(const std::string& id) const;
    [[nodiscard]] Account get_account(const std::string& id) const;
    // Throws NotFound when the account does not exist.
    void require_account(const std::string& id) const;
    void put_account(const Account& account);

    [[nodiscard]] std::optional<Market> find_market(const std::string& id) const;
    [[nodiscard]] Market get_market(const std::string& id) const;
    void require_market(const std::string& id) const;
    [[nodiscard]] std::vector<Market> markets() const;
    void put_market(const Market& market);

    [[nodiscard]] std::optional<Order> find_order(const std::string& id) const;
    [[nodiscard]] std::vector<Order> orders_in_market(const std::string& market_id) const;
    [[nodiscard]] std::vector<Order> orders_of_account(const std::string& account_id) const;
    void put_order(const Order& order);

    [[nodiscard]] std::optional<Position> find_position(const std::string& id) const;
    [[nodiscard]] std::vector<Position> positions_in_market(const std::string& market_id) const;
    [[nodiscard]] std::vector<Position> positions_of_account(const std::string& account_id) const;
    void put_position(const Position& position);

    [[nodiscard]] std::optional<MarketWeight> find_weight(const std::string& market_id) const;
    [[nodiscard]] std::vector<MarketWeight> weights() const;
    void put_weight(const MarketWeight& weight);

    [[nodiscard]] std::optional<CurveShape> find_shape(const std::string& id) const;
    [[nodiscard]] std::vector<CurveShape> shapes() const;
    void put_shape(const CurveShape& shape);
    void remove_shape(const std::string& id);

    [[nodiscard]] MarketOverride market_override(const std::string& market_id) const;
    void put_override(const std::string& market_id, const MarketOverride& override_value);

    [[nodiscard]] ExposureSnapshot exposure() const;
    void put_exposure(const ExposureSnapshot& snapshot);

    // Balance movements. Both append an audit entry and return the new balance.
    std::int64_t credit(const std::string& account_id, std::int64_t amount, AuditKind kind,
                        const std::string& reference_id, const std::string& details = {});
    std::int64_t debit(const std::string& account_id, std::int64_t amount, AuditKind kind,
                       const std::string& reference_id, const std::string& details = {});
    void record(AuditKind kind, const std::string& account_id, const std::string& reference_id,
                const std::string& details);

    std::uint64_t next_sequence();
    [[nodiscard]] std::int64_t timestamp_ms() const noexcept { return timestamp_ms_; }

    [[nodiscard]] const LedgerChanges& changes() const noexcept { return changes_; }

    // Runs invariant checks, appends to the journal, then publishes the writes.
    void commit();
    [[nodiscard]] bool committed() const noexcept { return committed_; }

private:
    void require_writable() const;
    void check_invariants() const;

    LedgerStore& store_;
    Mode mode_;
    std::unique_lock<std::shared_mutex> write_lock_;
    std::shared_lock<std::shared_mutex> read_lock_;
    LedgerChanges changes_;
    std::int64_t timestamp_ms_;
    bool committed_ = false;
};

} // namespace ledger
