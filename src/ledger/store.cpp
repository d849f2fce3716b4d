#include "ledger/store.hpp"
#include "ledger/errors.hpp"
#include "ledger/util.hpp"

#include <algorithm>
#include <iostream>

namespace ledger {

namespace {

void index_row(std::unordered_map<std::string, std::vector<std::string>>& index,
               const std::string& key, const std::string& id) {
    index[key].push_back(id);
}

// Rows listed by the store index for a key, overlaid with this transaction's
// staged versions, plus staged rows the store has never seen.
template <typename Row, typename Match>
std::vector<Row> merged_rows(const std::unordered_map<std::string, std::vector<std::string>>& index,
                             const std::string& key,
                             const std::map<std::string, Row>& base,
                             const std::map<std::string, Row>& staged,
                             Match matches) {
    std::vector<Row> rows;
    if (const auto it = index.find(key); it != index.end()) {
        rows.reserve(it->second.size());
        for (const auto& id : it->second) {
            if (const auto staged_it = staged.find(id); staged_it != staged.end()) {
                rows.push_back(staged_it->second);
            } else {
                rows.push_back(base.at(id));
            }
        }
    }
    for (const auto& [id, row] : staged) {
        if (base.find(id) == base.end() && matches(row)) {
            rows.push_back(row);
        }
    }
    std::sort(rows.begin(), rows.end(), [](const Row& a, const Row& b) {
        return a.sequence < b.sequence;
    });
    return rows;
}

template <typename Row>
std::optional<Row> find_row(const std::map<std::string, Row>& staged,
                            const std::map<std::string, Row>& base,
                            const std::string& id) {
    if (const auto it = staged.find(id); it != staged.end()) {
        return it->second;
    }
    if (const auto it = base.find(id); it != base.end()) {
        return it->second;
    }
    return std::nullopt;
}

[[noreturn]] void violation(const std::string& message) {
    std::cerr << "[Ledger] Invariant violation: " << message << std::endl;
    throw LedgerError(ErrorKind::InvariantViolation, message);
}

} // namespace

bool LedgerChanges::empty() const {
    return accounts.empty() && markets.empty() && orders.empty() && positions.empty() &&
           weights.empty() && shapes.empty() && removed_shapes.empty() && overrides.empty() &&
           !exposure && audit.empty();
}

LedgerStore::LedgerStore() = default;

LedgerStore::LedgerStore(const std::filesystem::path& journal_path) {
    if (!journal_path.empty()) {
        journal_ = std::make_unique<LedgerJournal>(LedgerJournalConfig{journal_path});
    }
}

LedgerStore::~LedgerStore() = default;

std::size_t LedgerStore::load() {
    std::unique_lock lock(mutex_);
    if (!journal_) {
        return 0;
    }
    const auto applied = journal_->load([this](const LedgerChanges& changes) { apply(changes); });
    std::clog << "[Ledger] Replayed " << applied << " transactions from " << journal_->path().string();
    if (journal_->skipped_lines() > 0) {
        std::clog << " (" << journal_->skipped_lines() << " skipped)";
    }
    std::clog << std::endl;
    return applied;
}

std::uint64_t LedgerStore::sequence() const {
    std::shared_lock lock(mutex_);
    return sequence_;
}

std::vector<AuditEntry> LedgerStore::audit_log(const std::string& account_id) const {
    std::shared_lock lock(mutex_);
    if (account_id.empty()) {
        return audit_;
    }
    std::vector<AuditEntry> entries;
    for (const auto& entry : audit_) {
        if (entry.account_id == account_id) {
            entries.push_back(entry);
        }
    }
    return entries;
}

void LedgerStore::apply(const LedgerChanges& changes) {
    for (const auto& [id, account] : changes.accounts) {
        accounts_[id] = account;
    }
    for (const auto& [id, market] : changes.markets) {
        markets_[id] = market;
    }
    for (const auto& [id, order] : changes.orders) {
        if (orders_.find(id) == orders_.end()) {
            index_row(orders_by_market_, order.market_id, id);
            index_row(orders_by_account_, order.account_id, id);
        }
        orders_[id] = order;
    }
    for (const auto& [id, position] : changes.positions) {
        if (positions_.find(id) == positions_.end()) {
            index_row(positions_by_market_, position.market_id, id);
            index_row(positions_by_account_, position.yes_account_id, id);
            if (position.no_account_id != position.yes_account_id) {
                index_row(positions_by_account_, position.no_account_id, id);
            }
        }
        positions_[id] = position;
    }
    for (const auto& [market_id, weight] : changes.weights) {
        weights_[market_id] = weight;
    }
    for (const auto& [id, shape] : changes.shapes) {
        shapes_[id] = shape;
    }
    for (const auto& id : changes.removed_shapes) {
        shapes_.erase(id);
    }
    for (const auto& [market_id, override_value] : changes.overrides) {
        if (std::holds_alternative<DefaultCurve>(override_value)) {
            overrides_.erase(market_id);
        } else {
            overrides_[market_id] = override_value;
        }
    }
    if (changes.exposure) {
        exposure_ = *changes.exposure;
    }
    audit_.insert(audit_.end(), changes.audit.begin(), changes.audit.end());
    sequence_ = std::max(sequence_, changes.sequence);
}

LedgerTransaction::LedgerTransaction(LedgerStore& store, Mode mode)
    : store_(store),
      mode_(mode),
      timestamp_ms_(now_ms()) {
    if (mode_ == Mode::ReadWrite) {
        write_lock_ = std::unique_lock<std::shared_mutex>(store_.mutex_);
    } else {
        read_lock_ = std::shared_lock<std::shared_mutex>(store_.mutex_);
    }
    changes_.sequence = store_.sequence_;
}

void LedgerTransaction::require_writable() const {
    if (mode_ != Mode::ReadWrite) {
        throw LedgerError(ErrorKind::InvariantViolation, "Write attempted in a read-only transaction");
    }
    if (committed_) {
        throw LedgerError(ErrorKind::InvalidState, "Transaction already committed");
    }
}

std::optional<Account> LedgerTransaction::find_account(const std::string& id) const {
    return find_row(changes_.accounts, store_.accounts_, id);
}

Account LedgerTransaction::get_account(const std::string& id) const {
    auto account = find_account(id);
    if (!account) {
        throw_error(ErrorKind::NotFound, "Account not found: " + id);
    }
    return *account;
}

void LedgerTransaction::require_account(const std::string& id) const {
    if (!find_account(id)) {
        throw_error(ErrorKind::NotFound, "Account not found: " + id);
    }
}

void LedgerTransaction::put_account(const Account& account) {
    require_writable();
    changes_.accounts[account.id] = account;
}

std::optional<Market> LedgerTransaction::find_market(const std::string& id) const {
    return find_row(changes_.markets, store_.markets_, id);
}

Market LedgerTransaction::get_market(const std::string& id) const {
    auto market = find_market(id);
    if (!market) {
        throw_error(ErrorKind::NotFound, "Market not found: " + id);
    }
    return *market;
}

void LedgerTransaction::require_market(const std::string& id) const {
    if (!find_market(id)) {
        throw_error(ErrorKind::NotFound, "Market not found: " + id);
    }
}

std::vector<Market> LedgerTransaction::markets() const {
    std::map<std::string, Market> merged = store_.markets_;
    for (const auto& [id, market] : changes_.markets) {
        merged[id] = market;
    }
    std::vector<Market> result;
    result.reserve(merged.size());
    for (auto& [id, market] : merged) {
        result.push_back(std::move(market));
    }
    return result;
}

void LedgerTransaction::put_market(const Market& market) {
    require_writable();
    changes_.markets[market.id] = market;
}

std::optional<Order> LedgerTransaction::find_order(const std::string& id) const {
    return find_row(changes_.orders, store_.orders_, id);
}

std::vector<Order> LedgerTransaction::orders_in_market(const std::string& market_id) const {
    return merged_rows(store_.orders_by_market_, market_id, store_.orders_, changes_.orders,
                       [&](const Order& order) { return order.market_id == market_id; });
}

std::vector<Order> LedgerTransaction::orders_of_account(const std::string& account_id) const {
    return merged_rows(store_.orders_by_account_, account_id, store_.orders_, changes_.orders,
                       [&](const Order& order) { return order.account_id == account_id; });
}

void LedgerTransaction::put_order(const Order& order) {
    require_writable();
    changes_.orders[order.id] = order;
}

std::optional<Position> LedgerTransaction::find_position(const std::string& id) const {
    return find_row(changes_.positions, store_.positions_, id);
}

std::vector<Position> LedgerTransaction::positions_in_market(const std::string& market_id) const {
    return merged_rows(store_.positions_by_market_, market_id, store_.positions_, changes_.positions,
                       [&](const Position& position) { return position.market_id == market_id; });
}

std::vector<Position> LedgerTransaction::positions_of_account(const std::string& account_id) const {
    return merged_rows(store_.positions_by_account_, account_id, store_.positions_, changes_.positions,
                       [&](const Position& position) {
                           return position.yes_account_id == account_id ||
                                  position.no_account_id == account_id;
                       });
}

void LedgerTransaction::put_position(const Position& position) {
    require_writable();
    changes_.positions[position.id] = position;
}

std::optional<MarketWeight> LedgerTransaction::find_weight(const std::string& market_id) const {
    return find_row(changes_.weights, store_.weights_, market_id);
}

std::vector<MarketWeight> LedgerTransaction::weights() const {
    std::map<std::string, MarketWeight> merged = store_.weights_;
    for (const auto& [market_id, weight] : changes_.weights) {
        merged[market_id] = weight;
    }
    std::vector<MarketWeight> result;
    result.reserve(merged.size());
    for (auto& [market_id, weight] : merged) {
        result.push_back(std::move(weight));
    }
    return result;
}

void LedgerTransaction::put_weight(const MarketWeight& weight) {
    require_writable();
    changes_.weights[weight.market_id] = weight;
}

std::optional<CurveShape> LedgerTransaction::find_shape(const std::string& id) const {
    const auto& removed = changes_.removed_shapes;
    if (std::find(removed.begin(), removed.end(), id) != removed.end()) {
        return std::nullopt;
    }
    return find_row(changes_.shapes, store_.shapes_, id);
}

std::vector<CurveShape> LedgerTransaction::shapes() const {
    std::map<std::string, CurveShape> merged = store_.shapes_;
    for (const auto& id : changes_.removed_shapes) {
        merged.erase(id);
    }
    for (const auto& [id, shape] : changes_.shapes) {
        merged[id] = shape;
    }
    std::vector<CurveShape> result;
    result.reserve(merged.size());
    for (auto& [id, shape] : merged) {
        result.push_back(std::move(shape));
    }
    return result;
}

void LedgerTransaction::put_shape(const CurveShape& shape) {
    require_writable();
    auto& removed = changes_.removed_shapes;
    removed.erase(std::remove(removed.begin(), removed.end(), shape.id), removed.end());
    changes_.shapes[shape.id] = shape;
}

void LedgerTransaction::remove_shape(const std::string& id) {
    require_writable();
    changes_.shapes.erase(id);
    changes_.removed_shapes.push_back(id);
}

MarketOverride LedgerTransaction::market_override(const std::string& market_id) const {
    if (const auto it = changes_.overrides.find(market_id); it != changes_.overrides.end()) {
        return it->second;
    }
    if (const auto it = store_.overrides_.find(market_id); it != store_.overrides_.end()) {
        return it->second;
    }
    return DefaultCurve{};
}

void LedgerTransaction::put_override(const std::string& market_id, const MarketOverride& override_value) {
    require_writable();
    changes_.overrides[market_id] = override_value;
}

ExposureSnapshot LedgerTransaction::exposure() const {
    return changes_.exposure ? *changes_.exposure : store_.exposure_;
}

void LedgerTransaction::put_exposure(const ExposureSnapshot& snapshot) {
    require_writable();
    changes_.exposure = snapshot;
}

std::int64_t LedgerTransaction::credit(const std::string& account_id, std::int64_t amount, AuditKind kind,
                                       const std::string& reference_id, const std::string& details) {
    require_writable();
    if (amount < 0) {
        throw_error(ErrorKind::InvalidArgument, "Credit amount must not be negative");
    }
    auto account = get_account(account_id);
    account.balance += amount;
    put_account(account);

    AuditEntry entry;
    entry.sequence = next_sequence();
    entry.kind = kind;
    entry.account_id = account_id;
    entry.amount = amount;
    entry.balance_after = account.balance;
    entry.reference_id = reference_id;
    entry.details = details;
    entry.timestamp_ms = timestamp_ms_;
    changes_.audit.push_back(std::move(entry));
    return account.balance;
}

std::int64_t LedgerTransaction::debit(const std::string& account_id, std::int64_t amount, AuditKind kind,
                                      const std::string& reference_id, const std::string& details) {
    require_writable();
    if (amount < 0) {
        throw_error(ErrorKind::InvalidArgument, "Debit amount must not be negative");
    }
    auto account = get_account(account_id);
    if (account.balance < amount) {
        throw InsufficientFunds(amount, account.balance);
    }
    account.balance -= amount;
    put_account(account);

    AuditEntry entry;
    entry.sequence = next_sequence();
    entry.kind = kind;
    entry.account_id = account_id;
    entry.amount = -amount;
    entry.balance_after = account.balance;
    entry.reference_id = reference_id;
    entry.details = details;
    entry.timestamp_ms = timestamp_ms_;
    changes_.audit.push_back(std::move(entry));
    return account.balance;
}

void LedgerTransaction::record(AuditKind kind, const std::string& account_id, const std::string& reference_id,
                               const std::string& details) {
    require_writable();
    const auto account = find_account(account_id);

    AuditEntry entry;
    entry.sequence = next_sequence();
    entry.kind = kind;
    entry.account_id = account_id;
    entry.balance_after = account ? account->balance : 0;
    entry.reference_id = reference_id;
    entry.details = details;
    entry.timestamp_ms = timestamp_ms_;
    changes_.audit.push_back(std::move(entry));
}

std::uint64_t LedgerTransaction::next_sequence() {
    require_writable();
    return ++changes_.sequence;
}

void LedgerTransaction::check_invariants() const {
    for (const auto& [id, account] : changes_.accounts) {
        if (account.balance < 0) {
            violation("account " + id + " balance " + std::to_string(account.balance) + " is negative");
        }
    }
    for (const auto& [id, order] : changes_.orders) {
        if (order.shares <= 0) {
            violation("order " + id + " has non-positive shares");
        }
        if (order.filled < 0 || order.filled > order.shares) {
            violation("order " + id + " filled " + std::to_string(order.filled) +
                      " outside [0, " + std::to_string(order.shares) + "]");
        }
        if (order.price < kMinPrice || order.price > kMaxPrice) {
            violation("order " + id + " price " + std::to_string(order.price) + " out of range");
        }
    }
    for (const auto& [id, position] : changes_.positions) {
        if (position.shares <= 0) {
            violation("position " + id + " has non-positive shares");
        }
        if (position.trade_price < kMinPrice || position.trade_price > kMaxPrice) {
            violation("position " + id + " trade price " + std::to_string(position.trade_price) +
                      " out of range");
        }
    }
}

void LedgerTransaction::commit() {
    require_writable();
    check_invariants();
    changes_.committed_at_ms = timestamp_ms_;
    if (store_.journal_ && !changes_.empty()) {
        store_.journal_->append(changes_);
    }
    store_.apply(changes_);
    committed_ = true;
}

} // namespace ledger
