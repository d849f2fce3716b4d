#include "liquidity/market_weights.hpp"

#include "ledger/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace liquidity {

namespace {

using ledger::kWeightScale;
using ledger::MarketWeight;

// Splits total across rows in proportion to basis (equally when the basis is
// all zero). Floors each share and hands the remainder to the largest row.
void distribute(std::vector<MarketWeight*>& rows, std::int64_t total, const std::vector<std::int64_t>& basis) {
    if (rows.empty()) {
        return;
    }
    long double basis_sum = 0;
    for (const auto value : basis) {
        basis_sum += static_cast<long double>(value);
    }

    std::int64_t assigned = 0;
    std::size_t largest = 0;
    for (std::size_t i = 0; i < rows.size(); ++i) {
        std::int64_t share = 0;
        if (basis_sum > 0) {
            share = static_cast<std::int64_t>(
                std::floor(static_cast<long double>(basis[i]) * total / basis_sum));
        } else {
            share = total / static_cast<std::int64_t>(rows.size());
        }
        rows[i]->weight_ppb = share;
        assigned += share;
        if (basis[i] > basis[largest]) {
            largest = i;
        }
    }
    rows[largest]->weight_ppb += total - assigned;
}

void distribute_by_weight(std::vector<MarketWeight*>& rows, std::int64_t total) {
    std::vector<std::int64_t> basis;
    basis.reserve(rows.size());
    for (const auto* row : rows) {
        basis.push_back(std::max<std::int64_t>(0, row->weight_ppb));
    }
    distribute(rows, total, basis);
}

void normalize_rows(std::vector<MarketWeight>& rows, const std::optional<std::string>& pinned) {
    if (rows.empty()) {
        return;
    }
    std::vector<MarketWeight*> fixed;
    std::vector<MarketWeight*> free;
    std::int64_t fixed_sum = 0;
    for (auto& row : rows) {
        if (row.locked || (pinned && row.market_id == *pinned)) {
            fixed.push_back(&row);
            fixed_sum += row.weight_ppb;
        } else {
            free.push_back(&row);
        }
    }

    if (free.empty() && pinned) {
        const auto unlocked = std::any_of(rows.begin(), rows.end(), [](const MarketWeight& row) { return !row.locked; });
        if (unlocked) {
            // The pinned market is the only unlocked one: it takes what the locked markets leave.
            normalize_rows(rows, std::nullopt);
            return;
        }
    }

    if (free.empty()) {
        std::vector<MarketWeight*> all;
        for (auto& row : rows) {
            all.push_back(&row);
        }
        distribute_by_weight(all, kWeightScale);
    } else if (fixed_sum >= kWeightScale) {
        distribute_by_weight(fixed, kWeightScale);
        for (auto* row : free) {
            row->weight_ppb = 0;
        }
    } else {
        distribute_by_weight(free, kWeightScale - fixed_sum);
    }
}

void persist(ledger::LedgerTransaction& txn, std::vector<MarketWeight>& rows) {
    for (auto& row : rows) {
        row.updated_at_ms = txn.timestamp_ms();
        txn.put_weight(row);
    }
}

std::size_t index_of(const std::vector<MarketWeight>& rows, const std::string& market_id) {
    for (std::size_t i = 0; i < rows.size(); ++i) {
        if (rows[i].market_id == market_id) {
            return i;
        }
    }
    ledger::throw_error(ledger::ErrorKind::InvalidState, "Market " + market_id + " is not open");
}

} // namespace

std::vector<MarketWeight> open_market_weights(const ledger::LedgerTransaction& txn) {
    std::vector<MarketWeight> rows;
    for (const auto& market : txn.markets()) {
        if (market.status != ledger::MarketStatus::Open) {
            continue;
        }
        if (auto weight = txn.find_weight(market.id)) {
            rows.push_back(std::move(*weight));
        } else {
            MarketWeight row;
            row.market_id = market.id;
            rows.push_back(std::move(row));
        }
    }
    return rows;
}

std::vector<MarketWeight> normalize_weights(ledger::LedgerTransaction& txn, const std::optional<std::string>& pinned) {
    auto rows = open_market_weights(txn);
    normalize_rows(rows, pinned);
    persist(txn, rows);
    return rows;
}

std::vector<MarketWeight> initialize_market_weights(ledger::LedgerTransaction& txn) {
    auto rows = open_market_weights(txn);
    if (rows.empty()) {
        return rows;
    }
    const auto equal_share = kWeightScale / static_cast<std::int64_t>(rows.size());
    std::size_t added = 0;
    for (auto& row : rows) {
        if (!txn.find_weight(row.market_id)) {
            row.weight_ppb = equal_share;
            ++added;
        }
    }
    normalize_rows(rows, std::nullopt);
    persist(txn, rows);
    if (added > 0) {
        std::clog << "[Weights] Initialized " << added << " market weights across "
                  << rows.size() << " open markets" << std::endl;
    }
    return rows;
}

std::vector<MarketWeight> set_market_weight(ledger::LedgerTransaction& txn,
                                            const std::string& market_id,
                                            double weight,
                                            bool locked) {
    if (!std::isfinite(weight)) {
        ledger::throw_error(ledger::ErrorKind::InvalidArgument, "Weight must be a finite number");
    }
    txn.require_market(market_id);
    initialize_market_weights(txn);
    auto rows = open_market_weights(txn);
    auto& target = rows[index_of(rows, market_id)];

    const auto new_weight = std::clamp<std::int64_t>(
        static_cast<std::int64_t>(std::llround(std::clamp(weight, 0.0, 1.0) * static_cast<double>(kWeightScale))),
        0, kWeightScale);
    const auto diff = new_weight - target.weight_ppb;
    target.weight_ppb = new_weight;
    target.locked = locked;

    if (!locked) {
        std::vector<MarketWeight*> others;
        std::int64_t others_sum = 0;
        for (auto& row : rows) {
            if (!row.locked && row.market_id != market_id) {
                others.push_back(&row);
                others_sum += row.weight_ppb;
            }
        }
        distribute_by_weight(others, std::max<std::int64_t>(0, others_sum - diff));
    }

    normalize_rows(rows, market_id);
    persist(txn, rows);
    std::clog << "[Weights] " << market_id << " -> " << new_weight << " ppb"
              << (locked ? " (locked)" : "") << std::endl;
    return rows;
}

std::vector<MarketWeight> set_weight_lock(ledger::LedgerTransaction& txn, const std::string& market_id, bool locked) {
    txn.require_market(market_id);
    initialize_market_weights(txn);
    auto rows = open_market_weights(txn);
    rows[index_of(rows, market_id)].locked = locked;
    normalize_rows(rows, std::nullopt);
    persist(txn, rows);
    return rows;
}

MarketWeight set_relative_odds(ledger::LedgerTransaction& txn, const std::string& market_id, double odds) {
    if (!std::isfinite(odds) || odds < 0.0) {
        ledger::throw_error(ledger::ErrorKind::InvalidArgument, "Relative odds must be a non-negative number");
    }
    txn.require_market(market_id);
    MarketWeight row;
    row.market_id = market_id;
    if (auto existing = txn.find_weight(market_id)) {
        row = *existing;
    }
    row.relative_odds = odds;
    row.updated_at_ms = txn.timestamp_ms();
    txn.put_weight(row);
    return row;
}

std::vector<MarketWeight> apply_relative_odds(ledger::LedgerTransaction& txn) {
    initialize_market_weights(txn);
    auto rows = open_market_weights(txn);

    std::vector<MarketWeight*> free;
    std::vector<std::int64_t> basis;
    std::int64_t locked_sum = 0;
    for (auto& row : rows) {
        if (row.locked) {
            locked_sum += row.weight_ppb;
        } else {
            free.push_back(&row);
            basis.push_back(static_cast<std::int64_t>(std::llround(row.relative_odds * 1e6)));
        }
    }
    distribute(free, std::max<std::int64_t>(0, kWeightScale - locked_sum), basis);

    normalize_rows(rows, std::nullopt);
    persist(txn, rows);
    std::clog << "[Weights] Applied relative odds to " << free.size() << " unlocked markets" << std::endl;
    return rows;
}

double market_weight(const ledger::LedgerTransaction& txn, const std::string& market_id) {
    const auto weight = txn.find_weight(market_id);
    return weight ? weight->fraction() : 0.0;
}

} // namespace liquidity
