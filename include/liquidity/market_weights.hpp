#pragma once

#include "ledger/bot_tables.hpp"
#include "ledger/store.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace liquidity {

// Weights of open markets always sum to exactly kWeightScale after any of
// the mutating calls below. Each returns the open markets' weights.

// Gives every open market without a weight row an equal share, then renormalizes.
std::vector<ledger::MarketWeight> initialize_market_weights(ledger::LedgerTransaction& txn);

// Sets one market's weight (a fraction, clamped to [0, 1]). Unlocked markets
// absorb the difference proportionally; locking pins the value and renormalizes
// the rest around it.
std::vector<ledger::MarketWeight> set_market_weight(ledger::LedgerTransaction& txn,
                                                    const std::string& market_id,
                                                    double weight,
                                                    bool locked);

std::vector<ledger::MarketWeight> set_weight_lock(ledger::LedgerTransaction& txn,
                                                  const std::string& market_id,
                                                  bool locked);

ledger::MarketWeight set_relative_odds(ledger::LedgerTransaction& txn, const std::string& market_id, double odds);

// Redistributes the unlocked budget in proportion to each market's relative odds.
std::vector<ledger::MarketWeight> apply_relative_odds(ledger::LedgerTransaction& txn);

std::vector<ledger::MarketWeight> normalize_weights(ledger::LedgerTransaction& txn,
                                                    const std::optional<std::string>& pinned = std::nullopt);

std::vector<ledger::MarketWeight> open_market_weights(const ledger::LedgerTransaction& txn);

// Weight of a market as a fraction; 0 when it has none.
double market_weight(const ledger::LedgerTransaction& txn, const std::string& market_id);

} // namespace liquidity
