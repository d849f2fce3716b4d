#pragma once

#include "ledger/bot_tables.hpp"
#include "ledger/store.hpp"

#include <optional>
#include <string>
#include <vector>

namespace liquidity {

inline constexpr const char* kDefaultShapeName = "Default Bell";

// Named curve shapes with exactly one default. Points are regenerated
// whenever the parameters change.
ledger::CurveShape save_shape(ledger::LedgerTransaction& txn,
                              const std::string& name,
                              const ledger::ShapeParams& params);

std::vector<ledger::CurveShape> list_shapes(const ledger::LedgerTransaction& txn);

ledger::CurveShape get_shape(const ledger::LedgerTransaction& txn, const std::string& shape_id);

ledger::CurveShape update_shape(ledger::LedgerTransaction& txn,
                                const std::string& shape_id,
                                const ledger::ShapeParams& params,
                                const std::optional<std::string>& name = std::nullopt);

ledger::CurveShape set_default_shape(ledger::LedgerTransaction& txn, const std::string& shape_id);

// The default shape cannot be deleted.
void delete_shape(ledger::LedgerTransaction& txn, const std::string& shape_id);

// Returns the default shape, creating "Default Bell" when none exists.
ledger::CurveShape ensure_default_shape(ledger::LedgerTransaction& txn);

// Points of the default shape, or the default bell when none is saved yet.
std::vector<ledger::CurvePoint> default_curve(const ledger::LedgerTransaction& txn);

} // namespace liquidity
