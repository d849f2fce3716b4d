#pragma once

#include "ledger/bot_tables.hpp"

#include <array>
#include <cstdint>
#include <vector>

namespace liquidity {

// YES prices the bot quotes, per 1000. The bot offers NO at 1000 - price.
constexpr std::array<std::int64_t, 10> kLadderPrices = {50, 100, 150, 200, 250, 300, 350, 400, 450, 500};

// Throws ledger::LedgerError(InvalidArgument) for unusable parameters.
void validate_shape_params(const ledger::ShapeParams& params);

// Evaluates the shape over kLadderPrices and normalizes the weights to sum 1.
std::vector<ledger::CurvePoint> generate_shape(const ledger::ShapeParams& params);

// Scales weights to sum 1. Rejects negative weights and an all-zero curve.
std::vector<ledger::CurvePoint> normalize_points(std::vector<ledger::CurvePoint> points);

} // namespace liquidity
