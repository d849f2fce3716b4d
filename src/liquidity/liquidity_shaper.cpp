#include "liquidity/liquidity_shaper.hpp"

#include "ledger/errors.hpp"
#include "liquidity/curve_shapes.hpp"
#include "liquidity/exposure.hpp"
#include "liquidity/market_weights.hpp"
#include "liquidity/shape_library.hpp"

#include <cmath>
#include <utility>
#include <variant>

namespace liquidity {

namespace {

constexpr double kSizeEpsilon = 1e-9;

} // namespace

std::optional<std::vector<LadderRung>> compute_effective_curve(const ledger::LedgerTransaction& txn,
                                                               const BotConfig& config,
                                                               const std::string& market_id) {
    const auto market = txn.get_market(market_id);
    const auto override_value = txn.market_override(market_id);
    if (std::holds_alternative<ledger::DisabledCurve>(override_value)) {
        return std::nullopt;
    }

    std::vector<LadderRung> ladder;
    if (market.status != ledger::MarketStatus::Open) {
        return ladder;
    }

    double override_multiplier = 1.0;
    std::vector<ledger::CurvePoint> curve;
    if (const auto* replaced = std::get_if<ledger::ReplacedCurve>(&override_value)) {
        curve = replaced->points;
    } else {
        curve = default_curve(txn);
        if (const auto* multiplied = std::get_if<ledger::MultipliedCurve>(&override_value)) {
            override_multiplier = multiplied->factor;
        }
    }

    const auto exposure = compute_exposure(txn, config.bot_account_id);
    const double scale = static_cast<double>(config.total_liquidity) *
                         market_weight(txn, market_id) *
                         config.global_multiplier *
                         override_multiplier *
                         pullback_ratio(exposure, config.max_acceptable_loss);

    for (const auto& point : curve) {
        const auto shares = static_cast<std::int64_t>(std::floor(scale * point.weight + kSizeEpsilon));
        if (shares < config.min_order_shares || shares <= 0) {
            continue;
        }
        ladder.push_back({point.price, ledger::kPayoutPerShare - point.price, shares});
    }
    return ladder;
}

ledger::MarketOverride set_market_override(ledger::LedgerTransaction& txn,
                                           const std::string& market_id,
                                           ledger::MarketOverride override_value) {
    txn.require_market(market_id);
    if (auto* replaced = std::get_if<ledger::ReplacedCurve>(&override_value)) {
        replaced->points = normalize_points(std::move(replaced->points));
    } else if (const auto* multiplied = std::get_if<ledger::MultipliedCurve>(&override_value)) {
        if (!std::isfinite(multiplied->factor) || multiplied->factor < 0.0) {
            ledger::throw_error(ledger::ErrorKind::InvalidArgument, "Override factor must be a non-negative number");
        }
    }
    txn.put_override(market_id, override_value);
    return override_value;
}

} // namespace liquidity
