#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ledger {

// Market weights are parts-per-billion so rebalancing stays exact.
constexpr std::int64_t kWeightScale = 1'000'000'000;

struct MarketWeight {
    std::string market_id;
    std::int64_t weight_ppb = 0;
    bool locked = false;
    double relative_odds = 1.0;
    std::int64_t updated_at_ms = 0;

    [[nodiscard]] double fraction() const {
        return static_cast<double>(weight_ppb) / static_cast<double>(kWeightScale);
    }
};

// A single rung of a normalized curve: YES price and its share of the budget.
struct CurvePoint {
    std::int64_t price = 0;
    double weight = 0.0;
};

enum class ShapeKind { Bell, Flat, Exponential, Logarithmic, Sigmoid, Parabolic, Custom };

struct BellParams {
    double mu = 200.0;
    double sigma = 150.0;
};

struct FlatParams {};

struct ExponentialParams {
    double decay = 0.008;
};

struct LogarithmicParams {};

struct SigmoidParams {
    double midpoint = 250.0;
    double steepness = 0.03;
};

struct ParabolicParams {
    double max_price = 550.0;
};

struct CustomParams {
    std::vector<double> weights;  // one per ladder price, any positive scale
};

using ShapeParams = std::variant<BellParams,
                                 FlatParams,
                                 ExponentialParams,
                                 LogarithmicParams,
                                 SigmoidParams,
                                 ParabolicParams,
                                 CustomParams>;

ShapeKind shape_kind(const ShapeParams& params);
const char* to_string(ShapeKind kind);
ShapeKind parse_shape_kind(const std::string& text);

struct CurveShape {
    std::string id;
    std::string name;
    ShapeParams params;
    std::vector<CurvePoint> points;
    bool is_default = false;
    std::int64_t updated_at_ms = 0;
};

struct DefaultCurve {};
struct DisabledCurve {};
struct ReplacedCurve {
    std::vector<CurvePoint> points;
};
struct MultipliedCurve {
    double factor = 1.0;
};

using MarketOverride = std::variant<DefaultCurve, DisabledCurve, ReplacedCurve, MultipliedCurve>;

const char* override_name(const MarketOverride& override_value);

} // namespace ledger
