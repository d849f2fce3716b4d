#include "liquidity/curve_shapes.hpp"

#include "ledger/errors.hpp"
#include "ledger/types.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <variant>

namespace liquidity {

namespace {

using ledger::ErrorKind;

// Un-normalized weight of one ladder price for each shape kind.
struct ShapeWeight {
    double price;
    std::size_t index;

    double operator()(const ledger::BellParams& p) const {
        const double z = (price - p.mu) / p.sigma;
        return std::exp(-0.5 * z * z);
    }
    double operator()(const ledger::FlatParams&) const { return 1.0; }
    double operator()(const ledger::ExponentialParams& p) const { return std::exp(-p.decay * price); }
    double operator()(const ledger::LogarithmicParams&) const {
        return std::log(static_cast<double>(ledger::kPayoutPerShare + 1) - price);
    }
    // Inverted so cheaper YES prices carry more weight.
    double operator()(const ledger::SigmoidParams& p) const {
        return 1.0 / (1.0 + std::exp(p.steepness * (price - p.midpoint)));
    }
    double operator()(const ledger::ParabolicParams& p) const {
        const double distance = std::max(0.0, p.max_price - price);
        return distance * distance;
    }
    double operator()(const ledger::CustomParams& p) const { return p.weights.at(index); }
};

[[noreturn]] void invalid(const std::string& message) {
    ledger::throw_error(ErrorKind::InvalidArgument, message);
}

} // namespace

void validate_shape_params(const ledger::ShapeParams& params) {
    if (const auto* bell = std::get_if<ledger::BellParams>(&params)) {
        if (!std::isfinite(bell->mu) || !std::isfinite(bell->sigma) || bell->sigma <= 0.0) {
            invalid("Bell shape needs a finite mu and a positive sigma");
        }
    } else if (const auto* exponential = std::get_if<ledger::ExponentialParams>(&params)) {
        if (!std::isfinite(exponential->decay) || exponential->decay < 0.0) {
            invalid("Exponential decay must be a non-negative number");
        }
    } else if (const auto* sigmoid = std::get_if<ledger::SigmoidParams>(&params)) {
        if (!std::isfinite(sigmoid->midpoint) || !std::isfinite(sigmoid->steepness)) {
            invalid("Sigmoid midpoint and steepness must be finite");
        }
    } else if (const auto* parabolic = std::get_if<ledger::ParabolicParams>(&params)) {
        if (!std::isfinite(parabolic->max_price) || parabolic->max_price <= kLadderPrices.front()) {
            invalid("Parabolic max price must exceed the lowest ladder price");
        }
    } else if (const auto* custom = std::get_if<ledger::CustomParams>(&params)) {
        if (custom->weights.size() != kLadderPrices.size()) {
            invalid("Custom shape needs " + std::to_string(kLadderPrices.size()) + " weights, got " +
                    std::to_string(custom->weights.size()));
        }
        double total = 0.0;
        for (const auto weight : custom->weights) {
            if (!std::isfinite(weight) || weight < 0.0) {
                invalid("Custom shape weights must be non-negative numbers");
            }
            total += weight;
        }
        if (total <= 0.0) {
            invalid("Custom shape weights must not all be zero");
        }
    }
}

std::vector<ledger::CurvePoint> generate_shape(const ledger::ShapeParams& params) {
    validate_shape_params(params);
    std::vector<ledger::CurvePoint> points;
    points.reserve(kLadderPrices.size());
    for (std::size_t i = 0; i < kLadderPrices.size(); ++i) {
        const auto price = kLadderPrices[i];
        points.push_back({price, std::visit(ShapeWeight{static_cast<double>(price), i}, params)});
    }
    return normalize_points(std::move(points));
}

std::vector<ledger::CurvePoint> normalize_points(std::vector<ledger::CurvePoint> points) {
    double total = 0.0;
    for (const auto& point : points) {
        if (point.price < ledger::kMinPrice || point.price > ledger::kMaxPrice) {
            invalid("Curve price " + std::to_string(point.price) + " is outside the tradeable range");
        }
        if (!std::isfinite(point.weight) || point.weight < 0.0) {
            invalid("Curve weights must be non-negative numbers");
        }
        total += point.weight;
    }
    if (points.empty() || total <= 0.0) {
        invalid("Curve has no weight to normalize");
    }
    for (auto& point : points) {
        point.weight /= total;
    }
    return points;
}

} // namespace liquidity
