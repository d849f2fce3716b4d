#include "ledger/serialization.hpp"
#include "ledger/errors.hpp"
#include "ledger/store.hpp"

#include <string>

namespace ledger {

namespace {

template <typename T>
T json_value_or(const nlohmann::json& j, const char* key, T fallback) {
    if (!j.contains(key) || j[key].is_null()) {
        return fallback;
    }
    try {
        return j[key].get<T>();
    } catch (const nlohmann::json::exception&) {
        return fallback;
    }
}

template <typename T>
void put_optional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

template <typename T>
std::optional<T> get_optional(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<T>();
}

template <typename Row>
void read_rows(const nlohmann::json& j, const char* key, std::map<std::string, Row>& out) {
    if (!j.contains(key)) {
        return;
    }
    for (const auto& item : j[key]) {
        auto row = item.get<Row>();
        out[row.id] = std::move(row);
    }
}

template <typename Row>
nlohmann::json write_rows(const std::map<std::string, Row>& rows) {
    auto array = nlohmann::json::array();
    for (const auto& [id, row] : rows) {
        array.push_back(row);
    }
    return array;
}

} // namespace

void to_json(nlohmann::json& j, const Account& account) {
    j = nlohmann::json{{"id", account.id}, {"balance", account.balance}};
}

void from_json(const nlohmann::json& j, Account& account) {
    account.id = j.at("id").get<std::string>();
    account.balance = json_value_or<std::int64_t>(j, "balance", 0);
}

void to_json(nlohmann::json& j, const Market& market) {
    j = nlohmann::json{
        {"id", market.id},
        {"title", market.title},
        {"status", to_string(market.status)},
        {"createdAt", market.created_at_ms},
        {"resolvedAt", market.resolved_at_ms},
    };
    if (market.resolution) {
        j["resolution"] = to_string(*market.resolution);
    } else {
        j["resolution"] = nullptr;
    }
}

void from_json(const nlohmann::json& j, Market& market) {
    market.id = j.at("id").get<std::string>();
    market.title = json_value_or<std::string>(j, "title", "");
    market.status = parse_market_status(json_value_or<std::string>(j, "status", "open"));
    const auto resolution = get_optional<std::string>(j, "resolution");
    market.resolution = resolution ? std::optional<Outcome>(parse_outcome(*resolution)) : std::nullopt;
    market.created_at_ms = json_value_or<std::int64_t>(j, "createdAt", 0);
    market.resolved_at_ms = json_value_or<std::int64_t>(j, "resolvedAt", 0);
}

void to_json(nlohmann::json& j, const Order& order) {
    j = nlohmann::json{
        {"id", order.id},
        {"account", order.account_id},
        {"market", order.market_id},
        {"side", to_string(order.side)},
        {"price", order.price},
        {"shares", order.shares},
        {"filled", order.filled},
        {"status", to_string(order.status)},
        {"seq", order.sequence},
        {"createdAt", order.created_at_ms},
        {"updatedAt", order.updated_at_ms},
    };
}

void from_json(const nlohmann::json& j, Order& order) {
    order.id = j.at("id").get<std::string>();
    order.account_id = j.at("account").get<std::string>();
    order.market_id = j.at("market").get<std::string>();
    order.side = parse_side(j.at("side").get<std::string>());
    order.price = j.at("price").get<std::int64_t>();
    order.shares = j.at("shares").get<std::int64_t>();
    order.filled = json_value_or<std::int64_t>(j, "filled", 0);
    order.status = parse_order_status(json_value_or<std::string>(j, "status", "open"));
    order.sequence = json_value_or<std::uint64_t>(j, "seq", 0);
    order.created_at_ms = json_value_or<std::int64_t>(j, "createdAt", 0);
    order.updated_at_ms = json_value_or<std::int64_t>(j, "updatedAt", 0);
}

void to_json(nlohmann::json& j, const Position& position) {
    j = nlohmann::json{
        {"id", position.id},
        {"market", position.market_id},
        {"yesAccount", position.yes_account_id},
        {"noAccount", position.no_account_id},
        {"yesOrder", position.yes_order_id},
        {"noOrder", position.no_order_id},
        {"tradePrice", position.trade_price},
        {"shares", position.shares},
        {"status", to_string(position.status)},
        {"seq", position.sequence},
        {"createdAt", position.created_at_ms},
        {"settledAt", position.settled_at_ms},
    };
    put_optional(j, "winner", position.winner_account_id);
    put_optional(j, "parent", position.parent_id);
}

void from_json(const nlohmann::json& j, Position& position) {
    position.id = j.at("id").get<std::string>();
    position.market_id = j.at("market").get<std::string>();
    position.yes_account_id = j.at("yesAccount").get<std::string>();
    position.no_account_id = j.at("noAccount").get<std::string>();
    position.yes_order_id = json_value_or<std::string>(j, "yesOrder", "");
    position.no_order_id = json_value_or<std::string>(j, "noOrder", "");
    position.trade_price = j.at("tradePrice").get<std::int64_t>();
    position.shares = j.at("shares").get<std::int64_t>();
    position.status = parse_position_status(json_value_or<std::string>(j, "status", "active"));
    position.winner_account_id = get_optional<std::string>(j, "winner");
    position.parent_id = get_optional<std::string>(j, "parent");
    position.sequence = json_value_or<std::uint64_t>(j, "seq", 0);
    position.created_at_ms = json_value_or<std::int64_t>(j, "createdAt", 0);
    position.settled_at_ms = json_value_or<std::int64_t>(j, "settledAt", 0);
}

void to_json(nlohmann::json& j, const ExposureSnapshot& snapshot) {
    j = nlohmann::json{
        {"totalAtRisk", snapshot.total_at_risk},
        {"tier", snapshot.tier},
        {"updatedAt", snapshot.updated_at_ms},
    };
    put_optional(j, "lastPullbackAt", snapshot.last_pullback_at_ms);
}

void from_json(const nlohmann::json& j, ExposureSnapshot& snapshot) {
    snapshot.total_at_risk = json_value_or<std::int64_t>(j, "totalAtRisk", 0);
    snapshot.tier = json_value_or<std::int64_t>(j, "tier", 0);
    snapshot.last_pullback_at_ms = get_optional<std::int64_t>(j, "lastPullbackAt");
    snapshot.updated_at_ms = json_value_or<std::int64_t>(j, "updatedAt", 0);
}

void to_json(nlohmann::json& j, const AuditEntry& entry) {
    j = nlohmann::json{
        {"seq", entry.sequence},
        {"kind", to_string(entry.kind)},
        {"account", entry.account_id},
        {"amount", entry.amount},
        {"balanceAfter", entry.balance_after},
        {"reference", entry.reference_id},
        {"details", entry.details},
        {"time", entry.timestamp_ms},
    };
}

void from_json(const nlohmann::json& j, AuditEntry& entry) {
    entry.sequence = json_value_or<std::uint64_t>(j, "seq", 0);
    entry.kind = parse_audit_kind(j.at("kind").get<std::string>());
    entry.account_id = json_value_or<std::string>(j, "account", "");
    entry.amount = json_value_or<std::int64_t>(j, "amount", 0);
    entry.balance_after = json_value_or<std::int64_t>(j, "balanceAfter", 0);
    entry.reference_id = json_value_or<std::string>(j, "reference", "");
    entry.details = json_value_or<std::string>(j, "details", "");
    entry.timestamp_ms = json_value_or<std::int64_t>(j, "time", 0);
}

void to_json(nlohmann::json& j, const MarketWeight& weight) {
    j = nlohmann::json{
        {"market", weight.market_id},
        {"weightPpb", weight.weight_ppb},
        {"locked", weight.locked},
        {"relativeOdds", weight.relative_odds},
        {"updatedAt", weight.updated_at_ms},
    };
}

void from_json(const nlohmann::json& j, MarketWeight& weight) {
    weight.market_id = j.at("market").get<std::string>();
    weight.weight_ppb = json_value_or<std::int64_t>(j, "weightPpb", 0);
    weight.locked = json_value_or<bool>(j, "locked", false);
    weight.relative_odds = json_value_or<double>(j, "relativeOdds", 1.0);
    weight.updated_at_ms = json_value_or<std::int64_t>(j, "updatedAt", 0);
}

void to_json(nlohmann::json& j, const CurvePoint& point) {
    j = nlohmann::json{{"price", point.price}, {"weight", point.weight}};
}

void from_json(const nlohmann::json& j, CurvePoint& point) {
    point.price = j.at("price").get<std::int64_t>();
    point.weight = j.at("weight").get<double>();
}

void to_json(nlohmann::json& j, const ShapeParams& params) {
    j = nlohmann::json{{"type", to_string(shape_kind(params))}};
    if (const auto* bell = std::get_if<BellParams>(&params)) {
        j["mu"] = bell->mu;
        j["sigma"] = bell->sigma;
    } else if (const auto* exponential = std::get_if<ExponentialParams>(&params)) {
        j["decay"] = exponential->decay;
    } else if (const auto* sigmoid = std::get_if<SigmoidParams>(&params)) {
        j["midpoint"] = sigmoid->midpoint;
        j["steepness"] = sigmoid->steepness;
    } else if (const auto* parabolic = std::get_if<ParabolicParams>(&params)) {
        j["maxPrice"] = parabolic->max_price;
    } else if (const auto* custom = std::get_if<CustomParams>(&params)) {
        j["weights"] = custom->weights;
    }
}

void from_json(const nlohmann::json& j, ShapeParams& params) {
    switch (parse_shape_kind(j.at("type").get<std::string>())) {
        case ShapeKind::Bell: {
            BellParams bell;
            bell.mu = json_value_or<double>(j, "mu", bell.mu);
            bell.sigma = json_value_or<double>(j, "sigma", bell.sigma);
            params = bell;
            break;
        }
        case ShapeKind::Flat:
            params = FlatParams{};
            break;
        case ShapeKind::Exponential: {
            ExponentialParams exponential;
            exponential.decay = json_value_or<double>(j, "decay", exponential.decay);
            params = exponential;
            break;
        }
        case ShapeKind::Logarithmic:
            params = LogarithmicParams{};
            break;
        case ShapeKind::Sigmoid: {
            SigmoidParams sigmoid;
            sigmoid.midpoint = json_value_or<double>(j, "midpoint", sigmoid.midpoint);
            sigmoid.steepness = json_value_or<double>(j, "steepness", sigmoid.steepness);
            params = sigmoid;
            break;
        }
        case ShapeKind::Parabolic: {
            ParabolicParams parabolic;
            parabolic.max_price = json_value_or<double>(j, "maxPrice", parabolic.max_price);
            params = parabolic;
            break;
        }
        case ShapeKind::Custom: {
            CustomParams custom;
            if (!j.contains("weights") || !j["weights"].is_array()) {
                throw_error(ErrorKind::InvalidArgument, "Custom shape requires a weights array");
            }
            custom.weights = j["weights"].get<std::vector<double>>();
            params = custom;
            break;
        }
    }
}

void to_json(nlohmann::json& j, const CurveShape& shape) {
    j = nlohmann::json{
        {"id", shape.id},
        {"name", shape.name},
        {"params", shape.params},
        {"points", shape.points},
        {"isDefault", shape.is_default},
        {"updatedAt", shape.updated_at_ms},
    };
}

void from_json(const nlohmann::json& j, CurveShape& shape) {
    shape.id = j.at("id").get<std::string>();
    shape.name = json_value_or<std::string>(j, "name", "");
    shape.params = j.at("params").get<ShapeParams>();
    shape.points = json_value_or<std::vector<CurvePoint>>(j, "points", {});
    shape.is_default = json_value_or<bool>(j, "isDefault", false);
    shape.updated_at_ms = json_value_or<std::int64_t>(j, "updatedAt", 0);
}

void to_json(nlohmann::json& j, const MarketOverride& override_value) {
    j = nlohmann::json{{"type", override_name(override_value)}};
    if (const auto* replaced = std::get_if<ReplacedCurve>(&override_value)) {
        j["points"] = replaced->points;
    } else if (const auto* multiplied = std::get_if<MultipliedCurve>(&override_value)) {
        j["factor"] = multiplied->factor;
    }
}

void from_json(const nlohmann::json& j, MarketOverride& override_value) {
    const auto type = j.at("type").get<std::string>();
    if (type == "default") {
        override_value = DefaultCurve{};
    } else if (type == "disable") {
        override_value = DisabledCurve{};
    } else if (type == "replace") {
        override_value = ReplacedCurve{j.at("points").get<std::vector<CurvePoint>>()};
    } else if (type == "multiply") {
        override_value = MultipliedCurve{j.at("factor").get<double>()};
    } else {
        throw_error(ErrorKind::InvalidArgument, "Unknown curve override '" + type + "'");
    }
}

void to_json(nlohmann::json& j, const LedgerChanges& changes) {
    j = nlohmann::json{
        {"seq", changes.sequence},
        {"time", changes.committed_at_ms},
        {"accounts", write_rows(changes.accounts)},
        {"markets", write_rows(changes.markets)},
        {"orders", write_rows(changes.orders)},
        {"positions", write_rows(changes.positions)},
        {"shapes", write_rows(changes.shapes)},
        {"removedShapes", changes.removed_shapes},
        {"audit", changes.audit},
    };

    auto weights = nlohmann::json::array();
    for (const auto& [market_id, weight] : changes.weights) {
        weights.push_back(weight);
    }
    j["weights"] = std::move(weights);

    auto overrides = nlohmann::json::object();
    for (const auto& [market_id, override_value] : changes.overrides) {
        overrides[market_id] = override_value;
    }
    j["overrides"] = std::move(overrides);

    put_optional(j, "exposure", changes.exposure);
}

void from_json(const nlohmann::json& j, LedgerChanges& changes) {
    changes = LedgerChanges{};
    changes.sequence = json_value_or<std::uint64_t>(j, "seq", 0);
    changes.committed_at_ms = json_value_or<std::int64_t>(j, "time", 0);
    read_rows(j, "accounts", changes.accounts);
    read_rows(j, "markets", changes.markets);
    read_rows(j, "orders", changes.orders);
    read_rows(j, "positions", changes.positions);
    read_rows(j, "shapes", changes.shapes);
    changes.removed_shapes = json_value_or<std::vector<std::string>>(j, "removedShapes", {});
    if (j.contains("weights")) {
        for (const auto& item : j["weights"]) {
            auto weight = item.get<MarketWeight>();
            changes.weights[weight.market_id] = std::move(weight);
        }
    }
    if (j.contains("overrides")) {
        for (const auto& [market_id, item] : j["overrides"].items()) {
            changes.overrides[market_id] = item.get<MarketOverride>();
        }
    }
    changes.exposure = get_optional<ExposureSnapshot>(j, "exposure");
    if (j.contains("audit")) {
        changes.audit = j["audit"].get<std::vector<AuditEntry>>();
    }
}

} // namespace ledger
