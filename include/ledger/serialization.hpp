#pragma once

#include "ledger/bot_tables.hpp"
#include "ledger/types.hpp"

#include <nlohmann/json.hpp>

namespace ledger {

struct LedgerChanges;

void to_json(nlohmann::json& j, const Account& account);
void from_json(const nlohmann::json& j, Account& account);

void to_json(nlohmann::json& j, const Market& market);
void from_json(const nlohmann::json& j, Market& market);

void to_json(nlohmann::json& j, const Order& order);
void from_json(const nlohmann::json& j, Order& order);

void to_json(nlohmann::json& j, const Position& position);
void from_json(const nlohmann::json& j, Position& position);

void to_json(nlohmann::json& j, const ExposureSnapshot& snapshot);
void from_json(const nlohmann::json& j, ExposureSnapshot& snapshot);

void to_json(nlohmann::json& j, const AuditEntry& entry);
void from_json(const nlohmann::json& j, AuditEntry& entry);

void to_json(nlohmann::json& j, const MarketWeight& weight);
void from_json(const nlohmann::json& j, MarketWeight& weight);

void to_json(nlohmann::json& j, const CurvePoint& point);
void from_json(const nlohmann::json& j, CurvePoint& point);

// Shape params serialize as {"type": "...", ...typed fields}.
void to_json(nlohmann::json& j, const ShapeParams& params);
void from_json(const nlohmann::json& j, ShapeParams& params);

void to_json(nlohmann::json& j, const CurveShape& shape);
void from_json(const nlohmann::json& j, CurveShape& shape);

void to_json(nlohmann::json& j, const MarketOverride& override_value);
void from_json(const nlohmann::json& j, MarketOverride& override_value);

void to_json(nlohmann::json& j, const LedgerChanges& changes);
void from_json(const nlohmann::json& j, LedgerChanges& changes);

} // namespace ledger
