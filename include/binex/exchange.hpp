#pragma once

#include "ledger/bot_tables.hpp"
#include "ledger/store.hpp"
#include "ledger/types.hpp"
#include "liquidity/bot_config.hpp"
#include "liquidity/bot_stats.hpp"
#include "liquidity/deployment.hpp"
#include "liquidity/liquidity_shaper.hpp"
#include "liquidity/pullback_controller.hpp"
#include "matching/matching_engine.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace binex {

struct ExchangeConfig {
    std::string journal_path = "data/binex_journal.jsonl";  // empty keeps the ledger in memory
    liquidity::BotConfig bot;

    static ExchangeConfig from_env();
};

struct DeployAllResult {
    std::vector<liquidity::DeploymentResult> markets;
    std::vector<std::string> skipped;  // disabled or failed, with the reason logged
    std::int64_t total_cost = 0;
    std::int64_t refunded = 0;
};

// Entry point for every operation. Each call is one ledger transaction that
// either commits in full or leaves no trace.
class Exchange {
public:
    explicit Exchange(ExchangeConfig config);

    Exchange(const Exchange&) = delete;
    Exchange& operator=(const Exchange&) = delete;

    // Replays the journal. Returns the number of transactions applied.
    std::size_t load();

    ledger::Account create_account(const std::string& account_id, std::int64_t opening_balance);
    ledger::Market create_market(const std::string& market_id, const std::string& title);
    ledger::Market close_market(const std::string& market_id);
    matching::MarketCancellationResult cancel_market(const std::string& market_id);

    matching::OrderResult place_order(const std::string& account_id,
                                      const std::string& market_id,
                                      ledger::Side side,
                                      std::int64_t price,
                                      std::int64_t shares);
    matching::CancelResult cancel_order(const std::string& account_id, const std::string& order_id);
    std::vector<matching::CancelResult> withdraw_all_orders(const std::string& account_id);
    matching::ResolutionResult resolve_market(const std::string& market_id, ledger::Outcome outcome);

    [[nodiscard]] ledger::Account get_account(const std::string& account_id) const;
    [[nodiscard]] ledger::Market get_market(const std::string& market_id) const;
    [[nodiscard]] std::vector<ledger::Market> list_markets() const;
    [[nodiscard]] ledger::Order get_order(const std::string& order_id) const;
    [[nodiscard]] std::vector<ledger::Order> orders_of_account(const std::string& account_id) const;
    [[nodiscard]] std::vector<ledger::Order> orders_in_market(const std::string& market_id) const;
    [[nodiscard]] std::vector<ledger::Position> positions_of_account(const std::string& account_id) const;
    [[nodiscard]] std::vector<ledger::Position> positions_in_market(const std::string& market_id) const;
    [[nodiscard]] std::vector<ledger::AuditEntry> audit_log(const std::string& account_id = {}) const;

    [[nodiscard]] ledger::ExposureSnapshot get_exposure() const;
    [[nodiscard]] liquidity::BotStatistics statistics() const;
    [[nodiscard]] std::optional<std::vector<liquidity::LadderRung>> compute_effective_curve(
        const std::string& market_id) const;

    liquidity::DeploymentResult deploy_market(const std::string& market_id, const std::string& funding_account_id);
    DeployAllResult deploy_all(const std::string& funding_account_id);
    [[nodiscard]] liquidity::DeploymentPreview preview_deployment(const std::string& funding_account_id) const;

    std::vector<ledger::MarketWeight> initialize_market_weights();
    std::vector<ledger::MarketWeight> set_market_weight(const std::string& market_id, double weight, bool locked);
    std::vector<ledger::MarketWeight> set_weight_lock(const std::string& market_id, bool locked);
    ledger::MarketWeight set_relative_odds(const std::string& market_id, double odds);
    std::vector<ledger::MarketWeight> apply_relative_odds();
    [[nodiscard]] std::vector<ledger::MarketWeight> market_weights() const;

    std::string save_curve_shape(const std::string& name, const ledger::ShapeParams& params);
    [[nodiscard]] std::vector<ledger::CurveShape> list_curve_shapes() const;
    [[nodiscard]] ledger::CurveShape get_curve_shape(const std::string& shape_id) const;
    ledger::CurveShape update_curve_shape(const std::string& shape_id,
                                          const ledger::ShapeParams& params,
                                          const std::optional<std::string>& name = std::nullopt);
    ledger::CurveShape set_default_curve_shape(const std::string& shape_id);
    void delete_curve_shape(const std::string& shape_id);
    ledger::CurveShape default_curve_shape();

    ledger::MarketOverride set_market_override(const std::string& market_id, ledger::MarketOverride override_value);
    [[nodiscard]] ledger::MarketOverride market_override(const std::string& market_id) const;

    [[nodiscard]] liquidity::BotConfig bot_config() const;
    // Changing the loss ceiling or the tier width re-runs the pullback on
    // resting bot orders.
    void update_bot_config(const liquidity::BotConfig& config);

private:
    ExchangeConfig config_;
    mutable ledger::LedgerStore store_;  // read-only transactions still take its lock
    matching::MatchingEngine engine_;
    liquidity::PullbackController pullback_;
};

} // namespace binex
