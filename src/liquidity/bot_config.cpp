#include "liquidity/bot_config.hpp"

#include "ledger/errors.hpp"
#include "ledger/util.hpp"

#include <cmath>
#include <string>

namespace liquidity {

BotConfig BotConfig::from_env() {
    BotConfig config;
    config.bot_account_id = ledger::env_string("BINEX_BOT_ACCOUNT", config.bot_account_id);
    config.max_acceptable_loss = ledger::env_int("BINEX_MAX_LOSS", config.max_acceptable_loss);
    config.total_liquidity = ledger::env_int("BINEX_TOTAL_LIQUIDITY", config.total_liquidity);
    config.tier_width_percent = ledger::env_int("BINEX_TIER_WIDTH_PERCENT", config.tier_width_percent);
    config.global_multiplier = ledger::env_double("BINEX_GLOBAL_MULTIPLIER", config.global_multiplier);
    config.min_order_shares = ledger::env_int("BINEX_MIN_ORDER_SHARES", config.min_order_shares);
    config.is_active = ledger::env_bool("BINEX_BOT_ACTIVE", config.is_active);
    config.enforce_loss_cap = ledger::env_bool("BINEX_ENFORCE_LOSS_CAP", config.enforce_loss_cap);
    return config;
}

void BotConfig::validate() const {
    using ledger::ErrorKind;
    if (bot_account_id.empty()) {
        ledger::throw_error(ErrorKind::InvalidArgument, "Bot account id must not be empty");
    }
    if (max_acceptable_loss <= 0) {
        ledger::throw_error(ErrorKind::InvalidArgument, "Max acceptable loss must be positive");
    }
    if (max_acceptable_loss > kMaxLossCeiling) {
        ledger::throw_error(ErrorKind::InvalidArgument,
                            "Max acceptable loss must not exceed " + std::to_string(kMaxLossCeiling));
    }
    if (total_liquidity < 0) {
        ledger::throw_error(ErrorKind::InvalidArgument, "Total liquidity must not be negative");
    }
    if (tier_width_percent <= 0 || tier_width_percent > 100) {
        ledger::throw_error(ErrorKind::InvalidArgument, "Tier width must be within (0, 100] percent");
    }
    if (!std::isfinite(global_multiplier) || global_multiplier < 0.0) {
        ledger::throw_error(ErrorKind::InvalidArgument, "Global multiplier must be a non-negative number");
    }
    if (min_order_shares <= 0) {
        ledger::throw_error(ErrorKind::InvalidArgument, "Minimum order size must be positive");
    }
}

} // namespace liquidity
