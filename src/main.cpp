#include "binex/command_handler.hpp"
#include "binex/exchange.hpp"
#include "ledger/util.hpp"

#include <exception>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    const std::string env_path = argc > 1 ? argv[1] : ".env";
    if (ledger::load_env_file(env_path)) {
        std::clog << "[Config] Loaded " << env_path << std::endl;
    }

    try {
        auto config = binex::ExchangeConfig::from_env();
        binex::Exchange exchange{config};
        exchange.load();

        std::clog << "[Exchange] Ready (journal=" << (config.journal_path.empty() ? "<memory>" : config.journal_path)
                  << ", bot=" << config.bot.bot_account_id
                  << ", max loss=" << config.bot.max_acceptable_loss
                  << ", active=" << std::boolalpha << config.bot.is_active << ")" << std::endl;

        binex::CommandHandler handler{exchange};
        std::string line;
        while (std::getline(std::cin, line)) {
            if (ledger::trim(line).empty()) {
                continue;
            }
            std::cout << handler.handle_line(line) << std::endl;
        }
    } catch (const std::exception& ex) {
        std::cerr << "[Exchange] Fatal: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
