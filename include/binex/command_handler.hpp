#pragma once

#include "binex/exchange.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <unordered_map>

namespace binex {

// Maps {"op": "...", ...} requests onto Exchange calls. Responses are
// {"ok": true, "result": ...} or {"ok": false, "error": kind, "message": ...}.
// A request "id" is echoed back.
class CommandHandler {
public:
    explicit CommandHandler(Exchange& exchange);

    nlohmann::json handle(const nlohmann::json& request);

    // Parses one line and returns the serialized response.
    std::string handle_line(const std::string& line);

private:
    using Handler = std::function<nlohmann::json(const nlohmann::json&)>;

    void register_handlers();

    Exchange& exchange_;
    std::unordered_map<std::string, Handler> handlers_;
};

} // namespace binex
