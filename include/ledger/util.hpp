#pragma once

#include <cstdint>
#include <string>

namespace ledger {

std::string trim(std::string value);

std::string to_lower_copy(std::string value);

// Loads KEY=VALUE lines into the process environment. Missing file is not an error.
bool load_env_file(const std::string& path);

std::string env_string(const char* name, const std::string& fallback);
std::int64_t env_int(const char* name, std::int64_t fallback);
double env_double(const char* name, double fallback);
bool env_bool(const char* name, bool fallback);

std::int64_t now_ms();

// Builds ids such as "ord-000042" from a prefix and a store sequence number.
std::string make_id(const std::string& prefix, std::uint64_t sequence);

} // namespace ledger
