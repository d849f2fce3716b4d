#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ledger {

enum class ErrorKind {
    InvalidArgument,
    NotFound,
    InvalidState,
    Forbidden,
    InsufficientFunds,
    InvariantViolation
};

const char* to_string(ErrorKind kind);

class LedgerError : public std::runtime_error {
public:
    LedgerError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

    // True for errors a caller can act on (bad request, wrong state, funds).
    [[nodiscard]] bool is_actionable() const noexcept {
        return kind_ != ErrorKind::InvariantViolation;
    }

private:
    ErrorKind kind_;
};

class InsufficientFunds : public LedgerError {
public:
    InsufficientFunds(std::int64_t required, std::int64_t available)
        : LedgerError(ErrorKind::InsufficientFunds,
                      "Insufficient balance. Need " + std::to_string(required) +
                      ", have " + std::to_string(available)),
          required_(required),
          available_(available) {}

    [[nodiscard]] std::int64_t required() const noexcept { return required_; }
    [[nodiscard]] std::int64_t available() const noexcept { return available_; }

private:
    std::int64_t required_;
    std::int64_t available_;
};

[[noreturn]] inline void throw_error(ErrorKind kind, const std::string& message) {
    throw LedgerError(kind, message);
}

} // namespace ledger
