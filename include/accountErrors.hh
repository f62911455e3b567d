// Header file for the account error taxonomy

#ifndef ACCOUNT_ERRORS_H
#define ACCOUNT_ERRORS_H

#include <stdexcept>
#include <string>

enum class ErrorKind {
    InvalidAmount,
    InsufficientFunds,
    OverdraftExceeded,
    LockPeriodActive,
    DuplicateAccount,
    AccountNotFound
};

// Base of every recoverable account/bank failure
// A throw always happens before any balance is touched
class AccountError : public std::runtime_error {
public:
    AccountError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class InvalidAmount : public AccountError {
public:
    explicit InvalidAmount(const std::string& what)
        : AccountError(ErrorKind::InvalidAmount, what) {}
};

class InsufficientFunds : public AccountError {
public:
    InsufficientFunds() : AccountError(ErrorKind::InsufficientFunds, "Insufficient funds.") {}
};

class OverdraftExceeded : public AccountError {
public:
    OverdraftExceeded() : AccountError(ErrorKind::OverdraftExceeded, "Exceeds overdraft limit.") {}
};

class LockPeriodActive : public AccountError {
public:
    LockPeriodActive()
        : AccountError(ErrorKind::LockPeriodActive,
                       "Withdrawal not allowed before lock-in period ends.") {}
};

class DuplicateAccount : public AccountError {
public:
    explicit DuplicateAccount(const std::string& id)
        : AccountError(ErrorKind::DuplicateAccount,
                       "Account with this number already exists: " + id) {}
};

class AccountNotFound : public AccountError {
public:
    AccountNotFound() : AccountError(ErrorKind::AccountNotFound, "One or both accounts not found.") {}
};

#endif
