// Implementation of the Account hierarchy

#include "../include/account.hh"
#include "../include/accountErrors.hh"
#include "../include/visitor.hh"
#include <cmath>
#include <sstream>
#include <stdexcept>

const char* to_string(Account::Kind kind) {
    switch (kind) {
        case Account::Kind::Basic:        return "Basic";
        case Account::Kind::Savings:      return "Savings";
        case Account::Kind::Current:      return "Current";
        case Account::Kind::FixedDeposit: return "Fixed Deposit";
    }
    return "Unknown";
}

// ============================================================================
// BASE ACCOUNT
// ============================================================================

Cents Account::require_positive(double amount, const char* what) {
    Cents cents = amount > 0.0 ? to_cents(amount) : 0;
    if (cents <= 0) {
        throw InvalidAmount(std::string(what) + " amount must be positive.");
    }
    return cents;
}

void Account::deposit(double amount) {
    Cents cents = require_positive(amount, "Deposit");
    credit(cents);
    out() << "[" << holder_ << "] Deposited " << format_money(cents) << std::endl;
}

void Account::withdraw(double amount) {
    Cents cents = require_positive(amount, "Withdrawal");
    if (cents > balance_) {
        throw InsufficientFunds();
    }
    debit(cents);
    out() << "[" << holder_ << "] Withdrew " << format_money(cents) << std::endl;
}

std::string Account::describe() const {
    std::ostringstream text;
    text << "Account Number: " << id_ << "\n"
        << "Account Holder: " << holder_ << "\n"
        << "Balance: " << format_money(balance_);
    return text.str();
}

void BasicAccount::accept(AccountVisitor& visitor) {
    visitor.visit(*this);
}

void BasicAccount::accept(ConstAccountVisitor& visitor) const {
    visitor.visit(*this);
}

// ============================================================================
// SAVINGS
// ============================================================================

void SavingsAccount::accept(AccountVisitor& visitor) {
    visitor.visit(*this);
}

void SavingsAccount::accept(ConstAccountVisitor& visitor) const {
    visitor.visit(*this);
}

double SavingsAccount::apply_interest() {
    Cents interest = static_cast<Cents>(
        std::llround(static_cast<double>(get_balance_cents()) * interest_rate_ / 100.0));
    credit(interest);
    out() << "[" << get_holder() << "] Interest applied: " << format_money(interest) << std::endl;
    return to_amount(interest);
}

std::string SavingsAccount::describe() const {
    std::ostringstream text;
    text << Account::describe() << "\n"
        << "Account Type: " << to_string(kind()) << "\n"
        << "Interest Rate: " << format_number(interest_rate_) << "%";
    return text.str();
}

// ============================================================================
// CURRENT
// ============================================================================

void CurrentAccount::accept(AccountVisitor& visitor) {
    visitor.visit(*this);
}

void CurrentAccount::accept(ConstAccountVisitor& visitor) const {
    visitor.visit(*this);
}

void CurrentAccount::withdraw(double amount) {
    Cents cents = require_positive(amount, "Withdrawal");
    if (cents > get_balance_cents() + overdraft_limit_) {
        throw OverdraftExceeded();
    }
    debit(cents);
    out() << "[" << get_holder() << "] Withdrew " << format_money(cents)
          << " (Overdraft Allowed)" << std::endl;
}

std::string CurrentAccount::describe() const {
    std::ostringstream text;
    text << Account::describe() << "\n"
        << "Account Type: " << to_string(kind()) << "\n"
        << "Overdraft Limit: " << format_money(overdraft_limit_);
    return text.str();
}

// ============================================================================
// FIXED DEPOSIT
// ============================================================================

FixedDepositAccount::FixedDepositAccount(std::string id, std::string holder, int lock_period_days,
                                         double balance, std::shared_ptr<const Clock> clock)
    : Account(std::move(id), std::move(holder), balance),
      lock_period_days_(lock_period_days),
      clock_(std::move(clock)),
      created_at_(clock_->now()) {
    if (lock_period_days_ < 0) {
        throw std::invalid_argument("Lock period must not be negative");
    }
}

bool FixedDepositAccount::is_locked() const {
    // Compare in seconds: a long lock in nanoseconds would overflow
    auto elapsed = std::chrono::floor<std::chrono::seconds>(clock_->now() - created_at_);
    return elapsed < lock_period();
}

std::time_t FixedDepositAccount::unlock_time() const {
    return std::chrono::system_clock::to_time_t(created_at_) +
           static_cast<std::time_t>(lock_period().count());
}

void FixedDepositAccount::accept(AccountVisitor& visitor) {
    visitor.visit(*this);
}

void FixedDepositAccount::accept(ConstAccountVisitor& visitor) const {
    visitor.visit(*this);
}

void FixedDepositAccount::withdraw(double amount) {
    if (is_locked()) {
        throw LockPeriodActive();
    }
    Account::withdraw(amount);
}

std::string FixedDepositAccount::describe() const {
    std::ostringstream text;
    text << Account::describe() << "\n"
        << "Account Type: " << to_string(kind()) << "\n"
        << "Unlock Date: " << format_local_date(unlock_time());
    return text.str();
}
