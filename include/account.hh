// Header file for the Account hierarchy

#ifndef ACCOUNT_H
#define ACCOUNT_H

#include <chrono>
#include <ctime>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include "clock.hh"
#include "money.hh"

// Forward declarations
class AccountVisitor;
class ConstAccountVisitor;

// Abstract base class for all account variants
// Balance only changes through deposit/withdraw (and interest on savings)
// Amounts are rounded to whole cents on the way in
class Account {
public:
    enum class Kind { Basic, Savings, Current, FixedDeposit };

    Account(std::string id, std::string holder, double balance)
        : id_(std::move(id)), holder_(std::move(holder)), balance_(to_cents(balance)) {}

    virtual ~Account() = default;

    Account(const Account&) = delete;
    Account& operator=(const Account&) = delete;

    // Visitor pattern - variant-specific operations live in visitors
    virtual void accept(AccountVisitor& visitor) = 0;
    virtual void accept(ConstAccountVisitor& visitor) const = 0;

    virtual Kind kind() const = 0;

    virtual void deposit(double amount);

    // Base rule: the balance must cover the amount
    virtual void withdraw(double amount);

    // Multi-line summary, display only
    virtual std::string describe() const;

    // Accessors
    const std::string& get_id() const { return id_; }
    const std::string& get_holder() const { return holder_; }
    double get_balance() const { return to_amount(balance_); }
    Cents get_balance_cents() const { return balance_; }

    // Where confirmation messages go (defaults to std::cout)
    void set_output(std::ostream& out) { out_ = &out; }

protected:
    // Throws InvalidAmount unless amount is at least one cent
    static Cents require_positive(double amount, const char* what);

    void debit(Cents amount) { balance_ -= amount; }
    void credit(Cents amount) { balance_ += amount; }
    std::ostream& out() const { return *out_; }

private:
    std::string id_;
    std::string holder_;
    Cents balance_;
    std::ostream* out_ = &std::cout;
};

const char* to_string(Account::Kind kind);

// Plain account, base withdrawal rule
class BasicAccount : public Account {
public:
    BasicAccount(std::string id, std::string holder, double balance = 0.0)
        : Account(std::move(id), std::move(holder), balance) {}

    void accept(AccountVisitor& visitor) override;
    void accept(ConstAccountVisitor& visitor) const override;

    Kind kind() const override { return Kind::Basic; }
};

// Savings: base withdrawal rule plus interest accrual
// A negative rate is accepted and acts as a fee
class SavingsAccount : public Account {
public:
    SavingsAccount(std::string id, std::string holder, double interest_rate_percent,
                   double balance = 0.0)
        : Account(std::move(id), std::move(holder), balance),
          interest_rate_(interest_rate_percent) {}

    void accept(AccountVisitor& visitor) override;
    void accept(ConstAccountVisitor& visitor) const override;

    Kind kind() const override { return Kind::Savings; }
    std::string describe() const override;

    // Credits balance * rate / 100 (nearest cent), returns the amount credited
    double apply_interest();

    double get_interest_rate() const { return interest_rate_; }

private:
    double interest_rate_;  // In percent
};

// Current: may go negative down to -overdraft_limit
class CurrentAccount : public Account {
public:
    CurrentAccount(std::string id, std::string holder, double overdraft_limit,
                   double balance = 0.0)
        : Account(std::move(id), std::move(holder), balance),
          overdraft_limit_(to_cents(overdraft_limit)) {}

    void accept(AccountVisitor& visitor) override;
    void accept(ConstAccountVisitor& visitor) const override;

    Kind kind() const override { return Kind::Current; }
    void withdraw(double amount) override;
    std::string describe() const override;

    double get_overdraft_limit() const { return to_amount(overdraft_limit_); }

private:
    Cents overdraft_limit_;
};

// Fixed deposit: no withdrawals until created_at + lock_period_days
class FixedDepositAccount : public Account {
public:
    // Throws std::invalid_argument for a negative lock period
    FixedDepositAccount(std::string id, std::string holder, int lock_period_days,
                        double balance = 0.0,
                        std::shared_ptr<const Clock> clock = std::make_shared<SystemClock>());

    void accept(AccountVisitor& visitor) override;
    void accept(ConstAccountVisitor& visitor) const override;

    Kind kind() const override { return Kind::FixedDeposit; }
    void withdraw(double amount) override;
    std::string describe() const override;

    // Held in seconds so any int day count fits
    std::chrono::seconds lock_period() const {
        return std::chrono::hours(24) * lock_period_days_;
    }
    bool is_locked() const;

    // Unlock instant as calendar time (created_at + lock_period)
    std::time_t unlock_time() const;

    int get_lock_period_days() const { return lock_period_days_; }
    Clock::time_point get_created_at() const { return created_at_; }

private:
    int lock_period_days_;
    std::shared_ptr<const Clock> clock_;
    Clock::time_point created_at_;
};

#endif
