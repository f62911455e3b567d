// Header file for the Visitor Pattern implementation
// Separates bulk operations from account data

#ifndef VISITOR_H
#define VISITOR_H

#include <cstddef>
#include <map>

#include "account.hh"
#include "money.hh"

// Abstract Visitor interface - one overload per account variant
class AccountVisitor {
public:
    virtual ~AccountVisitor() = default;

    virtual void visit(BasicAccount& account) = 0;
    virtual void visit(SavingsAccount& account) = 0;
    virtual void visit(CurrentAccount& account) = 0;
    virtual void visit(FixedDepositAccount& account) = 0;
};

// Const visitor for read-only operations (reporting)
class ConstAccountVisitor {
public:
    virtual ~ConstAccountVisitor() = default;

    virtual void visit(const BasicAccount& account) = 0;
    virtual void visit(const SavingsAccount& account) = 0;
    virtual void visit(const CurrentAccount& account) = 0;
    virtual void visit(const FixedDepositAccount& account) = 0;
};

// ============================================================================
// MUTATING VISITORS
// ============================================================================

// Month-end run: credits interest on savings accounts, ignores the rest
class InterestAccrualVisitor : public AccountVisitor {
public:
    InterestAccrualVisitor() = default;

    void visit(BasicAccount& account) override;
    void visit(SavingsAccount& account) override;
    void visit(CurrentAccount& account) override;
    void visit(FixedDepositAccount& account) override;

    double get_total_interest() const { return to_amount(total_interest_); }
    size_t get_accounts_credited() const { return accounts_credited_; }
    void reset() { total_interest_ = 0; accounts_credited_ = 0; }

private:
    Cents total_interest_ = 0;
    size_t accounts_credited_ = 0;
};

// ============================================================================
// REPORTING VISITORS
// ============================================================================

// Sum of balances, overall and per account kind
class HoldingsVisitor : public ConstAccountVisitor {
public:
    HoldingsVisitor() = default;

    void visit(const BasicAccount& account) override;
    void visit(const SavingsAccount& account) override;
    void visit(const CurrentAccount& account) override;
    void visit(const FixedDepositAccount& account) override;

    double get_total() const { return to_amount(total_); }
    double get_total(Account::Kind kind) const;

    // Sum of negative current-account balances, as a positive number
    double get_overdraft_used() const { return to_amount(overdraft_used_); }
    // Fixed deposits still inside their lock period
    double get_locked_funds() const { return to_amount(locked_funds_); }

    void reset();

private:
    void add(const Account& account);

    Cents total_ = 0;
    std::map<Account::Kind, Cents> by_kind_;
    Cents overdraft_used_ = 0;
    Cents locked_funds_ = 0;
};

#endif
