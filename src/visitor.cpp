// Implementation of Visitor Pattern for bulk account operations

#include "../include/visitor.hh"
#include "../include/account.hh"

// ============================================================================
// INTEREST ACCRUAL VISITOR
// ============================================================================

void InterestAccrualVisitor::visit(BasicAccount&) {}

void InterestAccrualVisitor::visit(SavingsAccount& account) {
    total_interest_ += to_cents(account.apply_interest());
    ++accounts_credited_;
}

void InterestAccrualVisitor::visit(CurrentAccount&) {}

void InterestAccrualVisitor::visit(FixedDepositAccount&) {}

// ============================================================================
// HOLDINGS VISITOR
// ============================================================================

void HoldingsVisitor::add(const Account& account) {
    total_ += account.get_balance_cents();
    by_kind_[account.kind()] += account.get_balance_cents();
}

void HoldingsVisitor::visit(const BasicAccount& account) {
    add(account);
}

void HoldingsVisitor::visit(const SavingsAccount& account) {
    add(account);
}

void HoldingsVisitor::visit(const CurrentAccount& account) {
    add(account);
    if (account.get_balance_cents() < 0) {
        overdraft_used_ -= account.get_balance_cents();
    }
}

void HoldingsVisitor::visit(const FixedDepositAccount& account) {
    add(account);
    if (account.is_locked()) {
        locked_funds_ += account.get_balance_cents();
    }
}

double HoldingsVisitor::get_total(Account::Kind kind) const {
    auto it = by_kind_.find(kind);
    return it == by_kind_.end() ? 0.0 : to_amount(it->second);
}

void HoldingsVisitor::reset() {
    total_ = 0;
    by_kind_.clear();
    overdraft_used_ = 0;
    locked_funds_ = 0;
}
