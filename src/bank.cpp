// .cpp src file of the class Bank

#include "../include/bank.hh"
#include "../include/accountErrors.hh"
#include "../include/money.hh"
#include "../include/visitor.hh"
#include <stdexcept>

Account& Bank::add_account(std::unique_ptr<Account> account) {
    if (!account) {
        throw std::invalid_argument("Cannot register a null account");
    }
    const std::string& id = account->get_id();
    if (contains(id)) {
        throw DuplicateAccount(id);
    }
    auto inserted = accounts_.emplace(id, std::move(account));
    return *inserted.first->second;
}

Account* Bank::get_account(const std::string& id) {
    auto it = accounts_.find(id);
    if (it == accounts_.end()) return nullptr;
    return it->second.get();
}

const Account* Bank::get_account(const std::string& id) const {
    auto it = accounts_.find(id);
    if (it == accounts_.end()) return nullptr;
    return it->second.get();
}

void Bank::transfer_funds(const std::string& from_id, const std::string& to_id, double amount) {
    Account* from = get_account(from_id);
    Account* to = get_account(to_id);
    if (!from || !to) {
        throw AccountNotFound();
    }

    from->withdraw(amount);
    to->deposit(amount);
    *out_ << "Transferred " << format_money(to_cents(amount))
          << " from " << from->get_holder() << " to " << to->get_holder() << std::endl;
}

void Bank::accept(AccountVisitor& visitor) {
    for (auto& [id, account] : accounts_) {
        account->accept(visitor);
    }
}

void Bank::accept(ConstAccountVisitor& visitor) const {
    for (const auto& [id, account] : accounts_) {
        account->accept(visitor);
    }
}

double Bank::apply_interest_all() {
    InterestAccrualVisitor accrual;
    accept(accrual);
    return accrual.get_total_interest();
}

double Bank::total_holdings() const {
    HoldingsVisitor holdings;
    accept(holdings);
    return holdings.get_total();
}
