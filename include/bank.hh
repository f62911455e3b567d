// Header file of the class Bank

#ifndef BANK_H
#define BANK_H

#include <cstddef>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include "account.hh"

// Forward declarations
class AccountVisitor;
class ConstAccountVisitor;

// Bank: registry of accounts keyed by id
// Owns its accounts exclusively; ids are unique
class Bank {
public:
    Bank() = default;

    Bank(const Bank&) = delete;
    Bank& operator=(const Bank&) = delete;
    Bank(Bank&&) = default;
    Bank& operator=(Bank&&) = default;

    // Takes ownership; throws DuplicateAccount if the id is taken,
    // std::invalid_argument for a null account
    Account& add_account(std::unique_ptr<Account> account);

    // Create an account in-place and register it
    template <typename T, typename... Args>
    T& open_account(Args&&... args) {
        auto account = std::make_unique<T>(std::forward<Args>(args)...);
        T& ref = *account;
        add_account(std::move(account));
        return ref;
    }

    // nullptr when absent
    Account* get_account(const std::string& id);
    const Account* get_account(const std::string& id) const;

    bool contains(const std::string& id) const { return accounts_.count(id) != 0; }
    size_t size() const { return accounts_.size(); }

    // Withdraw from source, then deposit into destination. No rollback:
    // a deposit failure after a successful withdraw would lose the funds.
    void transfer_funds(const std::string& from_id, const std::string& to_id, double amount);

    // Apply a visitor to every account, in id order
    void accept(AccountVisitor& visitor);
    void accept(ConstAccountVisitor& visitor) const;

    // Interest on every savings account; returns the total credited
    double apply_interest_all();

    // Sum of all balances
    double total_holdings() const;

    // Where transfer confirmations go (defaults to std::cout)
    void set_output(std::ostream& out) { out_ = &out; }

private:
    std::map<std::string, std::unique_ptr<Account>> accounts_;
    std::ostream* out_ = &std::cout;
};

#endif
