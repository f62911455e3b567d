// Main.cpp of bankEngine

#include <iostream>
#include <iomanip>
#include <initializer_list>
#include <stdexcept>
#include <memory>
#include "../include/bank.hh"
#include "../include/account.hh"
#include "../include/accountErrors.hh"
#include "../include/visitor.hh"

void print_accounts(const Bank& bank) {
    for (const char* id : {"S1001", "C1001", "F1001"}) {
        const Account* account = bank.get_account(id);
        if (account) {
            std::cout << account->describe() << std::endl;
        }
    }
}

void print_holdings(const Bank& bank) {
    HoldingsVisitor holdings;
    bank.accept(holdings);
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "  Total holdings:  $" << holdings.get_total() << std::endl;
    std::cout << "  Overdraft used:  $" << holdings.get_overdraft_used() << std::endl;
    std::cout << "  Locked deposits: $" << holdings.get_locked_funds() << std::endl;
}

int main() {
    try {
        Bank bank;

        auto& savings = bank.open_account<SavingsAccount>("S1001", "Alice", 3.5, 1000.0);
        auto& current = bank.open_account<CurrentAccount>("C1001", "Bob", 500.0, 200.0);
        auto& fixed = bank.open_account<FixedDepositAccount>("F1001", "Charlie", 30, 5000.0);

        std::cout << "\n--- Initial Account Info ---" << std::endl;
        print_accounts(bank);

        std::cout << "\n--- Savings Account Operations ---" << std::endl;
        savings.deposit(500);
        savings.apply_interest();
        savings.withdraw(200);

        std::cout << "\n--- Current Account Operations ---" << std::endl;
        current.withdraw(600);  // Uses overdraft
        current.deposit(300);

        std::cout << "\n--- Attempt Early Withdrawal from Fixed Deposit ---" << std::endl;
        try {
            fixed.withdraw(1000);
        } catch (const AccountError& e) {
            std::cout << "Error: " << e.what() << std::endl;
        }

        std::cout << "\n--- Transfer Funds from Savings to Current ---" << std::endl;
        bank.transfer_funds("S1001", "C1001", 300);

        std::cout << "\n--- Final Balances ---" << std::endl;
        print_accounts(bank);

        std::cout << "\n--- Bank Holdings ---" << std::endl;
        print_holdings(bank);

    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
