#include <catch2/catch.hpp>

#include "../include/visitor.hh"
#include "../include/bank.hh"
#include "../include/account.hh"
#include "../include/clock.hh"

#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {

// Records the dispatch order and kind of every visited account
class KindRecorder : public ConstAccountVisitor {
public:
    void visit(const BasicAccount& a) override { seen.emplace_back(a.get_id(), Account::Kind::Basic); }
    void visit(const SavingsAccount& a) override { seen.emplace_back(a.get_id(), Account::Kind::Savings); }
    void visit(const CurrentAccount& a) override { seen.emplace_back(a.get_id(), Account::Kind::Current); }
    void visit(const FixedDepositAccount& a) override { seen.emplace_back(a.get_id(), Account::Kind::FixedDeposit); }

    std::vector<std::pair<std::string, Account::Kind>> seen;
};

}  // namespace

SCENARIO("Visitors dispatch on the account variant", "[Visitor]") {
    GIVEN("a bank with one account of each kind") {
        std::ostringstream log;
        auto clock = std::make_shared<ManualClock>();
        Bank bank;
        bank.open_account<SavingsAccount>("S1", "Alice", 5.0, 200.0).set_output(log);
        bank.open_account<CurrentAccount>("C1", "Bob", 100.0, -50.0).set_output(log);
        bank.open_account<FixedDepositAccount>("F1", "Charlie", 10, 1000.0, clock).set_output(log);
        bank.open_account<BasicAccount>("B1", "Dana", 25.0).set_output(log);

        WHEN("a const visitor walks the bank") {
            KindRecorder recorder;
            bank.accept(recorder);
            THEN("each account is visited once, in id order, through its own overload") {
                REQUIRE(recorder.seen.size() == 4);
                REQUIRE(recorder.seen[0] == std::make_pair(std::string("B1"), Account::Kind::Basic));
                REQUIRE(recorder.seen[1] == std::make_pair(std::string("C1"), Account::Kind::Current));
                REQUIRE(recorder.seen[2] == std::make_pair(std::string("F1"), Account::Kind::FixedDeposit));
                REQUIRE(recorder.seen[3] == std::make_pair(std::string("S1"), Account::Kind::Savings));
            }
        }

        WHEN("holdings are aggregated while the deposit is locked") {
            HoldingsVisitor holdings;
            bank.accept(holdings);
            THEN("totals, overdraft use and locked funds are reported") {
                REQUIRE(holdings.get_total() == Approx(200.0 - 50.0 + 1000.0 + 25.0));
                REQUIRE(holdings.get_total(Account::Kind::Savings) == Approx(200.0));
                REQUIRE(holdings.get_total(Account::Kind::Current) == Approx(-50.0));
                REQUIRE(holdings.get_overdraft_used() == Approx(50.0));
                REQUIRE(holdings.get_locked_funds() == Approx(1000.0));
            }
            AND_WHEN("the visitor is reset and rerun after unlock") {
                clock->advance_days(10);
                holdings.reset();
                bank.accept(holdings);
                THEN("no funds are locked") {
                    REQUIRE(holdings.get_locked_funds() == 0.0);
                    REQUIRE(holdings.get_total() == Approx(1175.0));
                }
            }
        }

        WHEN("interest accrual runs") {
            InterestAccrualVisitor accrual;
            bank.accept(accrual);
            THEN("only the savings account is credited") {
                REQUIRE(accrual.get_accounts_credited() == 1);
                REQUIRE(accrual.get_total_interest() == Approx(10.0));
                REQUIRE(bank.get_account("S1")->get_balance() == Approx(210.0));
                REQUIRE(bank.get_account("C1")->get_balance() == -50.0);
                REQUIRE(bank.get_account("B1")->get_balance() == 25.0);
            }
            AND_WHEN("the visitor is reset and run for a second period") {
                accrual.reset();
                REQUIRE(accrual.get_accounts_credited() == 0);
                REQUIRE(accrual.get_total_interest() == 0.0);
                bank.accept(accrual);
                THEN("only the second period's interest is reported") {
                    REQUIRE(accrual.get_accounts_credited() == 1);
                    REQUIRE(accrual.get_total_interest() == 10.5);
                    REQUIRE(bank.get_account("S1")->get_balance() == 220.5);
                }
            }
        }
    }
}
