// Header file for currency amounts
// Balances are held as whole cents; doubles only appear at the API boundary

#ifndef MONEY_H
#define MONEY_H

#include <cstdint>
#include <string>

using Cents = std::int64_t;

// Nearest whole cent
Cents to_cents(double amount);

double to_amount(Cents cents);

// "$1234.50", "$-400.00"
std::string format_money(Cents cents);

// Shortest decimal form that reads back as the same double ("3.5", "3.1234567", "10.0")
std::string format_number(double value);

#endif
