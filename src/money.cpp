// Implementation of currency helpers

#include "../include/money.hh"
#include <charconv>
#include <cmath>
#include <iomanip>
#include <sstream>

Cents to_cents(double amount) {
    return static_cast<Cents>(std::llround(amount * 100.0));
}

double to_amount(Cents cents) {
    return static_cast<double>(cents) / 100.0;
}

std::string format_money(Cents cents) {
    std::ostringstream out;
    out << '$' << std::fixed << std::setprecision(2) << to_amount(cents);
    return out.str();
}

std::string format_number(double value) {
    char buf[32];
    auto result = std::to_chars(buf, buf + sizeof(buf), value);
    std::string text(buf, result.ptr);
    // Whole numbers keep one decimal place ("10.0")
    if (std::isfinite(value) && text.find_first_of(".e") == std::string::npos) {
        text += ".0";
    }
    return text;
}
