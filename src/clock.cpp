// Implementation of clock helpers

#include "../include/clock.hh"
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string format_local_date(std::time_t t) {
    const std::tm* tm = std::localtime(&t);
    if (!tm) {
        throw std::runtime_error("Date out of range");
    }
    std::tm local = *tm;

    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d");
    return out.str();
}
