// CHAINSYNC - Core Types Implementation
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License

#include <chainsync/core/types.h>
#include <chainsync/core/errors.h>

#include <cmath>
#include <iomanip>
#include <sstream>

namespace chainsync {

Amount AmountFromValue(double value) {
    if (!std::isfinite(value)) {
        throw ValidationError("invalid amount");
    }
    
    double scaled = value * static_cast<double>(COIN);
    if (std::fabs(scaled) > static_cast<double>(MAX_MONEY)) {
        throw ValidationError("amount out of range");
    }
    
    return static_cast<Amount>(std::llround(scaled));
}

std::string FormatAmount(Amount amount, int decimals) {
    bool negative = amount < 0;
    if (negative) {
        amount = -amount;
    }
    
    Amount wholePart = amount / COIN;
    Amount fracPart = amount % COIN;
    
    std::ostringstream ss;
    if (negative) {
        ss << "-";
    }
    ss << wholePart;
    
    if (decimals > 0) {
        std::ostringstream fracSS;
        fracSS << std::setfill('0') << std::setw(8) << fracPart;
        ss << "." << fracSS.str().substr(0, decimals > 8 ? 8 : decimals);
    }
    
    return ss.str();
}

} // namespace chainsync
