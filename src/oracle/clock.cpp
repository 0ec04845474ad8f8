// PRICEFEED - Height Clock
// Copyright (c) 2024 PRICEFEED Developers
// MIT License

#include "pricefeed/oracle/clock.h"

#include <limits>

namespace pricefeed {
namespace oracle {

bool ManualClock::SetHeight(Height height) {
    Height current = height_.load();
    while (height >= current) {
        if (height_.compare_exchange_weak(current, height)) {
            return true;
        }
    }
    return false;
}

void ManualClock::Advance(Height delta) {
    Height current = height_.load();
    Height next;
    do {
        next = current > std::numeric_limits<Height>::max() - delta
             ? std::numeric_limits<Height>::max()
             : current + delta;
    } while (!height_.compare_exchange_weak(current, next));
}

} // namespace oracle
} // namespace pricefeed
