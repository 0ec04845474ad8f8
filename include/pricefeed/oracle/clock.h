// PRICEFEED - Height Clock
// Copyright (c) 2024 PRICEFEED Developers
// MIT License
//
// The engine never advances height itself; it reads it from the execution
// environment through this interface.

#ifndef PRICEFEED_ORACLE_CLOCK_H
#define PRICEFEED_ORACLE_CLOCK_H

#include "pricefeed/core/types.h"

#include <atomic>

namespace pricefeed {
namespace oracle {

/// Source of the current, monotonically non-decreasing height
class HeightClock {
public:
    virtual ~HeightClock() = default;
    virtual Height CurrentHeight() const = 0;
};

/**
 * Clock whose height is set explicitly. Used by tests and by the
 * command-line tool, which takes the height as an argument.
 */
class ManualClock : public HeightClock {
public:
    explicit ManualClock(Height start = 0) : height_(start) {}

    Height CurrentHeight() const override { return height_.load(); }

    /// Move to height; refuses to go backwards
    bool SetHeight(Height height);

    /// Advance by delta; saturates at the maximum height
    void Advance(Height delta);

private:
    std::atomic<Height> height_;
};

} // namespace oracle
} // namespace pricefeed

#endif // PRICEFEED_ORACLE_CLOCK_H
