#pragma once

#include "datatypes.hpp" // Needs Candle, TimeSeries
#include <string>
#include <vector>

namespace indicators {

class IIndicator {
public:
    virtual ~IIndicator() = default;

    // Name including parameters, e.g. "CCI(20)"
    virtual std::string getName() const = 0;

    // Number of leading bars that cannot carry a value. Outputs before this
    // index are always not-a-number.
    virtual int getLookback() const = 0;

    // Calculate the indicator based on input candle data (ascending by time).
    // Results are stored internally.
    virtual void calculate(const core::TimeSeries<core::Candle>& input) = 0;

    // Primary output line. Always the same length as the last input, with
    // not-a-number wherever the value is undefined.
    virtual const core::TimeSeries<double>& getResult() const = 0;
};

} // namespace indicators
