#pragma once

#include "datatypes.hpp"
#include <cstddef>
#include <vector>

namespace indicators {

    core::TimeSeries<double> nanSeries(std::size_t size);

    // Places a TA-Lib output buffer (out_count values starting at input index
    // out_begin) into a series of input_size values padded with NaN.
    core::TimeSeries<double> alignToInput(std::size_t input_size, int out_begin, int out_count,
                                          const std::vector<double>& buffer);

    // Simple moving average. A window containing any NaN yields NaN.
    core::TimeSeries<double> rollingMean(const core::TimeSeries<double>& series, int window);

    // Least-squares slope of the last `window` non-NaN values among the first
    // `count` entries of `series`, regressed on 0..window-1. NaN when fewer
    // values exist or the fit fails.
    double linearRegressionSlope(const core::TimeSeries<double>& series, int window, std::size_t count);
    double linearRegressionSlope(const core::TimeSeries<double>& series, int window);

} // namespace indicators
