#include "series_math.hpp"
#include "logging.hpp"
#include "ta_libc.h"  // TA-Lib C API header
#include <algorithm>
#include <cmath>

namespace indicators {

core::TimeSeries<double> nanSeries(std::size_t size) {
    return core::TimeSeries<double>(size, core::kNaN);
}

core::TimeSeries<double> alignToInput(std::size_t input_size, int out_begin, int out_count,
                                      const std::vector<double>& buffer)
{
    core::TimeSeries<double> aligned = nanSeries(input_size);
    if (out_begin < 0 || out_count <= 0) {
        return aligned;
    }
    const std::size_t count = std::min<std::size_t>(static_cast<std::size_t>(out_count), buffer.size());
    for (std::size_t i = 0; i < count && static_cast<std::size_t>(out_begin) + i < input_size; ++i) {
        aligned[static_cast<std::size_t>(out_begin) + i] = buffer[i];
    }
    return aligned;
}

core::TimeSeries<double> rollingMean(const core::TimeSeries<double>& series, int window) {
    core::TimeSeries<double> result = nanSeries(series.size());
    if (window <= 0 || series.size() < static_cast<std::size_t>(window)) {
        return result;
    }

    // Running sum over the finite values plus a count of NaNs in the window
    const std::size_t w = static_cast<std::size_t>(window);
    double sum = 0.0;
    std::size_t nan_count = 0;
    for (std::size_t i = 0; i < series.size(); ++i) {
        if (std::isnan(series[i])) {
            ++nan_count;
        } else {
            sum += series[i];
        }
        if (i >= w) {
            const double leaving = series[i - w];
            if (std::isnan(leaving)) {
                --nan_count;
            } else {
                sum -= leaving;
            }
        }
        if (i + 1 >= w && nan_count == 0) {
            result[i] = sum / static_cast<double>(w);
        }
    }
    return result;
}

double linearRegressionSlope(const core::TimeSeries<double>& series, int window, std::size_t count) {
    if (window < 2) {
        return core::kNaN;
    }
    count = std::min(count, series.size());

    // Collect the last `window` defined values, oldest first
    std::vector<double> values;
    values.reserve(static_cast<std::size_t>(window));
    for (std::size_t i = count; i-- > 0 && values.size() < static_cast<std::size_t>(window);) {
        if (!std::isnan(series[i])) {
            values.push_back(series[i]);
        }
    }
    if (values.size() < static_cast<std::size_t>(window)) {
        return core::kNaN;
    }
    std::reverse(values.begin(), values.end());

    int out_begin_idx = 0;
    int out_nb_element = 0;
    double slope = core::kNaN;
    TA_RetCode ret_code = TA_LINEARREG_SLOPE(
        window - 1,             // startIdx: only the last position
        window - 1,             // endIdx
        values.data(),
        window,                 // optInTimePeriod
        &out_begin_idx,
        &out_nb_element,
        &slope
    );

    if (ret_code != TA_SUCCESS || out_nb_element != 1 || !std::isfinite(slope)) {
        core::logging::getLogger()->debug("TA_LINEARREG_SLOPE degraded to NaN (code {}, elements {})",
                                          static_cast<int>(ret_code), out_nb_element);
        return core::kNaN;
    }
    return slope;
}

double linearRegressionSlope(const core::TimeSeries<double>& series, int window) {
    return linearRegressionSlope(series, window, series.size());
}

} // namespace indicators
