#include "datatypes.hpp"
#include <cmath>

namespace core {

    double SignalRecord::signedAdx() const {
        if (std::isnan(adx)) return adx;
        // Without direction data the stored sign is kept
        if (std::isnan(plus_di) || std::isnan(minus_di)) return adx;
        return plus_di >= minus_di ? std::fabs(adx) : -std::fabs(adx);
    }

} // namespace core
