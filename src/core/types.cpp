#include "aerotrace/types.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace aerotrace {

CylinderReading::CylinderReading(int number, double value)
    : number(number), value(value) {
    if (number < 1) {
        throw std::invalid_argument("Cylinder number must be >= 1");
    }
    if (!std::isfinite(value)) {
        throw std::invalid_argument("Temperature value must be numeric");
    }
}

const CylinderReading& CylinderReadings::at(size_t index) const {
    if (index >= readings_.size()) {
        throw std::out_of_range("CylinderReadings: index out of range");
    }
    return readings_[index];
}

std::optional<CylinderReading> CylinderReadings::find(int number) const {
    auto it = std::find_if(readings_.begin(), readings_.end(),
                           [number](const CylinderReading& r) {
                               return r.number == number;
                           });
    if (it == readings_.end()) {
        return std::nullopt;
    }
    return *it;
}

std::optional<CylinderReading> CylinderReadings::hottest() const {
    if (readings_.empty()) {
        return std::nullopt;
    }

    // max_element keeps the first of equal maxima
    return *std::max_element(readings_.begin(), readings_.end(),
                             [](const CylinderReading& a, const CylinderReading& b) {
                                 return a.value < b.value;
                             });
}

std::optional<CylinderReading> CylinderReadings::coolest() const {
    if (readings_.empty()) {
        return std::nullopt;
    }

    return *std::min_element(readings_.begin(), readings_.end(),
                             [](const CylinderReading& a, const CylinderReading& b) {
                                 return a.value < b.value;
                             });
}

std::optional<double> CylinderReadings::difference() const {
    auto hot = hottest();
    auto cool = coolest();

    if (hot && cool) {
        return hot->value - cool->value;
    }

    return std::nullopt;
}

const char* emsTypeName(EmsType type) {
    switch (type) {
        case EmsType::CGR_30P:
            return "CGR-30P";
        case EmsType::UNKNOWN:
        default:
            return "Unknown";
    }
}

} // namespace aerotrace
