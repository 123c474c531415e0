#include "aerotrace/exceedance_detector.h"
#include <cmath>
#include <string>
#include <utility>

namespace aerotrace {
namespace analysis {

namespace {

Exceedance makeExceedance(ExceedanceType type,
                          ExceedanceSeverity severity,
                          const EngineRecord& record,
                          int cylinder,
                          double actual,
                          double limit,
                          std::string description) {
    Exceedance e;
    e.type = type;
    e.severity = severity;
    e.record_index = record.index;
    e.cylinder = cylinder;
    e.actual_value = actual;
    e.limit = limit;
    e.description = std::move(description);
    return e;
}

bool isRunning(const EngineData& data, double running_rpm) {
    return data.rpm && *data.rpm > running_rpm;
}

} // namespace

ExceedanceDetector::ExceedanceDetector() : ExceedanceDetector(EngineLimits{}) {}

ExceedanceDetector::ExceedanceDetector(const EngineLimits& limits) : limits_(limits) {}

ExceedanceSeverity ExceedanceDetector::severityAbove(double actual, double limit) const {
    return actual > limit + std::abs(limit) * limits_.critical_margin ?
           ExceedanceSeverity::CRITICAL : ExceedanceSeverity::WARNING;
}

ExceedanceSeverity ExceedanceDetector::severityBelow(double actual, double limit) const {
    return actual < limit - std::abs(limit) * limits_.critical_margin ?
           ExceedanceSeverity::CRITICAL : ExceedanceSeverity::WARNING;
}

std::vector<Exceedance> ExceedanceDetector::analyze(const EngineRecord& record) {
    std::vector<Exceedance> found;

    auto engine = checkEngine(record);
    found.insert(found.end(), engine.begin(), engine.end());

    auto fluids = checkFluids(record);
    found.insert(found.end(), fluids.begin(), fluids.end());

    auto electrical = checkElectrical(record);
    found.insert(found.end(), electrical.begin(), electrical.end());

    if (previous_) {
        auto cooling = checkShockCooling(record, *previous_);
        found.insert(found.end(), cooling.begin(), cooling.end());
    }

    // Only timed samples can anchor a cooling rate
    if (record.elapsed_s) {
        previous_ = record;
    }

    for (const auto& e : found) {
        counts_[e.type]++;
        total_++;
    }

    return found;
}

std::vector<Exceedance> ExceedanceDetector::analyzeAll(const std::vector<EngineRecord>& records) {
    std::vector<Exceedance> found;
    for (const auto& record : records) {
        auto e = analyze(record);
        found.insert(found.end(), e.begin(), e.end());
    }
    return found;
}

std::vector<Exceedance> ExceedanceDetector::checkEngine(const EngineRecord& record) const {
    std::vector<Exceedance> found;
    const EngineData& data = record.data;

    if (data.rpm && *data.rpm > limits_.rpm_max) {
        found.push_back(makeExceedance(ExceedanceType::RPM_HIGH,
                                       severityAbove(*data.rpm, limits_.rpm_max),
                                       record, 0, *data.rpm, limits_.rpm_max,
                                       "RPM above redline"));
    }

    for (const auto& cht : data.chts) {
        if (cht.value > limits_.cht_max) {
            found.push_back(makeExceedance(ExceedanceType::CHT_HIGH,
                                           severityAbove(cht.value, limits_.cht_max),
                                           record, cht.number, cht.value, limits_.cht_max,
                                           "CHT " + std::to_string(cht.number) + " above limit"));
        }
    }

    for (const auto& egt : data.egts) {
        if (egt.value > limits_.egt_max) {
            found.push_back(makeExceedance(ExceedanceType::EGT_HIGH,
                                           severityAbove(egt.value, limits_.egt_max),
                                           record, egt.number, egt.value, limits_.egt_max,
                                           "EGT " + std::to_string(egt.number) + " above limit"));
        }
    }

    auto spread = data.egts.difference();
    if (spread && *spread > limits_.egt_spread_max) {
        int hottest = data.egts.hottest()->number;
        found.push_back(makeExceedance(ExceedanceType::EGT_SPREAD,
                                       severityAbove(*spread, limits_.egt_spread_max),
                                       record, hottest, *spread, limits_.egt_spread_max,
                                       "EGT spread above limit"));
    }

    return found;
}

std::vector<Exceedance> ExceedanceDetector::checkFluids(const EngineRecord& record) const {
    std::vector<Exceedance> found;
    const EngineData& data = record.data;
    bool running = isRunning(data, limits_.running_rpm);

    if (data.oil_pressure) {
        double p = *data.oil_pressure;
        if (p > limits_.oil_pressure_max) {
            found.push_back(makeExceedance(ExceedanceType::OIL_PRESSURE_HIGH,
                                           severityAbove(p, limits_.oil_pressure_max),
                                           record, 0, p, limits_.oil_pressure_max,
                                           "Oil pressure above limit"));
        } else if (running && p < limits_.oil_pressure_min) {
            found.push_back(makeExceedance(ExceedanceType::OIL_PRESSURE_LOW,
                                           severityBelow(p, limits_.oil_pressure_min),
                                           record, 0, p, limits_.oil_pressure_min,
                                           "Oil pressure below limit"));
        }
    }

    if (data.oil_temperature) {
        double t = *data.oil_temperature;
        if (t > limits_.oil_temp_max) {
            found.push_back(makeExceedance(ExceedanceType::OIL_TEMP_HIGH,
                                           severityAbove(t, limits_.oil_temp_max),
                                           record, 0, t, limits_.oil_temp_max,
                                           "Oil temperature above limit"));
        } else if (running && t < limits_.oil_temp_min) {
            found.push_back(makeExceedance(ExceedanceType::OIL_TEMP_LOW,
                                           ExceedanceSeverity::INFO,
                                           record, 0, t, limits_.oil_temp_min,
                                           "Oil temperature below operating range"));
        }
    }

    if (data.fuel_pressure && running && *data.fuel_pressure < limits_.fuel_pressure_min) {
        found.push_back(makeExceedance(ExceedanceType::FUEL_PRESSURE_LOW,
                                       severityBelow(*data.fuel_pressure, limits_.fuel_pressure_min),
                                       record, 0, *data.fuel_pressure, limits_.fuel_pressure_min,
                                       "Fuel pressure below limit"));
    }

    return found;
}

std::vector<Exceedance> ExceedanceDetector::checkElectrical(const EngineRecord& record) const {
    std::vector<Exceedance> found;

    if (!record.data.volts) {
        return found;
    }

    double v = *record.data.volts;
    if (v > limits_.volts_max) {
        found.push_back(makeExceedance(ExceedanceType::VOLTS_HIGH,
                                       severityAbove(v, limits_.volts_max),
                                       record, 0, v, limits_.volts_max,
                                       "Bus voltage above limit"));
    } else if (v < limits_.volts_min) {
        found.push_back(makeExceedance(ExceedanceType::VOLTS_LOW,
                                       severityBelow(v, limits_.volts_min),
                                       record, 0, v, limits_.volts_min,
                                       "Bus voltage below limit"));
    }

    return found;
}

std::vector<Exceedance> ExceedanceDetector::checkShockCooling(const EngineRecord& current,
                                                              const EngineRecord& previous) const {
    std::vector<Exceedance> found;

    if (!current.elapsed_s || !previous.elapsed_s) {
        return found;
    }

    double dt = *current.elapsed_s - *previous.elapsed_s;
    if (dt <= 0.0) {
        return found;
    }

    for (const auto& cht : current.data.chts) {
        auto before = previous.data.chts.find(cht.number);
        if (!before) {
            continue;
        }

        double rate = (before->value - cht.value) / (dt / 60.0);
        if (rate > limits_.cht_cooling_max) {
            found.push_back(makeExceedance(ExceedanceType::SHOCK_COOLING,
                                           severityAbove(rate, limits_.cht_cooling_max),
                                           current, cht.number, rate, limits_.cht_cooling_max,
                                           "CHT " + std::to_string(cht.number) +
                                           " cooling faster than limit"));
        }
    }

    return found;
}

size_t ExceedanceDetector::getCount(ExceedanceType type) const {
    auto it = counts_.find(type);
    return (it != counts_.end()) ? it->second : 0;
}

void ExceedanceDetector::clear() {
    previous_.reset();
    counts_.clear();
    total_ = 0;
}

const char* exceedanceTypeName(ExceedanceType type) {
    switch (type) {
        case ExceedanceType::RPM_HIGH:          return "RPM_HIGH";
        case ExceedanceType::CHT_HIGH:          return "CHT_HIGH";
        case ExceedanceType::EGT_HIGH:          return "EGT_HIGH";
        case ExceedanceType::EGT_SPREAD:        return "EGT_SPREAD";
        case ExceedanceType::SHOCK_COOLING:     return "SHOCK_COOLING";
        case ExceedanceType::OIL_PRESSURE_LOW:  return "OIL_PRESSURE_LOW";
        case ExceedanceType::OIL_PRESSURE_HIGH: return "OIL_PRESSURE_HIGH";
        case ExceedanceType::OIL_TEMP_HIGH:     return "OIL_TEMP_HIGH";
        case ExceedanceType::OIL_TEMP_LOW:      return "OIL_TEMP_LOW";
        case ExceedanceType::VOLTS_LOW:         return "VOLTS_LOW";
        case ExceedanceType::VOLTS_HIGH:        return "VOLTS_HIGH";
        case ExceedanceType::FUEL_PRESSURE_LOW: return "FUEL_PRESSURE_LOW";
        case ExceedanceType::NONE:
        default:
            return "NONE";
    }
}

} // namespace analysis
} // namespace aerotrace
