#ifndef AEROTRACE_EXCEEDANCE_DETECTOR_H
#define AEROTRACE_EXCEEDANCE_DETECTOR_H

#include "aerotrace/types.h"
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace aerotrace {
namespace analysis {

// Exceedance types that can be detected
enum class ExceedanceType : uint8_t {
    NONE = 0,
    RPM_HIGH = 1,
    CHT_HIGH = 2,
    EGT_HIGH = 3,
    EGT_SPREAD = 4,             // Hottest minus coolest EGT
    SHOCK_COOLING = 5,          // CHT dropping too fast
    OIL_PRESSURE_LOW = 6,
    OIL_PRESSURE_HIGH = 7,
    OIL_TEMP_HIGH = 8,
    OIL_TEMP_LOW = 9,
    VOLTS_LOW = 10,
    VOLTS_HIGH = 11,
    FUEL_PRESSURE_LOW = 12
};

// Severity levels
enum class ExceedanceSeverity : uint8_t {
    INFO = 0,       // Outside the normal band, usually harmless
    WARNING = 1,    // Limit exceeded
    CRITICAL = 2    // Limit exceeded by more than the critical margin
};

// Detected exceedance record
struct Exceedance {
    ExceedanceType type = ExceedanceType::NONE;
    ExceedanceSeverity severity = ExceedanceSeverity::INFO;
    size_t record_index = 0;
    int cylinder = 0;               // 0 when not cylinder specific
    std::string description;

    double actual_value = 0.0;
    double limit = 0.0;
};

// Engine operating limits (°F, PSI, V, RPM)
struct EngineLimits {
    double rpm_max = 2700.0;

    double cht_max = 460.0;
    double egt_max = 1650.0;
    double egt_spread_max = 150.0;
    double cht_cooling_max = 60.0;      // °F per minute

    double oil_pressure_min = 25.0;     // Applies above running_rpm
    double oil_pressure_max = 100.0;
    double oil_temp_min = 100.0;        // Reported as INFO only
    double oil_temp_max = 245.0;

    double volts_min = 12.0;
    double volts_max = 15.0;

    double fuel_pressure_min = 0.5;     // Applies above running_rpm

    double running_rpm = 1000.0;        // Engine considered running above this
    double critical_margin = 0.10;      // Fraction of the limit
};

/**
 * Exceedance Detector
 *
 * Checks decoded samples against engine limits. Records must be fed in
 * log order for shock cooling detection.
 */
class ExceedanceDetector {
public:
    ExceedanceDetector();
    explicit ExceedanceDetector(const EngineLimits& limits);

    /**
     * Analyze one record against all limits
     * @return List of detected exceedances (may be empty)
     */
    std::vector<Exceedance> analyze(const EngineRecord& record);

    /**
     * Analyze a whole log in order
     */
    std::vector<Exceedance> analyzeAll(const std::vector<EngineRecord>& records);

    /**
     * Check RPM, EGT, CHT and EGT spread
     */
    std::vector<Exceedance> checkEngine(const EngineRecord& record) const;

    /**
     * Check oil and fuel system
     */
    std::vector<Exceedance> checkFluids(const EngineRecord& record) const;

    /**
     * Check bus voltage
     */
    std::vector<Exceedance> checkElectrical(const EngineRecord& record) const;

    /**
     * Check CHT cooling rate between two records
     */
    std::vector<Exceedance> checkShockCooling(const EngineRecord& current,
                                              const EngineRecord& previous) const;

    /**
     * Get exceedance statistics
     */
    size_t getTotal() const { return total_; }
    size_t getCount(ExceedanceType type) const;

    /**
     * Clear statistics and history
     */
    void clear();

    const EngineLimits& limits() const { return limits_; }

private:
    EngineLimits limits_;
    std::optional<EngineRecord> previous_;
    std::unordered_map<ExceedanceType, size_t> counts_;
    size_t total_ = 0;

    ExceedanceSeverity severityAbove(double actual, double limit) const;
    ExceedanceSeverity severityBelow(double actual, double limit) const;
};

const char* exceedanceTypeName(ExceedanceType type);

} // namespace analysis
} // namespace aerotrace

#endif // AEROTRACE_EXCEEDANCE_DETECTOR_H
