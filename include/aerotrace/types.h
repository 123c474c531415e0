#ifndef AEROTRACE_TYPES_H
#define AEROTRACE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <utility>
#include <optional>

namespace aerotrace {

// EMS types supported by the parser
enum class EmsType : uint8_t {
    UNKNOWN = 0,
    CGR_30P = 1     // Electronics International CGR-30P
};

// Temperature unit used by a log or a single column
enum class TemperatureUnit : uint8_t {
    FAHRENHEIT = 0,
    CELSIUS = 1
};

// Temperature reading for a specific cylinder (EGT or CHT)
struct CylinderReading {
    int number = 1;         // Cylinder number (1-based)
    double value = 0.0;     // Degrees Fahrenheit

    // Throws std::invalid_argument on number < 1 or a non-finite value
    CylinderReading(int number, double value);

    bool operator==(const CylinderReading& other) const {
        return number == other.number && value == other.value;
    }
    bool operator!=(const CylinderReading& other) const {
        return !(*this == other);
    }
};

// Collection of cylinder temperature readings
class CylinderReadings {
public:
    using container_type = std::vector<CylinderReading>;
    using const_iterator = container_type::const_iterator;
    using iterator = const_iterator;

    CylinderReadings() = default;
    explicit CylinderReadings(std::vector<CylinderReading> readings)
        : readings_(std::move(readings)) {}

    const_iterator begin() const { return readings_.begin(); }
    const_iterator end() const { return readings_.end(); }

    size_t size() const { return readings_.size(); }
    bool empty() const { return readings_.empty(); }

    const CylinderReading& operator[](size_t index) const { return readings_[index]; }

    // Bounds-checked access, throws std::out_of_range
    const CylinderReading& at(size_t index) const;

    void add(const CylinderReading& reading) { readings_.push_back(reading); }

    // Reading for a cylinder number, if present
    std::optional<CylinderReading> find(int number) const;

    // Highest value (first one on ties)
    std::optional<CylinderReading> hottest() const;

    // Lowest value (first one on ties)
    std::optional<CylinderReading> coolest() const;

    // Hottest minus coolest
    std::optional<double> difference() const;

    bool operator==(const CylinderReadings& other) const {
        return readings_ == other.readings_;
    }
    bool operator!=(const CylinderReadings& other) const {
        return !(*this == other);
    }

private:
    container_type readings_;
};

// Standardized engine data for all EMS types.
// Temperatures in Fahrenheit, pressures in PSI, manifold pressure in inHg,
// electrical values in Volts/Amps, G-force as a multiplier.
struct EngineData {
    std::optional<double> rpm;
    std::optional<double> manifold_pressure;   // inHg

    // Cylinders
    CylinderReadings egts;
    CylinderReadings chts;

    // Oil system
    std::optional<double> oil_pressure;        // PSI
    std::optional<double> oil_temperature;     // °F

    // Fuel system
    std::optional<double> fuel_pressure;       // PSI

    // Electrical system
    std::optional<double> volts;
    std::optional<double> amps;

    // General
    std::optional<double> g_force;
};

// One decoded sample of a data log
struct EngineRecord {
    size_t index = 0;               // Sample number (0-based)
    size_t line = 0;                // Source line (1-based)
    std::string date;               // Date as logged
    std::string time;               // Time of day as logged
    std::optional<double> elapsed_s; // Seconds since the first sample
    EngineData data;
};

// Information from the log preamble
struct FlightMetadata {
    std::string model;
    std::string aircraft_id;
    std::string serial_number;
    std::string software_version;
    TemperatureUnit temperature_unit = TemperatureUnit::FAHRENHEIT;
    bool temperature_unit_declared = false;

    // Remaining "Key: Value" pairs in file order
    std::vector<std::pair<std::string, std::string>> extra;
};

// Non-fatal problem found while parsing
struct ParseWarning {
    size_t line = 0;
    std::string message;
};

// Result returned by the parser
struct ParseResult {
    bool success = false;
    EmsType ems_type = EmsType::UNKNOWN;
    std::string error;              // Error message if failed

    FlightMetadata metadata;
    std::vector<EngineRecord> records;
    std::vector<ParseWarning> warnings;

    size_t lines_read = 0;
    size_t rows_skipped = 0;
};

const char* emsTypeName(EmsType type);

} // namespace aerotrace

#endif // AEROTRACE_TYPES_H
