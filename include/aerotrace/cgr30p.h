#ifndef AEROTRACE_CGR30P_H
#define AEROTRACE_CGR30P_H

#include "aerotrace/types.h"
#include <cstdint>
#include <string>
#include <vector>

namespace aerotrace {
namespace cgr30p {

// Data channels found in a CGR-30P data log
enum class Channel : uint8_t {
    NONE = 0,
    DATE = 1,
    TIME = 2,
    RPM = 3,
    MAP = 4,
    EGT = 5,
    CHT = 6,
    OIL_PRESSURE = 7,
    OIL_TEMPERATURE = 8,
    FUEL_PRESSURE = 9,
    VOLTS = 10,
    AMPS = 11,
    G_FORCE = 12
};

constexpr const char* MODEL_NAME = "CGR-30P";
constexpr size_t DEFAULT_MAX_CYLINDERS = 12;
constexpr size_t MIN_HEADER_CHANNELS = 2;       // Known data channels in a header row
constexpr size_t MAX_PREAMBLE_LINES = 64;       // Lines allowed before the header row

// How a column of the log maps onto EngineData
struct ColumnMapping {
    Channel channel = Channel::NONE;
    int cylinder = 0;                   // 1-based for EGT/CHT, 0 otherwise
    TemperatureUnit unit = TemperatureUnit::FAHRENHEIT;
    bool unit_declared = false;         // Unit given in the column name
    std::string name;                   // Column name as logged
};

// Decode result
struct DecodeResult {
    bool success = false;
    bool no_data = false;       // Row carried no channel values
    std::string error;
};

/**
 * CGR-30P data log decoder
 *
 * Decodes the CSV export of the Electronics International CGR-30P:
 * optional preamble lines ("Key: Value"), one column header row,
 * then one row per sample.
 */
class CGR30P_Decoder {
public:
    explicit CGR30P_Decoder(size_t max_cylinders = DEFAULT_MAX_CYLINDERS);

    /**
     * Check if the leading lines of a log look like a CGR-30P export
     */
    bool isCGR30P(const std::vector<std::string>& lines) const;

    /**
     * Check if split fields form a column header row
     */
    bool isHeaderRow(const std::vector<std::string>& fields) const;

    /**
     * Decode one preamble line into metadata
     * Returns false for lines carrying nothing recognizable
     */
    bool decodePreambleLine(const std::string& line, FlightMetadata& metadata) const;

    /**
     * Build the column layout from the header row.
     * Columns without a declared unit take the metadata temperature unit.
     */
    DecodeResult decodeHeader(const std::vector<std::string>& fields,
                              const FlightMetadata& metadata,
                              size_t line,
                              std::vector<ParseWarning>& warnings);

    /**
     * Decode one data row into record.data, record.date and record.time.
     * record.line must be set by the caller.
     */
    DecodeResult decodeRow(const std::vector<std::string>& fields,
                           EngineRecord& record,
                           bool strict,
                           std::vector<ParseWarning>& warnings) const;

    /**
     * Classify a single column name (no cylinder range check)
     */
    static ColumnMapping classifyColumn(const std::string& name);

    const std::vector<ColumnMapping>& columns() const { return columns_; }
    size_t maxCylinders() const { return max_cylinders_; }

    // Forget the current column layout
    void reset();

private:
    size_t max_cylinders_;
    std::vector<ColumnMapping> columns_;

    // Helper functions
    static bool isModelLine(const std::string& line);
    static bool decodeUnit(const std::string& text, TemperatureUnit& unit);
    static double toFahrenheit(double value, TemperatureUnit unit);
    static bool isTemperatureChannel(Channel channel);
    size_t countChannels(const std::vector<std::string>& fields,
                         bool& has_rpm, bool& has_egt, bool& has_cht) const;
};

} // namespace cgr30p
} // namespace aerotrace

#endif // AEROTRACE_CGR30P_H
