#ifndef AEROTRACE_PARSER_H
#define AEROTRACE_PARSER_H

#include "aerotrace/types.h"
#include "aerotrace/flight_log.h"
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace aerotrace {

// Configuration options for the parser
struct ParserConfig {
    // Format options
    EmsType ems_type = EmsType::UNKNOWN;    // UNKNOWN = auto-detect
    TemperatureUnit temperature_unit = TemperatureUnit::FAHRENHEIT; // When the log declares none
    size_t max_cylinders = 12;              // Highest cylinder number accepted
    bool strict = false;                    // Fail on the first malformed value

    // Flight grouping
    bool split_flights = true;              // Feed records to the flight log
    double flight_gap_s = 300.0;            // Time gap that starts a new flight

    // Retain decoded records in ParseResult (off for callback-only streaming)
    bool keep_records = true;
};

// Callbacks for parse events
using RecordCallback = std::function<void(const EngineRecord&)>;
using WarningCallback = std::function<void(const ParseWarning&)>;

// Main parser class
class EMSParser {
public:
    EMSParser();
    explicit EMSParser(const ParserConfig& config);
    ~EMSParser();

    // Non-copyable
    EMSParser(const EMSParser&) = delete;
    EMSParser& operator=(const EMSParser&) = delete;

    // Movable
    EMSParser(EMSParser&&) noexcept;
    EMSParser& operator=(EMSParser&&) noexcept;

    // Detect the EMS type of a log from its text
    EmsType detect(const std::string& text) const;

    // Parse a complete log held in memory
    ParseResult parse(const std::string& text);

    // Parse a log from a stream, one line at a time
    ParseResult parse(std::istream& input);

    // Parse a log file
    ParseResult parseFile(const std::string& path);

    // Flights seen since construction or the last clear()
    const std::vector<FlightSummary>& getFlights() const;
    size_t getFlightCount() const;

    // Forget all flights
    void clear();

    // Set callback for every decoded record
    void setOnRecord(RecordCallback callback);

    // Set callback for a new flight
    void setOnNewFlight(FlightCallback callback);

    // Set callback for warnings
    void setOnWarning(WarningCallback callback);

    const ParserConfig& config() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace aerotrace

#endif // AEROTRACE_PARSER_H
