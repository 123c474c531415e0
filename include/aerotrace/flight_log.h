#ifndef AEROTRACE_FLIGHT_LOG_H
#define AEROTRACE_FLIGHT_LOG_H

#include "aerotrace/types.h"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace aerotrace {

// Running summary of one flight
struct FlightSummary {
    uint32_t number = 0;            // Flight number (1-based)

    size_t first_index = 0;         // First record index
    size_t last_index = 0;          // Last record index
    size_t sample_count = 0;

    std::string start_date;
    std::string start_time;
    std::string end_date;
    std::string end_time;
    double duration_s = 0.0;

    // Extremes over the flight
    std::optional<double> max_rpm;
    std::optional<CylinderReading> max_cht;
    std::optional<CylinderReading> max_egt;
    std::optional<double> max_egt_spread;
    std::optional<double> min_oil_pressure;
    std::optional<double> max_oil_pressure;
    std::optional<double> max_oil_temperature;
    std::optional<double> min_volts;

    // Elapsed time of the first and latest timed samples
    std::optional<double> start_elapsed_s;
    std::optional<double> end_elapsed_s;
};

using FlightCallback = std::function<void(const FlightSummary&)>;

class FlightLog {
public:
    explicit FlightLog(double gap_s = 300.0);

    // Add a record to the current flight or open a new one
    // Returns true if this record started a new flight
    bool update(const EngineRecord& record);

    // Next record starts a new flight (new log file)
    void beginLog();

    // All flights, oldest first
    const std::vector<FlightSummary>& getFlights() const;

    // Flight currently being filled (nullptr if none)
    const FlightSummary* current() const;

    // Get count of flights
    size_t count() const;

    // Clear all flights
    void clear();

    // Set callbacks
    void setOnNewFlight(FlightCallback callback);
    void setOnFlightUpdate(FlightCallback callback);

    double gap() const { return gap_s_; }

private:
    std::vector<FlightSummary> flights_;
    double gap_s_;
    bool force_new_;

    FlightCallback on_new_flight_;
    FlightCallback on_flight_update_;

    bool startsNewFlight(const EngineRecord& record) const;
    static void accumulate(FlightSummary& flight, const EngineRecord& record);
};

} // namespace aerotrace

#endif // AEROTRACE_FLIGHT_LOG_H
