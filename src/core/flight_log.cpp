#include "aerotrace/flight_log.h"
#include <utility>

namespace aerotrace {

namespace {

void keepMax(std::optional<double>& current, const std::optional<double>& value) {
    if (value && (!current || *value > *current)) {
        current = value;
    }
}

void keepMin(std::optional<double>& current, const std::optional<double>& value) {
    if (value && (!current || *value < *current)) {
        current = value;
    }
}

void keepHottest(std::optional<CylinderReading>& current, const CylinderReadings& readings) {
    auto hottest = readings.hottest();
    if (hottest && (!current || hottest->value > current->value)) {
        current = hottest;
    }
}

} // namespace

FlightLog::FlightLog(double gap_s)
    : gap_s_(gap_s), force_new_(false) {}

bool FlightLog::startsNewFlight(const EngineRecord& record) const {
    if (flights_.empty() || force_new_) {
        return true;
    }

    const FlightSummary& flight = flights_.back();
    if (!record.elapsed_s || !flight.end_elapsed_s) {
        return false;
    }

    double delta = *record.elapsed_s - *flight.end_elapsed_s;

    // Clock went backwards: a different log run
    if (delta < 0.0) {
        return true;
    }

    return delta > gap_s_;
}

void FlightLog::accumulate(FlightSummary& flight, const EngineRecord& record) {
    const EngineData& data = record.data;

    flight.last_index = record.index;
    flight.sample_count++;

    if (!record.date.empty()) {
        flight.end_date = record.date;
        if (flight.start_date.empty()) {
            flight.start_date = record.date;
        }
    }
    if (!record.time.empty()) {
        flight.end_time = record.time;
        if (flight.start_time.empty()) {
            flight.start_time = record.time;
        }
    }

    if (record.elapsed_s) {
        if (!flight.start_elapsed_s) {
            flight.start_elapsed_s = record.elapsed_s;
        }
        flight.end_elapsed_s = record.elapsed_s;
        flight.duration_s = *flight.end_elapsed_s - *flight.start_elapsed_s;
    }

    keepMax(flight.max_rpm, data.rpm);
    keepHottest(flight.max_cht, data.chts);
    keepHottest(flight.max_egt, data.egts);
    keepMax(flight.max_egt_spread, data.egts.difference());
    keepMin(flight.min_oil_pressure, data.oil_pressure);
    keepMax(flight.max_oil_pressure, data.oil_pressure);
    keepMax(flight.max_oil_temperature, data.oil_temperature);
    keepMin(flight.min_volts, data.volts);
}

bool FlightLog::update(const EngineRecord& record) {
    bool is_new = startsNewFlight(record);
    force_new_ = false;

    if (is_new) {
        FlightSummary flight;
        flight.number = static_cast<uint32_t>(flights_.size() + 1);
        flight.first_index = record.index;
        accumulate(flight, record);
        flights_.push_back(flight);

        if (on_new_flight_) {
            on_new_flight_(flights_.back());
        }
    } else {
        FlightSummary& existing = flights_.back();
        accumulate(existing, record);

        if (on_flight_update_) {
            on_flight_update_(existing);
        }
    }

    return is_new;
}

void FlightLog::beginLog() {
    force_new_ = true;
}

const std::vector<FlightSummary>& FlightLog::getFlights() const {
    return flights_;
}

const FlightSummary* FlightLog::current() const {
    return flights_.empty() ? nullptr : &flights_.back();
}

size_t FlightLog::count() const {
    return flights_.size();
}

void FlightLog::clear() {
    flights_.clear();
    force_new_ = false;
}

void FlightLog::setOnNewFlight(FlightCallback callback) {
    on_new_flight_ = std::move(callback);
}

void FlightLog::setOnFlightUpdate(FlightCallback callback) {
    on_flight_update_ = std::move(callback);
}

} // namespace aerotrace
