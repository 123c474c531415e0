#include "aerotrace/aerotrace_c.h"
#include "aerotrace/aerotrace.h"
#include <algorithm>
#include <cstring>
#include <exception>
#include <string>
#include <vector>

/* ============================================================================
 * Internal wrapper structure
 * ============================================================================ */

struct aerotrace_parser_t {
    aerotrace::EMSParser parser;
    std::vector<aerotrace::EngineRecord> records;
    aerotrace_record_callback_t on_record;
    void* record_user_data;

    aerotrace_parser_t() : on_record(nullptr), record_user_data(nullptr) {}

    explicit aerotrace_parser_t(const aerotrace::ParserConfig& config)
        : parser(config), on_record(nullptr), record_user_data(nullptr) {}
};

/* ============================================================================
 * Helper functions
 * ============================================================================ */

static void copy_text(char* dest, size_t dest_size, const std::string& src) {
    std::strncpy(dest, src.c_str(), dest_size - 1);
    dest[dest_size - 1] = '\0';
}

static size_t convert_cylinders(const aerotrace::CylinderReadings& src,
                                aerotrace_cylinder_t* dest) {
    size_t count = 0;
    for (const auto& reading : src) {
        if (count >= AEROTRACE_MAX_CYLINDERS) {
            break;
        }
        dest[count].number = reading.number;
        dest[count].value = reading.value;
        count++;
    }
    return count;
}

static void set_optional(int* has, double* value, const std::optional<double>& src) {
    *has = src ? 1 : 0;
    *value = src ? *src : 0.0;
}

static void convert_record_to_c(const aerotrace::EngineRecord& src, aerotrace_record_t* dest) {
    std::memset(dest, 0, sizeof(aerotrace_record_t));

    dest->index = src.index;
    dest->line = src.line;
    copy_text(dest->date, sizeof(dest->date), src.date);
    copy_text(dest->time, sizeof(dest->time), src.time);
    set_optional(&dest->has_elapsed, &dest->elapsed_s, src.elapsed_s);

    const aerotrace::EngineData& data = src.data;
    set_optional(&dest->has_rpm, &dest->rpm, data.rpm);
    set_optional(&dest->has_manifold_pressure, &dest->manifold_pressure, data.manifold_pressure);

    dest->egt_count = convert_cylinders(data.egts, dest->egts);
    dest->cht_count = convert_cylinders(data.chts, dest->chts);

    set_optional(&dest->has_oil_pressure, &dest->oil_pressure, data.oil_pressure);
    set_optional(&dest->has_oil_temperature, &dest->oil_temperature, data.oil_temperature);
    set_optional(&dest->has_fuel_pressure, &dest->fuel_pressure, data.fuel_pressure);
    set_optional(&dest->has_volts, &dest->volts, data.volts);
    set_optional(&dest->has_amps, &dest->amps, data.amps);
    set_optional(&dest->has_g_force, &dest->g_force, data.g_force);
}

static void convert_flight_to_c(const aerotrace::FlightSummary& src, aerotrace_flight_t* dest) {
    std::memset(dest, 0, sizeof(aerotrace_flight_t));

    dest->number = src.number;
    dest->first_index = src.first_index;
    dest->last_index = src.last_index;
    dest->sample_count = src.sample_count;
    dest->duration_s = src.duration_s;

    set_optional(&dest->has_max_rpm, &dest->max_rpm, src.max_rpm);
    if (src.max_cht) {
        dest->max_cht_cylinder = src.max_cht->number;
        dest->max_cht = src.max_cht->value;
    }
    if (src.max_egt) {
        dest->max_egt_cylinder = src.max_egt->number;
        dest->max_egt = src.max_egt->value;
    }
    set_optional(&dest->has_max_egt_spread, &dest->max_egt_spread, src.max_egt_spread);
}

static aerotrace::ParserConfig convert_config_from_c(const aerotrace_config_t* config) {
    aerotrace::ParserConfig cfg;
    cfg.ems_type = static_cast<aerotrace::EmsType>(config->ems_type);
    cfg.temperature_unit = static_cast<aerotrace::TemperatureUnit>(config->temperature_unit);
    // Records carry at most AEROTRACE_MAX_CYLINDERS readings per channel
    cfg.max_cylinders = std::min<size_t>(config->max_cylinders, AEROTRACE_MAX_CYLINDERS);
    cfg.strict = config->strict != 0;
    cfg.split_flights = config->split_flights != 0;
    cfg.flight_gap_s = config->flight_gap_s;
    return cfg;
}

static void convert_result_to_c(const aerotrace::ParseResult& src, aerotrace_result_t* dest) {
    dest->success = src.success ? 1 : 0;
    dest->ems_type = static_cast<aerotrace_ems_type_t>(src.ems_type);
    copy_text(dest->error, sizeof(dest->error), src.error);
    copy_text(dest->aircraft_id, sizeof(dest->aircraft_id), src.metadata.aircraft_id);
    dest->record_count = src.records.size();
    dest->warning_count = src.warnings.size();
    dest->rows_skipped = src.rows_skipped;
}

static int finish_parse(aerotrace_parser_t* parser,
                        aerotrace::ParseResult& cpp_result,
                        aerotrace_result_t* result) {
    convert_result_to_c(cpp_result, result);
    parser->records = std::move(cpp_result.records);
    return result->success ? AEROTRACE_OK : AEROTRACE_ERR_PARSE;
}

/* ============================================================================
 * Library functions implementation
 * ============================================================================ */

extern "C" {

const char* aerotrace_version(void) {
    return aerotrace::VERSION;
}

aerotrace_config_t aerotrace_default_config(void) {
    aerotrace::ParserConfig defaults;

    aerotrace_config_t config;
    config.ems_type = static_cast<aerotrace_ems_type_t>(defaults.ems_type);
    config.temperature_unit = static_cast<aerotrace_temperature_unit_t>(defaults.temperature_unit);
    config.max_cylinders = static_cast<uint32_t>(defaults.max_cylinders);
    config.strict = defaults.strict ? 1 : 0;
    config.split_flights = defaults.split_flights ? 1 : 0;
    config.flight_gap_s = defaults.flight_gap_s;
    return config;
}

aerotrace_parser_t* aerotrace_create(void) {
    try {
        return new aerotrace_parser_t();
    } catch (const std::exception&) {
        return nullptr;
    }
}

aerotrace_parser_t* aerotrace_create_with_config(const aerotrace_config_t* config) {
    if (!config) {
        return aerotrace_create();
    }

    try {
        auto cfg = convert_config_from_c(config);
        return new aerotrace_parser_t(cfg);
    } catch (const std::exception&) {
        return nullptr;
    }
}

void aerotrace_destroy(aerotrace_parser_t* parser) {
    delete parser;
}

int aerotrace_parse_buffer(aerotrace_parser_t* parser,
                           const char* data,
                           size_t data_len,
                           aerotrace_result_t* result) {
    if (!parser || !result || (!data && data_len > 0)) {
        return AEROTRACE_ERR_INVALID_ARG;
    }

    std::memset(result, 0, sizeof(aerotrace_result_t));

    try {
        std::string text = data ? std::string(data, data_len) : std::string();
        auto cpp_result = parser->parser.parse(text);
        return finish_parse(parser, cpp_result, result);
    } catch (const std::exception& e) {
        copy_text(result->error, sizeof(result->error), e.what());
        return AEROTRACE_ERR_INVALID_ARG;
    }
}

int aerotrace_parse_file(aerotrace_parser_t* parser,
                         const char* path,
                         aerotrace_result_t* result) {
    if (!parser || !path || !result) {
        return AEROTRACE_ERR_INVALID_ARG;
    }

    std::memset(result, 0, sizeof(aerotrace_result_t));

    try {
        auto cpp_result = parser->parser.parseFile(path);
        return finish_parse(parser, cpp_result, result);
    } catch (const std::exception& e) {
        copy_text(result->error, sizeof(result->error), e.what());
        return AEROTRACE_ERR_INVALID_ARG;
    }
}

size_t aerotrace_get_record_count(const aerotrace_parser_t* parser) {
    if (!parser) {
        return 0;
    }
    return parser->records.size();
}

int aerotrace_get_record(const aerotrace_parser_t* parser,
                         size_t index,
                         aerotrace_record_t* record) {
    if (!parser || !record) {
        return AEROTRACE_ERR_INVALID_ARG;
    }
    if (index >= parser->records.size()) {
        return AEROTRACE_ERR_NOT_FOUND;
    }

    convert_record_to_c(parser->records[index], record);
    return AEROTRACE_OK;
}

size_t aerotrace_get_flight_count(const aerotrace_parser_t* parser) {
    if (!parser) {
        return 0;
    }
    return parser->parser.getFlightCount();
}

int aerotrace_get_flight(const aerotrace_parser_t* parser,
                         size_t index,
                         aerotrace_flight_t* flight) {
    if (!parser || !flight) {
        return AEROTRACE_ERR_INVALID_ARG;
    }

    const auto& flights = parser->parser.getFlights();
    if (index >= flights.size()) {
        return AEROTRACE_ERR_NOT_FOUND;
    }

    convert_flight_to_c(flights[index], flight);
    return AEROTRACE_OK;
}

void aerotrace_clear(aerotrace_parser_t* parser) {
    if (parser) {
        parser->records.clear();
        parser->parser.clear();
    }
}

void aerotrace_set_on_record(aerotrace_parser_t* parser,
                             aerotrace_record_callback_t callback,
                             void* user_data) {
    if (!parser) {
        return;
    }

    parser->on_record = callback;
    parser->record_user_data = user_data;

    if (callback) {
        parser->parser.setOnRecord([parser](const aerotrace::EngineRecord& record) {
            aerotrace_record_t c_record;
            convert_record_to_c(record, &c_record);
            parser->on_record(&c_record, parser->record_user_data);
        });
    } else {
        parser->parser.setOnRecord(nullptr);
    }
}

} /* extern "C" */
