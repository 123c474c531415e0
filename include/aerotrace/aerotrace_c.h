#ifndef AEROTRACE_C_H
#define AEROTRACE_C_H

/**
 * AeroTrace C API - Pure C interface for cross-language bindings
 *
 * This header provides a C-compatible API for use with:
 * - Python ctypes/cffi
 * - Other FFI systems
 */

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Opaque handle types
 * ============================================================================ */

typedef struct aerotrace_parser_t aerotrace_parser_t;

/* ============================================================================
 * Enumerations
 * ============================================================================ */

typedef enum {
    AEROTRACE_EMS_UNKNOWN = 0,
    AEROTRACE_EMS_CGR_30P = 1
} aerotrace_ems_type_t;

typedef enum {
    AEROTRACE_UNIT_FAHRENHEIT = 0,
    AEROTRACE_UNIT_CELSIUS = 1
} aerotrace_temperature_unit_t;

/* ============================================================================
 * Data structures (C-compatible, fixed-size)
 * ============================================================================ */

#define AEROTRACE_MAX_CYLINDERS 12
#define AEROTRACE_MAX_TEXT_LENGTH 32
#define AEROTRACE_MAX_ERROR_LENGTH 128

/* Return codes */
#define AEROTRACE_OK 0
#define AEROTRACE_ERR_INVALID_ARG (-1)
#define AEROTRACE_ERR_NOT_FOUND (-2)
#define AEROTRACE_ERR_PARSE 1

typedef struct {
    int number;         /* 1-based, 0 = unused slot */
    double value;       /* Degrees F */
} aerotrace_cylinder_t;

typedef struct {
    size_t index;
    size_t line;
    char date[AEROTRACE_MAX_TEXT_LENGTH];
    char time[AEROTRACE_MAX_TEXT_LENGTH];

    int has_elapsed;
    double elapsed_s;

    int has_rpm;
    double rpm;
    int has_manifold_pressure;
    double manifold_pressure;       /* inHg */

    size_t egt_count;
    aerotrace_cylinder_t egts[AEROTRACE_MAX_CYLINDERS];
    size_t cht_count;
    aerotrace_cylinder_t chts[AEROTRACE_MAX_CYLINDERS];

    int has_oil_pressure;
    double oil_pressure;            /* PSI */
    int has_oil_temperature;
    double oil_temperature;         /* Degrees F */
    int has_fuel_pressure;
    double fuel_pressure;           /* PSI */
    int has_volts;
    double volts;
    int has_amps;
    double amps;
    int has_g_force;
    double g_force;
} aerotrace_record_t;

typedef struct {
    uint32_t number;
    size_t first_index;
    size_t last_index;
    size_t sample_count;
    double duration_s;

    int has_max_rpm;
    double max_rpm;
    int max_cht_cylinder;           /* 0 if no CHT data */
    double max_cht;
    int max_egt_cylinder;           /* 0 if no EGT data */
    double max_egt;
    int has_max_egt_spread;
    double max_egt_spread;
} aerotrace_flight_t;

typedef struct {
    int success;
    aerotrace_ems_type_t ems_type;
    char error[AEROTRACE_MAX_ERROR_LENGTH];
    char aircraft_id[AEROTRACE_MAX_TEXT_LENGTH];
    size_t record_count;
    size_t warning_count;
    size_t rows_skipped;
} aerotrace_result_t;

typedef struct {
    aerotrace_ems_type_t ems_type;  /* UNKNOWN = auto-detect */
    aerotrace_temperature_unit_t temperature_unit;
    uint32_t max_cylinders;         /* Clamped to AEROTRACE_MAX_CYLINDERS */
    int strict;
    int split_flights;
    double flight_gap_s;
} aerotrace_config_t;

/* ============================================================================
 * Callback types
 * ============================================================================ */

typedef void (*aerotrace_record_callback_t)(const aerotrace_record_t* record, void* user_data);

/* ============================================================================
 * Library functions
 * ============================================================================ */

/**
 * Get library version string
 */
const char* aerotrace_version(void);

/**
 * Get default configuration
 */
aerotrace_config_t aerotrace_default_config(void);

/**
 * Create a new parser instance with default configuration
 * @return Parser handle, or NULL on failure
 */
aerotrace_parser_t* aerotrace_create(void);

/**
 * Create a new parser instance with custom configuration
 * @param config Configuration options
 * @return Parser handle, or NULL on failure
 */
aerotrace_parser_t* aerotrace_create_with_config(const aerotrace_config_t* config);

/**
 * Destroy a parser instance and free resources
 * @param parser Parser handle
 */
void aerotrace_destroy(aerotrace_parser_t* parser);

/**
 * Parse a data log held in memory
 * @param parser Parser handle
 * @param data Log text
 * @param data_len Length of the text
 * @param result Output result structure
 * @return AEROTRACE_OK on success, AEROTRACE_ERR_PARSE if the log could not
 *         be parsed, negative on invalid arguments
 */
int aerotrace_parse_buffer(aerotrace_parser_t* parser,
                           const char* data,
                           size_t data_len,
                           aerotrace_result_t* result);

/**
 * Parse a data log file
 * @param parser Parser handle
 * @param path File path
 * @param result Output result structure
 * @return Same codes as aerotrace_parse_buffer
 */
int aerotrace_parse_file(aerotrace_parser_t* parser,
                         const char* path,
                         aerotrace_result_t* result);

/**
 * Get count of records retained from the last parse
 */
size_t aerotrace_get_record_count(const aerotrace_parser_t* parser);

/**
 * Get a record from the last parse
 * @return AEROTRACE_OK, or AEROTRACE_ERR_NOT_FOUND if index is out of range
 */
int aerotrace_get_record(const aerotrace_parser_t* parser,
                         size_t index,
                         aerotrace_record_t* record);

/**
 * Get count of flights seen so far
 */
size_t aerotrace_get_flight_count(const aerotrace_parser_t* parser);

/**
 * Get a flight summary (0-based position)
 * @return AEROTRACE_OK, or AEROTRACE_ERR_NOT_FOUND if index is out of range
 */
int aerotrace_get_flight(const aerotrace_parser_t* parser,
                         size_t index,
                         aerotrace_flight_t* flight);

/**
 * Clear records and flights
 */
void aerotrace_clear(aerotrace_parser_t* parser);

/**
 * Set callback for every decoded record
 * @param parser Parser handle
 * @param callback Callback function (NULL to remove)
 * @param user_data User data passed to callback
 */
void aerotrace_set_on_record(aerotrace_parser_t* parser,
                             aerotrace_record_callback_t callback,
                             void* user_data);

#ifdef __cplusplus
}
#endif

#endif /* AEROTRACE_C_H */
