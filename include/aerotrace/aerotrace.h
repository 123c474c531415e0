#ifndef AEROTRACE_H
#define AEROTRACE_H

// AeroTrace - Main include header
// Include this file to access all AeroTrace functionality

#include "aerotrace/types.h"
#include "aerotrace/parser.h"
#include "aerotrace/flight_log.h"
#include "aerotrace/exceedance_detector.h"
#include "aerotrace/standard_writer.h"

namespace aerotrace {

// Library version
constexpr const char* VERSION = "0.1.0";
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

} // namespace aerotrace

#endif // AEROTRACE_H
