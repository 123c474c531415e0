#ifndef AEROTRACE_STANDARD_WRITER_H
#define AEROTRACE_STANDARD_WRITER_H

#include "aerotrace/types.h"
#include "aerotrace/flight_log.h"
#include <iosfwd>
#include <string>
#include <vector>

namespace aerotrace {
namespace output {

// Options for the standardized CSV
struct WriterConfig {
    char delimiter = ',';
    int precision = 1;          // Digits after the decimal point
    bool include_header = true;
};

/**
 * Writes decoded records in the standardized AeroTrace CSV layout:
 *
 *   index,date,time,elapsed_s,rpm,map_inhg,egt1..egtN,cht1..chtN,
 *   oil_press_psi,oil_temp_f,fuel_press_psi,volts,amps,g_force
 *
 * N is the highest cylinder number in the record set. Absent values
 * are written as empty cells.
 */
class StandardWriter {
public:
    StandardWriter();
    explicit StandardWriter(const WriterConfig& config);

    void write(const std::vector<EngineRecord>& records, std::ostream& out) const;

    // Returns false if the file cannot be opened or written
    bool writeFile(const std::vector<EngineRecord>& records, const std::string& path) const;

    // One line per flight
    void writeSummary(const std::vector<FlightSummary>& flights, std::ostream& out) const;

    // Column names for a given cylinder count
    std::vector<std::string> columnNames(int cylinders) const;

    // Highest cylinder number in EGT or CHT readings
    static int maxCylinder(const std::vector<EngineRecord>& records);

    const WriterConfig& config() const { return config_; }

private:
    WriterConfig config_;

    std::string formatValue(const std::optional<double>& value) const;
    std::string quote(const std::string& text) const;
};

} // namespace output
} // namespace aerotrace

#endif // AEROTRACE_STANDARD_WRITER_H
