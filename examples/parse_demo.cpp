#include <iostream>
#include <iomanip>
#include "aerotrace/aerotrace.h"

// Example: Parsing a CGR-30P data log and writing the standardized CSV
//
// Usage: aerotrace_parse_demo [log.csv [out.csv]]

namespace {

// Short CGR-30P export used when no file is given
const char* SAMPLE_LOG =
    "Electronics International Inc.\n"
    "CGR-30P Data Log\n"
    "Aircraft ID: N4218X\n"
    "Serial Number: 300571\n"
    "Software Version: 2.3\n"
    "DATE,TIME,RPM,MAP,EGT1,EGT2,EGT3,EGT4,CHT1,CHT2,CHT3,CHT4,OIL P,OIL T,FUEL P,VOLTS,AMPS,G\n"
    "05/13/2024,14:02:10,2410,24.8,1310,1342,1298,1325,372,381,366,379,68,188,24.1,14.1,12.3,1.0\n"
    "05/13/2024,14:02:16,2420,24.9,1318,1350,1301,1330,375,384,368,381,67,189,24.0,14.1,12.1,1.1\n"
    "05/13/2024,14:02:22,2700,25.0,1402,1561,1390,1415,402,468,391,399,66,191,23.9,14.2,11.8,1.0\n"
    "05/13/2024,14:02:28,2400,24.7,1300,1338,1290,1320,371,379,---,378,68,190,24.2,14.1,12.4,0.9\n";

void printMetadata(const aerotrace::ParseResult& result) {
    std::cout << "  EMS:      " << aerotrace::emsTypeName(result.ems_type) << std::endl;
    std::cout << "  Model:    " << result.metadata.model << std::endl;
    std::cout << "  Aircraft: " << result.metadata.aircraft_id << std::endl;
    std::cout << "  Serial:   " << result.metadata.serial_number << std::endl;
    std::cout << "  Software: " << result.metadata.software_version << std::endl;
    std::cout << "  Records:  " << result.records.size()
              << " (" << result.rows_skipped << " rows skipped)" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    std::cout << "AeroTrace v" << aerotrace::VERSION << std::endl;
    std::cout << "========================================" << std::endl;

    aerotrace::EMSParser parser;

    parser.setOnNewFlight([](const aerotrace::FlightSummary& flight) {
        std::cout << "[NEW FLIGHT] #" << flight.number
                  << " starting " << flight.start_date << " " << flight.start_time
                  << std::endl;
    });

    parser.setOnWarning([](const aerotrace::ParseWarning& warning) {
        std::cerr << "[WARNING] line " << warning.line << ": " << warning.message << std::endl;
    });

    aerotrace::ParseResult result;
    if (argc > 1) {
        std::cout << "\nParsing " << argv[1] << "..." << std::endl;
        result = parser.parseFile(argv[1]);
    } else {
        std::cout << "\nParsing built-in sample log..." << std::endl;
        result = parser.parse(std::string(SAMPLE_LOG));
    }

    if (!result.success) {
        std::cout << "[FAILED] " << result.error << std::endl;
        return 1;
    }

    std::cout << "\n[SUCCESS]" << std::endl;
    printMetadata(result);

    std::cout << "\nFlights:" << std::endl;
    aerotrace::output::StandardWriter writer;
    writer.writeSummary(parser.getFlights(), std::cout);

    aerotrace::analysis::ExceedanceDetector detector;
    auto exceedances = detector.analyzeAll(result.records);

    std::cout << "\nExceedances: " << exceedances.size() << std::endl;
    for (const auto& e : exceedances) {
        std::cout << "  #" << e.record_index << " "
                  << aerotrace::analysis::exceedanceTypeName(e.type) << ": "
                  << e.description << " (" << std::fixed << std::setprecision(1)
                  << e.actual_value << " / " << e.limit << ")" << std::endl;
    }

    if (argc > 2) {
        if (!writer.writeFile(result.records, argv[2])) {
            std::cout << "[FAILED] Cannot write " << argv[2] << std::endl;
            return 1;
        }
        std::cout << "\nStandardized data written to " << argv[2] << std::endl;
    } else {
        std::cout << "\nStandardized data:" << std::endl;
        writer.write(result.records, std::cout);
    }

    return 0;
}
