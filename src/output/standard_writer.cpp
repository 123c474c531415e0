#include "aerotrace/standard_writer.h"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace aerotrace {
namespace output {

StandardWriter::StandardWriter() : StandardWriter(WriterConfig{}) {}

StandardWriter::StandardWriter(const WriterConfig& config) : config_(config) {}

int StandardWriter::maxCylinder(const std::vector<EngineRecord>& records) {
    int highest = 0;
    for (const auto& record : records) {
        for (const auto& r : record.data.egts) {
            highest = std::max(highest, r.number);
        }
        for (const auto& r : record.data.chts) {
            highest = std::max(highest, r.number);
        }
    }
    return highest;
}

std::vector<std::string> StandardWriter::columnNames(int cylinders) const {
    std::vector<std::string> names = {"index", "date", "time", "elapsed_s", "rpm", "map_inhg"};

    for (int i = 1; i <= cylinders; i++) {
        names.push_back("egt" + std::to_string(i));
    }
    for (int i = 1; i <= cylinders; i++) {
        names.push_back("cht" + std::to_string(i));
    }

    names.insert(names.end(), {"oil_press_psi", "oil_temp_f", "fuel_press_psi",
                               "volts", "amps", "g_force"});
    return names;
}

std::string StandardWriter::formatValue(const std::optional<double>& value) const {
    if (!value) {
        return std::string();
    }

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(std::max(0, config_.precision)) << *value;
    return ss.str();
}

std::string StandardWriter::quote(const std::string& text) const {
    if (text.find(config_.delimiter) == std::string::npos &&
        text.find('"') == std::string::npos) {
        return text;
    }

    std::string out = "\"";
    for (char c : text) {
        if (c == '"') {
            out.push_back('"');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

void StandardWriter::write(const std::vector<EngineRecord>& records, std::ostream& out) const {
    const int cylinders = maxCylinder(records);
    const char d = config_.delimiter;

    if (config_.include_header) {
        auto names = columnNames(cylinders);
        for (size_t i = 0; i < names.size(); i++) {
            if (i > 0) {
                out << d;
            }
            out << names[i];
        }
        out << '\n';
    }

    for (const auto& record : records) {
        const EngineData& data = record.data;

        out << record.index << d
            << quote(record.date) << d
            << quote(record.time) << d
            << formatValue(record.elapsed_s) << d
            << formatValue(data.rpm) << d
            << formatValue(data.manifold_pressure);

        for (int cyl = 1; cyl <= cylinders; cyl++) {
            auto egt = data.egts.find(cyl);
            out << d << formatValue(egt ? std::optional<double>(egt->value) : std::nullopt);
        }
        for (int cyl = 1; cyl <= cylinders; cyl++) {
            auto cht = data.chts.find(cyl);
            out << d << formatValue(cht ? std::optional<double>(cht->value) : std::nullopt);
        }

        out << d << formatValue(data.oil_pressure)
            << d << formatValue(data.oil_temperature)
            << d << formatValue(data.fuel_pressure)
            << d << formatValue(data.volts)
            << d << formatValue(data.amps)
            << d << formatValue(data.g_force)
            << '\n';
    }
}

bool StandardWriter::writeFile(const std::vector<EngineRecord>& records,
                               const std::string& path) const {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }

    write(records, file);
    file.flush();
    return static_cast<bool>(file);
}

void StandardWriter::writeSummary(const std::vector<FlightSummary>& flights,
                                  std::ostream& out) const {
    const char d = config_.delimiter;

    if (config_.include_header) {
        out << "flight" << d << "start_date" << d << "start_time" << d
            << "end_date" << d << "end_time" << d << "duration_s" << d
            << "samples" << d << "max_rpm" << d << "max_cht" << d
            << "max_cht_cyl" << d << "max_egt" << d << "max_egt_cyl" << d
            << "max_egt_spread" << d << "min_oil_press_psi" << d
            << "max_oil_temp_f" << d << "min_volts" << '\n';
    }

    for (const auto& f : flights) {
        out << f.number << d
            << quote(f.start_date) << d << quote(f.start_time) << d
            << quote(f.end_date) << d << quote(f.end_time) << d
            << formatValue(f.duration_s) << d
            << f.sample_count << d
            << formatValue(f.max_rpm) << d
            << formatValue(f.max_cht ? std::optional<double>(f.max_cht->value) : std::nullopt) << d
            << (f.max_cht ? std::to_string(f.max_cht->number) : std::string()) << d
            << formatValue(f.max_egt ? std::optional<double>(f.max_egt->value) : std::nullopt) << d
            << (f.max_egt ? std::to_string(f.max_egt->number) : std::string()) << d
            << formatValue(f.max_egt_spread) << d
            << formatValue(f.min_oil_pressure) << d
            << formatValue(f.max_oil_temperature) << d
            << formatValue(f.min_volts) << '\n';
    }
}

} // namespace output
} // namespace aerotrace
