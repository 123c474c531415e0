#include "aerotrace/cgr30p.h"
#include "aerotrace/csv_reader.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <initializer_list>
#include <utility>

namespace aerotrace {
namespace cgr30p {

namespace {

struct ChannelAlias {
    const char* name;       // Normalized column name
    Channel channel;
};

// Column names seen in CGR-30P exports and their common variants
constexpr ChannelAlias CHANNEL_ALIASES[] = {
    {"DATE", Channel::DATE},
    {"LOCALDATE", Channel::DATE},
    {"TIME", Channel::TIME},
    {"LOCALTIME", Channel::TIME},
    {"UTCTIME", Channel::TIME},
    {"RPM", Channel::RPM},
    {"RPML", Channel::RPM},
    {"RPMR", Channel::RPM},
    {"TACH", Channel::RPM},
    {"MAP", Channel::MAP},
    {"MANP", Channel::MAP},
    {"MP", Channel::MAP},
    {"MANIFOLDPRESSURE", Channel::MAP},
    {"OILP", Channel::OIL_PRESSURE},
    {"OILPRESS", Channel::OIL_PRESSURE},
    {"OILPRESSURE", Channel::OIL_PRESSURE},
    {"OILT", Channel::OIL_TEMPERATURE},
    {"OILTEMP", Channel::OIL_TEMPERATURE},
    {"OILTEMPERATURE", Channel::OIL_TEMPERATURE},
    {"FUELP", Channel::FUEL_PRESSURE},
    {"FUELPRESS", Channel::FUEL_PRESSURE},
    {"FUELPRESSURE", Channel::FUEL_PRESSURE},
    {"FP", Channel::FUEL_PRESSURE},
    {"VOLTS", Channel::VOLTS},
    {"VOLT", Channel::VOLTS},
    {"BUSV", Channel::VOLTS},
    {"V", Channel::VOLTS},
    {"AMPS", Channel::AMPS},
    {"AMP", Channel::AMPS},
    {"A", Channel::AMPS},
    {"G", Channel::G_FORCE},
    {"GMETER", Channel::G_FORCE},
    {"GFORCE", Channel::G_FORCE},
    {"GLOAD", Channel::G_FORCE},
};

// "EGT12" with prefix "EGT" -> 12
bool parseCylinderColumn(const std::string& name, const char* prefix, int& cylinder) {
    std::string p(prefix);
    if (name.size() <= p.size() || name.compare(0, p.size(), p) != 0) {
        return false;
    }

    std::string digits = name.substr(p.size());
    if (digits.size() > 2) {
        return false;
    }
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }

    cylinder = std::stoi(digits);
    return cylinder >= 1;
}

bool keyIn(const std::string& key, std::initializer_list<const char*> names) {
    for (const char* n : names) {
        if (key == n) {
            return true;
        }
    }
    return false;
}

} // namespace

CGR30P_Decoder::CGR30P_Decoder(size_t max_cylinders)
    : max_cylinders_(max_cylinders) {}

ColumnMapping CGR30P_Decoder::classifyColumn(const std::string& name) {
    ColumnMapping mapping;
    mapping.name = utils::trim(name);

    std::string normalized = utils::normalizeColumnName(name);
    if (normalized.empty()) {
        return mapping;
    }

    for (const auto& alias : CHANNEL_ALIASES) {
        if (normalized == alias.name) {
            mapping.channel = alias.channel;
            break;
        }
    }

    if (mapping.channel == Channel::NONE) {
        int cylinder = 0;
        // Longer prefixes first so "CHT1" is not read as "C" + "HT1"
        if (parseCylinderColumn(normalized, "EGT", cylinder) ||
            parseCylinderColumn(normalized, "E", cylinder)) {
            mapping.channel = Channel::EGT;
            mapping.cylinder = cylinder;
        } else if (parseCylinderColumn(normalized, "CHT", cylinder) ||
                   parseCylinderColumn(normalized, "C", cylinder)) {
            mapping.channel = Channel::CHT;
            mapping.cylinder = cylinder;
        }
    }

    if (isTemperatureChannel(mapping.channel)) {
        std::string unit = utils::columnUnit(name);
        if (!unit.empty() && decodeUnit(unit, mapping.unit)) {
            mapping.unit_declared = true;
        }
    }

    return mapping;
}

size_t CGR30P_Decoder::countChannels(const std::vector<std::string>& fields,
                                     bool& has_rpm, bool& has_egt, bool& has_cht) const {
    size_t count = 0;
    has_rpm = false;
    has_egt = false;
    has_cht = false;

    for (const auto& field : fields) {
        ColumnMapping m = classifyColumn(field);
        switch (m.channel) {
            case Channel::NONE:
            case Channel::DATE:
            case Channel::TIME:
                continue;
            case Channel::RPM:
                has_rpm = true;
                break;
            case Channel::EGT:
                has_egt = true;
                break;
            case Channel::CHT:
                has_cht = true;
                break;
            default:
                break;
        }
        count++;
    }

    return count;
}

bool CGR30P_Decoder::isHeaderRow(const std::vector<std::string>& fields) const {
    bool has_rpm = false;
    bool has_egt = false;
    bool has_cht = false;
    return countChannels(fields, has_rpm, has_egt, has_cht) >= MIN_HEADER_CHANNELS;
}

bool CGR30P_Decoder::isCGR30P(const std::vector<std::string>& lines) const {
    for (const auto& line : lines) {
        if (isModelLine(line)) {
            return true;
        }

        bool has_rpm = false;
        bool has_egt = false;
        bool has_cht = false;
        countChannels(utils::splitCsvLine(line), has_rpm, has_egt, has_cht);
        if (has_rpm && has_egt && has_cht) {
            return true;
        }
    }

    return false;
}

bool CGR30P_Decoder::isModelLine(const std::string& line) {
    std::string compact;
    compact.reserve(line.size());
    for (char c : line) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x80 && std::isalnum(uc)) {
            compact.push_back(static_cast<char>(std::toupper(uc)));
        }
    }
    return compact.find("CGR30P") != std::string::npos;
}

bool CGR30P_Decoder::decodeUnit(const std::string& text, TemperatureUnit& unit) {
    std::string u = utils::normalizeColumnName(text);

    if (u == "F" || u == "FAHRENHEIT" || u == "DEGF") {
        unit = TemperatureUnit::FAHRENHEIT;
        return true;
    }
    if (u == "C" || u == "CELSIUS" || u == "CENTIGRADE" || u == "DEGC") {
        unit = TemperatureUnit::CELSIUS;
        return true;
    }
    return false;
}

double CGR30P_Decoder::toFahrenheit(double value, TemperatureUnit unit) {
    if (unit == TemperatureUnit::CELSIUS) {
        return value * 9.0 / 5.0 + 32.0;
    }
    return value;
}

bool CGR30P_Decoder::isTemperatureChannel(Channel channel) {
    return channel == Channel::EGT || channel == Channel::CHT ||
           channel == Channel::OIL_TEMPERATURE;
}

bool CGR30P_Decoder::decodePreambleLine(const std::string& line, FlightMetadata& metadata) const {
    std::string text = utils::trim(line);
    if (text.empty()) {
        return false;
    }

    bool recognized = false;
    if (isModelLine(text)) {
        metadata.model = MODEL_NAME;
        recognized = true;
    }

    std::string key;
    std::string value;
    size_t colon = text.find(':');
    size_t comma = text.find(',');
    if (colon != std::string::npos && (comma == std::string::npos || colon < comma)) {
        key = utils::trim(text.substr(0, colon));
        value = utils::trim(text.substr(colon + 1));
    } else {
        auto fields = utils::splitCsvLine(text);
        if (fields.size() >= 2) {
            key = fields[0];
            value = fields[1];
            for (size_t i = 2; i < fields.size(); i++) {
                if (!fields[i].empty()) {
                    return recognized;  // Not a key/value pair
                }
            }
        }
    }

    std::string k = utils::normalizeColumnName(key);
    if (k.empty()) {
        return recognized;
    }

    if (keyIn(k, {"AIRCRAFTID", "AIRCRAFT", "TAILNUMBER", "TAIL", "REGISTRATION", "NNUMBER"})) {
        metadata.aircraft_id = value;
    } else if (keyIn(k, {"SERIALNUMBER", "SERIALNO", "SERIAL", "SN"})) {
        metadata.serial_number = value;
    } else if (keyIn(k, {"SOFTWAREVERSION", "SOFTWARE", "SWVERSION", "FIRMWARE",
                         "FIRMWAREVERSION", "VERSION"})) {
        metadata.software_version = value;
    } else if (keyIn(k, {"MODEL", "EMS", "EMSMODEL", "INSTRUMENT"})) {
        if (metadata.model.empty()) {
            metadata.model = value;
        }
    } else if (keyIn(k, {"TEMPERATUREUNIT", "TEMPERATUREUNITS", "TEMPUNIT", "TEMPUNITS"}) &&
               decodeUnit(value, metadata.temperature_unit)) {
        metadata.temperature_unit_declared = true;
    } else {
        metadata.extra.emplace_back(key, value);
    }

    return true;
}

DecodeResult CGR30P_Decoder::decodeHeader(const std::vector<std::string>& fields,
                                          const FlightMetadata& metadata,
                                          size_t line,
                                          std::vector<ParseWarning>& warnings) {
    DecodeResult result;
    columns_.clear();
    columns_.reserve(fields.size());

    size_t data_channels = 0;

    for (const auto& field : fields) {
        ColumnMapping m = classifyColumn(field);

        if ((m.channel == Channel::EGT || m.channel == Channel::CHT) &&
            static_cast<size_t>(m.cylinder) > max_cylinders_) {
            warnings.push_back({line, "Column '" + m.name + "' exceeds " +
                                      std::to_string(max_cylinders_) +
                                      " cylinders, ignored"});
            m.channel = Channel::NONE;
        }

        if (m.channel != Channel::NONE) {
            bool duplicate = std::any_of(columns_.begin(), columns_.end(),
                                         [&m](const ColumnMapping& c) {
                                             return c.channel == m.channel &&
                                                    c.cylinder == m.cylinder;
                                         });
            if (duplicate) {
                warnings.push_back({line, "Duplicate column '" + m.name + "' ignored"});
                m.channel = Channel::NONE;
            }
        }

        if (isTemperatureChannel(m.channel) && !m.unit_declared) {
            m.unit = metadata.temperature_unit;
        }

        if (m.channel != Channel::NONE && m.channel != Channel::DATE &&
            m.channel != Channel::TIME) {
            data_channels++;
        }

        columns_.push_back(std::move(m));
    }

    if (data_channels == 0) {
        columns_.clear();
        result.error = "Header has no data channels";
        return result;
    }

    result.success = true;
    return result;
}

DecodeResult CGR30P_Decoder::decodeRow(const std::vector<std::string>& fields,
                                       EngineRecord& record,
                                       bool strict,
                                       std::vector<ParseWarning>& warnings) const {
    DecodeResult result;

    if (columns_.empty()) {
        result.error = "Column header not decoded";
        return result;
    }

    std::vector<std::pair<int, double>> egts;
    std::vector<std::pair<int, double>> chts;
    size_t values = 0;
    EngineData& data = record.data;

    for (size_t i = 0; i < columns_.size(); i++) {
        const ColumnMapping& col = columns_[i];
        if (col.channel == Channel::NONE) {
            continue;
        }

        // Short rows read as missing values
        const std::string text = (i < fields.size()) ? fields[i] : std::string();

        if (col.channel == Channel::DATE) {
            record.date = text;
            continue;
        }
        if (col.channel == Channel::TIME) {
            record.time = text;
            continue;
        }

        if (utils::isMissingValue(text)) {
            continue;
        }

        double value = 0.0;
        bool valid = utils::parseNumber(text, value);
        if (valid && isTemperatureChannel(col.channel)) {
            value = toFahrenheit(value, col.unit);
            valid = std::isfinite(value);   // Celsius near DBL_MAX overflows
        }

        if (!valid) {
            std::string message = "Invalid value '" + text + "' in column '" + col.name + "'";
            if (strict) {
                result.error = message;
                return result;
            }
            warnings.push_back({record.line, message});
            continue;
        }

        switch (col.channel) {
            case Channel::RPM:
                data.rpm = value;
                break;
            case Channel::MAP:
                data.manifold_pressure = value;
                break;
            case Channel::EGT:
                egts.emplace_back(col.cylinder, value);
                break;
            case Channel::CHT:
                chts.emplace_back(col.cylinder, value);
                break;
            case Channel::OIL_PRESSURE:
                data.oil_pressure = value;
                break;
            case Channel::OIL_TEMPERATURE:
                data.oil_temperature = value;
                break;
            case Channel::FUEL_PRESSURE:
                data.fuel_pressure = value;
                break;
            case Channel::VOLTS:
                data.volts = value;
                break;
            case Channel::AMPS:
                data.amps = value;
                break;
            case Channel::G_FORCE:
                data.g_force = value;
                break;
            default:
                break;
        }
        values++;
    }

    for (size_t i = columns_.size(); i < fields.size(); i++) {
        if (!fields[i].empty()) {
            warnings.push_back({record.line, "Row has " +
                                std::to_string(fields.size() - columns_.size()) +
                                " fields beyond the header"});
            break;
        }
    }

    if (values == 0) {
        result.no_data = true;
        result.error = "Row has no channel values";
        return result;
    }

    auto by_cylinder = [](const std::pair<int, double>& a, const std::pair<int, double>& b) {
        return a.first < b.first;
    };
    std::sort(egts.begin(), egts.end(), by_cylinder);
    std::sort(chts.begin(), chts.end(), by_cylinder);

    for (const auto& e : egts) {
        data.egts.add(CylinderReading(e.first, e.second));
    }
    for (const auto& c : chts) {
        data.chts.add(CylinderReading(c.first, c.second));
    }

    result.success = true;
    return result;
}

void CGR30P_Decoder::reset() {
    columns_.clear();
}

} // namespace cgr30p
} // namespace aerotrace
