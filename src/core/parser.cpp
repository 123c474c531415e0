#include "aerotrace/parser.h"
#include "aerotrace/cgr30p.h"
#include "aerotrace/csv_reader.h"
#include <fstream>
#include <istream>
#include <sstream>

namespace aerotrace {

namespace {

constexpr double SECONDS_PER_DAY = 86400.0;
constexpr double HALF_DAY_S = 43200.0;

// Elapsed seconds from time-of-day stamps, following midnight roll-over
class ElapsedClock {
public:
    std::optional<double> elapsed(const std::string& time_text) {
        double tod = 0.0;
        if (!utils::parseTimeOfDay(time_text, tod)) {
            return std::nullopt;
        }

        double absolute = tod + day_offset_;
        if (last_ && absolute < *last_ - HALF_DAY_S) {
            day_offset_ += SECONDS_PER_DAY;
            absolute += SECONDS_PER_DAY;
        }

        if (!first_) {
            first_ = absolute;
        }
        last_ = absolute;

        return absolute - *first_;
    }

private:
    std::optional<double> first_;
    std::optional<double> last_;
    double day_offset_ = 0.0;
};

void stripByteOrderMark(std::string& line) {
    if (line.size() >= 3 &&
        static_cast<unsigned char>(line[0]) == 0xEF &&
        static_cast<unsigned char>(line[1]) == 0xBB &&
        static_cast<unsigned char>(line[2]) == 0xBF) {
        line.erase(0, 3);
    }
}

} // namespace

struct EMSParser::Impl {
    ParserConfig config;
    FlightLog flight_log;
    cgr30p::CGR30P_Decoder cgr30p_decoder;

    RecordCallback on_record;
    WarningCallback on_warning;

    explicit Impl(const ParserConfig& cfg)
        : config(cfg)
        , flight_log(cfg.flight_gap_s)
        , cgr30p_decoder(cfg.max_cylinders) {}

    // Forward warnings added since 'from' to the callback
    void reportWarnings(const ParseResult& result, size_t from) {
        if (!on_warning) {
            return;
        }
        for (size_t i = from; i < result.warnings.size(); i++) {
            on_warning(result.warnings[i]);
        }
    }

    void warn(ParseResult& result, size_t line, const std::string& message) {
        result.warnings.push_back({line, message});
        reportWarnings(result, result.warnings.size() - 1);
    }
};

EMSParser::EMSParser()
    : EMSParser(ParserConfig{}) {}

EMSParser::EMSParser(const ParserConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

EMSParser::~EMSParser() = default;

EMSParser::EMSParser(EMSParser&&) noexcept = default;
EMSParser& EMSParser::operator=(EMSParser&&) noexcept = default;

EmsType EMSParser::detect(const std::string& text) const {
    std::istringstream input(text);
    std::vector<std::string> lines;
    std::string line;

    while (lines.size() <= cgr30p::MAX_PREAMBLE_LINES && std::getline(input, line)) {
        stripByteOrderMark(line);
        if (!utils::trim(line).empty()) {
            lines.push_back(line);
        }
    }

    if (impl_->cgr30p_decoder.isCGR30P(lines)) {
        return EmsType::CGR_30P;
    }
    return EmsType::UNKNOWN;
}

ParseResult EMSParser::parse(const std::string& text) {
    std::istringstream input(text);
    return parse(input);
}

ParseResult EMSParser::parse(std::istream& input) {
    ParseResult result;
    cgr30p::CGR30P_Decoder& decoder = impl_->cgr30p_decoder;
    decoder.reset();

    // Preamble: everything up to the column header row
    std::vector<std::string> preamble;
    std::vector<std::string> header;
    size_t header_line = 0;
    size_t line_no = 0;
    std::string line;

    while (std::getline(input, line)) {
        line_no++;
        if (line_no == 1) {
            stripByteOrderMark(line);
        }
        if (utils::trim(line).empty()) {
            continue;
        }

        auto fields = utils::splitCsvLine(line);
        if (decoder.isHeaderRow(fields)) {
            header = std::move(fields);
            header_line = line_no;
            break;
        }

        preamble.push_back(line);
        if (preamble.size() > cgr30p::MAX_PREAMBLE_LINES) {
            break;
        }
    }
    result.lines_read = line_no;

    if (preamble.empty() && header.empty()) {
        result.error = "Empty input";
        return result;
    }

    // A preamble that overruns the limit fails the same way for every format
    if (header.empty() && preamble.size() > cgr30p::MAX_PREAMBLE_LINES) {
        result.error = "No column header found";
        return result;
    }

    // Identify the EMS
    EmsType type = impl_->config.ems_type;
    if (type == EmsType::UNKNOWN) {
        std::vector<std::string> probe(preamble);
        if (!header.empty()) {
            probe.push_back(line);
        }
        if (decoder.isCGR30P(probe)) {
            type = EmsType::CGR_30P;
        }
    }

    if (type == EmsType::UNKNOWN) {
        result.error = "Unrecognized EMS format";
        return result;
    }
    result.ems_type = type;

    if (header.empty()) {
        result.error = "No column header found";
        return result;
    }

    for (const auto& text : preamble) {
        decoder.decodePreambleLine(text, result.metadata);
    }
    if (!result.metadata.temperature_unit_declared) {
        result.metadata.temperature_unit = impl_->config.temperature_unit;
    }
    if (result.metadata.model.empty()) {
        result.metadata.model = cgr30p::MODEL_NAME;
    }

    size_t warning_mark = result.warnings.size();
    auto header_result = decoder.decodeHeader(header, result.metadata, header_line, result.warnings);
    impl_->reportWarnings(result, warning_mark);
    if (!header_result.success) {
        result.error = header_result.error;
        return result;
    }

    // Data rows
    if (impl_->config.split_flights) {
        impl_->flight_log.beginLog();
    }

    ElapsedClock clock;
    size_t record_count = 0;

    while (std::getline(input, line)) {
        line_no++;
        if (utils::trim(line).empty()) {
            continue;
        }

        EngineRecord record;
        record.index = record_count;
        record.line = line_no;

        warning_mark = result.warnings.size();
        auto row = decoder.decodeRow(utils::splitCsvLine(line), record,
                                     impl_->config.strict, result.warnings);
        impl_->reportWarnings(result, warning_mark);

        if (!row.success) {
            result.rows_skipped++;
            if (impl_->config.strict && !row.no_data) {
                result.lines_read = line_no;
                result.error = "Line " + std::to_string(line_no) + ": " + row.error;
                return result;
            }
            impl_->warn(result, line_no, row.error);
            continue;
        }

        record.elapsed_s = clock.elapsed(record.time);
        record_count++;

        if (impl_->config.split_flights) {
            impl_->flight_log.update(record);
        }
        if (impl_->on_record) {
            impl_->on_record(record);
        }
        if (impl_->config.keep_records) {
            result.records.push_back(std::move(record));
        }
    }

    result.lines_read = line_no;
    result.success = true;
    return result;
}

ParseResult EMSParser::parseFile(const std::string& path) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        ParseResult result;
        result.error = "Cannot open file: " + path;
        return result;
    }

    return parse(file);
}

const std::vector<FlightSummary>& EMSParser::getFlights() const {
    return impl_->flight_log.getFlights();
}

size_t EMSParser::getFlightCount() const {
    return impl_->flight_log.count();
}

void EMSParser::clear() {
    impl_->flight_log.clear();
}

void EMSParser::setOnRecord(RecordCallback callback) {
    impl_->on_record = std::move(callback);
}

void EMSParser::setOnNewFlight(FlightCallback callback) {
    impl_->flight_log.setOnNewFlight(std::move(callback));
}

void EMSParser::setOnWarning(WarningCallback callback) {
    impl_->on_warning = std::move(callback);
}

const ParserConfig& EMSParser::config() const {
    return impl_->config;
}

} // namespace aerotrace
