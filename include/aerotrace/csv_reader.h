#ifndef AEROTRACE_CSV_READER_H
#define AEROTRACE_CSV_READER_H

#include <cstddef>
#include <string>
#include <vector>

namespace aerotrace {
namespace utils {

// Split one line of delimited text into fields.
// Double quotes group a field, "" inside quotes is a literal quote.
// Surrounding whitespace and a trailing '\r' are stripped.
std::vector<std::string> splitCsvLine(const std::string& line, char delimiter = ',');

// Cursor over the fields of one row
class CsvRow {
public:
    explicit CsvRow(std::vector<std::string> fields);

    // Read next field, throws std::out_of_range past the end
    const std::string& next();

    // Look at next field without consuming it
    const std::string& peek() const;

    // Skip fields
    void skip(size_t count = 1);

    // Check if more fields are available
    bool hasMore() const;
    size_t remaining() const;

    // Get current position
    size_t position() const;

    // Reset to first field
    void reset();

    size_t size() const { return fields_.size(); }
    const std::vector<std::string>& fields() const { return fields_; }

private:
    std::vector<std::string> fields_;
    size_t pos_;
};

// Strip leading/trailing blanks (space, tab, CR, LF)
std::string trim(const std::string& text);

// Upper-case ASCII copy
std::string toUpper(const std::string& text);

// Parse a plain decimal number (no hex, locale independent). Rejects
// empty text, trailing garbage, out-of-range and
// non-finite values. Returns false and leaves out untouched on failure.
bool parseNumber(const std::string& text, double& out);

// Placeholder a logger writes for "no reading"
bool isMissingValue(const std::string& text);

// Canonical column name: upper case, unit suffix in ()/[] removed,
// spaces and '_', '-', '.' separators removed. "Oil Temp (°F)" -> "OILTEMP"
std::string normalizeColumnName(const std::string& text);

// Unit text inside ()/[] of a column name, trimmed and upper-cased,
// with a leading degree sign removed. "CHT1 (°C)" -> "C". Empty if none.
std::string columnUnit(const std::string& text);

// Parse "hh:mm", "hh:mm:ss" or "hh:mm:ss.fff" into seconds of day.
// An optional trailing AM/PM marker is honoured.
bool parseTimeOfDay(const std::string& text, double& seconds);

} // namespace utils
} // namespace aerotrace

#endif // AEROTRACE_CSV_READER_H
