#include "aerotrace/csv_reader.h"
#include <cctype>
#include <charconv>
#include <cmath>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace aerotrace {
namespace utils {

namespace {

bool isBlank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

// Degree sign in UTF-8 (C2 B0) or Latin-1 (B0)
std::string stripDegreeSign(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); i++) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c == 0xC2 && i + 1 < text.size() &&
            static_cast<unsigned char>(text[i + 1]) == 0xB0) {
            i++;
            continue;
        }
        if (c == 0xB0) {
            continue;
        }
        out.push_back(text[i]);
    }
    return out;
}

} // namespace

std::vector<std::string> splitCsvLine(const std::string& line, char delimiter) {
    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;
    bool was_quoted = false;
    bool has_content = false;   // non-blank text outside quotes

    for (size_t i = 0; i < line.size(); i++) {
        char c = line[i];

        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current.push_back('"');
                    i++;
                } else {
                    in_quotes = false;
                }
            } else {
                current.push_back(c);
            }
            continue;
        }

        if (was_quoted && c != delimiter) {
            // Text between a closing quote and the delimiter is dropped
            continue;
        }

        if (c == '"') {
            // Quotes only open a field at its start (ignoring blanks)
            if (!has_content) {
                current.clear();
                in_quotes = true;
                was_quoted = true;
            } else {
                current.push_back(c);
            }
        } else if (c == delimiter) {
            fields.push_back(was_quoted ? current : trim(current));
            current.clear();
            was_quoted = false;
            has_content = false;
        } else {
            current.push_back(c);
            if (!isBlank(c)) {
                has_content = true;
            }
        }
    }

    // An unterminated quote keeps what was collected
    if (was_quoted) {
        fields.push_back(current);
    } else {
        fields.push_back(trim(current));
    }

    return fields;
}

CsvRow::CsvRow(std::vector<std::string> fields)
    : fields_(std::move(fields)), pos_(0) {}

const std::string& CsvRow::next() {
    if (pos_ >= fields_.size()) {
        throw std::out_of_range("CsvRow: no more fields");
    }
    return fields_[pos_++];
}

const std::string& CsvRow::peek() const {
    if (pos_ >= fields_.size()) {
        throw std::out_of_range("CsvRow: no more fields");
    }
    return fields_[pos_];
}

void CsvRow::skip(size_t count) {
    if (count > fields_.size() - pos_) {
        throw std::out_of_range("CsvRow: no more fields");
    }
    pos_ += count;
}

bool CsvRow::hasMore() const {
    return pos_ < fields_.size();
}

size_t CsvRow::remaining() const {
    return fields_.size() - pos_;
}

size_t CsvRow::position() const {
    return pos_;
}

void CsvRow::reset() {
    pos_ = 0;
}

std::string trim(const std::string& text) {
    size_t start = 0;
    size_t end = text.size();

    while (start < end && isBlank(text[start])) {
        start++;
    }
    while (end > start && isBlank(text[end - 1])) {
        end--;
    }

    return text.substr(start, end - start);
}

std::string toUpper(const std::string& text) {
    std::string out(text);
    for (auto& c : out) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return out;
}

bool parseNumber(const std::string& text, double& out) {
    std::string value = trim(text);
    if (value.empty()) {
        return false;
    }

    // Plain decimal only: from_chars takes no hex and ignores the locale
    const char* first = value.data();
    const char* last = first + value.size();
    if (*first == '+') {
        first++;
        if (first == last || *first == '-') {
            return false;
        }
    }

    double parsed = 0.0;
    auto res = std::from_chars(first, last, parsed);
    if (res.ec != std::errc() || res.ptr != last) {
        return false;
    }
    if (!std::isfinite(parsed)) {
        return false;
    }

    out = parsed;
    return true;
}

bool isMissingValue(const std::string& text) {
    std::string value = toUpper(trim(text));
    return value.empty() || value == "-" || value == "--" || value == "---" ||
           value == "N/A" || value == "NA" || value == "*";
}

std::string normalizeColumnName(const std::string& text) {
    std::string out;
    int depth = 0;

    for (char c : text) {
        if (c == '(' || c == '[') {
            depth++;
            continue;
        }
        if (c == ')' || c == ']') {
            if (depth > 0) {
                depth--;
            }
            continue;
        }
        if (depth > 0) {
            continue;
        }

        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x80 && std::isalnum(uc)) {
            out.push_back(static_cast<char>(std::toupper(uc)));
        }
    }

    return out;
}

std::string columnUnit(const std::string& text) {
    size_t open = text.find_first_of("([");
    if (open == std::string::npos) {
        return std::string();
    }

    size_t close = text.find_first_of(")]", open + 1);
    if (close == std::string::npos) {
        close = text.size();
    }

    std::string unit = toUpper(trim(stripDegreeSign(text.substr(open + 1, close - open - 1))));
    if (unit.compare(0, 3, "DEG") == 0) {
        unit = trim(unit.substr(3));
    }
    return unit;
}

bool parseTimeOfDay(const std::string& text, double& seconds) {
    std::string value = toUpper(trim(text));
    if (value.empty()) {
        return false;
    }

    int meridiem = 0;   // 0 = 24h clock, 1 = AM, 2 = PM
    if (value.size() > 2) {
        std::string suffix = value.substr(value.size() - 2);
        if (suffix == "AM" || suffix == "PM") {
            meridiem = (suffix == "AM") ? 1 : 2;
            value = trim(value.substr(0, value.size() - 2));
        }
    }

    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t colon = value.find(':', start);
        parts.push_back(value.substr(start, colon - start));
        if (colon == std::string::npos) {
            break;
        }
        start = colon + 1;
    }

    if (parts.size() < 2 || parts.size() > 3) {
        return false;
    }

    double hh = 0.0;
    double mm = 0.0;
    double ss = 0.0;
    if (!parseNumber(parts[0], hh) || !parseNumber(parts[1], mm)) {
        return false;
    }
    if (parts.size() == 3 && !parseNumber(parts[2], ss)) {
        return false;
    }

    // Hours and minutes must be whole numbers
    if (hh != std::floor(hh) || mm != std::floor(mm)) {
        return false;
    }

    if (meridiem != 0) {
        if (hh < 1.0 || hh > 12.0) {
            return false;
        }
        if (hh == 12.0) {
            hh = 0.0;
        }
        if (meridiem == 2) {
            hh += 12.0;
        }
    }

    if (hh < 0.0 || hh > 23.0 || mm < 0.0 || mm > 59.0 || ss < 0.0 || ss >= 60.0) {
        return false;
    }

    seconds = hh * 3600.0 + mm * 60.0 + ss;
    return true;
}

} // namespace utils
} // namespace aerotrace
