#include "ValueParsing.h"
#include "CommonUtils.h"

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <limits>
#include <tuple>
#include <vector>

namespace {
bool parseFixedInt(std::string_view s, size_t offset, size_t len, int& out) {
    if (offset + len > s.size()) return false;
    int value = 0;
    for (size_t i = 0; i < len; ++i) {
        unsigned char ch = static_cast<unsigned char>(s[offset + i]);
        if (ch < '0' || ch > '9') return false;
        value = value * 10 + static_cast<int>(ch - '0');
    }
    out = value;
    return true;
}

bool allDigits(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char ch) { return ch >= '0' && ch <= '9'; });
}

bool allAlpha(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char ch) { return std::isalpha(ch) != 0; });
}

bool isLeapYear(int year) {
    if (year % 400 == 0) return true;
    if (year % 100 == 0) return false;
    return (year % 4 == 0);
}

int daysInMonth(int year, int month) {
    static const int kMonthDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2) return isLeapYear(year) ? 29 : 28;
    return kMonthDays[month - 1];
}

int64_t daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const int mp = static_cast<int>(m) + (m > 2 ? -3 : 9);
    const unsigned doy = (153 * static_cast<unsigned>(mp) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<int64_t>(era) * 146097 + static_cast<int64_t>(doe) - 719468;
}

std::tuple<int, unsigned, unsigned> civilFromDays(int64_t z) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    int y = static_cast<int>(yoe) + static_cast<int>(era) * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp + (mp < 10 ? 3 : -9);
    y += (m <= 2);
    return {y, m, d};
}

int64_t floorDiv(int64_t value, int64_t divisor) {
    int64_t q = value / divisor;
    int64_t r = value % divisor;
    if (r != 0 && ((r > 0) != (divisor > 0))) {
        --q;
    }
    return q;
}

int monthFromName(std::string_view token) {
    static const std::array<const char*, 12> kShort = {
        "jan", "feb", "mar", "apr", "may", "jun", "jul", "aug", "sep", "oct", "nov", "dec"
    };
    static const std::array<const char*, 12> kLong = {
        "january", "february", "march", "april", "may", "june",
        "july", "august", "september", "october", "november", "december"
    };
    const std::string lower = CommonUtils::toLower(token);
    for (size_t i = 0; i < 12; ++i) {
        if (lower == kShort[i] || lower == kLong[i]) return static_cast<int>(i) + 1;
    }
    if (lower == "sept") return 9;
    return 0;
}

bool parseSmallInt(std::string_view s, size_t maxLen, int& out) {
    if (!allDigits(s) || s.size() > maxLen) return false;
    return parseFixedInt(s, 0, s.size(), out);
}

bool parseYear(std::string_view s, int& year) {
    if (s.size() == 4) return parseFixedInt(s, 0, 4, year);
    if (s.size() == 2) {
        int yy = 0;
        if (!parseFixedInt(s, 0, 2, yy)) return false;
        year = (yy >= 70) ? (1900 + yy) : (2000 + yy);
        return true;
    }
    return false;
}

bool parseTimePart(std::string_view timePart, int& hour, int& minute, int& second) {
    hour = minute = second = 0;
    if (timePart.empty()) return true;

    const size_t dot = timePart.find('.');
    if (dot != std::string_view::npos) {
        if (!allDigits(timePart.substr(dot + 1))) return false;
        timePart = timePart.substr(0, dot);
    }

    std::vector<std::string_view> fields;
    size_t start = 0;
    while (true) {
        const size_t colon = timePart.find(':', start);
        fields.push_back(timePart.substr(start, colon == std::string_view::npos ? std::string_view::npos : colon - start));
        if (colon == std::string_view::npos) break;
        start = colon + 1;
    }
    if (fields.size() < 2 || fields.size() > 3) return false;
    if (!parseSmallInt(fields[0], 2, hour)) return false;
    if (fields[1].size() != 2 || !parseSmallInt(fields[1], 2, minute)) return false;
    if (fields.size() == 3 && (fields[2].size() != 2 || !parseSmallInt(fields[2], 2, second))) return false;
    return true;
}

bool parseIsoWeekDate(std::string_view datePart, int& year, int& month, int& day) {
    // YYYY-Www-D (D:1..7)
    if (datePart.size() != 10 || datePart[4] != '-' || datePart[5] != 'W' || datePart[8] != '-') return false;
    int isoYear = 0;
    int isoWeek = 0;
    int isoDay = 0;
    if (!parseFixedInt(datePart, 0, 4, isoYear) ||
        !parseFixedInt(datePart, 6, 2, isoWeek) ||
        !parseFixedInt(datePart, 9, 1, isoDay)) {
        return false;
    }
    if (isoWeek < 1 || isoWeek > 53 || isoDay < 1 || isoDay > 7) return false;

    const int64_t jan4 = daysFromCivil(isoYear, 1, 4);
    const int jan4WeekdayMon1 = static_cast<int>(((jan4 + 3) % 7 + 7) % 7) + 1;
    const int64_t isoWeek1Monday = jan4 - static_cast<int64_t>(jan4WeekdayMon1 - 1);
    const int64_t targetDays = isoWeek1Monday + static_cast<int64_t>((isoWeek - 1) * 7 + (isoDay - 1));

    const auto [y, m, d] = civilFromDays(targetDays);
    year = y;
    month = static_cast<int>(m);
    day = static_cast<int>(d);
    return true;
}

bool parseSeparatedDate(std::string_view datePart, ValueParsing::DateLocaleHint hint, int& year, int& month, int& day) {
    char sep = 0;
    for (char ch : datePart) {
        if (ch == '-' || ch == '/' || ch == '.') {
            sep = ch;
            break;
        }
    }
    if (sep == 0) return false;

    std::vector<std::string_view> fields;
    size_t start = 0;
    while (true) {
        const size_t pos = datePart.find(sep, start);
        fields.push_back(datePart.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start));
        if (pos == std::string_view::npos) break;
        start = pos + 1;
    }
    if (fields.size() != 3) return false;

    // 05-Jan-2020
    if (allAlpha(fields[1])) {
        month = monthFromName(fields[1]);
        return month != 0 && parseSmallInt(fields[0], 2, day) && parseYear(fields[2], year);
    }
    for (const auto& f : fields) {
        if (!allDigits(f)) return false;
    }

    // YYYY-MM-DD, YYYY/MM/DD, YYYY.MM.DD
    if (fields[0].size() == 4) {
        return parseFixedInt(fields[0], 0, 4, year) &&
               parseSmallInt(fields[1], 2, month) &&
               parseSmallInt(fields[2], 2, day);
    }

    int a = 0;
    int b = 0;
    if (!parseSmallInt(fields[0], 2, a) || !parseSmallInt(fields[1], 2, b) || !parseYear(fields[2], year)) {
        return false;
    }

    bool dayFirst = false;
    if (hint == ValueParsing::DateLocaleHint::DMY) {
        dayFirst = true;
    } else if (hint == ValueParsing::DateLocaleHint::MDY) {
        dayFirst = false;
    } else if (sep == '/' || fields[2].size() == 2) {
        dayFirst = (a > 12 && b <= 12);
    } else {
        // DD-MM-YYYY and DD.MM.YYYY read day first unless that cannot be a date.
        dayFirst = !(b > 12 && a <= 12);
    }

    day = dayFirst ? a : b;
    month = dayFirst ? b : a;
    return true;
}

bool parseMonthNameDate(const std::vector<std::string_view>& tokens, int& year, int& month, int& day) {
    if (tokens.size() != 3) return false;

    std::string_view dayToken;
    if (allAlpha(tokens[0])) {
        // Jan 5 2020, January 5, 2020
        month = monthFromName(tokens[0]);
        dayToken = tokens[1];
    } else if (allAlpha(tokens[1])) {
        // 5 Jan 2020
        month = monthFromName(tokens[1]);
        dayToken = tokens[0];
    } else {
        return false;
    }
    if (month == 0) return false;
    return parseSmallInt(dayToken, 2, day) && tokens[2].size() == 4 && parseFixedInt(tokens[2], 0, 4, year);
}
}

namespace ValueParsing {

bool parseNumber(std::string_view text, double& out) {
    std::string s = CommonUtils::trim(text);
    if (s.empty()) return false;

    bool negative = false;
    size_t offset = 0;
    if (s[0] == '+' || s[0] == '-') {
        negative = (s[0] == '-');
        offset = 1;
    }
    if (offset >= s.size() || s[offset] == '+' || s[offset] == '-') return false;

    const std::string body = CommonUtils::toLower(std::string_view(s).substr(offset));
    if (body == "nan") return false;
    if (body == "inf" || body == "infinity") {
        out = negative ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();
        return true;
    }
    if (!std::isdigit(static_cast<unsigned char>(body[0])) && body[0] != '.') return false;

    double parsed = 0.0;
    const char* b = body.data();
    const char* e = b + body.size();
    auto [p, ec] = std::from_chars(b, e, parsed, std::chars_format::general);
    if (ec != std::errc{} || p != e) return false;
    out = negative ? -parsed : parsed;
    return true;
}

bool cellToNumber(const CellValue& cell, double& out) {
    if (const auto* b = std::get_if<bool>(&cell)) {
        out = *b ? 1.0 : 0.0;
        return true;
    }
    if (const auto* i = std::get_if<int64_t>(&cell)) {
        out = static_cast<double>(*i);
        return true;
    }
    if (const auto* d = std::get_if<double>(&cell)) {
        if (std::isnan(*d)) return false;
        out = *d;
        return true;
    }
    return parseNumber(std::get<std::string>(cell), out);
}

bool parseDateTime(std::string_view text, DateLocaleHint hint, int64_t& outUnixSeconds) {
    std::string s = CommonUtils::trim(text);
    if (s.size() < 6) return false;

    if ((s.back() == 'Z' || s.back() == 'z') && std::isdigit(static_cast<unsigned char>(s[s.size() - 2]))) {
        s.pop_back();
    }
    const size_t tPos = s.find_first_of("Tt");
    if (tPos != std::string::npos && tPos > 0 && tPos + 1 < s.size() &&
        std::isdigit(static_cast<unsigned char>(s[tPos - 1])) &&
        std::isdigit(static_cast<unsigned char>(s[tPos + 1]))) {
        s[tPos] = ' ';
    }

    std::vector<std::string_view> tokens;
    const std::string_view view(s);
    size_t start = 0;
    for (size_t i = 0; i <= view.size(); ++i) {
        if (i == view.size() || view[i] == ' ' || view[i] == ',') {
            if (i > start) tokens.push_back(view.substr(start, i - start));
            start = i + 1;
        }
    }
    if (tokens.empty()) return false;

    std::string_view timePart;
    if (tokens.size() > 1 && tokens.back().find(':') != std::string_view::npos) {
        timePart = tokens.back();
        tokens.pop_back();
    }

    int year = 0;
    int month = 0;
    int day = 0;
    bool dateOk = false;
    if (tokens.size() == 1) {
        dateOk = parseIsoWeekDate(tokens[0], year, month, day) ||
                 parseSeparatedDate(tokens[0], hint, year, month, day);
    } else {
        dateOk = parseMonthNameDate(tokens, year, month, day);
    }
    if (!dateOk) return false;

    int hour = 0;
    int minute = 0;
    int second = 0;
    if (!parseTimePart(timePart, hour, minute, second)) return false;

    if (month < 1 || month > 12) return false;
    const int dim = daysInMonth(year, month);
    if (day < 1 || day > dim) return false;
    if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 60) return false;

    const int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    outUnixSeconds = days * 86400 + static_cast<int64_t>(hour) * 3600 + static_cast<int64_t>(minute) * 60 + second;
    return true;
}

bool cellToDateTime(const CellValue& cell, DateLocaleHint hint, int64_t& outUnixSeconds) {
    const auto* text = std::get_if<std::string>(&cell);
    if (text == nullptr) return false;
    return parseDateTime(*text, hint, outUnixSeconds);
}

bool isDateLike(std::string_view text) {
    size_t alphaRun = 0;
    for (char ch : text) {
        if (ch == '/' || ch == '-' || ch == '.') return true;
        if (std::isalpha(static_cast<unsigned char>(ch))) {
            if (++alphaRun >= 3) return true;
        } else {
            alphaRun = 0;
        }
    }
    return false;
}

std::string formatNumber(double value) {
    if (std::isnan(value)) return "nan";
    if (std::isinf(value)) return value > 0 ? "inf" : "-inf";
    std::array<char, 32> buf{};
    auto [p, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value);
    if (ec != std::errc{}) return std::to_string(value);
    return std::string(buf.data(), p);
}

std::string formatTimestamp(int64_t unixSeconds) {
    const int64_t days = floorDiv(unixSeconds, 86400);
    const int64_t secs = unixSeconds - days * 86400;
    const auto [y, m, d] = civilFromDays(days);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u %02d:%02d:%02d",
                  y, m, d,
                  static_cast<int>(secs / 3600),
                  static_cast<int>((secs % 3600) / 60),
                  static_cast<int>(secs % 60));
    return std::string(buf);
}

std::string cellToText(const CellValue& cell) {
    if (const auto* b = std::get_if<bool>(&cell)) return *b ? "True" : "False";
    if (const auto* i = std::get_if<int64_t>(&cell)) return std::to_string(*i);
    if (const auto* d = std::get_if<double>(&cell)) return formatNumber(*d);
    return std::get<std::string>(cell);
}

bool cellsEqual(const CellValue& a, const CellValue& b) {
    const bool aText = std::holds_alternative<std::string>(a);
    const bool bText = std::holds_alternative<std::string>(b);
    if (aText || bText) {
        return aText && bText && std::get<std::string>(a) == std::get<std::string>(b);
    }
    if (std::holds_alternative<int64_t>(a) && std::holds_alternative<int64_t>(b)) {
        return std::get<int64_t>(a) == std::get<int64_t>(b);
    }
    double x = 0.0;
    double y = 0.0;
    if (!cellToNumber(a, x) || !cellToNumber(b, y)) return false;
    return x == y;
}

} // namespace ValueParsing
