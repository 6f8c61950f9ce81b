#include <cf/convert.h>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <locale>
#include <sstream>

namespace cf {

namespace {
    std::string lowercase(const std::string& s) {
        std::string out = s;
        for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return out;
    }

    // Optional sign followed by one or more digits.
    bool is_integer_text(const std::string& s) {
        size_t k = 0;
        if (k < s.size() and (s[k] == '+' or s[k] == '-')) ++k;
        if (k == s.size()) return false;
        for (; k < s.size(); ++k)
            if (not std::isdigit(static_cast<unsigned char>(s[k]))) return false;
        return true;
    }

    // strtod accepts leading whitespace and partial input; neither is a number here.
    bool scan_double(const std::string& s, double& out) {
        if (s.empty() or std::isspace(static_cast<unsigned char>(s[0]))) return false;
        const char* begin = s.c_str();
        char* end = nullptr;
        errno = 0;
        out = std::strtod(begin, &end);
        return end == begin + s.size();
    }

    std::string format_with_precision(double value, int precision) {
        std::ostringstream ss;
        ss.imbue(std::locale::classic());
        ss.precision(precision);
        ss << value;
        return ss.str();
    }

    std::string format_special(double value) {
        if (value != value) return "nan";
        return value < 0 ? "-inf" : "inf";
    }
}

bool is_bool_literal(const std::string& text) {
    std::string t = lowercase(text);
    return t == "true" or t == "yes" or t == "on" or t == "1" or t == "false" or t == "no" or t == "off" or
           t == "0";
}

bool is_number_literal(const std::string& text) {
    double ignored = 0.0;
    return scan_double(text, ignored);
}

namespace detail {

long long parse_signed(const std::string& text, long long min, long long max) {
    if (not is_integer_text(text)) throw ConversionError("cannot convert '" + text + "' to an integer");
    errno = 0;
    long long v = std::strtoll(text.c_str(), nullptr, 10);
    if (errno == ERANGE or v < min or v > max) throw ConversionError("value '" + text + "' is out of range");
    return v;
}

unsigned long long parse_unsigned(const std::string& text, unsigned long long max) {
    if (not is_integer_text(text) or text[0] == '-')
        throw ConversionError("cannot convert '" + text + "' to an unsigned integer");
    errno = 0;
    unsigned long long v = std::strtoull(text.c_str(), nullptr, 10);
    if (errno == ERANGE or v > max) throw ConversionError("value '" + text + "' is out of range");
    return v;
}

double parse_double(const std::string& text) {
    double v = 0.0;
    if (not scan_double(text, v)) throw ConversionError("cannot convert '" + text + "' to a number");
    if (errno == ERANGE and (v == HUGE_VAL or v == -HUGE_VAL))
        throw ConversionError("value '" + text + "' is out of range");
    return v;
}

std::string format_double(double value) {
    if (not std::isfinite(value)) return format_special(value);
    // shortest text that reads back to the same value
    for (int precision = 15; precision < 17; ++precision) {
        std::string s = format_with_precision(value, precision);
        if (std::strtod(s.c_str(), nullptr) == value) return s;
    }
    return format_with_precision(value, 17);
}

std::string format_float(float value) {
    if (not std::isfinite(value)) return format_special(value);
    for (int precision = 6; precision < 9; ++precision) {
        std::string s = format_with_precision(value, precision);
        if (std::strtof(s.c_str(), nullptr) == value) return s;
    }
    return format_with_precision(value, 9);
}

bool parse_bool(const std::string& text) {
    std::string t = lowercase(text);
    if (t == "true" or t == "yes" or t == "on" or t == "1") return true;
    if (t == "false" or t == "no" or t == "off" or t == "0") return false;
    throw ConversionError("cannot convert '" + text + "' to a boolean");
}

}  // namespace detail

}  // namespace cf
