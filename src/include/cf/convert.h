#pragma once

#include <cf/error.h>
#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <type_traits>
#include <utility>

namespace cf {

// Semantic type of a converted value. Text values that look like a number or
// boolean literal are quoted when written; Number and Boolean never are.
enum class ValueKind { Text, Number, Boolean };

// Text <-> T conversion. Specialize for your own types:
//
//   template <> struct cf::ValueConverter<Color> {
//       static constexpr cf::ValueKind kind = cf::ValueKind::Text;
//       static Color from_text(const std::string& text);  // throws cf::ConversionError
//       static std::string to_text(const Color& value);
//   };
//
// to_text must produce text that from_text reads back to an equal value.
template <typename T, typename Enable = void>
struct ValueConverter {};

namespace detail {
    long long parse_signed(const std::string& text, long long min, long long max);
    unsigned long long parse_unsigned(const std::string& text, unsigned long long max);
    double parse_double(const std::string& text);
    std::string format_double(double value);
    std::string format_float(float value);
    bool parse_bool(const std::string& text);
}

bool is_bool_literal(const std::string& text);
bool is_number_literal(const std::string& text);
// A literal that a text value must be quoted to distinguish from.
inline bool looks_like_literal(const std::string& text) {
    return is_bool_literal(text) || is_number_literal(text);
}

template <>
struct ValueConverter<std::string> {
    static constexpr ValueKind kind = ValueKind::Text;
    static std::string from_text(const std::string& text) { return text; }
    static std::string to_text(const std::string& value) { return value; }
};

template <>
struct ValueConverter<bool> {
    static constexpr ValueKind kind = ValueKind::Boolean;
    static bool from_text(const std::string& text) { return detail::parse_bool(text); }
    static std::string to_text(const bool& value) { return value ? "true" : "false"; }
};

template <typename T>
struct ValueConverter<T, std::enable_if_t<std::is_integral<T>::value && !std::is_same<T, bool>::value>> {
    static constexpr ValueKind kind = ValueKind::Number;

    static T from_text(const std::string& text) {
        if constexpr (std::is_signed<T>::value) {
            return static_cast<T>(detail::parse_signed(text, std::numeric_limits<T>::min(),
                                                       std::numeric_limits<T>::max()));
        } else {
            return static_cast<T>(detail::parse_unsigned(text, std::numeric_limits<T>::max()));
        }
    }

    static std::string to_text(const T& value) { return std::to_string(value); }
};

template <typename T>
struct ValueConverter<T, std::enable_if_t<std::is_floating_point<T>::value>> {
    static constexpr ValueKind kind = ValueKind::Number;

    static T from_text(const std::string& text) {
        double v = detail::parse_double(text);
        if constexpr (std::is_same<T, float>::value) {
            if (std::isfinite(v) && std::fabs(v) > std::numeric_limits<float>::max())
                throw ConversionError("value '" + text + "' is out of range for float");
        }
        return static_cast<T>(v);
    }

    static std::string to_text(const T& value) {
        if constexpr (std::is_same<T, float>::value)
            return detail::format_float(value);
        else
            return detail::format_double(static_cast<double>(value));
    }
};

template <typename T, typename = void>
struct has_value_converter : std::false_type {};

template <typename T>
struct has_value_converter<T, std::void_t<decltype(ValueConverter<T>::from_text(std::declval<const std::string&>()))>>
    : std::true_type {};

// Runtime form of a value conversion, so a single field can carry its own
// parse/render pair instead of the type's ValueConverter.
template <typename T>
struct Conversion {
    std::function<T(const std::string&)> parse;
    std::function<std::string(const T&)> render;
    ValueKind kind = ValueKind::Text;

    explicit operator bool() const { return parse && render; }

    static Conversion builtin() {
        Conversion c;
        c.parse = [](const std::string& text) { return ValueConverter<T>::from_text(text); };
        c.render = [](const T& value) { return ValueConverter<T>::to_text(value); };
        c.kind = ValueConverter<T>::kind;
        return c;
    }
};

}  // namespace cf
