#include "validation-walker.hpp"
#include "json_bridge.hpp"
#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>

namespace eure_schema {

namespace {

// Three-way comparison of a double against an integer without rounding either
int compare_exact(double value, std::int64_t limit) {
    constexpr double two_pow_63 = 9223372036854775808.0;
    if (value >= two_pow_63) {
        return 1;
    }
    if (value < -two_pow_63) {
        return -1;
    }
    const double whole = std::trunc(value);
    const auto truncated = static_cast<std::int64_t>(whole);
    if (truncated != limit) {
        return truncated < limit ? -1 : 1;
    }
    const double fraction = value - whole;
    return fraction > 0.0 ? 1 : (fraction < 0.0 ? -1 : 0);
}

// nullopt when the comparison is unordered (NaN)
std::optional<int> compare(double value, const number& limit) {
    if (std::isnan(value)) {
        return std::nullopt;
    }
    if (const auto* i = std::get_if<std::int64_t>(&limit)) {
        return compare_exact(value, *i);
    }
    const double d = std::get<double>(limit);
    if (std::isnan(d)) {
        return std::nullopt;
    }
    return value < d ? -1 : (value > d ? 1 : 0);
}

std::optional<int> compare(std::int64_t value, const number& limit) {
    if (const auto* i = std::get_if<std::int64_t>(&limit)) {
        return value < *i ? -1 : (value > *i ? 1 : 0);
    }
    const double d = std::get<double>(limit);
    if (std::isnan(d)) {
        return std::nullopt;
    }
    return -compare_exact(d, value);
}

std::string render(const number& n) {
    return eure::describe(std::visit([](auto v) { return eure::primitive{v}; }, n));
}

std::string render_range(const std::optional<bound>& min, const std::optional<bound>& max) {
    std::string out = min ? (min->exclusive ? "(" : "[") + render(min->limit) : "(-inf";
    out += ", ";
    out += max ? render(max->limit) + (max->exclusive ? ")" : "]") : "inf)";
    return out;
}

template <typename Value>
bool within(Value value, const std::optional<bound>& min, const std::optional<bound>& max) {
    if (min) {
        const auto c = compare(value, min->limit);
        if (!c || *c < 0 || (min->exclusive && *c == 0)) {
            return false;
        }
    }
    if (max) {
        const auto c = compare(value, max->limit);
        if (!c || *c > 0 || (max->exclusive && *c == 0)) {
            return false;
        }
    }
    return true;
}

/// value = mantissa * 10^exponent, sign dropped since it does not affect divisibility
struct decimal {
    std::uint64_t mantissa = 0;
    int exponent = 0;
};

decimal normalise(decimal d) {
    while (d.mantissa != 0 && d.mantissa % 10 == 0) {
        d.mantissa /= 10;
        ++d.exponent;
    }
    return d;
}

// Shortest round-trip decimal form, the value the author most likely wrote
std::optional<decimal> to_decimal(double value) {
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    char buffer[64];
    const auto written = std::to_chars(buffer, buffer + sizeof(buffer), value);
    const std::string_view text(buffer, static_cast<std::size_t>(written.ptr - buffer));

    std::string digits;
    int fraction_digits = 0;
    bool in_fraction = false;
    int exponent = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '-') {
            continue;
        }
        if (c == '.') {
            in_fraction = true;
        } else if (c == 'e' || c == 'E') {
            const auto* begin = text.data() + i + 1;
            if (*begin == '+') {
                ++begin;
            }
            if (std::from_chars(begin, text.data() + text.size(), exponent).ec != std::errc()) {
                return std::nullopt;
            }
            break;
        } else {
            digits.push_back(c);
            if (in_fraction) {
                ++fraction_digits;
            }
        }
    }

    // Trailing zeros move into the exponent so the mantissa fits 64 bits
    int scale = exponent - fraction_digits;
    while (digits.size() > 1 && digits.back() == '0') {
        digits.pop_back();
        ++scale;
    }
    decimal result;
    for (const char c : digits) {
        result.mantissa = result.mantissa * 10 + static_cast<std::uint64_t>(c - '0');
    }
    result.exponent = scale;
    return normalise(result);
}

decimal to_decimal(std::int64_t value) {
    const auto magnitude = value < 0 ? std::uint64_t(0) - static_cast<std::uint64_t>(value) : static_cast<std::uint64_t>(value);
    return normalise(decimal{magnitude, 0});
}

std::uint64_t mul_mod(std::uint64_t a, std::uint64_t b, std::uint64_t m) {
    std::uint64_t result = 0;
    a %= m;
    while (b != 0) {
        if (b & 1) {
            result = (result >= m - a) ? result - (m - a) : result + a;
        }
        a = (a >= m - a) ? a - (m - a) : a + a;
        b >>= 1;
    }
    return result;
}

bool is_multiple(const decimal& value, const decimal& divisor) {
    if (divisor.mantissa == 0) {
        return false;
    }
    if (value.mantissa == 0) {
        return true;
    }

    if (value.exponent >= divisor.exponent) {
        // value.mantissa * 10^k mod divisor.mantissa
        std::uint64_t remainder = value.mantissa % divisor.mantissa;
        for (int k = value.exponent - divisor.exponent; k > 0 && remainder != 0; --k) {
            remainder = mul_mod(remainder, 10, divisor.mantissa);
        }
        return remainder == 0;
    }

    // value.mantissa must be a multiple of divisor.mantissa * 10^k
    std::uint64_t scaled = divisor.mantissa;
    for (int k = divisor.exponent - value.exponent; k > 0; --k) {
        if (scaled > std::numeric_limits<std::uint64_t>::max() / 10) {
            return false;
        }
        scaled *= 10;
    }
    return value.mantissa % scaled == 0;
}

std::size_t code_points(std::string_view text) {
    std::size_t count = 0;
    for (const char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

} // namespace

validation_walker::status validation_walker::check_text_value(const text_schema& schema, const eure::text& value, const eure::eure_path& path) {
    if (schema.language && value.language != eure::language_kind::Implicit) {
        const std::string actual = value.language == eure::language_kind::Plaintext ? "plaintext" : value.language_name;
        if (actual != *schema.language) {
            report(validation_error_kind::LanguageMismatch, path, "expected language '" + *schema.language + "', found '" + actual + "'");
        }
    }

    const auto length = code_points(value.content);
    if ((schema.min_length && length < *schema.min_length) || (schema.max_length && length > *schema.max_length)) {
        const std::string lower = schema.min_length ? std::to_string(*schema.min_length) : "0";
        const std::string upper = schema.max_length ? std::to_string(*schema.max_length) : "inf";
        report(validation_error_kind::LengthOutOfBounds, path,
               "text length " + std::to_string(length) + " is outside [" + lower + ", " + upper + "]");
    }

    if (schema.pattern) {
        auto pattern = compiled_pattern(*schema.pattern, path);
        if (!pattern) {
            return std::unexpected(pattern.error());
        }
        if (!std::regex_search(value.content, **pattern)) {
            report(validation_error_kind::PatternMismatch, path, "text does not match pattern '" + *schema.pattern + "'");
        }
    }
    return {};
}

void validation_walker::check_integer_value(const integer_schema& schema, std::int64_t value, const eure::eure_path& path) {
    if (!within(value, schema.min, schema.max)) {
        report(validation_error_kind::OutOfRange, path, std::to_string(value) + " is outside the range " + render_range(schema.min, schema.max));
    }
    if (schema.multiple_of && *schema.multiple_of > 0 && value % *schema.multiple_of != 0) {
        report(validation_error_kind::NotMultipleOf, path, std::to_string(value) + " is not a multiple of " + std::to_string(*schema.multiple_of));
    }
}

validation_walker::status validation_walker::check(const text_schema& schema, eure::node_id node, const eure::eure_path& path) {
    const auto& n = doc_.get(node);
    const auto* p = n.as_primitive();
    const auto* value = p ? std::get_if<eure::text>(p) : nullptr;
    if (!value) {
        report_type_mismatch("text", n, path);
        return {};
    }
    return check_text_value(schema, *value, path);
}

validation_walker::status validation_walker::check(const integer_schema& schema, eure::node_id node, const eure::eure_path& path) {
    const auto& n = doc_.get(node);
    const auto* p = n.as_primitive();
    const auto* value = p ? std::get_if<std::int64_t>(p) : nullptr;
    if (!value) {
        report_type_mismatch("integer", n, path);
        return {};
    }
    check_integer_value(schema, *value, path);
    return {};
}

validation_walker::status validation_walker::check(const float_schema& schema, eure::node_id node, const eure::eure_path& path) {
    const auto& n = doc_.get(node);
    const auto* p = n.as_primitive();
    const auto* value = p ? std::get_if<double>(p) : nullptr;
    if (!value) {
        report_type_mismatch("float", n, path);
        return {};
    }

    const auto rendered = eure::describe(*p);
    if (!within(*value, schema.min, schema.max)) {
        report(validation_error_kind::OutOfRange, path, rendered + " is outside the range " + render_range(schema.min, schema.max));
    }
    if (schema.multiple_of) {
        const auto value_decimal = to_decimal(*value);
        const auto divisor = std::holds_alternative<std::int64_t>(*schema.multiple_of)
            ? std::optional<decimal>(to_decimal(std::get<std::int64_t>(*schema.multiple_of)))
            : to_decimal(std::get<double>(*schema.multiple_of));
        if (!value_decimal || !divisor || !is_multiple(*value_decimal, *divisor)) {
            report(validation_error_kind::NotMultipleOf, path, rendered + " is not a multiple of " + render(*schema.multiple_of));
        }
    }
    return {};
}

validation_walker::status validation_walker::check(const boolean_schema&, eure::node_id node, const eure::eure_path& path) {
    const auto& n = doc_.get(node);
    const auto* p = n.as_primitive();
    if (!p || !std::holds_alternative<bool>(*p)) {
        report_type_mismatch("boolean", n, path);
    }
    return {};
}

validation_walker::status validation_walker::check(const null_schema&, eure::node_id node, const eure::eure_path& path) {
    const auto& n = doc_.get(node);
    const auto* p = n.as_primitive();
    if (!p || !std::holds_alternative<eure::null_value>(*p)) {
        report_type_mismatch("null", n, path);
    }
    return {};
}

validation_walker::status validation_walker::check(const any_schema&, eure::node_id, const eure::eure_path&) {
    return {};
}

validation_walker::status validation_walker::check(const literal_schema& schema, eure::node_id node, const eure::eure_path& path) {
    auto actual = doc_.to_value(node);
    actual.extensions.clear();
    if (!(actual == schema.expected)) {
        report(validation_error_kind::LiteralMismatch, path, "expected the literal " + eure::to_json(schema.expected).dump());
    }
    return {};
}

} // namespace eure_schema
