#ifndef TRAILSKETCH_COMMON_DECIMAL_HPP
#define TRAILSKETCH_COMMON_DECIMAL_HPP

#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace trailsketch {

// Parse the whole of text as a decimal or scientific number, independent
// of the C locale. A single leading '+' is accepted. Returns nullopt on
// trailing characters or a value outside the double range.
inline std::optional<double> parse_decimal(std::string_view text) {
    if (text.size() > 1 && text.front() == '+' && text[1] != '-' && text[1] != '+') {
        text.remove_prefix(1);
    }
    double value = 0.0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value, std::chars_format::general);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

// Shortest text that parses back to exactly value, in plain positional
// notation (no exponent), independent of the C locale
inline std::string format_decimal(double value) {
    // Fixed notation of the smallest subnormal needs about 330 characters
    char buffer[512];
    auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value,
                                   std::chars_format::fixed);
    if (ec != std::errc{}) {
        return std::string();
    }
    return std::string(buffer, ptr);
}

}  // namespace trailsketch

#endif // TRAILSKETCH_COMMON_DECIMAL_HPP
