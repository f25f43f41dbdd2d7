#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <stdexcept>

namespace util {

namespace {

constexpr size_t WAD_DECIMALS = 18;
constexpr size_t MAX_DIGITS = 78;

bool all_digits(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

Wad digits_to_wad(const std::string& digits, const std::string& original) {
    std::string stripped = digits;
    stripped.erase(0, std::min(stripped.find_first_not_of('0'), stripped.size()));
    if (stripped.empty()) return Wad(0);
    if (stripped.size() > MAX_DIGITS) {
        throw std::invalid_argument("value out of range: " + original);
    }
    try {
        return Wad(stripped.c_str());
    } catch (const std::overflow_error&) {
        throw std::invalid_argument("value out of range: " + original);
    }
}

} // namespace

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto itt = std::chrono::system_clock::to_time_t(now);
    std::ostringstream ss;
    ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
    return ss.str();
}

int64_t current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string trim(const std::string& str) {
    auto first = str.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    auto last = str.find_last_not_of(" \t\n\r");
    return str.substr(first, last - first + 1);
}

Wad parse_wad(const std::string& text) {
    std::string s = trim(text);
    if (s.empty()) {
        throw std::invalid_argument("empty fixed-point value");
    }

    std::string mantissa = s;
    std::string exponent;
    auto e_pos = s.find_first_of("eE");
    if (e_pos != std::string::npos) {
        mantissa = s.substr(0, e_pos);
        exponent = s.substr(e_pos + 1);
        if (!exponent.empty() && exponent[0] == '+') exponent.erase(0, 1);
        if (exponent.empty() || !all_digits(exponent) || exponent.size() > 2) {
            throw std::invalid_argument("bad exponent in " + s);
        }
    }

    std::string int_part = mantissa;
    std::string frac_part;
    bool has_point = false;
    auto dot = mantissa.find('.');
    if (dot != std::string::npos) {
        has_point = true;
        int_part = mantissa.substr(0, dot);
        frac_part = mantissa.substr(dot + 1);
        if (frac_part.empty()) {
            throw std::invalid_argument("missing fractional digits in " + s);
        }
    }
    if (int_part.empty() || !all_digits(int_part) || !all_digits(frac_part)) {
        throw std::invalid_argument("not a number: " + s);
    }

    // Scientific notation is a raw integer: 1.2e18 == 1200000000000000000
    if (!exponent.empty()) {
        size_t exp = std::stoul(exponent);
        if (frac_part.size() > exp) {
            throw std::invalid_argument("not an integer: " + s);
        }
        return digits_to_wad(int_part + frac_part + std::string(exp - frac_part.size(), '0'), s);
    }

    if (!has_point) {
        return digits_to_wad(int_part, s);
    }

    if (frac_part.size() > WAD_DECIMALS) {
        throw std::invalid_argument("more than 18 decimals in " + s);
    }
    return digits_to_wad(int_part + frac_part + std::string(WAD_DECIMALS - frac_part.size(), '0'), s);
}

std::string wad_to_string(const Wad& value) {
    return value.str();
}

std::string wad_to_decimal(const Wad& value) {
    std::string digits = value.str();
    if (digits.size() <= WAD_DECIMALS) {
        digits.insert(0, WAD_DECIMALS + 1 - digits.size(), '0');
    }
    std::string int_part = digits.substr(0, digits.size() - WAD_DECIMALS);
    std::string frac_part = digits.substr(digits.size() - WAD_DECIMALS);

    auto last = frac_part.find_last_not_of('0');
    frac_part = last == std::string::npos ? "0" : frac_part.substr(0, last + 1);
    return int_part + "." + frac_part;
}

} // namespace util
