#include "argbind/coerce.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace {

const std::string kInvalidSyntax = "invalid syntax";
const std::string kOutOfRange = "value out of range";

struct DurationUnit {
    std::string_view suffix;
    std::uint64_t nanos;
};

constexpr DurationUnit kDurationUnits[] = {
    {"ns", 1},
    {"us", 1000},
    {"\xC2\xB5s", 1000}, // U+00B5 micro sign
    {"\xCE\xBCs", 1000}, // U+03BC Greek mu
    {"ms", 1000 * 1000},
    {"s", 1000 * 1000 * 1000},
    {"m", 60ULL * 1000 * 1000 * 1000},
    {"h", 60ULL * 60 * 1000 * 1000 * 1000},
};

constexpr std::uint64_t kDurationLimit = std::uint64_t{1} << 63;

bool isDurationDigit(char ch) { return ch >= '0' && ch <= '9'; }

// Consumes leading digits into `v`. False on overflow past 1<<63.
bool leadingInt(std::string_view s, std::size_t& pos, std::uint64_t& v) {
    v = 0;
    for (; pos < s.size() && isDurationDigit(s[pos]); ++pos) {
        if (v > (kDurationLimit - 1) / 10) return false;
        v = v * 10 + static_cast<std::uint64_t>(s[pos] - '0');
        if (v > kDurationLimit) return false;
    }
    return true;
}

// Consumes fraction digits. Digits past the precision of `f` are skipped, not rejected.
void leadingFraction(std::string_view s, std::size_t& pos, std::uint64_t& f, double& scale) {
    f = 0;
    scale = 1.0;
    bool overflow = false;
    for (; pos < s.size() && isDurationDigit(s[pos]); ++pos) {
        if (overflow) continue;
        if (f > (kDurationLimit - 1) / 10) {
            overflow = true;
            continue;
        }
        const std::uint64_t y = f * 10 + static_cast<std::uint64_t>(s[pos] - '0');
        if (y > kDurationLimit) {
            overflow = true;
            continue;
        }
        f = y;
        scale *= 10;
    }
}

} // namespace

namespace argbind::detail {

std::string_view trimWs(std::string_view s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::optional<std::string> parseBool(std::string_view s, bool& out) {
    const auto t = trimWs(s);
    if (t == "1" || t == "t" || t == "T" || t == "true" || t == "True" || t == "TRUE" || t == "on" || t == "yes") {
        out = true;
        return std::nullopt;
    }
    if (t == "0" || t == "f" || t == "F" || t == "false" || t == "False" || t == "FALSE" || t == "off" || t == "no") {
        out = false;
        return std::nullopt;
    }
    return kInvalidSyntax;
}

std::optional<std::string> parseSigned(std::string_view s, long long min, long long max, long long& out) {
    const auto t = trimWs(s);
    if (t.empty()) return kInvalidSyntax;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(tmp.c_str(), &end, 0);
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return kInvalidSyntax;
    if (errno == ERANGE || v < min || v > max) return kOutOfRange;
    if (errno != 0) return kInvalidSyntax;
    out = v;
    return std::nullopt;
}

std::optional<std::string> parseUnsigned(std::string_view s, unsigned long long max, unsigned long long& out) {
    const auto t = trimWs(s);
    if (t.empty()) return kInvalidSyntax;
    // strtoull silently wraps negative input.
    if (t.front() == '-') return kInvalidSyntax;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    const unsigned long long v = std::strtoull(tmp.c_str(), &end, 0);
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return kInvalidSyntax;
    if (errno == ERANGE || v > max) return kOutOfRange;
    if (errno != 0) return kInvalidSyntax;
    out = v;
    return std::nullopt;
}

std::optional<std::string> parseFloat(std::string_view s, float& out) {
    const auto t = trimWs(s);
    if (t.empty()) return kInvalidSyntax;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    const float v = std::strtof(tmp.c_str(), &end);
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return kInvalidSyntax;
    if (errno == ERANGE && std::isinf(v)) return kOutOfRange;
    out = v;
    return std::nullopt;
}

std::optional<std::string> parseFloat(std::string_view s, double& out) {
    const auto t = trimWs(s);
    if (t.empty()) return kInvalidSyntax;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(tmp.c_str(), &end);
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return kInvalidSyntax;
    if (errno == ERANGE && std::isinf(v)) return kOutOfRange;
    out = v;
    return std::nullopt;
}

std::optional<std::string> parseDuration(std::string_view s, Duration& out) {
    const auto sv = trimWs(s);
    const auto invalid = [&] { return "invalid duration \"" + std::string(sv) + "\""; };
    if (sv.empty()) return std::string("invalid duration");

    std::size_t pos = 0;
    bool neg = false;
    if (sv[pos] == '+' || sv[pos] == '-') {
        neg = sv[pos] == '-';
        ++pos;
    }
    if (sv.substr(pos) == "0") {
        out = Duration(0);
        return std::nullopt;
    }
    if (pos >= sv.size()) return invalid();

    // Magnitude in nanoseconds, at most 1<<63 so that the most negative value still fits.
    std::uint64_t total = 0;
    while (pos < sv.size()) {
        if (sv[pos] != '.' && !isDurationDigit(sv[pos])) return invalid();

        std::uint64_t v = 0;
        const std::size_t intStart = pos;
        if (!leadingInt(sv, pos, v)) return invalid();
        const bool pre = pos != intStart;

        std::uint64_t f = 0;
        double scale = 1.0;
        bool post = false;
        if (pos < sv.size() && sv[pos] == '.') {
            ++pos;
            const std::size_t fracStart = pos;
            leadingFraction(sv, pos, f, scale);
            post = pos != fracStart;
        }
        if (!pre && !post) return invalid();

        const std::size_t unitStart = pos;
        while (pos < sv.size() && sv[pos] != '.' && !isDurationDigit(sv[pos])) ++pos;
        if (pos == unitStart) return "missing unit in duration \"" + std::string(sv) + "\"";
        const std::string_view suffix = sv.substr(unitStart, pos - unitStart);

        const DurationUnit* unit = nullptr;
        for (const auto& u : kDurationUnits) {
            if (u.suffix == suffix) unit = &u;
        }
        if (!unit) return "unknown unit \"" + std::string(suffix) + "\" in duration \"" + std::string(sv) + "\"";

        if (v > kDurationLimit / unit->nanos) return invalid();
        v *= unit->nanos;
        if (f > 0) {
            v += static_cast<std::uint64_t>(static_cast<double>(f) * (static_cast<double>(unit->nanos) / scale));
            if (v > kDurationLimit) return invalid();
        }
        if (v > kDurationLimit - total) return invalid();
        total += v;
    }

    if (neg) {
        out = total == kDurationLimit ? Duration(std::numeric_limits<std::int64_t>::min())
                                      : Duration(-static_cast<std::int64_t>(total));
        return std::nullopt;
    }
    if (total > kDurationLimit - 1) return invalid();
    out = Duration(static_cast<std::int64_t>(total));
    return std::nullopt;
}

std::string demangle(const char* name) {
#if defined(__GNUG__)
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> out(abi::__cxa_demangle(name, nullptr, nullptr, &status), std::free);
    if (status == 0 && out) return out.get();
    return name;
#else
    return name;
#endif
}

} // namespace argbind::detail
