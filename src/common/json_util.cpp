// ---------------------------------------------------------------------------
// json_util.cpp
// ---------------------------------------------------------------------------

#include "common/json_util.hpp"

#include <charconv>
#include <cstdio>
#include <ctime>

#include <fmt/format.h>

std::string escape_json_string(std::string_view str) {
    std::string result;
    result.reserve(str.size() + 16);

    for (const char c : str) {
        const auto ch = static_cast<unsigned char>(c);
        switch (ch) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b";  break;
            case '\f': result += "\\f";  break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:
                if (ch < 0x20) {
                    char buf[8]{};
                    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
                    result += buf;
                } else {
                    result += c;
                }
                break;
        }
    }

    return result;
}

std::string json_quote(std::string_view str) {
    std::string out;
    out.reserve(str.size() + 2);
    out += '"';
    out += escape_json_string(str);
    out += '"';
    return out;
}

std::string json_string_array(const std::vector<std::string>& items) {
    std::string out = "[";
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += json_quote(items[i]);
    }
    out += ']';
    return out;
}

std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto since_epoch = tp.time_since_epoch();
    const auto seconds     = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto       millis      = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch - seconds).count();
    if (millis < 0) {
        millis = 0;
    }

    const std::time_t t = std::chrono::system_clock::to_time_t(
        std::chrono::system_clock::time_point{seconds});
    std::tm tm_val{};
    gmtime_r(&t, &tm_val);

    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       tm_val.tm_year + 1900, tm_val.tm_mon + 1, tm_val.tm_mday,
                       tm_val.tm_hour, tm_val.tm_min, tm_val.tm_sec, millis);
}

std::string format_compact_utc(const std::chrono::system_clock::time_point& tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_val{};
    gmtime_r(&t, &tm_val);
    return fmt::format("{:04}{:02}{:02}T{:02}{:02}{:02}",
                       tm_val.tm_year + 1900, tm_val.tm_mon + 1, tm_val.tm_mday,
                       tm_val.tm_hour, tm_val.tm_min, tm_val.tm_sec);
}

namespace {

// text[pos, pos+width) 를 정수로 읽는다. 실패 시 false.
bool read_fixed_int(std::string_view text, std::size_t pos, std::size_t width, int& out) {
    if (pos + width > text.size()) {
        return false;
    }
    const char* begin = text.data() + pos;
    const char* end   = begin + width;
    auto [ptr, ec] = std::from_chars(begin, end, out);
    return ec == std::errc{} && ptr == end;
}

}  // namespace

std::optional<std::chrono::system_clock::time_point>
parse_iso8601(std::string_view text) {
    using namespace std::chrono;

    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0, ms = 0;
    if (!read_fixed_int(text, 0, 4, y) || text.size() < 10 || text[4] != '-' ||
        !read_fixed_int(text, 5, 2, mo) || text[7] != '-' ||
        !read_fixed_int(text, 8, 2, d)) {
        return std::nullopt;
    }

    std::size_t pos = 10;
    if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
        if (!read_fixed_int(text, pos + 1, 2, h) || text.size() < pos + 9 ||
            text[pos + 3] != ':' || !read_fixed_int(text, pos + 4, 2, mi) ||
            text[pos + 6] != ':' || !read_fixed_int(text, pos + 7, 2, s)) {
            return std::nullopt;
        }
        pos += 9;
        if (pos < text.size() && text[pos] == '.') {
            if (!read_fixed_int(text, pos + 1, 3, ms)) {
                return std::nullopt;
            }
            pos += 4;
        }
    }
    if (pos < text.size() && text[pos] == 'Z') {
        ++pos;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok() || h > 23 || mi > 59 || s > 60) {
        return std::nullopt;
    }

    return system_clock::time_point{sys_days{ymd}} + hours{h} + minutes{mi} + seconds{s} +
           milliseconds{ms};
}
