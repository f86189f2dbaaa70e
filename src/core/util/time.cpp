#include "siweauth/core/util/time.hpp"
#include <format>

namespace siweauth {

    namespace {

        bool readDigits(std::string_view s, std::size_t pos, std::size_t count, int& out) {
            if (pos + count > s.size()) return false;
            int v = 0;
            for (std::size_t i = pos; i < pos + count; ++i) {
                if (s[i] < '0' || s[i] > '9') return false;
                v = v * 10 + (s[i] - '0');
            }
            out = v;
            return true;
        }

    }

    std::optional<std::int64_t> parseRfc3339(std::string_view s)
    {
        using namespace std::chrono;

        // YYYY-MM-DDTHH:MM:SS
        int y, mo, d, h, mi, sec;
        if (s.size() < 20) return std::nullopt;
        if (!readDigits(s, 0, 4, y) || s[4] != '-' ||
            !readDigits(s, 5, 2, mo) || s[7] != '-' ||
            !readDigits(s, 8, 2, d) ||
            (s[10] != 'T' && s[10] != 't') ||
            !readDigits(s, 11, 2, h) || s[13] != ':' ||
            !readDigits(s, 14, 2, mi) || s[16] != ':' ||
            !readDigits(s, 17, 2, sec))
            return std::nullopt;

        if (h > 23 || mi > 59 || sec > 60) return std::nullopt;
        if (sec == 60) sec = 59;   // leap second, clamp

        year_month_day ymd{ year{ y }, month{ static_cast<unsigned>(mo) }, day{ static_cast<unsigned>(d) } };
        if (!ymd.ok()) return std::nullopt;

        std::size_t pos = 19;
        std::int64_t millis = 0;
        if (pos < s.size() && s[pos] == '.') {
            ++pos;
            std::size_t digits = 0;
            int scale = 100;
            while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
                if (digits < 3) {
                    millis += (s[pos] - '0') * scale;
                    scale /= 10;
                }
                ++digits;
                ++pos;
            }
            if (digits == 0) return std::nullopt;
        }

        std::int64_t offsetMin = 0;
        if (pos >= s.size()) return std::nullopt;
        if (s[pos] == 'Z' || s[pos] == 'z') {
            ++pos;
        }
        else if (s[pos] == '+' || s[pos] == '-') {
            int oh, om;
            if (!readDigits(s, pos + 1, 2, oh) || pos + 3 >= s.size() || s[pos + 3] != ':' ||
                !readDigits(s, pos + 4, 2, om) || oh > 23 || om > 59)
                return std::nullopt;
            offsetMin = oh * 60 + om;
            if (s[pos] == '-') offsetMin = -offsetMin;
            pos += 6;
        }
        else {
            return std::nullopt;
        }
        if (pos != s.size()) return std::nullopt;

        auto tp = sys_days{ ymd } + hours{ h } + minutes{ mi } + seconds{ sec };
        std::int64_t ms = duration_cast<milliseconds>(tp.time_since_epoch()).count() + millis;
        return ms - offsetMin * 60'000;
    }

    std::string formatRfc3339(std::int64_t epochMs)
    {
        using namespace std::chrono;
        sys_time<milliseconds> tp{ milliseconds{ epochMs } };
        auto dp = floor<days>(tp);
        year_month_day ymd{ dp };
        hh_mm_ss hms{ tp - dp };
        return std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
            static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
            static_cast<unsigned>(ymd.day()), hms.hours().count(),
            hms.minutes().count(), hms.seconds().count(),
            hms.subseconds().count());
    }

}
