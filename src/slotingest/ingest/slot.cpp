#include <slotingest/ingest/slot.h>

#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace slotingest::ingest {

std::string Slot::to_string() const {
    return "Slot(" + identifier + ", " + format_timestamp(timestamp) + ")";
}

std::int64_t to_epoch_millis(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               ts.time_since_epoch())
        .count();
}

Timestamp from_epoch_millis(std::int64_t millis) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::milliseconds(millis)));
}

std::int64_t to_epoch_nanos(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               ts.time_since_epoch())
        .count();
}

Timestamp from_epoch_nanos(std::int64_t nanos) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::nanoseconds(nanos)));
}

Timestamp parse_timestamp(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    char sep = ' ';
    int consumed = 0;

    int fields = std::sscanf(text.c_str(), "%4d-%2d-%2d%n", &year, &month,
                             &day, &consumed);
    if (fields != 3) {
        throw std::invalid_argument("Invalid timestamp: '" + text + "'");
    }

    if (static_cast<std::size_t>(consumed) < text.size()) {
        int rest_consumed = 0;
        fields = std::sscanf(text.c_str() + consumed, "%c%2d:%2d:%2d%n", &sep,
                             &hour, &minute, &second, &rest_consumed);
        if (fields != 4 || (sep != ' ' && sep != 'T') ||
            static_cast<std::size_t>(consumed + rest_consumed) !=
                text.size()) {
            throw std::invalid_argument("Invalid timestamp: '" + text + "'");
        }
    }

    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 ||
        minute > 59 || second > 59) {
        throw std::invalid_argument("Timestamp out of range: '" + text + "'");
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;

    std::time_t t = timegm(&tm);

    // timegm normalises out-of-range days, e.g. Feb 31 into March
    std::tm check{};
    gmtime_r(&t, &check);
    if (check.tm_year != year - 1900 || check.tm_mon != month - 1 ||
        check.tm_mday != day) {
        throw std::invalid_argument("No such date: '" + text + "'");
    }
    return std::chrono::system_clock::from_time_t(t);
}

std::string format_timestamp(Timestamp ts) {
    std::int64_t millis = to_epoch_millis(ts);
    std::int64_t secs = millis / 1000;
    std::int64_t rem = millis % 1000;
    if (rem < 0) {
        rem += 1000;
        secs -= 1;
    }

    std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    std::string out(buf);
    if (rem != 0) {
        char ms[8];
        std::snprintf(ms, sizeof(ms), ".%03d", static_cast<int>(rem));
        out += ms;
    }
    return out;
}

}  // namespace slotingest::ingest
