#include "sortid/types.h"
#include "sortid/errors.h"
#include <ctime>
#include <sstream>
#include <iomanip>

namespace sortid {

namespace {

constexpr uint64_t kNanosPerSecond = 1000000000ULL;

int64_t ToNanos(const Instant& instant) {
    return instant.time_since_epoch().count();
}

Instant FromNanos(int64_t nanos) {
    return Instant(std::chrono::nanoseconds(nanos));
}

} // namespace

uint64_t TimeLevelToNanoseconds(TimeLevel level) {
    switch (level) {
        case TimeLevel::NANOSECOND: return 1ULL;
        case TimeLevel::MICROSECOND: return 1000ULL;
        case TimeLevel::MILLISECOND: return 1000000ULL;
        case TimeLevel::SECOND: return kNanosPerSecond;
        case TimeLevel::MINUTE: return 60ULL * kNanosPerSecond;
        case TimeLevel::HOUR: return 3600ULL * kNanosPerSecond;
        case TimeLevel::DAY: return 86400ULL * kNanosPerSecond;
        case TimeLevel::MONTH: return 30ULL * 86400ULL * kNanosPerSecond;
        case TimeLevel::YEAR: return 365ULL * 86400ULL * kNanosPerSecond;
    }
    return 1ULL;
}

uint64_t SortableRateToPerSecond(SortableRate rate) {
    switch (rate) {
        case SortableRate::NANO_10: return 10ULL * 1000ULL * 1000ULL * 1000ULL;
        case SortableRate::MICRO_100: return 100ULL * 1000ULL * 1000ULL;
        case SortableRate::MICRO_1: return 1000ULL * 1000ULL;
        case SortableRate::MILLI_10: return 10ULL * 1000ULL;
        case SortableRate::SECOND_100: return 100ULL;
        case SortableRate::SECOND_1: return 1ULL;
    }
    return 1ULL;
}

bool IsKnownTimeLevel(TimeLevel level) {
    switch (level) {
        case TimeLevel::NANOSECOND:
        case TimeLevel::MICROSECOND:
        case TimeLevel::MILLISECOND:
        case TimeLevel::SECOND:
        case TimeLevel::MINUTE:
        case TimeLevel::HOUR:
        case TimeLevel::DAY:
        case TimeLevel::MONTH:
        case TimeLevel::YEAR:
            return true;
    }
    return false;
}

bool IsKnownSortableRate(SortableRate rate) {
    switch (rate) {
        case SortableRate::NANO_10:
        case SortableRate::MICRO_100:
        case SortableRate::MICRO_1:
        case SortableRate::MILLI_10:
        case SortableRate::SECOND_100:
        case SortableRate::SECOND_1:
            return true;
    }
    return false;
}

std::string TimeLevelToString(TimeLevel level) {
    switch (level) {
        case TimeLevel::NANOSECOND: return "nanosecond";
        case TimeLevel::MICROSECOND: return "microsecond";
        case TimeLevel::MILLISECOND: return "millisecond";
        case TimeLevel::SECOND: return "second";
        case TimeLevel::MINUTE: return "minute";
        case TimeLevel::HOUR: return "hour";
        case TimeLevel::DAY: return "day";
        case TimeLevel::MONTH: return "month";
        case TimeLevel::YEAR: return "year";
    }
    return "microsecond";
}

std::string SortableRateToString(SortableRate rate) {
    switch (rate) {
        case SortableRate::NANO_10: return "10_per_nanosecond";
        case SortableRate::MICRO_100: return "100_per_microsecond";
        case SortableRate::MICRO_1: return "1_per_microsecond";
        case SortableRate::MILLI_10: return "10_per_millisecond";
        case SortableRate::SECOND_100: return "100_per_second";
        case SortableRate::SECOND_1: return "1_per_second";
    }
    return "100_per_microsecond";
}

bool ParseTimeLevel(const std::string& str, TimeLevel& level) {
    if (str == "nanosecond") { level = TimeLevel::NANOSECOND; return true; }
    if (str == "microsecond") { level = TimeLevel::MICROSECOND; return true; }
    if (str == "millisecond") { level = TimeLevel::MILLISECOND; return true; }
    if (str == "second") { level = TimeLevel::SECOND; return true; }
    if (str == "minute") { level = TimeLevel::MINUTE; return true; }
    if (str == "hour") { level = TimeLevel::HOUR; return true; }
    if (str == "day") { level = TimeLevel::DAY; return true; }
    if (str == "month") { level = TimeLevel::MONTH; return true; }
    if (str == "year") { level = TimeLevel::YEAR; return true; }
    return false;
}

bool ParseSortableRate(const std::string& str, SortableRate& rate) {
    if (str == "10_per_nanosecond") { rate = SortableRate::NANO_10; return true; }
    if (str == "100_per_microsecond") { rate = SortableRate::MICRO_100; return true; }
    if (str == "1_per_microsecond") { rate = SortableRate::MICRO_1; return true; }
    if (str == "10_per_millisecond") { rate = SortableRate::MILLI_10; return true; }
    if (str == "100_per_second") { rate = SortableRate::SECOND_100; return true; }
    if (str == "1_per_second") { rate = SortableRate::SECOND_1; return true; }
    return false;
}

std::string FormatInstant(const Instant& instant) {
    int64_t nanos = ToNanos(instant);
    int64_t seconds = nanos / static_cast<int64_t>(kNanosPerSecond);
    int64_t fraction = nanos % static_cast<int64_t>(kNanosPerSecond);
    if (fraction < 0) {
        fraction += static_cast<int64_t>(kNanosPerSecond);
        --seconds;
    }

    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm tm_utc{};
#ifdef _WIN32
    gmtime_s(&tm_utc, &t);
#else
    gmtime_r(&t, &tm_utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(9) << fraction << 'Z';
    return oss.str();
}

GeneratorConfig DefaultConfig() {
    return GeneratorConfig();
}

void GeneratorInfo::saveToJson() {
    setString("alphabet", alphabet_);
    setInt64("alphabet_size", static_cast<int64_t>(alphabet_.size()));
    setInt64("total_length", total_length_);
    setInt64("timestamp_length", timestamp_length_);
    setInt64("chrono_length", chrono_length_);
    setInt64("suffix_length", suffix_length_);
    setString("timestamp_level", TimeLevelToString(timestamp_level_));
    setString("max_sortable_rate", SortableRateToString(max_sortable_rate_));
    setString("start_date", FormatInstant(start_date_));
    setInt64("start_date_ns", ToNanos(start_date_));
    setString("end_date", FormatInstant(end_date_));
    setInt64("end_date_ns", ToNanos(end_date_));
    setString("random_source", random_degraded_ ? "insecure_fallback" : "secure");
}

void GeneratorInfo::loadFromJson() {
    alphabet_ = getString("alphabet");
    total_length_ = getInt64("total_length");
    timestamp_length_ = getInt64("timestamp_length");
    chrono_length_ = getInt64("chrono_length");
    suffix_length_ = getInt64("suffix_length");

    std::string level = getString("timestamp_level");
    if (!ParseTimeLevel(level, timestamp_level_)) {
        throw SerializationException("unknown timestamp level: " + level);
    }
    std::string rate = getString("max_sortable_rate");
    if (!ParseSortableRate(rate, max_sortable_rate_)) {
        throw SerializationException("unknown sortable rate: " + rate);
    }

    start_date_ = FromNanos(getInt64("start_date_ns"));
    end_date_ = FromNanos(getInt64("end_date_ns"));

    if (hasKey("random_source")) {
        random_degraded_ = (getString("random_source") == "insecure_fallback");
    } else {
        random_degraded_ = false;
    }
}

} // namespace sortid
