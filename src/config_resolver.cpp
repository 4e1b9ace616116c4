#include "sortid/config_resolver.h"
#include "sortid/checked_math.h"
#include "sortid/errors.h"
#include <spdlog/spdlog.h>
#include <limits>

namespace sortid {

namespace {

constexpr uint64_t kNanosPerSecond = 1000000000ULL;

// 2의 보수 뺄셈, a >= b 일 때만 사용
uint64_t NanosBetween(const Instant& from, const Instant& to) {
    return static_cast<uint64_t>(to.time_since_epoch().count()) -
           static_cast<uint64_t>(from.time_since_epoch().count());
}

} // namespace

bool ResolvedConfig::BucketAt(const Instant& instant, uint64_t& bucket) const {
    if (instant < timestamp_start) {
        return false;
    }
    bucket = NanosBetween(timestamp_start, instant) / bucket_nanoseconds;
    return true;
}

bool ResolvedConfig::InstantOfBucket(uint64_t bucket, Instant& instant) const {
    uint64_t offset = 0;
    if (!CheckedMultiply(bucket, bucket_nanoseconds, offset)) {
        return false;
    }

    const int64_t start_ns = timestamp_start.time_since_epoch().count();
    const uint64_t headroom = static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) -
                              static_cast<uint64_t>(start_ns);
    if (offset > headroom) {
        return false;
    }

    instant = Instant(std::chrono::nanoseconds(
        static_cast<int64_t>(static_cast<uint64_t>(start_ns) + offset)));
    return true;
}

uint64_t ConfigResolver::CountUnits(const Instant& start, const Instant& end, uint64_t unit_nanoseconds) {
    if (end <= start) {
        return 0;
    }
    return NanosBetween(start, end) / unit_nanoseconds;
}

uint64_t ConfigResolver::ExpectedPerBucket(SortableRate rate, TimeLevel level) {
    const uint64_t per_second = SortableRateToPerSecond(rate);
    const uint64_t unit_ns = TimeLevelToNanoseconds(level);

    uint64_t expected = 0;
    if (unit_ns % kNanosPerSecond == 0) {
        if (!CheckedMultiply(per_second, unit_ns / kNanosPerSecond, expected)) {
            throw ConfigurationException("expected issuance per bucket exceeds 64-bit range (rate: " +
                                         SortableRateToString(rate) + ", level: " +
                                         TimeLevelToString(level) + ")");
        }
        return expected;
    }

    if (!CheckedMultiply(per_second, unit_ns, expected)) {
        throw ConfigurationException("expected issuance per bucket exceeds 64-bit range (rate: " +
                                     SortableRateToString(rate) + ", level: " +
                                     TimeLevelToString(level) + ")");
    }
    return expected / kNanosPerSecond;
}

ResolvedConfig ConfigResolver::Resolve(const GeneratorConfig& config) {
    ResolvedConfig resolved(Alphabet::Normalize(config.alphabet));
    const uint64_t base = resolved.alphabet.Size();

    if (config.total_length < 2) {
        throw ConfigurationException("total length must be at least 2");
    }
    if (config.random_pool_size == 0) {
        throw ConfigurationException("random pool size must be positive");
    }

    resolved.timestamp_start = config.timestamp_start;
    resolved.timestamp_end = config.timestamp_end.value_or(Instant::max());
    if (resolved.timestamp_end < resolved.timestamp_start) {
        throw ConfigurationException("end date cannot be before start date");
    }

    if (!IsKnownTimeLevel(config.timestamp_level)) {
        throw ConfigurationException("unknown timestamp level value: " +
                                     std::to_string(static_cast<int>(config.timestamp_level)));
    }
    if (!IsKnownSortableRate(config.max_sortable_rate)) {
        throw ConfigurationException("unknown sortable rate value: " +
                                     std::to_string(static_cast<int>(config.max_sortable_rate)));
    }

    resolved.timestamp_level = config.timestamp_level;
    resolved.max_sortable_rate = config.max_sortable_rate;
    resolved.bucket_nanoseconds = TimeLevelToNanoseconds(config.timestamp_level);

    if (config.timestamp_length > 0) {
        if (config.timestamp_length >= config.total_length) {
            throw ConfigurationException("timestamp length " + std::to_string(config.timestamp_length) +
                                         " must be shorter than total length " +
                                         std::to_string(config.total_length));
        }
        resolved.timestamp_length = config.timestamp_length;
    } else {
        uint64_t units = CountUnits(resolved.timestamp_start, resolved.timestamp_end,
                                    resolved.bucket_nanoseconds);
        resolved.timestamp_length = MinimumDigits(base, units);
    }

    resolved.expected_per_bucket = ExpectedPerBucket(config.max_sortable_rate, config.timestamp_level);
    resolved.chrono_length = MinimumDigits(base, resolved.expected_per_bucket);

    uint64_t required = 0;
    if (!CheckedAdd(resolved.timestamp_length, resolved.chrono_length, required) ||
        !CheckedAdd(required, 1, required)) {
        throw ConfigurationException("timestamp and chrono lengths exceed the addressable range");
    }
    if (config.total_length < required) {
        throw ConfigurationException("total length must be at least " + std::to_string(required) +
                                     " (timestamp: " + std::to_string(resolved.timestamp_length) +
                                     ", chrono: " + std::to_string(resolved.chrono_length) +
                                     ", minimum random: 1)");
    }

    resolved.total_length = config.total_length;
    resolved.suffix_length = config.total_length - resolved.timestamp_length - resolved.chrono_length;
    resolved.max_timestamp = SaturatingPow(base, resolved.timestamp_length);

    resolved.random_pool_size = config.random_pool_size;
    resolved.allow_insecure_fallback = config.allow_insecure_fallback;
    resolved.exhaustion_retries = config.exhaustion_retries;
    resolved.exhaustion_retry_interval = config.exhaustion_retry_interval;

    spdlog::debug("sortid: resolved base={} timestamp={} chrono={} suffix={} expected_per_bucket={}",
                  base, resolved.timestamp_length, resolved.chrono_length,
                  resolved.suffix_length, resolved.expected_per_bucket);

    return resolved;
}

} // namespace sortid
