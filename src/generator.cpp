#include "sortid/generator.h"
#include "sortid/errors.h"
#include <spdlog/spdlog.h>
#include <thread>
#include <utility>

namespace sortid {

namespace {

std::unique_ptr<IClock> RequireClock(std::unique_ptr<IClock> clock) {
    if (!clock) {
        throw ConfigurationException("clock must not be null");
    }
    return clock;
}

std::unique_ptr<IRandomSource> RequireRandomSource(std::unique_ptr<IRandomSource> source) {
    if (!source) {
        throw ConfigurationException("random source must not be null");
    }
    return source;
}

} // namespace

SortableIdGenerator::SortableIdGenerator(const GeneratorConfig& config)
    : SortableIdGenerator(config, CreateClock(), CreateRandomSource()) {
}

SortableIdGenerator::SortableIdGenerator(const GeneratorConfig& config,
                                         std::unique_ptr<IClock> clock,
                                         std::unique_ptr<IRandomSource> random_source)
    : config_(ConfigResolver::Resolve(config))
    , codec_(config_.alphabet)
    , cascade_(config_.alphabet)
    , clock_(RequireClock(std::move(clock)))
    , random_source_(RequireRandomSource(std::move(random_source)))
    , pool_(config_.alphabet, random_source_.get(),
            config_.random_pool_size, config_.allow_insecure_fallback) {
    WarnIfMisconfigured();
}

std::string SortableIdGenerator::Generate() {
    for (uint32_t attempt = 0;; ++attempt) {
        try {
            std::lock_guard<std::mutex> lock(mutex_);
            return GenerateLocked();
        } catch (const RateExceededException&) {
            if (attempt >= config_.exhaustion_retries) {
                throw;
            }
        }
        // 잠금 해제 상태에서 다음 버킷을 기다림
        std::this_thread::sleep_for(config_.exhaustion_retry_interval);
    }
}

std::string SortableIdGenerator::GenerateLocked() {
    const Instant now = clock_->Now();

    uint64_t bucket = 0;
    if (!config_.BucketAt(now, bucket)) {
        throw TimestampExhaustedException("current time " + FormatInstant(now) +
                                          " precedes timestamp start " +
                                          FormatInstant(config_.timestamp_start));
    }

    if (bucket >= config_.max_timestamp) {
        throw TimestampExhaustedException(
            "current time exceeds maximum supported timestamp, "
            "please increase the timestamp length or use a different timestamp level "
            "(timestamp length: " + std::to_string(config_.timestamp_length) +
            ", timestamp level: " + TimeLevelToString(config_.timestamp_level) + ")");
    }

    if (!state_.has_issued || bucket > state_.last_bucket) {
        return IssueNewBucket(bucket);
    }

    if (bucket < state_.last_bucket) {
        // 시계가 뒤로 간 경우 마지막 버킷을 계속 사용 (단조성 유지)
        spdlog::warn("sortid: clock moved backwards by {} bucket(s), continuing in last issued bucket",
                     state_.last_bucket - bucket);
    }

    return AdvanceWithinBucket();
}

std::string SortableIdGenerator::IssueNewBucket(uint64_t bucket) {
    std::string chrono(config_.chrono_length, config_.alphabet.Min());

    std::string id = codec_.Encode(bucket, config_.timestamp_length);
    id.reserve(config_.total_length);
    id += chrono;
    id += pool_.NextSymbols(config_.suffix_length);

    state_.has_issued = true;
    state_.last_bucket = bucket;
    state_.last_id = id;
    state_.last_chrono = std::move(chrono);
    return id;
}

std::string SortableIdGenerator::AdvanceWithinBucket() {
    const size_t ts_length = config_.timestamp_length;
    const std::string& last_id = state_.last_id;

    // 1) chrono 필드만 증가, suffix 유지
    std::string next;
    if (cascade_.Advance(state_.last_chrono, next)) {
        std::string id = last_id.substr(0, ts_length) + next +
                         last_id.substr(ts_length + config_.chrono_length);
        state_.last_id = id;
        state_.last_chrono = std::move(next);
        return id;
    }

    // 2) chrono + suffix 전체 증가
    if (cascade_.Advance(last_id.substr(ts_length), next)) {
        std::string id = last_id.substr(0, ts_length) + next;
        state_.last_chrono = next.substr(0, config_.chrono_length);
        state_.last_id = id;
        return id;
    }

    throw RateExceededException(
        "too many ids generated in a short period of time, "
        "please slow down the generation rate, increase the total length or "
        "use a finer timestamp level (timestamp level: " +
        TimeLevelToString(config_.timestamp_level) +
        ", total length: " + std::to_string(config_.total_length) + ")");
}

DecodedId SortableIdGenerator::Decode(const std::string& id) const {
    if (id.size() != config_.total_length) {
        throw DecodeException("ID must be exactly " + std::to_string(config_.total_length) +
                              " characters long, got " + std::to_string(id.size()));
    }
    if (!config_.alphabet.ContainsAll(id)) {
        throw DecodeException("ID contains invalid characters");
    }

    const size_t ts_length = config_.timestamp_length;
    DecodedId decoded;
    decoded.bucket = codec_.Decode(id.substr(0, ts_length), ts_length);
    if (!config_.InstantOfBucket(decoded.bucket, decoded.timestamp)) {
        throw DecodeException("timestamp field is outside the representable time range");
    }
    decoded.chrono_part = id.substr(ts_length, config_.chrono_length);
    decoded.suffix_part = id.substr(ts_length + config_.chrono_length);
    return decoded;
}

Instant SortableIdGenerator::MaxSupportedInstant() const {
    Instant instant;
    if (!config_.InstantOfBucket(config_.max_timestamp, instant)) {
        return Instant::max();
    }
    return instant;
}

bool SortableIdGenerator::IsRandomDegraded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_.IsDegraded();
}

void SortableIdGenerator::Describe(GeneratorInfo& info) const {
    info.SetAlphabet(config_.alphabet.Symbols());
    info.SetTotalLength(static_cast<int64_t>(config_.total_length));
    info.SetTimestampLength(static_cast<int64_t>(config_.timestamp_length));
    info.SetChronoLength(static_cast<int64_t>(config_.chrono_length));
    info.SetSuffixLength(static_cast<int64_t>(config_.suffix_length));
    info.SetTimestampLevel(config_.timestamp_level);
    info.SetMaxSortableRate(config_.max_sortable_rate);
    info.SetStartDate(config_.timestamp_start);
    info.SetEndDate(MaxSupportedInstant());
    info.SetRandomDegraded(IsRandomDegraded());
}

void SortableIdGenerator::LogInfo() const {
    GeneratorInfo info;
    Describe(info);

    spdlog::info("ID Generator Configuration:");
    spdlog::info("  Timestamp Length: {} symbols", info.GetTimestampLength());
    spdlog::info("  Start Date: {}", FormatInstant(info.GetStartDate()));
    spdlog::info("  End Date: {}", FormatInstant(info.GetEndDate()));
    spdlog::info("  Timestamp Level: {}", TimeLevelToString(info.GetTimestampLevel()));
    spdlog::info("  Chrono Length: {} symbols", info.GetChronoLength());
    spdlog::info("  Suffix Length: {} symbols", info.GetSuffixLength());
    spdlog::info("  Alphabet ({} chars): {}", info.GetAlphabet().size(), info.GetAlphabet());
    spdlog::info("  Total ID Length: {} symbols", info.GetTotalLength());
    spdlog::info("  Max Sortable Rate: {}", SortableRateToString(info.GetMaxSortableRate()));
    if (info.IsRandomDegraded()) {
        spdlog::info("  Random Source: insecure fallback");
    }
}

void SortableIdGenerator::WarnIfMisconfigured() {
    if (MaxSupportedInstant() < clock_->Now()) {
        spdlog::warn("sortid: max supported date {} is in the past, "
                     "increase the timestamp length (current: {})",
                     FormatInstant(MaxSupportedInstant()), config_.timestamp_length);
    }
    if (config_.suffix_length < config_.timestamp_length) {
        spdlog::warn("sortid: suffix length {} is shorter than timestamp length {}, "
                     "uniqueness across generators relies on the suffix",
                     config_.suffix_length, config_.timestamp_length);
    }
}

} // namespace sortid
