#pragma once

#include "sortid/alphabet.h"
#include "sortid/types.h"
#include <string>
#include <cstdint>

namespace sortid {

/**
 * 검증 및 계산이 끝난 불변 설정
 */
struct ResolvedConfig {
    explicit ResolvedConfig(const Alphabet& canonical)
        : alphabet(canonical) {}

    Alphabet alphabet;
    size_t total_length = 0;
    size_t timestamp_length = 0;
    size_t chrono_length = 0;
    size_t suffix_length = 0;

    Instant timestamp_start;
    Instant timestamp_end;
    TimeLevel timestamp_level = TimeLevel::MICROSECOND;
    SortableRate max_sortable_rate = SortableRate::MICRO_100;

    uint64_t bucket_nanoseconds = 1;
    uint64_t max_timestamp = 0;        // base^timestamp_length (uint64 포화)
    uint64_t expected_per_bucket = 0;  // 버킷당 예상 최대 발급 수

    size_t random_pool_size = 0;
    bool allow_insecure_fallback = false;
    uint32_t exhaustion_retries = 0;
    std::chrono::milliseconds exhaustion_retry_interval{1};

    /**
     * 시각을 버킷 인덱스로 변환
     * @param instant 변환할 시각
     * @param bucket 출력 버킷 인덱스
     * @return instant가 시작 시각보다 이전이면 false
     */
    bool BucketAt(const Instant& instant, uint64_t& bucket) const;

    /**
     * 버킷 인덱스를 버킷 시작 시각으로 변환
     * @param bucket 버킷 인덱스
     * @param instant 출력 시각
     * @return Instant 범위를 넘으면 false
     */
    bool InstantOfBucket(uint64_t bucket, Instant& instant) const;
};

/**
 * 원본 설정을 검증하고 필드 길이를 계산
 */
class ConfigResolver {
public:
    /**
     * @param config 원본 설정
     * @return 불변 설정
     * @throws ConfigurationException
     */
    static ResolvedConfig Resolve(const GeneratorConfig& config);

    /**
     * 시작~종료 사이의 버킷 개수
     */
    static uint64_t CountUnits(const Instant& start, const Instant& end, uint64_t unit_nanoseconds);

    /**
     * 버킷 하나에 들어갈 예상 발급 수 (소수점 이하 버림)
     * @throws ConfigurationException 64비트 범위를 넘는 경우
     */
    static uint64_t ExpectedPerBucket(SortableRate rate, TimeLevel level);
};

} // namespace sortid
