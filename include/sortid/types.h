#pragma once

#include <string>
#include <cstdint>
#include <chrono>
#include <optional>
#include "jsonable/Jsonable.hpp"

namespace sortid {

/**
 * ID에 사용하는 시각 타입 (UTC, 나노초 해상도)
 */
using Instant = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

/**
 * 타임스탬프 버킷 단위
 */
enum class TimeLevel {
    NANOSECOND,
    MICROSECOND,
    MILLISECOND,
    SECOND,
    MINUTE,
    HOUR,
    DAY,
    MONTH,   // 30일 근사
    YEAR     // 365일 근사
};

/**
 * 정렬을 보장할 최대 발급 속도
 */
enum class SortableRate {
    NANO_10,      // 10 per nanosecond
    MICRO_100,    // 100 per microsecond
    MICRO_1,      // 1 per microsecond
    MILLI_10,     // 10 per millisecond
    SECOND_100,   // 100 per second
    SECOND_1      // 1 per second
};

/**
 * 버킷 하나의 길이 (나노초)
 * 버킷 계산과 chrono 길이 계산이 모두 이 표를 사용한다.
 */
uint64_t TimeLevelToNanoseconds(TimeLevel level);

/**
 * 초당 발급 개수
 */
uint64_t SortableRateToPerSecond(SortableRate rate);

/**
 * 열거형 범위 안의 값인지 검사
 */
bool IsKnownTimeLevel(TimeLevel level);
bool IsKnownSortableRate(SortableRate rate);

std::string TimeLevelToString(TimeLevel level);
std::string SortableRateToString(SortableRate rate);

/**
 * 문자열을 TimeLevel로 변환
 * @param str "millisecond" 등
 * @param level 출력 값
 * @return 알 수 없는 이름이면 false
 */
bool ParseTimeLevel(const std::string& str, TimeLevel& level);

/**
 * 문자열을 SortableRate로 변환
 * @param str "100_per_microsecond" 등
 * @param rate 출력 값
 * @return 알 수 없는 이름이면 false
 */
bool ParseSortableRate(const std::string& str, SortableRate& rate);

/**
 * ISO 8601 (UTC) 문자열로 변환
 */
std::string FormatInstant(const Instant& instant);

/**
 * 생성기 설정
 */
struct GeneratorConfig {
    std::string alphabet = "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ-_";
    size_t total_length = 32;
    Instant timestamp_start = Instant(std::chrono::seconds(1704067200));  // 2024-01-01T00:00:00Z
    std::optional<Instant> timestamp_end;   // 미지정시 사실상 무제한
    size_t timestamp_length = 0;            // 0이면 시작/종료 시각으로부터 계산
    TimeLevel timestamp_level = TimeLevel::MICROSECOND;
    SortableRate max_sortable_rate = SortableRate::MICRO_100;

    size_t random_pool_size = 256;
    bool allow_insecure_fallback = false;

    // 버킷 소진시 재시도 (0이면 즉시 RateExceeded)
    uint32_t exhaustion_retries = 0;
    std::chrono::milliseconds exhaustion_retry_interval{1};
};

/**
 * 기본 설정 반환
 */
GeneratorConfig DefaultConfig();

/**
 * ID 디코딩 결과
 */
struct DecodedId {
    Instant timestamp;
    uint64_t bucket = 0;
    std::string chrono_part;
    std::string suffix_part;
};

/**
 * 생성기 설정 스냅샷 (진단/로깅용)
 * jsonable을 상속받아 JSON 직렬화/역직렬화 지원
 */
class GeneratorInfo : public json::Jsonable {
public:
    GeneratorInfo() = default;
    ~GeneratorInfo() = default;

    // Getter/Setter
    const std::string& GetAlphabet() const { return alphabet_; }
    void SetAlphabet(const std::string& alphabet) { alphabet_ = alphabet; }

    int64_t GetTotalLength() const { return total_length_; }
    void SetTotalLength(int64_t length) { total_length_ = length; }

    int64_t GetTimestampLength() const { return timestamp_length_; }
    void SetTimestampLength(int64_t length) { timestamp_length_ = length; }

    int64_t GetChronoLength() const { return chrono_length_; }
    void SetChronoLength(int64_t length) { chrono_length_ = length; }

    int64_t GetSuffixLength() const { return suffix_length_; }
    void SetSuffixLength(int64_t length) { suffix_length_ = length; }

    TimeLevel GetTimestampLevel() const { return timestamp_level_; }
    void SetTimestampLevel(TimeLevel level) { timestamp_level_ = level; }

    SortableRate GetMaxSortableRate() const { return max_sortable_rate_; }
    void SetMaxSortableRate(SortableRate rate) { max_sortable_rate_ = rate; }

    const Instant& GetStartDate() const { return start_date_; }
    void SetStartDate(const Instant& instant) { start_date_ = instant; }

    const Instant& GetEndDate() const { return end_date_; }
    void SetEndDate(const Instant& instant) { end_date_ = instant; }

    bool IsRandomDegraded() const { return random_degraded_; }
    void SetRandomDegraded(bool degraded) { random_degraded_ = degraded; }

    // jsonable 인터페이스 구현
    void saveToJson() override;
    void loadFromJson() override;

private:
    std::string alphabet_;
    int64_t total_length_ = 0;
    int64_t timestamp_length_ = 0;
    int64_t chrono_length_ = 0;
    int64_t suffix_length_ = 0;
    TimeLevel timestamp_level_ = TimeLevel::MICROSECOND;
    SortableRate max_sortable_rate_ = SortableRate::MICRO_100;
    Instant start_date_;
    Instant end_date_;          // 표현 가능한 최대 시각
    bool random_degraded_ = false;
};

} // namespace sortid
