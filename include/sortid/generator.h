#pragma once

#include "sortid/types.h"
#include "sortid/config_resolver.h"
#include "sortid/codec.h"
#include "sortid/sequence_cascade.h"
#include "sortid/random_pool.h"
#include "sortid/random_source.h"
#include "sortid/clock.h"
#include <string>
#include <memory>
#include <mutex>

namespace sortid {

/**
 * 정렬 가능한 ID 생성기
 *
 * ID 형식: [timestamp][chrono][suffix]
 * 같은 인스턴스가 발급한 ID는 발급 순서대로 사전순 비내림차순이다.
 * 모든 public 메서드는 스레드 안전하다.
 */
class SortableIdGenerator {
public:
    /**
     * 시스템 시계와 OpenSSL 난수 소스로 생성
     * @param config 생성기 설정
     * @throws ConfigurationException
     */
    explicit SortableIdGenerator(const GeneratorConfig& config = DefaultConfig());

    /**
     * 시계와 난수 소스를 주입하여 생성
     * @param config 생성기 설정
     * @param clock 시각 소스
     * @param random_source 난수 바이트 소스
     * @throws ConfigurationException
     */
    SortableIdGenerator(const GeneratorConfig& config,
                        std::unique_ptr<IClock> clock,
                        std::unique_ptr<IRandomSource> random_source);

    ~SortableIdGenerator() = default;

    /**
     * 새 ID 생성
     * @return 길이가 total_length인 ID
     * @throws TimestampExhaustedException 현재 시각이 표현 범위 밖
     * @throws RateExceededException 현재 버킷의 chrono + suffix 공간 소진
     * @throws RandomSourceException 보안 난수 실패 (fallback 미허용)
     */
    std::string Generate();

    /**
     * ID 디코딩 (상태 변경 없음)
     * @param id 디코딩할 ID
     * @return 타임스탬프와 chrono/suffix 부분
     * @throws DecodeException
     */
    DecodedId Decode(const std::string& id) const;

    /**
     * 현재 설정으로 표현 가능한 최대 시각
     */
    Instant MaxSupportedInstant() const;

    /**
     * 설정 스냅샷 (진단용, 생성 상태에 영향 없음)
     * @param info 출력 스냅샷
     */
    void Describe(GeneratorInfo& info) const;

    /**
     * 설정 스냅샷을 로그로 출력
     */
    void LogInfo() const;

    /**
     * 비보안 난수 fallback이 사용되었는지
     */
    bool IsRandomDegraded() const;

    const Alphabet& GetAlphabet() const { return config_.alphabet; }
    size_t GetTotalLength() const { return config_.total_length; }
    size_t GetTimestampLength() const { return config_.timestamp_length; }
    size_t GetChronoLength() const { return config_.chrono_length; }
    size_t GetSuffixLength() const { return config_.suffix_length; }

private:
    // 마지막 발급 상태 (mutex_ 보호)
    struct IssuanceState {
        bool has_issued = false;
        uint64_t last_bucket = 0;
        std::string last_id;
        std::string last_chrono;
    };

    const ResolvedConfig config_;
    const BaseNCodec codec_;
    const SequenceCascade cascade_;
    std::unique_ptr<IClock> clock_;
    std::unique_ptr<IRandomSource> random_source_;

    mutable std::mutex mutex_;
    IssuanceState state_;
    RandomSymbolPool pool_;

    std::string GenerateLocked();
    std::string IssueNewBucket(uint64_t bucket);
    std::string AdvanceWithinBucket();
    void WarnIfMisconfigured();
};

} // namespace sortid
