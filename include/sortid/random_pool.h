#pragma once

#include "sortid/alphabet.h"
#include "sortid/random_source.h"
#include <string>
#include <vector>
#include <random>
#include <cstdint>

namespace sortid {

/**
 * 버퍼링된 난수 심볼 풀
 *
 * 난수 바이트를 pool_size 단위로 미리 받아두고, 비트 마스크 + 거절 샘플링으로
 * 알파벳 인덱스를 균등하게 뽑는다.
 * 스레드 안전하지 않음 (생성기의 뮤텍스 안에서만 사용).
 */
class RandomSymbolPool {
public:
    /**
     * @param alphabet 정규 알파벳
     * @param source 난수 소스 (소유하지 않음)
     * @param pool_size 한 번에 받아올 바이트 수
     * @param allow_insecure_fallback 소스 실패시 비보안 난수 사용 허용
     */
    RandomSymbolPool(const Alphabet& alphabet,
                     IRandomSource* source,
                     size_t pool_size,
                     bool allow_insecure_fallback);
    ~RandomSymbolPool() = default;

    // 복사 방지
    RandomSymbolPool(const RandomSymbolPool&) = delete;
    RandomSymbolPool& operator=(const RandomSymbolPool&) = delete;

    /**
     * 난수 심볼 하나 반환
     * @throws RandomSourceException 소스 실패 + fallback 미허용, 또는 거절 횟수 한도 초과
     */
    char NextSymbol();

    /**
     * 난수 심볼 문자열 반환
     * @param count 심볼 개수
     */
    std::string NextSymbols(size_t count);

    /**
     * 비보안 fallback이 한 번이라도 사용되었는지
     */
    bool IsDegraded() const { return degraded_; }

    /**
     * 버퍼를 다시 채운 횟수
     */
    uint64_t GetRefillCount() const { return refill_count_; }

    uint8_t GetMask() const { return mask_; }

    /**
     * size - 1 이상인 가장 작은 2^k - 1 (k >= 1)
     */
    static uint8_t ComputeMask(size_t alphabet_size);

private:
    // 심볼 하나당 재추첨 한도 (풀 길이 배수, 최소값)
    static constexpr size_t kMaxRedrawPoolLengths = 4;
    static constexpr size_t kMinRedraws = 64;

    Alphabet alphabet_;
    IRandomSource* source_;
    std::vector<uint8_t> pool_;
    size_t offset_;
    uint8_t mask_;
    bool allow_insecure_fallback_;
    bool degraded_ = false;
    uint64_t refill_count_ = 0;
    std::mt19937_64 fallback_engine_;
    bool fallback_seeded_ = false;

    void Refill();
    void FillInsecure();
};

} // namespace sortid
