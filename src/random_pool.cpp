#include "sortid/random_pool.h"
#include "sortid/errors.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>

namespace sortid {

RandomSymbolPool::RandomSymbolPool(const Alphabet& alphabet,
                                   IRandomSource* source,
                                   size_t pool_size,
                                   bool allow_insecure_fallback)
    : alphabet_(alphabet)
    , source_(source)
    , pool_(pool_size)
    , offset_(pool_size)   // 첫 사용시 채움
    , mask_(ComputeMask(alphabet.Size()))
    , allow_insecure_fallback_(allow_insecure_fallback) {
}

uint8_t RandomSymbolPool::ComputeMask(size_t alphabet_size) {
    unsigned mask = 1;
    while (mask < alphabet_size - 1) {
        mask = (mask << 1) | 1;
    }
    return static_cast<uint8_t>(mask);
}

char RandomSymbolPool::NextSymbol() {
    const size_t max_draws = std::max(pool_.size() * kMaxRedrawPoolLengths, kMinRedraws);
    for (size_t draw = 0; draw < max_draws; ++draw) {
        if (offset_ >= pool_.size()) {
            Refill();
        }
        size_t index = pool_[offset_++] & mask_;
        // 마스크 범위가 알파벳보다 크면 다시 뽑음 (modulo 편향 방지)
        if (index < alphabet_.Size()) {
            return alphabet_.At(index);
        }
    }
    throw RandomSourceException("no usable byte after " + std::to_string(max_draws) +
                                " draws (alphabet size: " + std::to_string(alphabet_.Size()) + ")");
}

std::string RandomSymbolPool::NextSymbols(size_t count) {
    std::string result;
    result.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        result.push_back(NextSymbol());
    }
    return result;
}

void RandomSymbolPool::Refill() {
    ++refill_count_;
    offset_ = 0;

    if (source_ && source_->Fill(pool_.data(), pool_.size())) {
        spdlog::debug("sortid: random pool refilled ({} bytes)", pool_.size());
        return;
    }

    if (!allow_insecure_fallback_) {
        offset_ = pool_.size();
        throw RandomSourceException("secure random source unavailable");
    }

    if (!degraded_) {
        spdlog::warn("sortid: secure random source failed, using insecure fallback for ID suffixes");
        degraded_ = true;
    }
    FillInsecure();
}

void RandomSymbolPool::FillInsecure() {
    if (!fallback_seeded_) {
        fallback_engine_.seed(static_cast<uint64_t>(
            std::chrono::steady_clock::now().time_since_epoch().count()));
        fallback_seeded_ = true;
    }
    std::uniform_int_distribution<uint32_t> distribution(0, 255);
    for (auto& byte : pool_) {
        byte = static_cast<uint8_t>(distribution(fallback_engine_));
    }
}

} // namespace sortid
