#pragma once

#include <cstdint>
#include <limits>

namespace sortid {

/**
 * 오버플로 검사 곱셈
 * @return 오버플로시 false (result는 변경하지 않음)
 */
inline bool CheckedMultiply(uint64_t a, uint64_t b, uint64_t& result) {
    if (a != 0 && b > std::numeric_limits<uint64_t>::max() / a) {
        return false;
    }
    result = a * b;
    return true;
}

/**
 * 오버플로 검사 덧셈
 * @return 오버플로시 false (result는 변경하지 않음)
 */
inline bool CheckedAdd(uint64_t a, uint64_t b, uint64_t& result) {
    if (b > std::numeric_limits<uint64_t>::max() - a) {
        return false;
    }
    result = a + b;
    return true;
}

/**
 * base^exponent, uint64 범위를 넘으면 UINT64_MAX로 포화
 */
inline uint64_t SaturatingPow(uint64_t base, size_t exponent) {
    uint64_t result = 1;
    for (size_t i = 0; i < exponent; ++i) {
        if (!CheckedMultiply(result, base, result)) {
            return std::numeric_limits<uint64_t>::max();
        }
    }
    return result;
}

/**
 * base^width > value 를 만족하는 최소 width (1 이상)
 */
inline size_t MinimumDigits(uint64_t base, uint64_t value) {
    size_t width = 1;
    uint64_t capacity = base;
    while (capacity <= value) {
        ++width;
        if (!CheckedMultiply(capacity, base, capacity)) {
            // base^width 가 uint64 범위를 넘으면 value 보다 크다
            break;
        }
    }
    return width;
}

} // namespace sortid
