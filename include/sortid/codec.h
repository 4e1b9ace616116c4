#pragma once

#include "sortid/alphabet.h"
#include <string>
#include <cstdint>

namespace sortid {

/**
 * 고정 폭 Base-N 인코더/디코더
 * 값은 big-endian으로, 빈 자리는 alphabet[0]으로 채운다.
 */
class BaseNCodec {
public:
    explicit BaseNCodec(const Alphabet& alphabet);

    /**
     * 정수를 고정 폭 심볼 문자열로 인코딩
     * @param value 인코딩할 값
     * @param width 출력 길이
     * @return 길이가 width인 문자열
     * @throws std::invalid_argument value가 width 자리에 들어가지 않는 경우
     */
    std::string Encode(uint64_t value, size_t width) const;

    /**
     * 심볼 문자열을 정수로 디코딩
     * @param symbols 디코딩할 문자열
     * @param width 기대하는 길이
     * @return 디코딩된 값
     * @throws DecodeException 길이 불일치, 알파벳 외 심볼, 64비트 초과
     */
    uint64_t Decode(const std::string& symbols, size_t width) const;

    const Alphabet& GetAlphabet() const { return alphabet_; }

private:
    Alphabet alphabet_;
};

} // namespace sortid
