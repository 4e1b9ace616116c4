#pragma once

#include "sortid/alphabet.h"
#include <string>

namespace sortid {

/**
 * 오도미터 방식 증가 엔진
 *
 * 마지막 심볼부터 1씩 올리고, 최대 심볼은 alphabet[0]으로 되돌리며 왼쪽으로 자리올림한다.
 * 정수로 변환하지 않으므로 필드 길이에 제한이 없다.
 */
class SequenceCascade {
public:
    explicit SequenceCascade(const Alphabet& alphabet);

    /**
     * 다음 값 계산
     * @param current 현재 심볼 문자열
     * @param next 출력 값 (실패시 변경 없음)
     * @return 모든 자리가 최대값이라 다음 값이 없으면 false (Overflow)
     * @throws std::invalid_argument current에 알파벳 외 심볼이 있는 경우
     */
    bool Advance(const std::string& current, std::string& next) const;

private:
    Alphabet alphabet_;
};

} // namespace sortid
