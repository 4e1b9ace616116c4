#pragma once

#include <string>
#include <array>
#include <cstdint>

namespace sortid {

/**
 * 정규화된(중복 없음, 바이트 값 오름차순) 심볼 집합
 *
 * 심볼의 위치가 곧 숫자 값이며, std::string 비교 순서와 일치한다.
 * 생성 후에는 변경되지 않는다.
 */
class Alphabet {
public:
    static constexpr size_t MIN_SIZE = 2;
    static constexpr size_t MAX_SIZE = 255;

    /**
     * 원본 문자열을 정렬하여 정규 알파벳 생성
     * @param raw 사용자 지정 알파벳
     * @return 정규 알파벳
     * @throws ConfigurationException 길이가 2 미만/255 초과이거나 중복 심볼이 있는 경우
     */
    static Alphabet Normalize(const std::string& raw);

    size_t Size() const { return symbols_.size(); }
    size_t MaxIndex() const { return symbols_.size() - 1; }

    char At(size_t index) const { return symbols_[index]; }
    char Min() const { return symbols_.front(); }
    char Max() const { return symbols_.back(); }

    /**
     * 심볼의 숫자 값
     * @return 알파벳에 없으면 -1
     */
    int IndexOf(char symbol) const {
        return index_[static_cast<unsigned char>(symbol)];
    }

    bool Contains(char symbol) const { return IndexOf(symbol) >= 0; }

    /**
     * 모든 심볼이 알파벳에 속하는지 확인
     */
    bool ContainsAll(const std::string& str) const;

    const std::string& Symbols() const { return symbols_; }

private:
    explicit Alphabet(std::string symbols);

    std::string symbols_;
    std::array<int16_t, 256> index_;
};

} // namespace sortid
