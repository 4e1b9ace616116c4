#pragma once

#include <cstdint>
#include <cstddef>
#include <memory>

namespace sortid {

/**
 * 난수 바이트 소스 인터페이스 (DIP 준수)
 * 테스트에서는 고정 바이트열을 주입할 수 있다.
 */
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /**
     * 버퍼를 난수 바이트로 채움
     * @param buffer 출력 버퍼
     * @param size 바이트 수
     * @return 성공시 true
     */
    virtual bool Fill(uint8_t* buffer, size_t size) = 0;
};

/**
 * 보안 난수 소스 팩토리 함수
 */
std::unique_ptr<IRandomSource> CreateRandomSource();

} // namespace sortid
