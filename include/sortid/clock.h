#pragma once

#include "sortid/types.h"
#include <memory>

namespace sortid {

/**
 * 시각 소스 인터페이스
 * 테스트에서는 시뮬레이션 시각을 주입한다.
 */
class IClock {
public:
    virtual ~IClock() = default;

    /**
     * 현재 시각 (UTC)
     */
    virtual Instant Now() = 0;
};

/**
 * 시스템 시계
 */
class SystemClock : public IClock {
public:
    SystemClock() = default;
    ~SystemClock() override = default;

    Instant Now() override;
};

/**
 * 시스템 시계 팩토리 함수
 */
std::unique_ptr<IClock> CreateClock();

} // namespace sortid
