#pragma once

#include "sortid/random_source.h"

namespace sortid {

/**
 * OpenSSL RAND_bytes 기반 보안 난수 소스
 */
class OpenSSLRandomSource : public IRandomSource {
public:
    OpenSSLRandomSource() = default;
    ~OpenSSLRandomSource() override = default;

    // IRandomSource 인터페이스 구현
    bool Fill(uint8_t* buffer, size_t size) override;
};

} // namespace sortid
