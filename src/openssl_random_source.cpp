#include "sortid/openssl_random_source.h"
#include <openssl/rand.h>
#include <climits>

namespace sortid {

bool OpenSSLRandomSource::Fill(uint8_t* buffer, size_t size) {
    // RAND_bytes는 int 길이를 받으므로 나누어 요청
    while (size > 0) {
        int chunk = size > static_cast<size_t>(INT_MAX) ? INT_MAX : static_cast<int>(size);
        if (RAND_bytes(buffer, chunk) != 1) {
            return false;
        }
        buffer += chunk;
        size -= static_cast<size_t>(chunk);
    }
    return true;
}

} // namespace sortid
