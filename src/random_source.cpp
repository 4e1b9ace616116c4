#include "sortid/random_source.h"
#include "sortid/openssl_random_source.h"

namespace sortid {

std::unique_ptr<IRandomSource> CreateRandomSource() {
    return std::make_unique<OpenSSLRandomSource>();
}

} // namespace sortid
