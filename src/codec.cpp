#include "sortid/codec.h"
#include "sortid/checked_math.h"
#include "sortid/errors.h"
#include <stdexcept>

namespace sortid {

BaseNCodec::BaseNCodec(const Alphabet& alphabet)
    : alphabet_(alphabet) {
}

std::string BaseNCodec::Encode(uint64_t value, size_t width) const {
    std::string result(width, alphabet_.Min());
    if (value == 0) {
        return result;
    }

    const uint64_t base = alphabet_.Size();
    uint64_t remaining = value;
    for (size_t i = width; i > 0 && remaining > 0; --i) {
        result[i - 1] = alphabet_.At(static_cast<size_t>(remaining % base));
        remaining /= base;
    }

    if (remaining > 0) {
        throw std::invalid_argument("value " + std::to_string(value) +
                                    " does not fit in " + std::to_string(width) + " symbols");
    }
    return result;
}

uint64_t BaseNCodec::Decode(const std::string& symbols, size_t width) const {
    if (symbols.size() != width) {
        throw DecodeException("expected " + std::to_string(width) +
                              " symbols, got " + std::to_string(symbols.size()));
    }

    const uint64_t base = alphabet_.Size();
    uint64_t total = 0;
    for (char c : symbols) {
        int index = alphabet_.IndexOf(c);
        if (index < 0) {
            throw DecodeException("symbol outside alphabet");
        }
        if (!CheckedMultiply(total, base, total) ||
            !CheckedAdd(total, static_cast<uint64_t>(index), total)) {
            throw DecodeException("value exceeds 64-bit range");
        }
    }
    return total;
}

} // namespace sortid
