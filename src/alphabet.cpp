#include "sortid/alphabet.h"
#include "sortid/errors.h"
#include <algorithm>
#include <utility>

namespace sortid {

Alphabet::Alphabet(std::string symbols)
    : symbols_(std::move(symbols)) {
    index_.fill(-1);
    for (size_t i = 0; i < symbols_.size(); ++i) {
        index_[static_cast<unsigned char>(symbols_[i])] = static_cast<int16_t>(i);
    }
}

Alphabet Alphabet::Normalize(const std::string& raw) {
    if (raw.size() < MIN_SIZE) {
        throw ConfigurationException("alphabet must contain at least 2 characters");
    }
    if (raw.size() > MAX_SIZE) {
        throw ConfigurationException("alphabet must contain no more than 255 characters");
    }

    // std::string 비교와 같은 순서 (unsigned char)
    std::string sorted = raw;
    std::sort(sorted.begin(), sorted.end(), [](char a, char b) {
        return static_cast<unsigned char>(a) < static_cast<unsigned char>(b);
    });

    if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end()) {
        throw ConfigurationException("alphabet must contain unique characters");
    }

    return Alphabet(std::move(sorted));
}

bool Alphabet::ContainsAll(const std::string& str) const {
    for (char c : str) {
        if (!Contains(c)) {
            return false;
        }
    }
    return true;
}

} // namespace sortid
