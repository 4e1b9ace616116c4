#include "sortid/sequence_cascade.h"
#include <stdexcept>
#include <utility>

namespace sortid {

SequenceCascade::SequenceCascade(const Alphabet& alphabet)
    : alphabet_(alphabet) {
}

bool SequenceCascade::Advance(const std::string& current, std::string& next) const {
    std::string symbols = current;

    for (size_t i = symbols.size(); i > 0; --i) {
        int index = alphabet_.IndexOf(symbols[i - 1]);
        if (index < 0) {
            throw std::invalid_argument("symbol outside alphabet in cascade input");
        }

        if (static_cast<size_t>(index) < alphabet_.MaxIndex()) {
            symbols[i - 1] = alphabet_.At(static_cast<size_t>(index) + 1);
            next = std::move(symbols);
            return true;
        }

        // 자리올림
        symbols[i - 1] = alphabet_.Min();
    }

    return false;
}

} // namespace sortid
