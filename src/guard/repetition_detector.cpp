#include "guard/repetition_detector.h"

#include <algorithm>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include <absl/strings/str_split.h>

#include "guard/utf8.h"

namespace promptguard::guard {

namespace {

/// absl::StrSplit delimiter matching one Unicode white-space character
struct ByUnicodeWhitespace {
    absl::string_view Find(absl::string_view text, size_t pos) const {
        const std::string_view view(text.data(), text.size());
        size_t index = pos;
        uint32_t cp = 0;
        while (index < view.size()) {
            const size_t start = index;
            if (utf8::DecodeNext(view, &index, &cp) && utf8::IsWhitespace(cp)) {
                return text.substr(start, index - start);
            }
        }
        return absl::string_view(text.data() + text.size(), 0);
    }
};

}  // namespace

bool HasCharacterRun(std::string_view text, size_t threshold) {
    size_t index = 0;
    uint32_t previous = 0;
    size_t run = 0;

    while (index < text.size()) {
        uint32_t cp = 0;
        utf8::DecodeNext(text, &index, &cp);
        if (cp == '\n') {
            run = 0;
            continue;
        }
        run = (run > 0 && cp == previous) ? run + 1 : 1;
        previous = cp;
        if (run > threshold) {
            return true;
        }
    }
    return false;
}

bool HasDominantToken(std::string_view text, size_t min_token_count, double dominant_ratio) {
    const std::vector<std::string> tokens =
        absl::StrSplit(absl::string_view(text.data(), text.size()), ByUnicodeWhitespace(),
                       absl::SkipEmpty());
    if (tokens.size() <= min_token_count) {
        return false;
    }

    std::unordered_map<std::string, size_t> counts;
    size_t most_common = 0;
    for (const auto& token : tokens) {
        most_common = std::max(most_common, ++counts[token]);
    }
    return static_cast<double>(most_common) >
           static_cast<double>(tokens.size()) * dominant_ratio;
}

bool HasExcessiveRepetition(std::string_view text, const RepetitionOptions& options) {
    return HasCharacterRun(text, options.char_threshold) ||
           HasDominantToken(text, options.min_token_count, options.dominant_ratio);
}

}  // namespace promptguard::guard
