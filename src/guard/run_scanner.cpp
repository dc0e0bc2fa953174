#include "guard/run_scanner.h"

#include <absl/strings/ascii.h>

#include "guard/utf8.h"

namespace promptguard::guard {

namespace {

bool IsBase64Char(char c) {
    return absl::ascii_isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
}

std::string_view NotFound(std::string_view text) {
    return text.substr(text.size());
}

/// Code-point run of characters accepted by in_class, at least min_length long
template <typename Predicate>
std::string_view FindCodePointRun(std::string_view text, size_t min_length, Predicate in_class) {
    size_t run_start = 0;
    size_t run_length = 0;
    size_t index = 0;
    uint32_t cp = 0;

    while (index < text.size()) {
        const size_t start = index;
        const bool valid = utf8::DecodeNext(text, &index, &cp);
        if (valid && in_class(cp)) {
            if (run_length++ == 0) {
                run_start = start;
            }
            continue;
        }
        if (run_length >= min_length) {
            return text.substr(run_start, start - run_start);
        }
        run_length = 0;
    }
    if (run_length > 0 && run_length >= min_length) {
        return text.substr(run_start);
    }
    return NotFound(text);
}

}  // namespace

std::string_view FindBase64Run(std::string_view text, size_t min_length, size_t from) {
    size_t i = from;
    while (i < text.size()) {
        if (!IsBase64Char(text[i])) {
            ++i;
            continue;
        }
        const size_t start = i;
        while (i < text.size() && IsBase64Char(text[i])) {
            ++i;
        }
        if (i - start < min_length) {
            continue;
        }
        for (int padding = 0; padding < 2 && i < text.size() && text[i] == '='; ++padding) {
            ++i;
        }
        return text.substr(start, i - start);
    }
    return NotFound(text);
}

std::string_view FindZeroWidthRun(std::string_view text) {
    return FindCodePointRun(text, 1, utf8::IsZeroWidth);
}

std::string_view FindCombiningMarkRun(std::string_view text, size_t min_length) {
    return FindCodePointRun(text, min_length, utf8::IsCombiningMark);
}

}  // namespace promptguard::guard
