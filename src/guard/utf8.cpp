#include "guard/utf8.h"

#include <algorithm>

namespace promptguard::guard::utf8 {

bool DecodeNext(std::string_view text, size_t* index, uint32_t* code_point) {
    const size_t start = *index;
    const auto lead = static_cast<unsigned char>(text[start]);

    if (lead < 0x80) {
        *code_point = lead;
        *index = start + 1;
        return true;
    }

    size_t extra = 0;
    uint32_t value = 0;
    uint32_t min_value = 0;
    if ((lead & 0xE0) == 0xC0) {
        extra = 1;
        value = lead & 0x1F;
        min_value = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        extra = 2;
        value = lead & 0x0F;
        min_value = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        extra = 3;
        value = lead & 0x07;
        min_value = 0x10000;
    } else {
        *code_point = lead;
        *index = start + 1;
        return false;
    }

    if (start + extra >= text.size()) {
        *code_point = lead;
        *index = start + 1;
        return false;
    }

    for (size_t i = 1; i <= extra; ++i) {
        const auto cont = static_cast<unsigned char>(text[start + i]);
        if ((cont & 0xC0) != 0x80) {
            *code_point = lead;
            *index = start + 1;
            return false;
        }
        value = (value << 6) | (cont & 0x3F);
    }

    // Overlong forms, surrogates and values past U+10FFFF
    if (value < min_value || value > 0x10FFFF || (value >= 0xD800 && value <= 0xDFFF)) {
        *code_point = lead;
        *index = start + 1;
        return false;
    }

    *code_point = value;
    *index = start + extra + 1;
    return true;
}

size_t Length(std::string_view text) {
    size_t count = 0;
    size_t index = 0;
    uint32_t cp = 0;
    while (index < text.size()) {
        DecodeNext(text, &index, &cp);
        ++count;
    }
    return count;
}

std::string_view Truncate(std::string_view text, size_t max_chars) {
    size_t count = 0;
    size_t index = 0;
    uint32_t cp = 0;
    while (index < text.size() && count < max_chars) {
        DecodeNext(text, &index, &cp);
        ++count;
    }
    return text.substr(0, index);
}

std::string DropInvalid(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());
    size_t index = 0;
    uint32_t cp = 0;
    while (index < bytes.size()) {
        const size_t start = index;
        if (DecodeNext(bytes, &index, &cp)) {
            out.append(bytes.substr(start, index - start));
        }
    }
    return out;
}

std::string StripZeroWidth(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    size_t index = 0;
    uint32_t cp = 0;
    while (index < text.size()) {
        const size_t start = index;
        const bool valid = DecodeNext(text, &index, &cp);
        if (valid && IsZeroWidth(cp)) {
            continue;
        }
        out.append(text.substr(start, index - start));
    }
    return out;
}

bool IsBlank(std::string_view text) {
    size_t index = 0;
    uint32_t cp = 0;
    while (index < text.size()) {
        if (!DecodeNext(text, &index, &cp) || !IsWhitespace(cp)) {
            return false;
        }
    }
    return true;
}

std::string_view Trim(std::string_view text) {
    size_t begin = text.size();
    size_t end = 0;
    size_t index = 0;
    uint32_t cp = 0;
    while (index < text.size()) {
        const size_t start = index;
        const bool valid = DecodeNext(text, &index, &cp);
        if (!valid || !IsWhitespace(cp)) {
            begin = std::min(begin, start);
            end = index;
        }
    }
    if (begin >= end) {
        return text.substr(0, 0);
    }
    return text.substr(begin, end - begin);
}

std::string CollapseWhitespace(std::string_view text, size_t min_run,
                               std::string_view replacement) {
    std::string out;
    out.reserve(text.size());

    size_t run_start = 0;
    size_t run_length = 0;
    auto flush_run = [&](size_t run_end) {
        if (run_length == 0) {
            return;
        }
        if (run_length >= min_run) {
            out.append(replacement);
        } else {
            out.append(text.substr(run_start, run_end - run_start));
        }
        run_length = 0;
    };

    size_t index = 0;
    uint32_t cp = 0;
    while (index < text.size()) {
        const size_t start = index;
        const bool valid = DecodeNext(text, &index, &cp);
        if (valid && IsWhitespace(cp)) {
            if (run_length == 0) {
                run_start = start;
            }
            ++run_length;
            continue;
        }
        flush_run(start);
        out.append(text.substr(start, index - start));
    }
    flush_run(text.size());
    return out;
}

}  // namespace promptguard::guard::utf8
