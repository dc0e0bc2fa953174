#include "guard/payload_inspector.h"

#include <utility>

#include "common/logging.h"
#include "guard/run_scanner.h"
#include "guard/utf8.h"

namespace promptguard::guard {

namespace {

// Base64 decoding table
constexpr int kBase64DecodeTable[128] = {
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, 62, -1, -1, -1, 63,
    52, 53, 54, 55, 56, 57, 58, 59, 60, 61, -1, -1, -1, -1, -1, -1,
    -1,  0,  1,  2,  3,  4,  5,  6,  7,  8,  9, 10, 11, 12, 13, 14,
    15, 16, 17, 18, 19, 20, 21, 22, 23, 24, 25, -1, -1, -1, -1, -1,
    -1, 26, 27, 28, 29, 30, 31, 32, 33, 34, 35, 36, 37, 38, 39, 40,
    41, 42, 43, 44, 45, 46, 47, 48, 49, 50, 51, -1, -1, -1, -1, -1
};

constexpr std::string_view kHiddenJailbreakEvidence = "base64_hidden_jailbreak";

}  // namespace

std::optional<std::string> DecodeBase64(std::string_view input) {
    size_t data_length = input.size();
    while (data_length > 0 && input[data_length - 1] == '=') {
        --data_length;
    }
    const size_t padding = input.size() - data_length;

    // A trailing group of 2 data chars needs "==", of 3 needs "=", of 4 none
    const size_t remainder = data_length % 4;
    if (remainder == 1) {
        return std::nullopt;
    }
    const size_t expected_padding = remainder == 0 ? 0 : 4 - remainder;
    if (padding != expected_padding) {
        return std::nullopt;
    }

    std::string output;
    output.reserve(data_length * 3 / 4);
    int val = 0;
    int valb = -8;
    for (size_t i = 0; i < data_length; ++i) {
        const auto c = static_cast<unsigned char>(input[i]);
        if (c >= 128 || kBase64DecodeTable[c] == -1) {
            return std::nullopt;
        }
        val = ((val << 6) + kBase64DecodeTable[c]) & 0xFFFFFF;
        valb += 6;
        if (valb >= 0) {
            output.push_back(static_cast<char>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }
    return output;
}

PayloadInspector::PayloadInspector(std::shared_ptr<const PatternRegistry> registry)
    : registry_(std::move(registry)) {}

std::optional<Detection> PayloadInspector::Inspect(std::string_view text) const {
    const size_t min_length = registry_->InspectorRunMinLength();

    size_t from = 0;
    while (from < text.size()) {
        const std::string_view run = FindBase64Run(text, min_length, from);
        if (run.empty()) {
            break;
        }
        from = static_cast<size_t>(run.data() - text.data()) + run.size();

        auto decoded = DecodeBase64(run);
        if (!decoded.has_value()) {
            PROMPTGUARD_LOG_DEBUG("Skipping undecodable Base64 candidate ({} chars)",
                                  run.size());
            continue;
        }

        const std::string plaintext =
            utf8::CollapseWhitespace(utf8::DropInvalid(*decoded), 1, " ");
        if (MatchesJailbreak(plaintext)) {
            return Detection{DetectionCategory::kBase64HiddenJailbreak,
                             std::string(kHiddenJailbreakEvidence)};
        }
    }
    return std::nullopt;
}

bool PayloadInspector::MatchesJailbreak(std::string_view plaintext) const {
    for (const auto& rule : registry_->Rules(DetectionCategory::kJailbreak)) {
        std::string_view match;
        if (rule.Search(plaintext, &match)) {
            return true;
        }
    }
    return false;
}

}  // namespace promptguard::guard
