#pragma once
#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include <cstddef>
#include <string>
#include <string_view>
namespace keyward::identity::crypto {
struct GraphemeStats {
    size_t length = 0;
    size_t unique = 0;
};
// Canonical forms of the KDF inputs. Any change here changes every derived key.
class TextNormalizer {
public:
    /// Trimmed, Unicode lowercase (root locale).
    [[nodiscard]] static std::string NormalizeEmail(std::string_view email);
    /// Trimmed, NFC, runs of ASCII whitespace collapsed to one space.
    [[nodiscard]] static Result<std::string, IdentityFailure> NormalizePassphrase(
        std::string_view passphrase);
    /// Extended grapheme clusters: total count and distinct count.
    [[nodiscard]] static Result<GraphemeStats, IdentityFailure> MeasureGraphemes(
        std::string_view text);
    [[nodiscard]] static std::string_view Trim(std::string_view text) noexcept;
    [[nodiscard]] static bool IsAsciiWhitespace(char c) noexcept;
private:
    TextNormalizer() = delete;
};
}
