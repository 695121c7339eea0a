#include "keyward/crypto/text_normalizer.hpp"
#include "keyward/core/format.hpp"

#include <unicode/brkiter.h>
#include <unicode/locid.h>
#include <unicode/normalizer2.h>
#include <unicode/unistr.h>
#include <sodium.h>
#include <algorithm>
#include <memory>
#include <vector>

namespace keyward::identity::crypto {
    namespace {
        // Characters stripped by trim(): space, \t, \n, \r, \0, \v.
        bool IsTrimmed(const char c) {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\0' || c == '\v';
        }

        void WipeUnicode(icu::UnicodeString& text) {
            const int32_t capacity = text.getCapacity();
            if (capacity <= 0) {
                return;
            }
            if (char16_t* buffer = text.getBuffer(capacity); buffer != nullptr) {
                sodium_memzero(buffer, static_cast<size_t>(capacity) * sizeof(char16_t));
                text.releaseBuffer(0);
            }
        }

        void WipeString(std::string& text) {
            sodium_memzero(text.data(), text.size());
            text.clear();
        }

        // Secret strings start on the heap so moves hand over the buffer
        // instead of copying an inline one.
        constexpr size_t kSecretStringReserve = 32;

        icu::UnicodeString FromUtf8(std::string_view text) {
            return icu::UnicodeString::fromUTF8(
                icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));
        }
    }

    std::string_view TextNormalizer::Trim(std::string_view text) noexcept {
        while (!text.empty() && IsTrimmed(text.front())) {
            text.remove_prefix(1);
        }
        while (!text.empty() && IsTrimmed(text.back())) {
            text.remove_suffix(1);
        }
        return text;
    }

    bool TextNormalizer::IsAsciiWhitespace(const char c) noexcept {
        return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
    }

    std::string TextNormalizer::NormalizeEmail(std::string_view email) {
        icu::UnicodeString unicode = FromUtf8(Trim(email));
        unicode.toLower(icu::Locale::getRoot());
        std::string normalized;
        unicode.toUTF8String(normalized);
        return normalized;
    }

    Result<std::string, IdentityFailure> TextNormalizer::NormalizePassphrase(
        std::string_view passphrase) {
        UErrorCode status = U_ZERO_ERROR;
        const icu::Normalizer2* nfc = icu::Normalizer2::getNFCInstance(status);
        if (U_FAILURE(status) || nfc == nullptr) {
            return Result<std::string, IdentityFailure>::Err(
                IdentityFailure::Configuration(
                    compat::format("ICU NFC normalizer unavailable: {}", u_errorName(status))));
        }

        icu::UnicodeString source = FromUtf8(Trim(passphrase));
        icu::UnicodeString composed = nfc->normalize(source, status);
        WipeUnicode(source);
        if (U_FAILURE(status)) {
            WipeUnicode(composed);
            return Result<std::string, IdentityFailure>::Err(
                IdentityFailure::KeyDerivation(
                    compat::format("NFC normalization failed: {}", u_errorName(status))));
        }

        std::string utf8;
        utf8.reserve(std::max<size_t>(static_cast<size_t>(composed.length()) * 3, kSecretStringReserve));
        composed.toUTF8String(utf8);
        WipeUnicode(composed);

        std::string collapsed;
        collapsed.reserve(std::max(utf8.size(), kSecretStringReserve));
        bool in_whitespace = false;
        for (const char c : utf8) {
            if (IsAsciiWhitespace(c)) {
                if (!in_whitespace) {
                    collapsed.push_back(' ');
                }
                in_whitespace = true;
                continue;
            }
            in_whitespace = false;
            collapsed.push_back(c);
        }
        WipeString(utf8);
        return Result<std::string, IdentityFailure>::Ok(std::move(collapsed));
    }

    Result<GraphemeStats, IdentityFailure> TextNormalizer::MeasureGraphemes(
        std::string_view text) {
        UErrorCode status = U_ZERO_ERROR;
        std::unique_ptr<icu::BreakIterator> breaker(
            icu::BreakIterator::createCharacterInstance(icu::Locale::getRoot(), status));
        if (U_FAILURE(status) || !breaker) {
            return Result<GraphemeStats, IdentityFailure>::Err(
                IdentityFailure::Configuration(
                    compat::format("ICU character break iterator unavailable: {}",
                                   u_errorName(status))));
        }

        icu::UnicodeString unicode = FromUtf8(text);
        breaker->setText(unicode);

        std::vector<std::string> clusters;
        int32_t start = breaker->first();
        for (int32_t end = breaker->next(); end != icu::BreakIterator::DONE;
             start = end, end = breaker->next()) {
            icu::UnicodeString cluster(unicode, start, end - start);
            std::string& utf8 = clusters.emplace_back();
            utf8.reserve(kSecretStringReserve);
            cluster.toUTF8String(utf8);
            WipeUnicode(cluster);
        }
        breaker.reset();
        WipeUnicode(unicode);

        GraphemeStats stats;
        stats.length = clusters.size();
        std::vector<std::string_view> distinct(clusters.begin(), clusters.end());
        std::sort(distinct.begin(), distinct.end());
        stats.unique = static_cast<size_t>(
            std::unique(distinct.begin(), distinct.end()) - distinct.begin());

        for (auto& cluster : clusters) {
            WipeString(cluster);
        }
        return Result<GraphemeStats, IdentityFailure>::Ok(stats);
    }
}
