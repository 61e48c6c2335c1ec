#include "processing/normalizer.hpp"

#include <fmt/format.h>

#include <unicode/normalizer2.h>
#include <unicode/translit.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>

#include <stdexcept>

using namespace yamlview;

namespace {

bool
is_width_variant(UChar32 c) {
    return c == 0x3000 || (c >= 0xFF00 && c <= 0xFFEF);
}

// Runs of fullwidth/halfwidth forms go through NFKC as a whole so that
// halfwidth voiced marks combine with the preceding kana.
icu::UnicodeString
fold_width(const icu::UnicodeString& text, const icu::Normalizer2* nfkc, UErrorCode& status) {
    icu::UnicodeString result;
    icu::UnicodeString run;

    auto flush = [&] {
        if (!run.isEmpty()) {
            result.append(nfkc->normalize(run, status));
            run.remove();
        }
    };

    for (int32_t i = 0; i < text.length();) {
        UChar32 c = text.char32At(i);
        if (is_width_variant(c)) {
            run.append(c);
        } else {
            flush();
            result.append(c);
        }
        i += U16_LENGTH(c);
    }
    flush();
    return result;
}

icu::UnicodeString
strip_marks(const icu::UnicodeString& text) {
    icu::UnicodeString result;
    for (int32_t i = 0; i < text.length();) {
        UChar32 c = text.char32At(i);
        if (u_charType(c) != U_NON_SPACING_MARK) {
            result.append(c);
        }
        i += U16_LENGTH(c);
    }
    return result;
}

}  // namespace

Normalizer::Normalizer(NormalizerOptions options) : options_(std::move(options)) {
    UErrorCode status = U_ZERO_ERROR;
    nfd_ = icu::Normalizer2::getNFDInstance(status);
    nfc_ = icu::Normalizer2::getNFCInstance(status);
    nfkc_ = icu::Normalizer2::getNFKCInstance(status);
    if (U_FAILURE(status)) {
        throw std::runtime_error(fmt::format("unicode normalization data unavailable: {}", u_errorName(status)));
    }

    for (const auto& id : options_.transformers) {
        UErrorCode tstatus = U_ZERO_ERROR;
        std::shared_ptr<const icu::Transliterator> t(
            icu::Transliterator::createInstance(icu::UnicodeString::fromUTF8(id), UTRANS_FORWARD, tstatus));
        if (U_FAILURE(tstatus) || !t) {
            throw std::invalid_argument(fmt::format("unknown transformer '{}': {}", id, u_errorName(tstatus)));
        }
        transliterators_.push_back(std::move(t));
    }
}

std::string
Normalizer::normalize(const std::string& input) const {
    if (input.empty()) {
        return input;
    }

    UErrorCode status = U_ZERO_ERROR;
    icu::UnicodeString text = icu::UnicodeString::fromUTF8(input);

    if (options_.width_fold) {
        text = fold_width(text, nfkc_, status);
    }

    if (options_.diacritic_fold) {
        text = nfd_->normalize(text, status);
        text = strip_marks(text);
        text = nfc_->normalize(text, status);
    }

    if (options_.case_fold) {
        text.foldCase();
    }

    for (const auto& prototype : transliterators_) {
        std::unique_ptr<icu::Transliterator> t(prototype->clone());
        t->transliterate(text);
    }

    // Leave the input alone rather than return a partial result.
    if (U_FAILURE(status)) {
        return input;
    }

    std::string result;
    text.toUTF8String(result);
    return result;
}
