#pragma once

#include <memory>
#include <string>
#include <vector>

#include <unicode/uversion.h>

U_NAMESPACE_BEGIN
class Normalizer2;
class Transliterator;
U_NAMESPACE_END

namespace yamlview {

struct NormalizerOptions {
    // Full Unicode case folding, e.g. "Straße" -> "strasse".
    bool case_fold = true;

    // Decompose, drop non-spacing marks, recompose. "Café" -> "Cafe".
    bool diacritic_fold = true;

    // Fullwidth and halfwidth forms to their canonical width. "ａｂｃ" -> "abc".
    bool width_fold = false;

    // ICU transliterator IDs (e.g. "Latin-ASCII", "Any-Latin") applied in
    // order after the built-in folds.
    std::vector<std::string> transformers;
};

// Folds strings for comparison. The pipeline is fixed at construction; the
// order is width, diacritics, case, then the extra transformers.
//
// normalize() may be called concurrently. Transliterators are cloned per call.
class Normalizer {
   public:
    // Throws std::invalid_argument for unknown transliterator IDs and
    // std::runtime_error if ICU fails to provide its normalization data.
    explicit Normalizer(NormalizerOptions options = {});

    std::string
    normalize(const std::string& input) const;

    const NormalizerOptions&
    options() const {
        return options_;
    }

   private:
    NormalizerOptions options_;

    const icu::Normalizer2* nfd_ = nullptr;
    const icu::Normalizer2* nfc_ = nullptr;
    const icu::Normalizer2* nfkc_ = nullptr;

    std::vector<std::shared_ptr<const icu::Transliterator>> transliterators_;
};

}  // namespace yamlview
