#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "detector/ientity_detector.hpp"

#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace textscrub {

/**
 * @brief Regex recognizer. Every non-empty match that passes the declared
 * validator becomes a span scored with the recognizer's default score.
 *
 * A leading "(?i)" in the pattern selects case-insensitive matching.
 *
 * Text longer than kMaxSegmentBytes is matched segment by segment, cut at
 * whitespace (line breaks preferred), which keeps std::regex backtracking
 * depth bounded. A match cannot span a cut. A run of non-whitespace longer
 * than the limit is a DETECTION_ERROR rather than a regex stack overflow.
 */
class PatternRecognizer {
public:
    static constexpr size_t kMaxSegmentBytes = 4096;

    [[nodiscard]] static Result<PatternRecognizer> compile(const RecognizerSpec& spec);

    [[nodiscard]] const RecognizerSpec& spec() const { return spec_; }

    [[nodiscard]] Result<std::vector<DetectedSpan>> match(
        std::string_view text, std::string_view language) const;

    /**
     * @brief [begin, end) byte ranges the pattern is run over
     */
    [[nodiscard]] static Result<std::vector<std::pair<size_t, size_t>>> segment(std::string_view text);

private:
    PatternRecognizer(RecognizerSpec spec, std::regex regex)
        : spec_(std::move(spec)), regex_(std::move(regex)) {}

    RecognizerSpec spec_;
    std::regex regex_;
};

/**
 * @brief Case-insensitive whole-word membership against a fixed term list.
 *
 * At each word boundary the longest matching term wins; matches never overlap.
 */
class DenyListRecognizer {
public:
    [[nodiscard]] static Result<DenyListRecognizer> create(const RecognizerSpec& spec);

    [[nodiscard]] const RecognizerSpec& spec() const { return spec_; }

    [[nodiscard]] Result<std::vector<DetectedSpan>> match(
        std::string_view text, std::string_view language) const;

private:
    DenyListRecognizer(RecognizerSpec spec, std::vector<std::string> terms)
        : spec_(std::move(spec)), terms_(std::move(terms)) {}

    RecognizerSpec spec_;
    std::vector<std::string> terms_;    // lower-cased, longest first
};

/**
 * @brief Delegates to a named external detector, restricted to this
 * recognizer's entity type. Delegate failures surface as DETECTION_ERROR.
 */
class ModelRecognizer {
public:
    ModelRecognizer(RecognizerSpec spec, std::shared_ptr<const IEntityDetector> delegate)
        : spec_(std::move(spec)), delegate_(std::move(delegate)) {}

    [[nodiscard]] const RecognizerSpec& spec() const { return spec_; }

    [[nodiscard]] Result<std::vector<DetectedSpan>> match(
        std::string_view text, std::string_view language) const;

private:
    RecognizerSpec spec_;
    std::shared_ptr<const IEntityDetector> delegate_;
};

using Recognizer = std::variant<PatternRecognizer, DenyListRecognizer, ModelRecognizer>;

[[nodiscard]] const RecognizerSpec& recognizer_spec(const Recognizer& recognizer);

[[nodiscard]] Result<std::vector<DetectedSpan>> match_recognizer(
    const Recognizer& recognizer, std::string_view text, std::string_view language);

[[nodiscard]] std::string_view recognizer_kind_name(RecognizerKind kind);

} // namespace textscrub
