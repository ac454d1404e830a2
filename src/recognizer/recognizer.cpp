#include "recognizer/recognizer.hpp"
#include "recognizer/validators.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <iterator>

namespace textscrub {

namespace {

constexpr std::string_view kCaseInsensitivePrefix = "(?i)";

DetectedSpan make_span(const RecognizerSpec& spec, std::string_view text,
                       size_t start, size_t end, double score) {
    DetectedSpan span;
    span.entity_type = spec.entity_type;
    span.start = start;
    span.end = end;
    span.original_text = std::string(text.substr(start, end - start));
    span.score = score;
    span.source_recognizer = spec.name;
    return span;
}

} // anonymous namespace

// ============================================================================
// PatternRecognizer
// ============================================================================

Result<PatternRecognizer> PatternRecognizer::compile(const RecognizerSpec& spec) {
    if (spec.pattern.empty()) {
        return Result<PatternRecognizer>::error(ErrorCategory::CONFIGURATION_ERROR,
            std::format("Recognizer '{}': empty pattern", spec.name));
    }

    std::string_view pattern = spec.pattern;
    auto flags = std::regex::ECMAScript | std::regex::optimize;
    if (pattern.starts_with(kCaseInsensitivePrefix)) {
        pattern.remove_prefix(kCaseInsensitivePrefix.size());
        flags |= std::regex::icase;
    }

    try {
        std::regex regex(pattern.begin(), pattern.end(), flags);
        return Result<PatternRecognizer>::ok(PatternRecognizer(spec, std::move(regex)));
    } catch (const std::regex_error& e) {
        return Result<PatternRecognizer>::error(ErrorCategory::CONFIGURATION_ERROR,
            std::format("Recognizer '{}': invalid pattern '{}': {}", spec.name, spec.pattern, e.what()));
    }
}

Result<std::vector<std::pair<size_t, size_t>>> PatternRecognizer::segment(std::string_view text) {
    using SegmentResult = Result<std::vector<std::pair<size_t, size_t>>>;

    std::vector<std::pair<size_t, size_t>> segments;
    size_t start = 0;
    while (start < text.size()) {
        const size_t remaining = text.size() - start;
        if (remaining <= kMaxSegmentBytes) {
            segments.emplace_back(start, text.size());
            break;
        }

        // Cut at the last line break of the window, else at the last blank
        const auto window = text.substr(start, kMaxSegmentBytes);
        size_t cut = window.find_last_of('\n');
        if (cut == std::string_view::npos || cut < kMaxSegmentBytes / 2) {
            cut = window.find_last_of(" \t\r\f\v\n");
        }
        if (cut == std::string_view::npos) {
            return SegmentResult::error(ErrorCategory::DETECTION_ERROR,
                std::format("unbroken run of more than {} bytes at offset {}", kMaxSegmentBytes, start));
        }
        if (cut > 0) {
            segments.emplace_back(start, start + cut);
        }
        start += cut + 1;
    }
    return SegmentResult::ok(std::move(segments));
}

Result<std::vector<DetectedSpan>> PatternRecognizer::match(
    std::string_view text, std::string_view /*language*/) const {

    using SpanResult = Result<std::vector<DetectedSpan>>;

    auto segments = segment(text);
    if (segments.is_error()) {
        return SpanResult::error(ErrorCategory::DETECTION_ERROR,
            std::format("Recognizer '{}': {}", spec_.name, segments.error_message()));
    }

    std::vector<DetectedSpan> spans;
    const char* const base = text.data();

    try {
        for (const auto& [seg_start, seg_end] : segments.value()) {
            // Word boundaries at the segment edge look at the real previous byte
            const auto flags = seg_start > 0 ? std::regex_constants::match_prev_avail
                                             : std::regex_constants::match_default;
            std::cregex_iterator it(base + seg_start, base + seg_end, regex_, flags);
            const std::cregex_iterator end;
            for (; it != end; ++it) {
                const auto& m = *it;
                if (m.length(0) == 0) continue;

                const auto start = static_cast<size_t>(m[0].first - base);
                const auto stop = start + static_cast<size_t>(m.length(0));
                if (!validators::validate(spec_.validator, text.substr(start, stop - start))) {
                    continue;
                }
                spans.push_back(make_span(spec_, text, start, stop, spec_.default_score));
            }
        }
    } catch (const std::regex_error& e) {
        return SpanResult::error(ErrorCategory::DETECTION_ERROR,
            std::format("Recognizer '{}': regex evaluation failed: {}", spec_.name, e.what()));
    }

    return SpanResult::ok(std::move(spans));
}

// ============================================================================
// DenyListRecognizer
// ============================================================================

Result<DenyListRecognizer> DenyListRecognizer::create(const RecognizerSpec& spec) {
    std::vector<std::string> terms;
    terms.reserve(spec.deny_list.size());
    for (const auto& term : spec.deny_list) {
        auto normalized = utils::to_lower(utils::trim(term));
        if (!normalized.empty()) {
            terms.emplace_back(std::move(normalized));
        }
    }

    if (terms.empty()) {
        return Result<DenyListRecognizer>::error(ErrorCategory::CONFIGURATION_ERROR,
            std::format("Recognizer '{}': deny list is empty", spec.name));
    }

    // Longest first so "religious belief" wins over "religious"
    std::sort(terms.begin(), terms.end(),
        [](const std::string& a, const std::string& b) {
            return a.size() != b.size() ? a.size() > b.size() : a < b;
        });
    terms.erase(std::unique(terms.begin(), terms.end()), terms.end());

    return Result<DenyListRecognizer>::ok(DenyListRecognizer(spec, std::move(terms)));
}

Result<std::vector<DetectedSpan>> DenyListRecognizer::match(
    std::string_view text, std::string_view /*language*/) const {

    std::vector<DetectedSpan> spans;
    const std::string lower = utils::to_lower(text);
    const size_t n = lower.size();

    size_t i = 0;
    while (i < n) {
        if (i > 0 && utils::is_word_char(lower[i - 1])) {
            ++i;
            continue;
        }

        size_t matched = 0;
        for (const auto& term : terms_) {
            if (term.size() > n - i) continue;
            if (lower.compare(i, term.size(), term) != 0) continue;
            const size_t stop = i + term.size();
            if (stop < n && utils::is_word_char(lower[stop])) continue;
            matched = term.size();
            break;
        }

        if (matched > 0) {
            spans.push_back(make_span(spec_, text, i, i + matched, spec_.default_score));
            i += matched;
        } else {
            ++i;
        }
    }

    return Result<std::vector<DetectedSpan>>::ok(std::move(spans));
}

// ============================================================================
// ModelRecognizer
// ============================================================================

Result<std::vector<DetectedSpan>> ModelRecognizer::match(
    std::string_view text, std::string_view language) const {

    using SpanResult = Result<std::vector<DetectedSpan>>;

    if (!delegate_) {
        return SpanResult::error(ErrorCategory::DETECTION_ERROR,
            std::format("Recognizer '{}': model '{}' is not available", spec_.name, spec_.model_ref));
    }

    DetectionReport report;
    try {
        report = delegate_->detect(text, language, EntityTypeSet{spec_.entity_type});
    } catch (const std::exception& e) {
        return SpanResult::error(ErrorCategory::DETECTION_ERROR,
            std::format("Recognizer '{}': model '{}' threw: {}", spec_.name, spec_.model_ref, e.what()));
    }

    if (!report.complete()) {
        return SpanResult::error(ErrorCategory::DETECTION_ERROR,
            std::format("Recognizer '{}': model '{}' failed: {}",
                        spec_.name, spec_.model_ref, report.failures.front().message));
    }

    std::vector<DetectedSpan> spans;
    spans.reserve(report.spans.size());
    for (auto& candidate : report.spans) {
        if (candidate.entity_type != spec_.entity_type) continue;

        if (candidate.start >= candidate.end || candidate.end > text.size()) {
            return SpanResult::error(ErrorCategory::DETECTION_ERROR,
                std::format("Recognizer '{}': model '{}' returned invalid span [{}, {})",
                            spec_.name, spec_.model_ref, candidate.start, candidate.end));
        }

        spans.push_back(make_span(spec_, text, candidate.start, candidate.end,
                                  std::clamp(candidate.score, 0.0, 1.0)));
    }

    return SpanResult::ok(std::move(spans));
}

// ============================================================================
// Variant dispatch
// ============================================================================

const RecognizerSpec& recognizer_spec(const Recognizer& recognizer) {
    return std::visit([](const auto& r) -> const RecognizerSpec& { return r.spec(); }, recognizer);
}

Result<std::vector<DetectedSpan>> match_recognizer(
    const Recognizer& recognizer, std::string_view text, std::string_view language) {
    return std::visit([&](const auto& r) { return r.match(text, language); }, recognizer);
}

std::string_view recognizer_kind_name(RecognizerKind kind) {
    switch (kind) {
        case RecognizerKind::PATTERN:   return "pattern";
        case RecognizerKind::DENY_LIST: return "deny_list";
        case RecognizerKind::MODEL:     return "model";
    }
    return "pattern";
}

} // namespace textscrub
