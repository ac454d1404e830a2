#include "anonymizer/anonymizer_engine.hpp"
#include "anonymizer/conflict_resolver.hpp"
#include "anonymizer/reversal_engine.hpp"
#include "anonymizer/tokenizer.hpp"
#include "classifier/risk_tier_classifier.hpp"
#include "core/utils.hpp"
#include "detector/recognizer_entity_detector.hpp"

#include <format>
#include <stdexcept>

namespace textscrub {

AnonymizerEngine::AnonymizerEngine(std::shared_ptr<const RecognizerRegistry> registry)
    : AnonymizerEngine(std::move(registry), Options{}) {}

AnonymizerEngine::AnonymizerEngine(std::shared_ptr<const RecognizerRegistry> registry, Options options)
    : registry_(std::move(registry)),
      options_(std::move(options)) {
    if (!registry_) {
        throw std::invalid_argument("AnonymizerEngine requires a recognizer registry");
    }
    detector_ = std::make_shared<RecognizerEntityDetector>(registry_);
}

AnonymizerEngine::AnonymizerEngine(std::shared_ptr<const RecognizerRegistry> registry,
                                   std::shared_ptr<const IEntityDetector> detector,
                                   Options options)
    : registry_(std::move(registry)),
      detector_(std::move(detector)),
      options_(std::move(options)) {
    if (!registry_ || !detector_) {
        throw std::invalid_argument("AnonymizerEngine requires a recognizer registry and a detector");
    }
}

Result<ScrubResult> AnonymizerEngine::scrub(
    std::string_view text, std::string_view tier, std::string_view language) const {

    const auto parsed = parse_risk_tier(tier);
    if (!parsed) {
        return Result<ScrubResult>::error(ErrorCategory::CONFIGURATION_ERROR,
            std::format("Unknown risk tier '{}' (expected C1, C2, C3 or C4)", tier));
    }
    return scrub(text, *parsed, language);
}

Result<ScrubResult> AnonymizerEngine::scrub(
    std::string_view text,
    RiskTier tier,
    std::string_view language,
    std::optional<DetectionFailurePolicy> on_failure) const {

    if (text.empty()) {
        return Result<ScrubResult>::ok(ScrubResult{});
    }

    utils::Timer timer;
    const std::string_view lang = language.empty()
        ? std::string_view(options_.default_language) : language;
    const auto& entity_types = registry_->entity_types_for_tier(tier);

    auto report = detector_->detect(text, lang, entity_types);

    ScrubResult partial_info;
    if (!report.complete()) {
        const auto policy = on_failure.value_or(options_.on_failure);
        for (const auto& failure : report.failures) {
            utils::log::warn(std::format("Detection failure in '{}': {}",
                                         failure.recognizer, failure.message));
        }
        if (policy == DetectionFailurePolicy::FAIL) {
            const auto& first = report.failures.front();
            return Result<ScrubResult>::error(ErrorCategory::DETECTION_ERROR,
                std::format("Entity detection failed ({} recognizer(s)); first: {}: {}",
                            report.failures.size(), first.recognizer, first.message));
        }
        for (const auto& failure : report.failures) {
            partial_info.failed_recognizers.push_back(failure.recognizer);
        }
    }

    // Hold external detectors to the contract: requested types, valid ranges,
    // original_text equal to the exact slice
    std::vector<DetectedSpan> spans;
    spans.reserve(report.spans.size());
    for (auto& span : report.spans) {
        if (!entity_types.contains(span.entity_type)) continue;
        if (span.start >= span.end || span.end > text.size()) {
            return Result<ScrubResult>::error(ErrorCategory::DETECTION_ERROR,
                std::format("Detector '{}' returned invalid span [{}, {}) for {}",
                            detector_->name(), span.start, span.end, span.entity_type));
        }
        span.original_text = std::string(text.substr(span.start, span.end - span.start));
        spans.push_back(std::move(span));
    }

    const auto resolved = ConflictResolver::resolve(text, std::move(spans));
    auto result = Tokenizer::apply(text, resolved);
    result.failed_recognizers = std::move(partial_info.failed_recognizers);

    utils::log::debug(std::format("Scrubbed {} bytes at tier {}: {} entities in {}us",
                                  text.size(), risk_tier_name(tier), result.entities.size(),
                                  timer.elapsed_us().count()));

    return Result<ScrubResult>::ok(std::move(result));
}

Result<std::string> AnonymizerEngine::descrub(
    const ScrubResult& record, const DescrubRequest& request) {
    return ReversalEngine::descrub(record, request);
}

} // namespace textscrub
