#include "detector/recognizer_entity_detector.hpp"

#include <algorithm>

namespace textscrub {

RecognizerEntityDetector::RecognizerEntityDetector(
    std::shared_ptr<const RecognizerRegistry> registry, Options options)
    : registry_(std::move(registry)),
      options_(options),
      enhancer_(options.context) {}

DetectionReport RecognizerEntityDetector::detect(
    std::string_view text,
    std::string_view language,
    const EntityTypeSet& entity_types) const {

    auto report = registry_->detect(text, entity_types, language);

    enhancer_.enhance(text, report.spans, *registry_);

    if (options_.score_threshold > 0.0) {
        std::erase_if(report.spans, [&](const DetectedSpan& span) {
            return span.score < options_.score_threshold;
        });
    }

    return report;
}

} // namespace textscrub
