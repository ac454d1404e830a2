#pragma once

#include "detector/context_enhancer.hpp"
#include "detector/ientity_detector.hpp"
#include "recognizer/recognizer_registry.hpp"

#include <memory>
#include <string>

namespace textscrub {

/**
 * @brief Default entity detector: runs the registry's recognizers, applies
 * context enhancement, then drops spans scoring below score_threshold.
 */
class RecognizerEntityDetector : public IEntityDetector {
public:
    struct Options {
        double score_threshold = 0.0;
        ContextEnhancer::Config context;
    };

    explicit RecognizerEntityDetector(std::shared_ptr<const RecognizerRegistry> registry)
        : RecognizerEntityDetector(std::move(registry), Options{}) {}

    RecognizerEntityDetector(std::shared_ptr<const RecognizerRegistry> registry, Options options);

    [[nodiscard]] DetectionReport detect(
        std::string_view text,
        std::string_view language,
        const EntityTypeSet& entity_types) const override;

    [[nodiscard]] std::string name() const override { return "recognizer_registry"; }

private:
    std::shared_ptr<const RecognizerRegistry> registry_;
    Options options_;
    ContextEnhancer enhancer_;
};

} // namespace textscrub
