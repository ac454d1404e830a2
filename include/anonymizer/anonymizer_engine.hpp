#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "detector/ientity_detector.hpp"
#include "recognizer/recognizer_registry.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace textscrub {

/**
 * @brief Scrub / descrub entry point
 *
 * scrub: tier -> entity types -> detection -> conflict resolution ->
 * tokenization. Stateless per call; the registry and detector are shared
 * immutable collaborators, so any number of calls may run concurrently.
 * Nothing is persisted: callers store the returned ScrubResult (and the
 * original text, if full reversal will be needed) themselves.
 */
class AnonymizerEngine {
public:
    struct Options {
        std::string default_language = "en";
        DetectionFailurePolicy on_failure = DetectionFailurePolicy::FAIL;
    };

    /**
     * @brief Engine using the registry's own recognizers as the detector
     */
    explicit AnonymizerEngine(std::shared_ptr<const RecognizerRegistry> registry);
    AnonymizerEngine(std::shared_ptr<const RecognizerRegistry> registry, Options options);

    /**
     * @brief Engine with an externally supplied detector (the registry still
     * provides the tier tables)
     */
    AnonymizerEngine(std::shared_ptr<const RecognizerRegistry> registry,
                     std::shared_ptr<const IEntityDetector> detector,
                     Options options);

    /**
     * @brief Anonymize text at a tier given by name ("C1".."C4")
     * @return CONFIGURATION_ERROR for an unknown tier, DETECTION_ERROR when
     *         detection failed under the FAIL policy
     */
    [[nodiscard]] Result<ScrubResult> scrub(
        std::string_view text,
        std::string_view tier,
        std::string_view language = {}) const;

    [[nodiscard]] Result<ScrubResult> scrub(
        std::string_view text,
        RiskTier tier,
        std::string_view language = {},
        std::optional<DetectionFailurePolicy> on_failure = std::nullopt) const;

    /**
     * @brief Reverse a scrub record in full or for selected tokens
     */
    [[nodiscard]] static Result<std::string> descrub(
        const ScrubResult& record, const DescrubRequest& request);

    [[nodiscard]] const RecognizerRegistry& registry() const { return *registry_; }

private:
    std::shared_ptr<const RecognizerRegistry> registry_;
    std::shared_ptr<const IEntityDetector> detector_;
    Options options_;
};

} // namespace textscrub
