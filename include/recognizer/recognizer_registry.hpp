#pragma once

#include "classifier/risk_tier_classifier.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "detector/ientity_detector.hpp"
#include "recognizer/recognizer.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace textscrub {

// Named model delegates that MODEL recognizers resolve their model_ref against
using ModelDelegates = std::unordered_map<std::string, std::shared_ptr<const IEntityDetector>>;

/**
 * @brief Immutable set of compiled recognizers plus the tier tables derived
 * from them
 *
 * Built once at startup through RecognizerRegistry::Builder and shared by
 * const pointer; no method mutates it, so concurrent detect() calls need no
 * locking.
 *
 * Recognizers are deduplicated by (entity_type, kind): the first registration
 * is kept, and its min_tier is lowered to the lowest tier that referenced it.
 */
class RecognizerRegistry {
public:
    class Builder {
    public:
        /**
         * @brief Register a recognizer definition
         * @return false when an equivalent (entity_type, kind) recognizer was
         *         already registered and this one was folded into it
         */
        bool register_recognizer(RecognizerSpec spec);

        Builder& add_model(std::string name, std::shared_ptr<const IEntityDetector> model);

        [[nodiscard]] size_t size() const { return specs_.size(); }

        /**
         * @brief Compile every recognizer. Fails with CONFIGURATION_ERROR on an
         * unparsable pattern, empty deny list, unknown model reference or
         * out-of-range score.
         */
        [[nodiscard]] Result<std::shared_ptr<const RecognizerRegistry>> build() const;

    private:
        std::vector<RecognizerSpec> specs_;
        ModelDelegates models_;
    };

    /**
     * @brief Convenience: register every spec and build
     */
    [[nodiscard]] static Result<std::shared_ptr<const RecognizerRegistry>> create(
        std::vector<RecognizerSpec> specs, const ModelDelegates& models = {});

    /**
     * @brief Union of the spans of every recognizer whose entity type is in
     * entity_types and whose language matches. Each recognizer scans the whole
     * text independently; a failing recognizer is reported, not skipped silently.
     */
    [[nodiscard]] DetectionReport detect(
        std::string_view text,
        const EntityTypeSet& entity_types,
        std::string_view language) const;

    [[nodiscard]] const EntityTypeSet& entity_types_for_tier(RiskTier tier) const {
        return tiers_.entity_types_for_tier(tier);
    }

    [[nodiscard]] const RiskTierClassifier& tiers() const { return tiers_; }

    [[nodiscard]] const std::vector<Recognizer>& recognizers() const { return recognizers_; }

    [[nodiscard]] size_t size() const { return recognizers_.size(); }

    [[nodiscard]] const RecognizerSpec* find(std::string_view name) const;

private:
    RecognizerRegistry(std::vector<Recognizer> recognizers, RiskTierClassifier tiers)
        : recognizers_(std::move(recognizers)), tiers_(std::move(tiers)) {}

    std::vector<Recognizer> recognizers_;
    RiskTierClassifier tiers_;
};

} // namespace textscrub
