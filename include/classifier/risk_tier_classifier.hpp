#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <array>
#include <optional>
#include <string_view>
#include <vector>

namespace textscrub {

/**
 * @brief Parse a tier name ("C1".."C4", case-insensitive, surrounding
 * whitespace ignored). Anything else yields nullopt; there is no default tier.
 */
[[nodiscard]] std::optional<RiskTier> parse_risk_tier(std::string_view name);

[[nodiscard]] std::string_view risk_tier_name(RiskTier tier);

/**
 * @brief Maps a risk tier to the cumulative set of active entity types
 *
 * An entity type is active at tier T when some recognizer for it declares
 * min_tier <= T. All four sets are computed once at construction, so every
 * lookup is a const reference into immutable state.
 *
 * Invariant: entity_types_for_tier(Cj) is a subset of entity_types_for_tier(Ck)
 * for every j < k.
 */
class RiskTierClassifier {
public:
    RiskTierClassifier() = default;
    explicit RiskTierClassifier(const std::vector<RecognizerSpec>& specs);

    [[nodiscard]] const EntityTypeSet& entity_types_for_tier(RiskTier tier) const;

    /**
     * @brief String overload; unknown tier names fail with CONFIGURATION_ERROR
     */
    [[nodiscard]] Result<EntityTypeSet> entity_types_for_tier(std::string_view tier_name) const;

    /**
     * @brief Lowest tier at which entity_type becomes active
     */
    [[nodiscard]] std::optional<RiskTier> min_tier_of(const std::string& entity_type) const;

private:
    static constexpr size_t index_of(RiskTier tier) {
        return static_cast<size_t>(tier) - 1;
    }

    std::array<EntityTypeSet, 4> tiers_;
};

} // namespace textscrub
