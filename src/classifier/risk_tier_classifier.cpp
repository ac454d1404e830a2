#include "classifier/risk_tier_classifier.hpp"
#include "core/utils.hpp"

#include <format>

namespace textscrub {

std::optional<RiskTier> parse_risk_tier(std::string_view name) {
    const std::string normalized = utils::to_upper(utils::trim(std::string(name)));

    if (normalized == "C1") return RiskTier::C1;
    if (normalized == "C2") return RiskTier::C2;
    if (normalized == "C3") return RiskTier::C3;
    if (normalized == "C4") return RiskTier::C4;
    return std::nullopt;
}

std::string_view risk_tier_name(RiskTier tier) {
    switch (tier) {
        case RiskTier::C1: return "C1";
        case RiskTier::C2: return "C2";
        case RiskTier::C3: return "C3";
        case RiskTier::C4: return "C4";
    }
    return "C4";
}

RiskTierClassifier::RiskTierClassifier(const std::vector<RecognizerSpec>& specs) {
    // A recognizer declared at tier T is active at T and every tier above it
    for (const auto& spec : specs) {
        for (const RiskTier tier : kAllRiskTiers) {
            if (spec.min_tier <= tier) {
                tiers_[index_of(tier)].insert(spec.entity_type);
            }
        }
    }

    for (size_t i = 1; i < tiers_.size(); ++i) {
        if (tiers_[i].size() == tiers_[i - 1].size() && !tiers_[i].empty()) {
            utils::log::warn(std::format(
                "Tier {} activates no entity types beyond tier {}",
                risk_tier_name(kAllRiskTiers[i]), risk_tier_name(kAllRiskTiers[i - 1])));
        }
    }
}

const EntityTypeSet& RiskTierClassifier::entity_types_for_tier(RiskTier tier) const {
    return tiers_[index_of(tier)];
}

Result<EntityTypeSet> RiskTierClassifier::entity_types_for_tier(std::string_view tier_name) const {
    const auto tier = parse_risk_tier(tier_name);
    if (!tier) {
        return Result<EntityTypeSet>::error(ErrorCategory::CONFIGURATION_ERROR,
            std::format("Unknown risk tier '{}' (expected C1, C2, C3 or C4)", tier_name));
    }
    return Result<EntityTypeSet>::ok(entity_types_for_tier(*tier));
}

std::optional<RiskTier> RiskTierClassifier::min_tier_of(const std::string& entity_type) const {
    for (const RiskTier tier : kAllRiskTiers) {
        if (tiers_[index_of(tier)].contains(entity_type)) {
            return tier;
        }
    }
    return std::nullopt;
}

} // namespace textscrub
