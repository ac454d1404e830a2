#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace textscrub {

// ============================================================================
// Basic Enums
// ============================================================================

/**
 * @brief Sensitivity tier. Totally ordered: C1 < C2 < C3 < C4.
 *
 * Higher tiers activate a superset of the entity types of lower tiers.
 */
enum class RiskTier : uint8_t {
    C1 = 1,
    C2 = 2,
    C3 = 3,
    C4 = 4
};

inline constexpr RiskTier kAllRiskTiers[] = {
    RiskTier::C1, RiskTier::C2, RiskTier::C3, RiskTier::C4
};

enum class RecognizerKind {
    PATTERN,
    DENY_LIST,
    MODEL
};

/**
 * @brief Checksum applied to a pattern match before it is accepted
 */
enum class ValidatorKind {
    NONE,
    LUHN,
    IBAN,
    BE_NATIONAL_REGISTER
};

enum class DetectionFailurePolicy {
    FAIL,       // any failed recognizer fails the whole scrub
    PARTIAL     // proceed, report failed recognizers in the result
};

// Ordered so that iteration (and therefore output) is deterministic
using EntityTypeSet = std::set<std::string>;

// ============================================================================
// Recognizer Definition
// ============================================================================

/**
 * @brief Immutable definition of one recognizer, loaded once at startup
 *
 * Exactly one of pattern / deny_list / model_ref is meaningful, selected by kind.
 */
struct RecognizerSpec {
    std::string name;
    std::string entity_type;
    RecognizerKind kind = RecognizerKind::PATTERN;
    RiskTier min_tier = RiskTier::C4;

    std::string pattern;                    // PATTERN
    std::vector<std::string> deny_list;     // DENY_LIST
    std::string model_ref;                  // MODEL: name of a model delegate

    double default_score = 0.8;
    std::vector<std::string> context_keywords;
    ValidatorKind validator = ValidatorKind::NONE;
    std::string language;                   // empty = any language
};

// ============================================================================
// Detection / Anonymization Records
// ============================================================================

/**
 * @brief Raw candidate span. Offsets are in the ORIGINAL text.
 */
struct DetectedSpan {
    std::string entity_type;
    size_t start = 0;
    size_t end = 0;
    std::string original_text;
    double score = 0.0;
    std::string source_recognizer;
    // Position of the source recognizer in the registry; used as the final
    // tie-breaker so ordering never depends on detector execution order.
    size_t registration_order = std::numeric_limits<size_t>::max();

    [[nodiscard]] size_t length() const { return end - start; }

    bool operator==(const DetectedSpan&) const = default;
};

/**
 * @brief Durable per-entity record. Offsets are in the ANONYMIZED text.
 *
 * original_text holds the exact slice that was replaced; reversal splices it
 * back into [start, end).
 */
struct AnonymizedEntity {
    std::string entity_type;
    size_t start = 0;
    size_t end = 0;
    std::string original_text;
    std::string replacement_token;
    double score = 0.0;
    std::string explanation;

    bool operator==(const AnonymizedEntity&) const = default;
};

struct ScrubResult {
    std::string anonymized_text;
    std::vector<AnonymizedEntity> entities;
    // Recognizers that failed while the PARTIAL policy was in effect.
    // Empty on a complete detection run.
    std::vector<std::string> failed_recognizers;

    [[nodiscard]] bool complete() const { return failed_recognizers.empty(); }

    bool operator==(const ScrubResult&) const = default;
};

/**
 * @brief Reversal request: either every token (full reversal, needs the
 * caller-held original text) or an explicit subset of tokens.
 */
struct DescrubRequest {
    bool all = false;
    std::vector<std::string> target_tokens;
    std::optional<std::string> original_text;

    static DescrubRequest full(std::string original) {
        DescrubRequest req;
        req.all = true;
        req.original_text = std::move(original);
        return req;
    }

    static DescrubRequest selective(std::vector<std::string> tokens) {
        DescrubRequest req;
        req.target_tokens = std::move(tokens);
        return req;
    }
};

} // namespace textscrub
