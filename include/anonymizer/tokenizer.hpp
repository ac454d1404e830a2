#pragma once

#include "anonymizer/conflict_resolver.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace textscrub {

/**
 * @brief Builds the anonymized text and the durable entity records
 *
 * Spans are applied in the given order (ascending original start) as a fold
 * that carries the running length delta (token length - original length).
 * Each token lands at original_start + delta_so_far, and each
 * AnonymizedEntity reports [start, end) in anonymized-text coordinates.
 *
 * Input spans are expected not to overlap (ConflictResolver guarantees it);
 * a span that starts inside an already applied one is skipped.
 */
class Tokenizer {
public:
    [[nodiscard]] static ScrubResult apply(
        std::string_view text, const std::vector<ResolvedSpan>& spans);

    /**
     * @brief "EMAIL_ADDRESS" -> "Email address detected"
     */
    [[nodiscard]] static std::string explanation_for(std::string_view entity_type);
};

} // namespace textscrub
