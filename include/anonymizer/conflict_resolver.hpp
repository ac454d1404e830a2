#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace textscrub {

/**
 * @brief A detected span with its placeholder token assigned
 */
struct ResolvedSpan {
    DetectedSpan span;
    std::string token;
};

/**
 * @brief Orders raw spans and assigns deterministic placeholder tokens
 *
 *  1. per entity type, sort by (start asc, score desc, registration order asc)
 *     and merge overlapping spans into one span covering both, keeping the
 *     higher score (exact duplicates collapse)
 *  2. across types, walk spans in application order (start asc, registration
 *     order asc, entity type asc). A later span that partially overlaps the
 *     previous one takes the shared characters and the previous one keeps its
 *     prefix (dropped if empty). A span lying strictly inside the previous one
 *     is dropped so the outer span still covers every character.
 *  3. number the surviving spans per type: a single span gets <TYPE>; N > 1
 *     spans get <TYPE_1>..<TYPE_N> in reading order
 *
 * Output is non-overlapping, in application order, and does not depend on the
 * order spans arrive in.
 */
class ConflictResolver {
public:
    [[nodiscard]] static std::vector<ResolvedSpan> resolve(
        std::string_view text, std::vector<DetectedSpan> spans);

    /**
     * @brief Placeholder for the index-th (1-based) of count spans of a type
     */
    [[nodiscard]] static std::string make_token(
        std::string_view entity_type, size_t index, size_t count);

    /**
     * @brief Step 2 alone: cross-type arbitration over already merged spans
     */
    [[nodiscard]] static std::vector<DetectedSpan> settle_placements(
        std::string_view text, std::vector<DetectedSpan> spans);
};

} // namespace textscrub
