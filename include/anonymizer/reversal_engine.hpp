#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace textscrub {

/**
 * @brief Restores original values from a scrub record ("descrub")
 *
 * Never mutates the record; every call yields a new string.
 *
 * Full reversal returns the caller-held original text verbatim
 * (REVERSAL_CONFLICT_ERROR when it is missing). Selective reversal splices
 * the original_text of every entity whose token is targeted back into
 * [start, end) of the anonymized text, rightmost first so earlier splices
 * never shift the positions of the ones still pending.
 */
class ReversalEngine {
public:
    [[nodiscard]] static Result<std::string> descrub(
        const ScrubResult& record, const DescrubRequest& request);

    [[nodiscard]] static Result<std::string> restore_all(const DescrubRequest& request);

    /**
     * @brief Selective reversal
     * @return NOT_FOUND_ERROR for a requested token with no stored entity,
     *         INVALID_REQUEST for an empty token set or an entity whose range
     *         does not hold its token in anonymized_text
     */
    [[nodiscard]] static Result<std::string> restore_selected(
        std::string_view anonymized_text,
        const std::vector<AnonymizedEntity>& entities,
        const std::vector<std::string>& target_tokens);
};

} // namespace textscrub
