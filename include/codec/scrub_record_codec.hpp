#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <glaze/glaze.hpp>

#include <string>
#include <string_view>

// Wire names for the durable scrub record. Offsets are byte offsets into
// scrubbed_text.
template <>
struct glz::meta<textscrub::AnonymizedEntity> {
    using T = textscrub::AnonymizedEntity;
    static constexpr auto value = object(
        "type", &T::entity_type,
        "start", &T::start,
        "end", &T::end,
        "original", &T::original_text,
        "replacement", &T::replacement_token,
        "explanation", &T::explanation,
        "score", &T::score);
};

template <>
struct glz::meta<textscrub::ScrubResult> {
    using T = textscrub::ScrubResult;
    static constexpr auto value = object(
        "scrubbed_text", &T::anonymized_text,
        "entities", &T::entities,
        "failed_recognizers", &T::failed_recognizers);
};

namespace textscrub {

/**
 * @brief JSON encoding of ScrubResult, the record a caller stores to descrub later
 */
class ScrubRecordCodec {
public:
    [[nodiscard]] static Result<std::string> encode(const ScrubResult& record);

    /**
     * @brief Parse a stored record. Structural checks (entity ranges inside
     * scrubbed_text, replacement matching the text at its range) are left to
     * descrub, which reports them per token.
     */
    [[nodiscard]] static Result<ScrubResult> decode(std::string_view json);
};

} // namespace textscrub
