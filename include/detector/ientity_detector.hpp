#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace textscrub {

struct DetectionFailure {
    std::string recognizer;
    std::string message;
};

/**
 * @brief Outcome of one detection call
 *
 * An empty span list with no failures means nothing was found. A non-empty
 * failure list means some recognizer could not run; spans then holds whatever
 * the remaining recognizers produced.
 */
struct DetectionReport {
    std::vector<DetectedSpan> spans;
    std::vector<DetectionFailure> failures;

    [[nodiscard]] bool complete() const { return failures.empty(); }
};

/**
 * @brief Entity detection capability consumed by the anonymizer
 *
 * Implementations propose raw candidate spans for the requested entity types
 * only. They may block (model inference) and must be safe to call from many
 * threads at once on a const instance.
 */
class IEntityDetector {
public:
    virtual ~IEntityDetector() = default;

    /**
     * @brief Detect candidate spans
     * @param text Text to scan; span offsets refer to it
     * @param language Language code ("en", "fr", "nl", ...)
     * @param entity_types Only spans of these types may be returned
     */
    [[nodiscard]] virtual DetectionReport detect(
        std::string_view text,
        std::string_view language,
        const EntityTypeSet& entity_types) const = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace textscrub
