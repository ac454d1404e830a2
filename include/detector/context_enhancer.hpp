#pragma once

#include "core/types.hpp"
#include "recognizer/recognizer_registry.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace textscrub {

/**
 * @brief Raises span scores when a recognizer's context keyword appears
 * shortly before the match
 *
 * For a span whose recognizer declares context keywords, the window is the
 * window_words words immediately preceding the span. On a hit (whole word,
 * case-insensitive; multi-word keywords match consecutive words):
 *   score = min(1, max(score + boost, min_score_with_context))
 */
class ContextEnhancer {
public:
    struct Config {
        size_t window_words = 5;
        double boost = 0.35;
        double min_score_with_context = 0.4;
    };

    ContextEnhancer() = default;
    explicit ContextEnhancer(Config config) : config_(config) {}

    void enhance(std::string_view text,
                 std::vector<DetectedSpan>& spans,
                 const RecognizerRegistry& registry) const;

    /**
     * @brief Lower-cased words ending before offset, nearest last
     */
    [[nodiscard]] static std::vector<std::string> preceding_words(
        std::string_view text, size_t offset, size_t count);

    [[nodiscard]] const Config& config() const { return config_; }

private:
    Config config_;
};

} // namespace textscrub
