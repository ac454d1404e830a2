#include "detector/context_enhancer.hpp"
#include "core/utils.hpp"

#include <algorithm>

namespace textscrub {

std::vector<std::string> ContextEnhancer::preceding_words(
    std::string_view text, size_t offset, size_t count) {

    std::vector<std::string> words;
    size_t pos = std::min(offset, text.size());

    while (words.size() < count && pos > 0) {
        // Skip separators
        while (pos > 0 && !utils::is_word_char(text[pos - 1])) {
            --pos;
        }
        const size_t word_end = pos;
        while (pos > 0 && utils::is_word_char(text[pos - 1])) {
            --pos;
        }
        if (word_end > pos) {
            words.push_back(utils::to_lower(text.substr(pos, word_end - pos)));
        }
    }

    std::reverse(words.begin(), words.end());
    return words;
}

void ContextEnhancer::enhance(std::string_view text,
                              std::vector<DetectedSpan>& spans,
                              const RecognizerRegistry& registry) const {
    if (config_.window_words == 0) {
        return;
    }

    const auto& recognizers = registry.recognizers();

    for (auto& span : spans) {
        if (span.registration_order >= recognizers.size()) continue;

        const auto& keywords = recognizer_spec(recognizers[span.registration_order]).context_keywords;
        if (keywords.empty()) continue;

        const auto words = preceding_words(text, span.start, config_.window_words);
        if (words.empty()) continue;

        std::string window = " ";
        for (const auto& w : words) {
            window += w;
            window += ' ';
        }

        const bool hit = std::any_of(keywords.begin(), keywords.end(),
            [&](const std::string& keyword) {
                const std::string needle = " " + utils::to_lower(utils::trim(keyword)) + " ";
                return needle.size() > 2 && window.find(needle) != std::string::npos;
            });

        if (hit) {
            span.score = std::min(1.0, std::max(span.score + config_.boost,
                                                config_.min_score_with_context));
        }
    }
}

} // namespace textscrub
