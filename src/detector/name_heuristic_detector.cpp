#include "detector/name_heuristic_detector.hpp"
#include "core/utils.hpp"

#include <cctype>

namespace textscrub {

NameHeuristicDetector::NameHeuristicDetector(Config config)
    : config_(std::move(config)) {
    for (const auto& n : config_.given_names) {
        given_names_.insert(utils::to_lower(utils::trim(n)));
    }
    for (const auto& h : config_.honorifics) {
        honorifics_.insert(utils::to_lower(utils::trim(h)));
    }
    if (config_.max_name_words == 0) {
        config_.max_name_words = 1;
    }
}

std::vector<NameHeuristicDetector::Word> NameHeuristicDetector::split_words(std::string_view text) {
    std::vector<Word> words;
    size_t i = 0;
    while (i < text.size()) {
        if (!utils::is_word_char(text[i])) {
            ++i;
            continue;
        }
        const size_t start = i;
        while (i < text.size() && utils::is_word_char(text[i])) {
            ++i;
        }
        words.push_back({start, i});
    }
    return words;
}

bool NameHeuristicDetector::is_capitalised(std::string_view word) {
    return !word.empty() && std::isupper(static_cast<unsigned char>(word.front()));
}

// Words of one name are separated by spaces only (an honorific may carry a dot)
bool NameHeuristicDetector::joined_by_space(std::string_view text, const Word& a, const Word& b) {
    if (b.start <= a.end) return false;
    const auto gap = text.substr(a.end, b.start - a.end);
    size_t i = 0;
    if (i < gap.size() && gap[i] == '.') ++i;
    if (i == gap.size()) return false;
    for (; i < gap.size(); ++i) {
        if (gap[i] != ' ' && gap[i] != '\t') return false;
    }
    return true;
}

DetectionReport NameHeuristicDetector::detect(
    std::string_view text,
    std::string_view /*language*/,
    const EntityTypeSet& entity_types) const {

    DetectionReport report;
    if (!entity_types.contains(config_.entity_type)) {
        return report;
    }

    const auto words = split_words(text);
    size_t i = 0;
    while (i < words.size()) {
        const auto word = text.substr(words[i].start, words[i].end - words[i].start);
        const std::string lower = utils::to_lower(word);

        size_t first = i;
        size_t last = i;
        bool found = false;

        if (honorifics_.contains(lower) && i + 1 < words.size() &&
            joined_by_space(text, words[i], words[i + 1])) {
            const auto next = text.substr(words[i + 1].start, words[i + 1].end - words[i + 1].start);
            if (is_capitalised(next)) {
                last = i + 1;
                found = true;
            }
        } else if (is_capitalised(word) && given_names_.contains(lower)) {
            found = true;
        }

        if (!found) {
            ++i;
            continue;
        }

        // Extend over following capitalised surnames
        while (last + 1 < words.size() && (last - first + 1) < config_.max_name_words) {
            const auto& next = words[last + 1];
            const auto next_word = text.substr(next.start, next.end - next.start);
            if (!is_capitalised(next_word) || !joined_by_space(text, words[last], next)) break;
            ++last;
        }

        DetectedSpan span;
        span.entity_type = config_.entity_type;
        span.start = words[first].start;
        span.end = words[last].end;
        span.original_text = std::string(text.substr(span.start, span.end - span.start));
        span.score = config_.score;
        span.source_recognizer = config_.name;
        report.spans.push_back(std::move(span));

        i = last + 1;
    }

    return report;
}

} // namespace textscrub
