#include "anonymizer/tokenizer.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>

namespace textscrub {

std::string Tokenizer::explanation_for(std::string_view entity_type) {
    std::string words = utils::to_lower(entity_type);
    for (char& c : words) {
        if (c == '_') c = ' ';
    }
    if (!words.empty()) {
        words[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(words[0])));
    }
    return words + " detected";
}

ScrubResult Tokenizer::apply(std::string_view text, const std::vector<ResolvedSpan>& spans) {
    std::vector<const ResolvedSpan*> ordered;
    ordered.reserve(spans.size());
    for (const auto& resolved : spans) {
        ordered.push_back(&resolved);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
        [](const ResolvedSpan* a, const ResolvedSpan* b) { return a->span.start < b->span.start; });

    ScrubResult result;
    result.entities.reserve(ordered.size());
    result.anonymized_text.reserve(text.size());

    std::ptrdiff_t delta = 0;
    size_t cursor = 0;

    for (const ResolvedSpan* resolved : ordered) {
        const auto& span = resolved->span;
        // Overlaps are settled upstream; anything still crossing the cursor is skipped
        if (span.start < cursor || span.start >= span.end || span.end > text.size()) continue;

        const std::string& token = resolved->token;
        const size_t original_len = span.end - span.start;
        const auto output_start = static_cast<size_t>(static_cast<std::ptrdiff_t>(span.start) + delta);

        result.anonymized_text.append(text.substr(cursor, span.start - cursor));
        result.anonymized_text.append(token);
        cursor = span.end;

        AnonymizedEntity entity;
        entity.entity_type = span.entity_type;
        entity.start = output_start;
        entity.end = output_start + token.size();
        entity.original_text = std::string(text.substr(span.start, original_len));
        entity.replacement_token = token;
        entity.score = span.score;
        entity.explanation = explanation_for(entity.entity_type);
        result.entities.push_back(std::move(entity));

        delta += static_cast<std::ptrdiff_t>(token.size()) - static_cast<std::ptrdiff_t>(original_len);
    }

    result.anonymized_text.append(text.substr(cursor));
    return result;
}

} // namespace textscrub
