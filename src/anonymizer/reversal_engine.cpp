#include "anonymizer/reversal_engine.hpp"

#include <algorithm>
#include <format>
#include <unordered_set>

namespace textscrub {

Result<std::string> ReversalEngine::descrub(
    const ScrubResult& record, const DescrubRequest& request) {
    if (request.all) {
        return restore_all(request);
    }
    return restore_selected(record.anonymized_text, record.entities, request.target_tokens);
}

Result<std::string> ReversalEngine::restore_all(const DescrubRequest& request) {
    if (!request.original_text) {
        return Result<std::string>::error(ErrorCategory::REVERSAL_CONFLICT_ERROR,
            "Full reversal requires the original text; it is not stored with the scrub record");
    }
    return Result<std::string>::ok(*request.original_text);
}

Result<std::string> ReversalEngine::restore_selected(
    std::string_view anonymized_text,
    const std::vector<AnonymizedEntity>& entities,
    const std::vector<std::string>& target_tokens) {

    if (target_tokens.empty()) {
        return Result<std::string>::error(ErrorCategory::INVALID_REQUEST,
            "No replacement tokens given for selective reversal");
    }

    const std::unordered_set<std::string> targets(target_tokens.begin(), target_tokens.end());

    std::unordered_set<std::string> known;
    for (const auto& entity : entities) {
        known.insert(entity.replacement_token);
    }
    for (const auto& token : target_tokens) {
        if (!known.contains(token)) {
            return Result<std::string>::error(ErrorCategory::NOT_FOUND_ERROR,
                std::format("No stored entity for token '{}'", token));
        }
    }

    std::vector<const AnonymizedEntity*> selected;
    for (const auto& entity : entities) {
        if (!targets.contains(entity.replacement_token)) continue;

        if (entity.start > entity.end || entity.end > anonymized_text.size() ||
            anonymized_text.substr(entity.start, entity.end - entity.start) != entity.replacement_token) {
            return Result<std::string>::error(ErrorCategory::INVALID_REQUEST,
                std::format("Entity '{}' at [{}, {}) does not match the anonymized text",
                            entity.replacement_token, entity.start, entity.end));
        }
        selected.push_back(&entity);
    }

    // Rightmost first: a splice only moves text to its right
    std::sort(selected.begin(), selected.end(),
        [](const AnonymizedEntity* a, const AnonymizedEntity* b) { return a->start > b->start; });

    std::string restored(anonymized_text);
    for (const auto* entity : selected) {
        restored.replace(entity->start, entity->end - entity->start, entity->original_text);
    }

    return Result<std::string>::ok(std::move(restored));
}

} // namespace textscrub
