#include "anonymizer/conflict_resolver.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <map>
#include <tuple>

namespace textscrub {

namespace {

bool application_order(const DetectedSpan& a, const DetectedSpan& b) {
    return std::tie(a.start, a.registration_order, a.entity_type) <
           std::tie(b.start, b.registration_order, b.entity_type);
}

/**
 * @brief Same-type overlaps collapse into their union (exact duplicates too)
 */
std::vector<DetectedSpan> merge_same_type(std::string_view text, std::vector<DetectedSpan> group) {
    std::sort(group.begin(), group.end(), [](const DetectedSpan& a, const DetectedSpan& b) {
        if (a.start != b.start) return a.start < b.start;
        if (a.score != b.score) return a.score > b.score;
        if (a.registration_order != b.registration_order) {
            return a.registration_order < b.registration_order;
        }
        return a.end > b.end;
    });

    std::vector<DetectedSpan> merged;
    merged.reserve(group.size());
    for (auto& span : group) {
        if (!merged.empty() && span.start < merged.back().end) {
            auto& current = merged.back();
            if (span.end > current.end) {
                current.end = span.end;
                current.original_text = std::string(
                    text.substr(current.start, current.end - current.start));
            }
            current.score = std::max(current.score, span.score);
            continue;
        }
        merged.push_back(std::move(span));
    }
    return merged;
}

} // anonymous namespace

std::string ConflictResolver::make_token(std::string_view entity_type, size_t index, size_t count) {
    if (count <= 1) {
        return std::format("<{}>", entity_type);
    }
    return std::format("<{}_{}>", entity_type, index);
}

std::vector<DetectedSpan> ConflictResolver::settle_placements(
    std::string_view text, std::vector<DetectedSpan> spans) {

    std::sort(spans.begin(), spans.end(), application_order);

    std::vector<DetectedSpan> placed;
    placed.reserve(spans.size());
    for (auto& span : spans) {
        bool swallowed = false;
        while (!placed.empty() && placed.back().end > span.start) {
            auto& previous = placed.back();
            const bool same_range = previous.start == span.start && previous.end == span.end;
            if (span.end <= previous.end && !same_range) {
                swallowed = true;
                break;
            }
            previous.end = std::max(previous.start, span.start);
            if (previous.end > previous.start) {
                previous.original_text = std::string(
                    text.substr(previous.start, previous.end - previous.start));
                break;
            }
            placed.pop_back();
        }
        if (!swallowed) {
            placed.push_back(std::move(span));
        }
    }
    return placed;
}

std::vector<ResolvedSpan> ConflictResolver::resolve(
    std::string_view text, std::vector<DetectedSpan> spans) {

    // Group by entity type (ordered map keeps grouping deterministic)
    std::map<std::string, std::vector<DetectedSpan>> groups;
    for (auto& span : spans) {
        if (span.start >= span.end || span.end > text.size()) continue;
        groups[span.entity_type].push_back(std::move(span));
    }

    std::vector<DetectedSpan> merged;
    for (auto& [entity_type, group] : groups) {
        auto collapsed = merge_same_type(text, std::move(group));
        std::move(collapsed.begin(), collapsed.end(), std::back_inserter(merged));
    }

    // Numbering only counts what survives the cross-type pass
    auto placed = settle_placements(text, std::move(merged));

    std::map<std::string, size_t> totals;
    for (const auto& span : placed) {
        ++totals[span.entity_type];
    }

    std::map<std::string, size_t> seen;
    std::vector<ResolvedSpan> resolved;
    resolved.reserve(placed.size());
    for (auto& span : placed) {
        const size_t index = ++seen[span.entity_type];
        auto token = make_token(span.entity_type, index, totals[span.entity_type]);
        resolved.push_back({std::move(span), std::move(token)});
    }
    return resolved;
}

} // namespace textscrub
