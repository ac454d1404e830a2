#include "recognizer/recognizer_registry.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace textscrub {

namespace {

bool language_matches(const RecognizerSpec& spec, std::string_view language) {
    return spec.language.empty() || utils::to_lower(spec.language) == utils::to_lower(language);
}

Result<Recognizer> compile_recognizer(const RecognizerSpec& spec, const ModelDelegates& models) {
    switch (spec.kind) {
        case RecognizerKind::PATTERN: {
            auto compiled = PatternRecognizer::compile(spec);
            if (compiled.is_error()) {
                return Result<Recognizer>::error(compiled.error_category(), compiled.error_message());
            }
            return Result<Recognizer>::ok(Recognizer(std::move(compiled.value())));
        }
        case RecognizerKind::DENY_LIST: {
            auto created = DenyListRecognizer::create(spec);
            if (created.is_error()) {
                return Result<Recognizer>::error(created.error_category(), created.error_message());
            }
            return Result<Recognizer>::ok(Recognizer(std::move(created.value())));
        }
        case RecognizerKind::MODEL: {
            const auto it = models.find(spec.model_ref);
            if (it == models.end() || !it->second) {
                return Result<Recognizer>::error(ErrorCategory::CONFIGURATION_ERROR,
                    std::format("Recognizer '{}': unknown model '{}'", spec.name, spec.model_ref));
            }
            return Result<Recognizer>::ok(Recognizer(ModelRecognizer(spec, it->second)));
        }
    }
    return Result<Recognizer>::error(ErrorCategory::INTERNAL_ERROR,
        std::format("Recognizer '{}': unhandled kind", spec.name));
}

} // anonymous namespace

// ============================================================================
// Builder
// ============================================================================

bool RecognizerRegistry::Builder::register_recognizer(RecognizerSpec spec) {
    const auto existing = std::find_if(specs_.begin(), specs_.end(),
        [&](const RecognizerSpec& s) {
            return s.entity_type == spec.entity_type && s.kind == spec.kind;
        });

    if (existing != specs_.end()) {
        existing->min_tier = std::min(existing->min_tier, spec.min_tier);
        utils::log::debug(std::format(
            "Recognizer '{}' folded into '{}' ({} / {})",
            spec.name, existing->name, spec.entity_type, recognizer_kind_name(spec.kind)));
        return false;
    }

    specs_.push_back(std::move(spec));
    return true;
}

RecognizerRegistry::Builder& RecognizerRegistry::Builder::add_model(
    std::string name, std::shared_ptr<const IEntityDetector> model) {
    models_[std::move(name)] = std::move(model);
    return *this;
}

Result<std::shared_ptr<const RecognizerRegistry>> RecognizerRegistry::Builder::build() const {
    using BuildResult = Result<std::shared_ptr<const RecognizerRegistry>>;

    std::vector<Recognizer> recognizers;
    recognizers.reserve(specs_.size());

    for (const auto& spec : specs_) {
        if (spec.name.empty() || spec.entity_type.empty()) {
            return BuildResult::error(ErrorCategory::CONFIGURATION_ERROR,
                "Recognizer must have a name and an entity type");
        }
        if (spec.default_score < 0.0 || spec.default_score > 1.0) {
            return BuildResult::error(ErrorCategory::CONFIGURATION_ERROR,
                std::format("Recognizer '{}': score {} outside [0, 1]", spec.name, spec.default_score));
        }

        auto compiled = compile_recognizer(spec, models_);
        if (compiled.is_error()) {
            return BuildResult::error(compiled.error_category(), compiled.error_message());
        }
        recognizers.push_back(std::move(compiled.value()));
    }

    RiskTierClassifier tiers(specs_);
    utils::log::info(std::format(
        "Recognizer registry built: {} recognizers, {} entity types at C4",
        recognizers.size(), tiers.entity_types_for_tier(RiskTier::C4).size()));

    return BuildResult::ok(std::shared_ptr<const RecognizerRegistry>(
        new RecognizerRegistry(std::move(recognizers), std::move(tiers))));
}

// ============================================================================
// RecognizerRegistry
// ============================================================================

Result<std::shared_ptr<const RecognizerRegistry>> RecognizerRegistry::create(
    std::vector<RecognizerSpec> specs, const ModelDelegates& models) {

    Builder builder;
    for (auto& spec : specs) {
        builder.register_recognizer(std::move(spec));
    }
    for (const auto& [name, model] : models) {
        builder.add_model(name, model);
    }
    return builder.build();
}

DetectionReport RecognizerRegistry::detect(
    std::string_view text,
    const EntityTypeSet& entity_types,
    std::string_view language) const {

    DetectionReport report;
    if (text.empty() || entity_types.empty()) {
        return report;
    }

    for (size_t i = 0; i < recognizers_.size(); ++i) {
        const auto& recognizer = recognizers_[i];
        const auto& spec = recognizer_spec(recognizer);

        if (!entity_types.contains(spec.entity_type) || !language_matches(spec, language)) {
            continue;
        }

        auto result = match_recognizer(recognizer, text, language);
        if (result.is_error()) {
            report.failures.push_back({spec.name, result.error_message()});
            continue;
        }

        for (auto& span : result.value()) {
            span.registration_order = i;
            report.spans.push_back(std::move(span));
        }
    }

    return report;
}

const RecognizerSpec* RecognizerRegistry::find(std::string_view name) const {
    for (const auto& recognizer : recognizers_) {
        const auto& spec = recognizer_spec(recognizer);
        if (spec.name == name) {
            return &spec;
        }
    }
    return nullptr;
}

} // namespace textscrub
