#include "anonymizer/anonymizer_engine.hpp"
#include "codec/scrub_record_codec.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "detector/model_factory.hpp"
#include "detector/recognizer_entity_detector.hpp"
#include "recognizer/recognizer_registry.hpp"

#include <cstdio>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace textscrub;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitEngine = 2;

struct CliOptions {
    std::string config_file = "config/scrubber.toml";
    std::string command;
    std::string tier;
    std::string language;
    std::string record_file;
    std::string original_file;
    std::string tokens;
    bool all = false;
};

void print_usage(const char* prog) {
    std::cerr << std::format(
        "Usage:\n"
        "  {0} [--config FILE] scrub --tier C1|C2|C3|C4 [--lang LANG]   < text\n"
        "  {0} [--config FILE] descrub --record FILE --all --original FILE\n"
        "  {0} [--config FILE] descrub --record FILE --tokens \"<PERSON>,<EMAIL_ADDRESS>\"\n",
        prog);
}

// Returns nullopt (after printing why) on a malformed command line
std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto next_value = [&](std::string& out) -> bool {
            if (i + 1 >= argc) {
                std::cerr << std::format("Missing value for {}\n", arg);
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--config") {
            if (!next_value(opts.config_file)) return std::nullopt;
        } else if (arg == "--tier") {
            if (!next_value(opts.tier)) return std::nullopt;
        } else if (arg == "--lang") {
            if (!next_value(opts.language)) return std::nullopt;
        } else if (arg == "--record") {
            if (!next_value(opts.record_file)) return std::nullopt;
        } else if (arg == "--original") {
            if (!next_value(opts.original_file)) return std::nullopt;
        } else if (arg == "--tokens") {
            if (!next_value(opts.tokens)) return std::nullopt;
        } else if (arg == "--all") {
            opts.all = true;
        } else if (opts.command.empty() && (arg == "scrub" || arg == "descrub")) {
            opts.command = arg;
        } else {
            std::cerr << std::format("Unknown argument: {}\n", arg);
            return std::nullopt;
        }
    }

    if (opts.command == "scrub") {
        if (opts.tier.empty()) {
            std::cerr << "scrub requires --tier\n";
            return std::nullopt;
        }
    } else if (opts.command == "descrub") {
        if (opts.record_file.empty()) {
            std::cerr << "descrub requires --record\n";
            return std::nullopt;
        }
        if (opts.all == !opts.tokens.empty()) {
            std::cerr << "descrub requires exactly one of --all or --tokens\n";
            return std::nullopt;
        }
        if (opts.all && opts.original_file.empty()) {
            std::cerr << "descrub --all requires --original\n";
            return std::nullopt;
        }
    } else {
        std::cerr << "Missing command (scrub or descrub)\n";
        return std::nullopt;
    }

    return opts;
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::vector<std::string> parse_token_list(const std::string& tokens) {
    std::vector<std::string> result;
    for (const auto& part : utils::split(tokens, ',')) {
        auto token = utils::trim(part);
        if (!token.empty()) {
            result.emplace_back(std::move(token));
        }
    }
    return result;
}

int run_scrub(const CliOptions& opts) {
    auto config_result = ConfigLoader::load_from_file(opts.config_file);
    if (!config_result.success) {
        utils::log::error(config_result.error_message);
        return kExitEngine;
    }
    const auto& config = config_result.config;

    if (auto level = utils::log::parse_level(config.logging.level)) {
        utils::log::set_level(*level);
    }
    utils::log::info(std::format("Loaded {} recognizers, {} models from {}",
        config.recognizers.size(), config.models.size(), opts.config_file));

    auto models = create_model_delegates(config.models);
    if (models.is_error()) {
        utils::log::error(models.error_message());
        return kExitEngine;
    }

    auto registry = RecognizerRegistry::create(config.recognizers, models.value());
    if (registry.is_error()) {
        utils::log::error(registry.error_message());
        return kExitEngine;
    }

    RecognizerEntityDetector::Options detector_opts;
    detector_opts.score_threshold = config.detection.score_threshold;
    detector_opts.context.window_words = config.detection.context_window_words;
    detector_opts.context.boost = config.detection.context_boost;
    detector_opts.context.min_score_with_context = config.detection.min_score_with_context;
    auto detector = std::make_shared<RecognizerEntityDetector>(registry.value(), detector_opts);

    AnonymizerEngine::Options engine_opts;
    engine_opts.default_language = config.detection.default_language;
    engine_opts.on_failure = config.detection.on_failure;
    const AnonymizerEngine engine(registry.value(), detector, engine_opts);

    const std::string text(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>{});

    utils::Timer timer;
    auto result = engine.scrub(text, opts.tier, opts.language);
    if (result.is_error()) {
        utils::log::error(std::format("{}: {}",
            error_category_name(result.error_category()), result.error_message()));
        return kExitEngine;
    }
    utils::log::info(std::format("Scrubbed {} bytes at {}: {} entities in {}us",
        text.size(), opts.tier, result.value().entities.size(), timer.elapsed_us().count()));

    for (const auto& failed : result.value().failed_recognizers) {
        utils::log::warn(std::format("Recognizer '{}' failed; result is partial", failed));
    }

    auto encoded = ScrubRecordCodec::encode(result.value());
    if (encoded.is_error()) {
        utils::log::error(encoded.error_message());
        return kExitEngine;
    }
    std::cout << encoded.value() << '\n';
    return kExitOk;
}

int run_descrub(const CliOptions& opts) {
    auto record_json = read_file(opts.record_file);
    if (!record_json) {
        utils::log::error(std::format("Cannot read record file {}", opts.record_file));
        return kExitUsage;
    }

    auto record = ScrubRecordCodec::decode(*record_json);
    if (record.is_error()) {
        utils::log::error(record.error_message());
        return kExitEngine;
    }

    DescrubRequest request;
    if (opts.all) {
        auto original = read_file(opts.original_file);
        if (!original) {
            utils::log::error(std::format("Cannot read original file {}", opts.original_file));
            return kExitUsage;
        }
        request = DescrubRequest::full(std::move(*original));
    } else {
        request = DescrubRequest::selective(parse_token_list(opts.tokens));
    }

    auto restored = AnonymizerEngine::descrub(record.value(), request);
    if (restored.is_error()) {
        utils::log::error(std::format("{}: {}",
            error_category_name(restored.error_category()), restored.error_message()));
        return kExitEngine;
    }
    std::cout << restored.value();
    return kExitOk;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage(argc > 0 ? argv[0] : "textscrub");
        return kExitUsage;
    }

    try {
        if (opts->command == "scrub") {
            return run_scrub(*opts);
        }
        return run_descrub(*opts);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitEngine;
    }
}
