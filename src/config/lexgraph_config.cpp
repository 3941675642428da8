#include <lexgraph/config/config_helpers.h>
#include <lexgraph/config/lexgraph_config.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <cstdlib>

namespace lexgraph::config {

namespace {

Result<std::size_t> parseSize(const std::string& key, const std::string& raw) {
    std::string v = raw;
    // Allow TOML digit separators: 400_000
    v.erase(std::remove(v.begin(), v.end(), '_'), v.end());
    std::size_t out = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
    if (ec != std::errc() || ptr != v.data() + v.size() || v.empty()) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid numeric value for '" + key + "': " + raw};
    }
    return out;
}

Result<bool> parseBool(const std::string& key, const std::string& raw) {
    std::string v = raw;
    std::transform(v.begin(), v.end(), v.begin(), ::tolower);
    if (v == "true" || v == "1" || v == "yes" || v == "on") {
        return true;
    }
    if (v == "false" || v == "0" || v == "no" || v == "off") {
        return false;
    }
    return Error{ErrorCode::InvalidArgument, "Invalid boolean value for '" + key + "': " + raw};
}

} // namespace

Result<LexGraphConfig> loadConfig(const std::filesystem::path& configPath) {
    LexGraphConfig cfg;

    ConfigValues values;
    if (!configPath.empty() && std::filesystem::exists(configPath)) {
        values = parse_config_file(configPath);
        spdlog::debug("Loaded {} config values from {}", values.size(), configPath.string());
    } else {
        spdlog::debug("Config file {} not found, using defaults", configPath.string());
    }

    auto get = [&values](const char* key) -> const std::string* {
        auto it = values.find(key);
        return it == values.end() ? nullptr : &it->second;
    };

    if (auto* v = get("ontology.file"); v && !v->empty()) {
        cfg.ontology.file = expand_tilde(*v);
    }
    if (auto* v = get("ontology.namespace"); v && !v->empty()) {
        cfg.ontology.ns = *v;
    }

    struct SizeKey {
        const char* key;
        std::size_t* target;
    };
    const SizeKey sizeKeys[] = {
        {"nlp.pipeline_safe_max_chars", &cfg.nlp.pipelineSafeMaxChars},
        {"nlp.key_terms_max_chars", &cfg.nlp.keyTermsMaxChars},
        {"nlp.key_terms_top_n", &cfg.nlp.keyTermsTopN},
        {"ingest.graph_key_terms", &cfg.ingest.graphKeyTerms},
        {"ingest.search_limit", &cfg.ingest.searchLimit},
    };
    for (const auto& sk : sizeKeys) {
        if (auto* v = get(sk.key)) {
            auto parsed = parseSize(sk.key, *v);
            if (!parsed) {
                return parsed.error();
            }
            *sk.target = parsed.value();
        }
    }

    if (auto* v = get("nlp.enable_pipeline")) {
        auto parsed = parseBool("nlp.enable_pipeline", *v);
        if (!parsed) {
            return parsed.error();
        }
        cfg.nlp.enablePipeline = parsed.value();
    }
    if (auto* v = get("nlp.enable_pos_tagging")) {
        auto parsed = parseBool("nlp.enable_pos_tagging", *v);
        if (!parsed) {
            return parsed.error();
        }
        cfg.nlp.enablePosTagging = parsed.value();
    }
    if (auto* v = get("nlp.lexicon_path"); v && !v->empty()) {
        cfg.nlp.lexiconPath = expand_tilde(*v);
    }
    if (auto* v = get("logging.level"); v && !v->empty()) {
        cfg.logLevel = *v;
    }

    // Environment overrides
    if (const char* env = std::getenv("LEXGRAPH_ONTOLOGY_FILE"); env && *env) {
        cfg.ontology.file = expand_tilde(env);
    }
    if (const char* env = std::getenv("LEXGRAPH_LOG_LEVEL"); env && *env) {
        cfg.logLevel = env;
    }

    return cfg;
}

Result<LexGraphConfig> loadDefaultConfig(const std::string& overridePath) {
    return loadConfig(get_config_path(overridePath));
}

} // namespace lexgraph::config
