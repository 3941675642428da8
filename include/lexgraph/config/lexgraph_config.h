#pragma once

#include <lexgraph/core/types.h>

#include <cstddef>
#include <filesystem>
#include <string>

namespace lexgraph::config {

struct OntologyConfig {
    std::filesystem::path file = "data/ontology.owl";
    std::string ns = "http://law.ontology.ru/#";
};

/**
 * Size-safety thresholds and capability switches for the linguistic analyzer.
 * The two thresholds are independent: the pipeline threshold guards the heavy pipeline,
 * the key-terms threshold caps frequency counting.
 */
struct NlpConfig {
    std::size_t pipelineSafeMaxChars = 400'000;
    std::size_t keyTermsMaxChars = 1'500'000;
    bool enablePipeline = true;
    bool enablePosTagging = true;
    std::filesystem::path lexiconPath; // empty: no morphological analyzer
    std::size_t keyTermsTopN = 10;
};

struct IngestConfig {
    std::size_t graphKeyTerms = 20;
    std::size_t searchLimit = 50;
};

struct LexGraphConfig {
    OntologyConfig ontology;
    NlpConfig nlp;
    IngestConfig ingest;
    std::string logLevel = "info";
};

// Resolution order: environment -> config file -> defaults. A missing file is not an error.
Result<LexGraphConfig> loadConfig(const std::filesystem::path& configPath);

// Same as loadConfig(get_config_path(overridePath)).
Result<LexGraphConfig> loadDefaultConfig(const std::string& overridePath = "");

} // namespace lexgraph::config
