#pragma once

#include <lexgraph/config/lexgraph_config.h>
#include <lexgraph/core/types.h>
#include <lexgraph/graph/knowledge_store.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace CLI {
class App;
}

namespace lexgraph::cli {

/**
 * @brief Command line front end: ingest, search, query, pages, laws.
 *
 * Results are printed as JSON on stdout; diagnostics go to the log.
 */
class LexGraphCli {
public:
    LexGraphCli();
    ~LexGraphCli();

    int run(int argc, char* argv[]);

private:
    Result<void> initialize();
    Result<void> openStore();
    Result<void> runIngest();
    Result<void> runSearch();
    Result<void> runQuery();
    Result<void> runPages();
    Result<void> runLaws();

    std::unique_ptr<CLI::App> app_;
    config::LexGraphConfig config_;
    std::unique_ptr<graph::KnowledgeStore> store_;
    std::function<Result<void>()> pending_;

    std::string configPath_;
    std::string ontologyFile_;
    bool verbose_ = false;
    bool replaceExisting_ = false;
    std::vector<std::string> inputFiles_;
    std::string searchTerm_;
    std::string queryText_;
    std::string pdfPath_;
    std::vector<std::string> articleNumbers_;
};

} // namespace lexgraph::cli
