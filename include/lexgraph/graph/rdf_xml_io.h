#pragma once

#include <lexgraph/core/types.h>
#include <lexgraph/graph/graph_query.h>
#include <lexgraph/graph/triple_store.h>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace lexgraph::graph {

/**
 * @brief Serialize the store as RDF/XML, one rdf:Description per subject in first-seen
 * order. Predicates are written as qualified names using prefixes; unknown namespaces get
 * generated prefixes.
 */
Result<std::string> serializeRdfXml(const TripleStore& store, const PrefixMap& prefixes);

// Overwrites path wholesale
Result<void> writeRdfXmlFile(const TripleStore& store, const std::filesystem::path& path,
                             const PrefixMap& prefixes);

/**
 * @brief Parse RDF/XML into a fresh store.
 *
 * Raw control bytes, bare '&' and invalid UTF-8 are rejected before the XML parser runs.
 * Every failure is MalformedPersistedGraph.
 */
Result<TripleStore> parseRdfXml(std::string_view content);

/**
 * @brief Repair common corruption in extracted text: drop control bytes other than TAB,
 * LF and CR, replace invalid UTF-8 with U+FFFD, escape '&' that does not start an entity.
 */
std::string sanitizeRdfXml(std::string_view raw);

// "<stem>.sanitized<ext>" beside the original
std::filesystem::path sanitizedCopyPath(const std::filesystem::path& path);

struct RdfXmlLoadReport {
    std::filesystem::path loadedFrom;
    bool sanitized = false;
    std::size_t tripleCount = 0;
};

/**
 * @brief Load a graph file, falling back to a sanitized copy when the original is malformed
 * @return MalformedPersistedGraph only if the sanitized copy fails as well
 */
Result<RdfXmlLoadReport> loadRdfXmlFile(const std::filesystem::path& path, TripleStore& store);

} // namespace lexgraph::graph
