#include <gtest/gtest.h>
#include <lexgraph/graph/rdf_xml_io.h>

#include <set>

#include "support/temp_dir_scope.hpp"

using namespace lexgraph;
using namespace lexgraph::graph;
using lexgraph::test_support::TempDirScope;

namespace {

const std::string kNs = "http://law.test/#";

std::string graphFile(const std::string& text) {
    return "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
           "<rdf:RDF xmlns:rdf=\"http://www.w3.org/1999/02/22-rdf-syntax-ns#\"\n"
           "         xmlns:law=\"http://law.test/#\">\n"
           "  <rdf:Description rdf:about=\"http://law.test/#law_1_article_1\">\n"
           "    <rdf:type rdf:resource=\"http://law.test/#Article\"/>\n"
           "    <law:hasNumber>1</law:hasNumber>\n"
           "    <law:hasText xml:lang=\"ru\">" +
           text +
           "</law:hasText>\n"
           "  </rdf:Description>\n"
           "</rdf:RDF>\n";
}

std::set<Triple> asSet(const TripleStore& store) {
    return std::set<Triple>(store.triples().begin(), store.triples().end());
}

} // namespace

TEST(RdfXmlIoTest, ParsesDescriptionsAndLiterals) {
    auto parsed = parseRdfXml(graphFile("Текст A &amp; B"));
    ASSERT_TRUE(parsed) << parsed.error().message;
    const auto& store = parsed.value();
    ASSERT_EQ(store.size(), 3u);

    auto text = store.match(std::nullopt, RdfTerm::iri(kNs + "hasText"), std::nullopt);
    ASSERT_EQ(text.size(), 1u);
    EXPECT_EQ(text[0]->object.value, "Текст A & B");
    EXPECT_EQ(text[0]->object.language, "ru");
    EXPECT_TRUE(store.contains({RdfTerm::iri(kNs + "law_1_article_1"),
                                RdfTerm::iri(vocab::rdfType()), RdfTerm::iri(kNs + "Article")}));
}

TEST(RdfXmlIoTest, TypedNodesNestedNodesAndParseTypeResource) {
    const std::string xml = R"(<?xml version="1.0"?>
<rdf:RDF xmlns:rdf="http://www.w3.org/1999/02/22-rdf-syntax-ns#" xmlns:law="http://law.test/#"
         xml:lang="ru">
  <law:Law rdf:about="http://law.test/#law_1" law:hasTitle="Закон">
    <law:hasDate rdf:datatype="http://www.w3.org/2001/XMLSchema#date">2020-01-01</law:hasDate>
    <law:containsChapter>
      <law:Chapter rdf:about="http://law.test/#law_1_chapter_1"/>
    </law:containsChapter>
    <law:note rdf:parseType="Resource">
      <law:hasText>примечание</law:hasText>
    </law:note>
  </law:Law>
</rdf:RDF>)";
    auto parsed = parseRdfXml(xml);
    ASSERT_TRUE(parsed) << parsed.error().message;
    const auto& store = parsed.value();

    const RdfTerm law = RdfTerm::iri(kNs + "law_1");
    EXPECT_TRUE(store.contains({law, RdfTerm::iri(vocab::rdfType()), RdfTerm::iri(kNs + "Law")}));
    EXPECT_TRUE(store.contains({law, RdfTerm::iri(kNs + "hasTitle"), RdfTerm::literal("Закон", "ru")}));
    EXPECT_TRUE(store.contains({law, RdfTerm::iri(kNs + "hasDate"),
                                RdfTerm::literal("2020-01-01", {}, vocab::xsdDate())}));
    EXPECT_TRUE(store.contains({law, RdfTerm::iri(kNs + "containsChapter"),
                                RdfTerm::iri(kNs + "law_1_chapter_1")}));

    auto note = store.match(law, RdfTerm::iri(kNs + "note"), std::nullopt);
    ASSERT_EQ(note.size(), 1u);
    EXPECT_EQ(note[0]->object.value.rfind("_:", 0), 0u);
    EXPECT_EQ(store.match(note[0]->object, std::nullopt, std::nullopt).size(), 1u);
}

TEST(RdfXmlIoTest, RejectsCorruptInput) {
    std::string withNul = graphFile("Текст");
    withNul.insert(withNul.find("Текст"), 1, '\0');
    for (const auto& bad : {withNul, graphFile("A & B"), graphFile("bad \xFF byte"),
                            std::string("<rdf:RDF>")}) {
        auto parsed = parseRdfXml(bad);
        ASSERT_FALSE(parsed);
        EXPECT_EQ(parsed.error().code, ErrorCode::MalformedPersistedGraph);
    }
}

TEST(RdfXmlIoTest, SanitizeRepairsControlBytesAmpersandsAndEncoding) {
    std::string raw = "a\x01" "b & c &amp; d &#38; e \xFF";
    EXPECT_EQ(sanitizeRdfXml(raw), "ab &amp; c &amp; d &#38; e \xEF\xBF\xBD");
    EXPECT_EQ(sanitizedCopyPath("/data/ontology.owl"),
              std::filesystem::path("/data/ontology.sanitized.owl"));
}

TEST(RdfXmlIoTest, CorruptFileLoadsThroughSanitizedCopy) {
    TempDirScope dir = TempDirScope::unique_under("lexgraph_rdfxml");

    std::string corrupt = graphFile("Текст A & B");
    corrupt.insert(corrupt.find("Текст"), 1, '\0');
    auto corruptPath = dir.write("ontology.owl", corrupt);
    auto cleanPath = dir.write("clean.owl", graphFile("Текст A &amp; B"));

    TripleStore repaired;
    auto report = loadRdfXmlFile(corruptPath, repaired);
    ASSERT_TRUE(report) << report.error().message;
    EXPECT_TRUE(report.value().sanitized);
    EXPECT_EQ(report.value().loadedFrom, dir.path() / "ontology.sanitized.owl");
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "ontology.sanitized.owl"));
    EXPECT_EQ(report.value().tripleCount, 3u);

    TripleStore clean;
    auto cleanReport = loadRdfXmlFile(cleanPath, clean);
    ASSERT_TRUE(cleanReport);
    EXPECT_FALSE(cleanReport.value().sanitized);
    EXPECT_EQ(asSet(repaired), asSet(clean));
}

TEST(RdfXmlIoTest, UnrepairableFileIsReported) {
    TempDirScope dir = TempDirScope::unique_under("lexgraph_rdfxml");
    auto path = dir.write("ontology.owl", "<rdf:RDF><unclosed>");
    TripleStore store;
    auto report = loadRdfXmlFile(path, store);
    ASSERT_FALSE(report);
    EXPECT_EQ(report.error().code, ErrorCode::MalformedPersistedGraph);
}

TEST(RdfXmlIoTest, WrittenGraphReadsBackIdentically) {
    TripleStore store;
    const RdfTerm article = RdfTerm::iri(kNs + "law_1_article_1");
    store.add({article, RdfTerm::iri(vocab::rdfType()), RdfTerm::iri(kNs + "Article")});
    store.add({article, RdfTerm::iri(kNs + "hasText"),
               RdfTerm::literal("«Кавычки» <теги> & амперсанд", "ru")});
    store.add({article, RdfTerm::iri(kNs + "hasPage"), RdfTerm::literal("12", {}, vocab::xsdInteger())});
    store.add({article, RdfTerm::iri("http://other.test/vocab/seeAlso"), RdfTerm::iri("_:n1")});
    store.add({RdfTerm::iri("_:n1"), RdfTerm::iri(kNs + "hasNumber"), RdfTerm::literal("7")});

    TempDirScope dir = TempDirScope::unique_under("lexgraph_rdfxml");
    auto path = dir.path() / "nested" / "graph.owl";
    ASSERT_TRUE(writeRdfXmlFile(store, path, {{"law", kNs}}));

    TripleStore loaded;
    auto report = loadRdfXmlFile(path, loaded);
    ASSERT_TRUE(report) << report.error().message;
    EXPECT_FALSE(report.value().sanitized);
    EXPECT_EQ(asSet(loaded), asSet(store));
}

TEST(RdfXmlIoTest, UnserializablePredicateIsAnError) {
    TripleStore store;
    store.add({RdfTerm::iri(kNs + "a"), RdfTerm::iri(kNs + "1bad"), RdfTerm::literal("x")});
    auto xml = serializeRdfXml(store, {{"law", kNs}});
    ASSERT_FALSE(xml);
    EXPECT_EQ(xml.error().code, ErrorCode::InvalidData);
}
