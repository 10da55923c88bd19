#include <gtest/gtest.h>

#include <astkg/graph/graph_loader.h>

#include <filesystem>
#include <fstream>

using namespace astkg;
using namespace astkg::graph;
namespace fs = std::filesystem;

namespace {

const char* kSnapshot = R"json({
  "nodes": [
    {"id": "com.acme.Auth", "type": "Class", "labels": ["Public"],
     "properties": {"name": "Auth", "isAbstract": false, "summary": "auth entry"},
     "embedding": [0.1, 0.2, 0.3]},
    {"id": "com.acme.Auth.login", "type": "Method",
     "properties": {"name": "login", "signature": "void login()"}}
  ],
  "edges": [
    {"from": "com.acme.Auth", "to": "com.acme.Auth.login", "type": "HAS_METHOD"},
    {"from": "com.acme.Auth", "to": "com.acme.Missing", "type": "USES"}
  ]
})json";

} // namespace

TEST(GraphLoaderTest, LoadsNodesEdgesAndEmbeddings) {
    MemoryGraphStore store;
    auto stats = loadGraphJson(nlohmann::json::parse(kSnapshot), store);
    ASSERT_TRUE(stats) << stats.error().message;
    EXPECT_EQ(stats.value().nodes, 2u);
    EXPECT_EQ(stats.value().edges, 1u);
    EXPECT_EQ(stats.value().embeddings, 1u);
    EXPECT_EQ(stats.value().rejectedEdges, 1u);

    auto node = store.getNode("com.acme.Auth");
    ASSERT_TRUE(node);
    ASSERT_TRUE(node.value().has_value());
    EXPECT_TRUE(node.value()->hasLabel("Public"));
    EXPECT_TRUE(node.value()->hasLabel("Class"));
    EXPECT_EQ(node.value()->property(prop::IsAbstract), "false");

    EXPECT_TRUE(store.edgeExists("Auth", "login", "HAS_METHOD").value());
    auto emb = store.getNodeEmbedding("com.acme.Auth");
    ASSERT_TRUE(emb);
    ASSERT_TRUE(emb.value().has_value());
    EXPECT_EQ(emb.value()->size(), 3u);
}

TEST(GraphLoaderTest, NodeWithoutIdFailsTheLoad) {
    MemoryGraphStore store;
    auto doc = nlohmann::json::parse(R"({"nodes": [{"type": "Class"}]})");
    auto stats = loadGraphJson(doc, store);
    ASSERT_FALSE(stats);
    EXPECT_EQ(stats.error().code, ErrorCode::InvalidData);
}

TEST(GraphLoaderTest, FileErrors) {
    auto missing = loadGraphFile("/nonexistent/astkg/graph.json");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);

    auto path = fs::temp_directory_path() / "astkg_loader_test_bad.json";
    {
        std::ofstream out(path);
        out << "{ \"nodes\": [ ";
    }
    auto bad = loadGraphFile(path);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::ParseError);
    std::error_code ec;
    fs::remove(path, ec);
}

TEST(GraphLoaderTest, LoadsFromFile) {
    auto path = fs::temp_directory_path() / "astkg_loader_test_ok.json";
    {
        std::ofstream out(path);
        out << kSnapshot;
    }
    auto store = loadGraphFile(path);
    ASSERT_TRUE(store) << store.error().message;
    EXPECT_EQ(store.value()->nodeCount(), 2u);
    EXPECT_EQ(store.value()->edgeCount(), 1u);
    std::error_code ec;
    fs::remove(path, ec);
}
