#pragma once

#include <astkg/graph/memory_graph_store.h>
#include <astkg/llm/model_interfaces.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace astkg::test {

namespace ids {
inline const std::string AuthPkg = "com.acme.auth";
inline const std::string AuthService = "com.acme.auth.AuthService";
inline const std::string Login = "com.acme.auth.AuthService.login";
inline const std::string Validate = "com.acme.auth.AuthService.validate";
inline const std::string UserRepository = "com.acme.auth.UserRepository";
inline const std::string FindByName = "com.acme.auth.UserRepository.findByName";
inline const std::string InvoiceService = "com.acme.billing.InvoiceService";
inline const std::string Render = "com.acme.billing.InvoiceService.render";
inline const std::string Total = "com.acme.billing.InvoiceService.total";
} // namespace ids

inline graph::GraphNode makeNode(const std::string& id, const std::string& type,
                                 const std::string& name, const std::string& signature = {},
                                 const std::string& summary = {}) {
    graph::GraphNode n;
    n.id = id;
    n.type = type;
    n.labels.insert(type);
    n.properties[graph::prop::Name] = name;
    if (!signature.empty())
        n.properties[graph::prop::Signature] = signature;
    if (!summary.empty())
        n.properties[graph::prop::Summary] = summary;
    return n;
}

inline graph::GraphEdge makeEdge(const std::string& from, const std::string& to,
                                 const std::string& type) {
    return graph::GraphEdge{from, to, type, {}};
}

// Query embedding for "How does login validate credentials?"
// Axes: authentication, credential checking, billing, persistence
inline Embedding loginQueryEmbedding() {
    return {0.8f, 0.6f, 0.0f, 0.0f};
}

/**
 * Small code graph with an authentication corner and an unrelated billing
 * corner:
 *
 *   AuthService -HAS_METHOD-> login -CALLS-> validate -CALLS-> findByName
 *   AuthService -HAS_METHOD-> validate, AuthService -USES-> UserRepository
 *   UserRepository -HAS_METHOD-> findByName
 *   InvoiceService -HAS_METHOD-> render -CALLS-> total, InvoiceService -HAS_METHOD-> total
 */
inline std::shared_ptr<graph::MemoryGraphStore> makeLoginGraph() {
    using graph::node_type::Class;
    using graph::node_type::Interface;
    using graph::node_type::Method;
    using graph::node_type::Package;

    auto store = std::make_shared<graph::MemoryGraphStore>();
    auto add = [&](graph::GraphNode n, Embedding emb) {
        const auto id = n.id;
        if (!store->addNode(std::move(n)))
            throw std::runtime_error("fixture: addNode failed for " + id);
        if (!emb.empty() && !store->setEmbedding(id, std::move(emb)))
            throw std::runtime_error("fixture: setEmbedding failed for " + id);
    };
    auto link = [&](const std::string& from, const std::string& to, const std::string& type) {
        if (!store->addEdge(makeEdge(from, to, type)))
            throw std::runtime_error("fixture: addEdge failed for " + from + " -> " + to);
    };

    add(makeNode(ids::AuthPkg, Package, "com.acme.auth"), {});
    add(makeNode(ids::AuthService, Class, "AuthService", "public class AuthService",
                 "Authenticates users against stored credentials"),
        {0.8f, 0.3f, 0.0f, 0.2f});
    add(makeNode(ids::Login, Method, "login", "boolean login(String user, String password)",
                 "Logs a user in after checking credentials"),
        {0.9f, 0.4f, 0.0f, 0.1f});
    add(makeNode(ids::Validate, Method, "validate", "boolean validate(Credentials credentials)",
                 "Validates user credentials against the repository"),
        {0.6f, 0.8f, 0.0f, 0.1f});
    add(makeNode(ids::UserRepository, Interface, "UserRepository",
                 "public interface UserRepository", "Stores user accounts"),
        {0.3f, 0.2f, 0.0f, 0.9f});
    add(makeNode(ids::FindByName, Method, "findByName", "User findByName(String name)",
                 "Looks up a user by name"),
        {0.2f, 0.3f, 0.0f, 0.9f});
    add(makeNode(ids::InvoiceService, Class, "InvoiceService", "public class InvoiceService",
                 "Produces customer invoices"),
        {0.0f, 0.0f, 1.0f, 0.1f});
    add(makeNode(ids::Render, Method, "render", "byte[] render(Invoice invoice)",
                 "Renders an invoice as PDF"),
        {0.0f, 0.05f, 0.95f, 0.0f});
    add(makeNode(ids::Total, Method, "total", "Money total(Invoice invoice)",
                 "Sums invoice lines"),
        {0.0f, 0.0f, 0.9f, 0.2f});

    link(ids::AuthPkg, ids::AuthService, "CONTAINS");
    link(ids::AuthService, ids::Login, "HAS_METHOD");
    link(ids::AuthService, ids::Validate, "HAS_METHOD");
    link(ids::Login, ids::Validate, "CALLS");
    link(ids::Validate, ids::FindByName, "CALLS");
    link(ids::AuthService, ids::UserRepository, "USES");
    link(ids::UserRepository, ids::FindByName, "HAS_METHOD");
    link(ids::InvoiceService, ids::Render, "HAS_METHOD");
    link(ids::InvoiceService, ids::Total, "HAS_METHOD");
    link(ids::Render, ids::Total, "CALLS");
    return store;
}

// Delegating store whose individual operations can be made to fail or stall
class FaultyGraphStore final : public graph::GraphStore {
public:
    explicit FaultyGraphStore(std::shared_ptr<graph::GraphStore> inner) : inner_(std::move(inner)) {}

    bool throwOnLexical = false;
    bool failVector = false;
    std::chrono::milliseconds lexicalDelay{0};
    std::chrono::milliseconds vectorDelay{0};
    // expand() calls allowed to succeed before every later call fails; -1 = never fail
    int expandFailAfter = -1;
    bool failEdgeExists = false;

    Result<std::vector<search::SearchHit>> lexicalSearch(const search::ExtractedTerms& terms,
                                                         size_t limit) override {
        if (lexicalDelay.count() > 0)
            std::this_thread::sleep_for(lexicalDelay);
        if (throwOnLexical)
            throw std::runtime_error("lexical index unavailable");
        return inner_->lexicalSearch(terms, limit);
    }

    Result<std::vector<search::SearchHit>> vectorSearch(const Embedding& embedding,
                                                        size_t limit) override {
        if (vectorDelay.count() > 0)
            std::this_thread::sleep_for(vectorDelay);
        if (failVector)
            return Error{ErrorCode::NetworkError, "vector index unavailable"};
        return inner_->vectorSearch(embedding, limit);
    }

    Result<graph::SubGraph> expand(const std::vector<NodeId>& seedIds, size_t maxHops, size_t cap,
                                   const std::vector<std::string>& relationshipTypes) override {
        const int call = expandCalls_.fetch_add(1);
        if (expandFailAfter >= 0 && call >= expandFailAfter)
            return Error{ErrorCode::NetworkError, "connection reset during traversal"};
        return inner_->expand(seedIds, maxHops, cap, relationshipTypes);
    }

    Result<bool> edgeExists(const std::string& fromName, const std::string& toName,
                            const std::string& relType) override {
        if (failEdgeExists)
            return Error{ErrorCode::Timeout, "edge check timed out"};
        return inner_->edgeExists(fromName, toName, relType);
    }

    Result<std::optional<graph::GraphNode>> getNode(const NodeId& id) override {
        return inner_->getNode(id);
    }

    Result<std::optional<Embedding>> getNodeEmbedding(const NodeId& id) override {
        return inner_->getNodeEmbedding(id);
    }

    int expandCalls() const { return expandCalls_.load(); }

private:
    std::shared_ptr<graph::GraphStore> inner_;
    std::atomic<int> expandCalls_{0};
};

class FixedEmbeddingModel final : public llm::EmbeddingModel {
public:
    explicit FixedEmbeddingModel(Embedding embedding) : embedding_(std::move(embedding)) {}

    Result<Embedding> embed(const std::string&) override { return embedding_; }

private:
    Embedding embedding_;
};

/**
 * Answerer driven by a callback. Relevance prompts (DISTILL) and answer
 * prompts (GENERATE) are told apart by their opening line so tests can count
 * generate calls separately.
 */
class ScriptedAnswerer final : public llm::Answerer {
public:
    using Responder = std::function<Result<std::string>(const std::string& prompt)>;

    explicit ScriptedAnswerer(Responder answer, Responder relevance = {})
        : answer_(std::move(answer)), relevance_(std::move(relevance)) {}

    Result<std::string> generate(const std::string& prompt) override {
        if (isRelevancePrompt(prompt)) {
            ++relevanceCalls_;
            if (relevance_)
                return relevance_(prompt);
            return std::string(R"({"relevant": true, "relevanceScore": 0.9, "reason": "ok"})");
        }
        {
            std::lock_guard<std::mutex> lk(mutex_);
            answerPrompts_.push_back(prompt);
        }
        ++answerCalls_;
        return answer_(prompt);
    }

    static bool isRelevancePrompt(const std::string& prompt) {
        return prompt.rfind("Decide whether this code context", 0) == 0;
    }

    int answerCalls() const { return answerCalls_.load(); }
    int relevanceCalls() const { return relevanceCalls_.load(); }

    std::vector<std::string> answerPrompts() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return answerPrompts_;
    }

private:
    Responder answer_;
    Responder relevance_;
    std::atomic<int> answerCalls_{0};
    std::atomic<int> relevanceCalls_{0};
    mutable std::mutex mutex_;
    std::vector<std::string> answerPrompts_;
};

// Answer JSON asserting one relationship claim
inline std::string answerWithClaim(const std::string& from, const std::string& to,
                                   const std::string& type) {
    return R"json({"summary": "login delegates credential checks to validate.",
               "components": [{"type": "method", "name": "login",
                               "signature": "boolean login(String user, String password)",
                               "summary": "Entry point", "relevanceScore": 0.95}],
               "relationships": [{"fromComponent": ")json" +
           from + R"(", "toComponent": ")" + to + R"(", "relationshipType": ")" + type +
           R"(", "description": "claimed"}]})";
}

} // namespace astkg::test
