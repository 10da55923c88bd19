#pragma once

#include <astkg/core/types.h>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace astkg::query {

// Assertion "fromComponent --relationshipType--> toComponent" made by an answer
struct RelationshipClaim {
    std::string fromComponent;
    std::string toComponent;
    std::string relationshipType;
    std::string description;
    bool verified = false;
};

struct RelevantComponent {
    std::string type; // "method" | "class"
    std::string name;
    std::string signature;
    std::string summary;
    double relevanceScore = 0.8;
};

// Retrieved node considered for the answer context
struct CandidateContext {
    NodeId nodeId;
    std::string type;
    std::string name;
    std::string signature;
    std::string summary;
    std::string details;
    std::vector<std::string> tags;
    double retrievalScore = 0.0;
};

struct RelevantContext {
    CandidateContext candidate;
    double relevanceScore = 0.0;
    std::string reason;
};

struct GeneratedAnswer {
    std::string summary;
    std::vector<RelevantComponent> components;
    std::vector<RelationshipClaim> claims;
    // True when the Answerer failed or its output could not be parsed
    bool degraded = false;
    Metadata metadata;
};

struct QueryResult {
    std::string query;
    std::string summary;
    std::vector<RelevantComponent> components;
    std::vector<RelationshipClaim> claims;
    double confidence = 0.0;
    bool verified = false;
    bool error = false;
    std::string errorMessage;
    std::vector<std::string> verificationErrors;
    Metadata metadata;
};

void to_json(nlohmann::json& j, const RelationshipClaim& c);
void to_json(nlohmann::json& j, const RelevantComponent& c);
void to_json(nlohmann::json& j, const QueryResult& r);

} // namespace astkg::query
