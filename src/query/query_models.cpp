#include <astkg/query/query_models.h>

namespace astkg::query {

void to_json(nlohmann::json& j, const RelationshipClaim& c) {
    j = nlohmann::json{{"fromComponent", c.fromComponent},
                       {"toComponent", c.toComponent},
                       {"relationshipType", c.relationshipType},
                       {"description", c.description},
                       {"verified", c.verified}};
}

void to_json(nlohmann::json& j, const RelevantComponent& c) {
    j = nlohmann::json{{"type", c.type},
                       {"name", c.name},
                       {"signature", c.signature},
                       {"summary", c.summary},
                       {"relevanceScore", c.relevanceScore}};
}

void to_json(nlohmann::json& j, const QueryResult& r) {
    j = nlohmann::json{{"query", r.query},
                       {"summary", r.summary},
                       {"components", r.components},
                       {"relationships", r.claims},
                       {"confidence", r.confidence},
                       {"verified", r.verified},
                       {"verificationErrors", r.verificationErrors},
                       {"metadata", r.metadata}};
    if (r.error) {
        j["error"] = true;
        j["errorMessage"] = r.errorMessage;
    }
}

} // namespace astkg::query
