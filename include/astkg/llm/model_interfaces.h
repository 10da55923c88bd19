#pragma once

#include <astkg/core/types.h>
#include <astkg/search/search_types.h>

#include <string>

namespace astkg::llm {

// Pulls structured identifiers and keywords out of a natural-language question
class EntityExtractor {
public:
    virtual ~EntityExtractor() = default;
    virtual Result<search::ExtractedTerms> extract(const std::string& query) = 0;
};

class EmbeddingModel {
public:
    virtual ~EmbeddingModel() = default;
    virtual Result<Embedding> embed(const std::string& text) = 0;
};

// Text completion; output is opaque and parsed by the caller
class Answerer {
public:
    virtual ~Answerer() = default;
    virtual Result<std::string> generate(const std::string& prompt) = 0;
};

} // namespace astkg::llm
