#pragma once

#include <astkg/llm/model_interfaces.h>

#include <set>
#include <string>

namespace astkg::llm {

/**
 * Offline EntityExtractor based on token shape:
 *  - UpperCamelCase tokens             -> classNames
 *  - lowerCamelCase, foo() or a_b      -> methodNames
 *  - dotted lower-case (com.acme.auth)  -> packageNames
 *  - common code verbs (login, validate) -> methodNames
 *  - remaining non-stopword words       -> freeTerms
 *
 * Intent is guessed from cue words ("where is X used" -> Usage).
 */
class HeuristicEntityExtractor final : public EntityExtractor {
public:
    HeuristicEntityExtractor();

    Result<search::ExtractedTerms> extract(const std::string& query) override;

private:
    std::set<std::string> stopwords_;
};

} // namespace astkg::llm
