#pragma once

#include <astkg/core/types.h>

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace astkg::search {

enum class SearchSignal { Lexical, Vector };

enum class MatchKind { Exact, Prefix, Wildcard, Fuzzy, Semantic };

enum class QueryIntent { Unknown, Implementation, Usage, Configuration, Discovery, Status };

const char* toString(SearchSignal signal) noexcept;
const char* toString(MatchKind kind) noexcept;
const char* toString(QueryIntent intent) noexcept;
QueryIntent parseIntent(std::string_view s) noexcept;

/**
 * One hit from a single search branch. Scores are in [0, 1] for vector hits;
 * lexical scores may exceed 1 for stores that return raw relevance and are
 * normalized by the ResultCombiner.
 */
struct SearchHit {
    NodeId nodeId;
    double score = 0.0;
    SearchSignal signal = SearchSignal::Lexical;
    MatchKind matchKind = MatchKind::Exact;
    std::string name;
    std::string signature;
    std::string nodeType;
};

struct RankedResult {
    NodeId nodeId;
    double lexicalScore = 0.0;
    double vectorScore = 0.0;
    double combinedScore = 0.0;
    bool foundByLexical = false;
    bool foundByVector = false;
    std::string name;
    std::string signature;
    std::string nodeType;

    // Descending by combinedScore; ties broken by nodeId ascending
    bool operator<(const RankedResult& other) const {
        if (combinedScore != other.combinedScore)
            return combinedScore > other.combinedScore;
        return nodeId < other.nodeId;
    }
};

// Structured terms pulled out of the raw question
struct ExtractedTerms {
    std::vector<std::string> classNames;
    std::vector<std::string> methodNames;
    std::vector<std::string> packageNames;
    std::vector<std::string> freeTerms;
    QueryIntent intent = QueryIntent::Unknown;

    bool empty() const {
        return classNames.empty() && methodNames.empty() && packageNames.empty() &&
               freeTerms.empty();
    }

    // Every term, identifiers first
    std::vector<std::string> allTerms() const;
};

enum class BranchStatus { Ok, Failed, Timeout, Skipped };

const char* toString(BranchStatus status) noexcept;

struct BranchStats {
    BranchStatus status = BranchStatus::Skipped;
    size_t hits = 0;
    std::chrono::milliseconds latency{0};
    std::string error;
};

struct ParallelSearchResult {
    std::vector<SearchHit> lexicalHits;
    std::vector<SearchHit> vectorHits;
    BranchStats lexical;
    BranchStats vector;
};

} // namespace astkg::search
