#include <astkg/search/search_types.h>

#include <astkg/common/text_utils.h>

namespace astkg::search {

const char* toString(SearchSignal signal) noexcept {
    switch (signal) {
        case SearchSignal::Lexical:
            return "lexical";
        case SearchSignal::Vector:
            return "vector";
    }
    return "unknown";
}

const char* toString(MatchKind kind) noexcept {
    switch (kind) {
        case MatchKind::Exact:
            return "exact";
        case MatchKind::Prefix:
            return "prefix";
        case MatchKind::Wildcard:
            return "wildcard";
        case MatchKind::Fuzzy:
            return "fuzzy";
        case MatchKind::Semantic:
            return "semantic";
    }
    return "unknown";
}

const char* toString(QueryIntent intent) noexcept {
    switch (intent) {
        case QueryIntent::Unknown:
            return "unknown";
        case QueryIntent::Implementation:
            return "implementation";
        case QueryIntent::Usage:
            return "usage";
        case QueryIntent::Configuration:
            return "configuration";
        case QueryIntent::Discovery:
            return "discovery";
        case QueryIntent::Status:
            return "status";
    }
    return "unknown";
}

QueryIntent parseIntent(std::string_view s) noexcept {
    const auto lower = common::to_lower(s);
    if (lower == "implementation")
        return QueryIntent::Implementation;
    if (lower == "usage")
        return QueryIntent::Usage;
    if (lower == "configuration")
        return QueryIntent::Configuration;
    if (lower == "discovery")
        return QueryIntent::Discovery;
    if (lower == "status")
        return QueryIntent::Status;
    return QueryIntent::Unknown;
}

const char* toString(BranchStatus status) noexcept {
    switch (status) {
        case BranchStatus::Ok:
            return "ok";
        case BranchStatus::Failed:
            return "failed";
        case BranchStatus::Timeout:
            return "timeout";
        case BranchStatus::Skipped:
            return "skipped";
    }
    return "unknown";
}

std::vector<std::string> ExtractedTerms::allTerms() const {
    std::vector<std::string> out;
    out.reserve(classNames.size() + methodNames.size() + packageNames.size() + freeTerms.size());
    out.insert(out.end(), classNames.begin(), classNames.end());
    out.insert(out.end(), methodNames.begin(), methodNames.end());
    out.insert(out.end(), packageNames.begin(), packageNames.end());
    out.insert(out.end(), freeTerms.begin(), freeTerms.end());
    return out;
}

} // namespace astkg::search
