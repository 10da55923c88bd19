#include <astkg/llm/heuristic_entity_extractor.h>

#include <astkg/common/text_utils.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <vector>

namespace astkg::llm {

namespace {

const std::set<std::string> kCodeVerbs = {
    "login",     "logout",  "validate", "create",   "update",   "delete",  "remove",
    "save",      "load",    "fetch",    "find",     "process",  "handle",  "parse",
    "send",      "build",   "register", "authenticate", "authorize", "verify", "compute",
    "calculate", "execute", "connect",  "refresh",  "reset",    "encode",  "decode",
    "serialize", "deserialize", "initialize", "publish", "subscribe", "schedule", "retry",
};

bool isUpperCamel(const std::string& t) {
    if (t.size() < 2 || !std::isupper(static_cast<unsigned char>(t[0])))
        return false;
    return std::any_of(t.begin() + 1, t.end(),
                       [](unsigned char c) { return std::islower(c); });
}

bool isLowerCamel(const std::string& t) {
    if (t.empty() || !std::islower(static_cast<unsigned char>(t[0])))
        return false;
    return std::any_of(t.begin(), t.end(), [](unsigned char c) { return std::isupper(c); });
}

void pushUnique(std::vector<std::string>& v, const std::string& s) {
    if (std::find(v.begin(), v.end(), s) == v.end())
        v.push_back(s);
}

search::QueryIntent guessIntent(const std::vector<std::string>& lowered) {
    auto has = [&](std::initializer_list<const char*> cues) {
        for (const auto* cue : cues) {
            if (std::find(lowered.begin(), lowered.end(), cue) != lowered.end())
                return true;
        }
        return false;
    };
    if (has({"used", "uses", "usage", "calls", "callers", "invoked", "references"}))
        return search::QueryIntent::Usage;
    if (has({"config", "configured", "configuration", "property", "properties", "setting",
             "settings"}))
        return search::QueryIntent::Configuration;
    if (has({"status", "state", "states", "phase", "lifecycle"}))
        return search::QueryIntent::Status;
    if (has({"list", "which", "all", "overview", "services", "controllers"}))
        return search::QueryIntent::Discovery;
    if (has({"how", "implement", "implemented", "implementation", "logic", "work", "works"}))
        return search::QueryIntent::Implementation;
    return search::QueryIntent::Unknown;
}

} // namespace

HeuristicEntityExtractor::HeuristicEntityExtractor()
    : stopwords_{"a",    "an",   "the",   "is",    "are",  "was",   "be",    "to",   "of",
                 "in",   "on",   "for",   "and",   "or",   "how",   "what",  "where", "which",
                 "who",  "why",  "when",  "does",  "do",   "did",   "can",   "it",   "its",
                 "this", "that", "these", "those", "with", "from",  "by",    "as",   "at",
                 "me",   "i",    "we",    "you",   "my",   "our",   "there", "all",  "any",
                 "used", "uses", "use",   "show",  "tell", "explain", "list", "get", "set"} {}

Result<search::ExtractedTerms> HeuristicEntityExtractor::extract(const std::string& query) {
    if (common::trim(query).empty()) {
        return Error{ErrorCode::InvalidArgument, "query is empty"};
    }

    search::ExtractedTerms terms;
    std::vector<std::string> lowered;
    std::string token;
    auto flush = [&]() {
        // Trailing punctuation and call parens are not part of the identifier
        bool call = false;
        while (!token.empty() && (token.back() == '.' || token.back() == ')' ||
                                  token.back() == '(' || token.back() == ',')) {
            call = call || token.back() == ')' || token.back() == '(';
            token.pop_back();
        }
        if (token.empty())
            return;
        const auto lower = common::to_lower(token);
        lowered.push_back(lower);
        // A capitalized first word is sentence case, not a type name
        const bool sentenceStart = lowered.size() == 1 &&
                                   std::count_if(token.begin(), token.end(), [](unsigned char ch) {
                                       return std::isupper(ch);
                                   }) == 1;

        if (stopwords_.count(lower)) {
            // skip
        } else if (token.find('.') != std::string::npos && lower == token) {
            pushUnique(terms.packageNames, token);
        } else if (isUpperCamel(token) && !sentenceStart) {
            pushUnique(terms.classNames, token);
        } else if (call || isLowerCamel(token) || token.find('_') != std::string::npos) {
            pushUnique(terms.methodNames, token);
        } else if (kCodeVerbs.count(lower)) {
            pushUnique(terms.methodNames, lower);
        } else if (lower.size() > 2) {
            pushUnique(terms.freeTerms, lower);
        }
        token.clear();
    };

    for (char c : query) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '_' || c == '.' || c == '(' || c == ')') {
            token.push_back(c);
        } else {
            flush();
        }
    }
    flush();

    terms.intent = guessIntent(lowered);
    spdlog::debug("[EntityExtractor] classes={} methods={} packages={} terms={} intent={}",
                  terms.classNames.size(), terms.methodNames.size(), terms.packageNames.size(),
                  terms.freeTerms.size(), search::toString(terms.intent));
    return terms;
}

} // namespace astkg::llm
