#include <engram/providers/entity_extractor.hpp>
#include <engram/memory/text_analysis.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>
#include <algorithm>
#include <cctype>
#include <map>

namespace engram {

namespace {

const char* PERSON_INDICATORS[] = {
    "mr", "ms", "mrs", "dr", "prof", "ceo", "cto", "founder",
    "author", "engineer", "manager", "director", "president"
};

const char* ORG_INDICATORS[] = {
    "inc", "corp", "ltd", "llc", "company", "organization",
    "university", "institute", "bank", "hospital", "agency"
};

const char* LOCATION_INDICATORS[] = {
    "city", "town", "state", "country", "region", "province",
    "district", "avenue", "street", "road", "boulevard"
};

template <size_t N>
bool word_in(const std::string& word, const char* (&list)[N]) {
    for (size_t i = 0; i < N; ++i) {
        if (word == list[i]) return true;
    }
    return false;
}

// "TechCorp", "Citibank": an indicator fused onto a longer name
template <size_t N>
bool word_ends_with(const std::string& word, const char* (&list)[N]) {
    for (size_t i = 0; i < N; ++i) {
        std::string suffix(list[i]);
        if (word.size() > suffix.size() + 1 &&
            word.compare(word.size() - suffix.size(), suffix.size(), suffix) == 0) {
            return true;
        }
    }
    return false;
}

struct KeywordStat {
    std::string word;
    size_t first;
    int count;
};

bool keyword_before(const KeywordStat& a, const KeywordStat& b) {
    if (a.count != b.count) return a.count > b.count;
    return a.first < b.first;
}

bool is_acronym(const std::string& word) {
    if (word.size() < 2 || word.size() > 5) return false;
    for (size_t i = 0; i < word.size(); ++i) {
        if (!std::isupper(static_cast<unsigned char>(word[i]))) return false;
    }
    return true;
}

bool all_alpha(const std::string& word) {
    for (size_t i = 0; i < word.size(); ++i) {
        if (!std::isalpha(static_cast<unsigned char>(word[i]))) return false;
    }
    return true;
}

// std::regex matching recurses per character; bound what it sees
const size_t MAX_REGEX_INPUT = 8192;
const size_t MAX_REGEX_TOKEN = 512;

// Prefix of text with whitespace-free runs longer than MAX_REGEX_TOKEN blanked
std::string regex_safe_input(const std::string& text) {
    std::string out = text.size() > MAX_REGEX_INPUT ? text.substr(0, MAX_REGEX_INPUT) : text;
    size_t i = 0;
    while (i < out.size()) {
        if (std::isspace(static_cast<unsigned char>(out[i]))) { ++i; continue; }
        size_t start = i;
        while (i < out.size() && !std::isspace(static_cast<unsigned char>(out[i]))) ++i;
        if (i - start > MAX_REGEX_TOKEN) {
            out.replace(start, i - start, i - start, ' ');
        }
    }
    return out;
}

} // anonymous namespace

PatternEntityExtractor::PatternEntityExtractor(size_t max_keywords)
    : max_keywords_(max_keywords > 0 ? max_keywords : 10)
    , email_re_("[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\\.[A-Za-z]{2,}")
    , url_re_("https?://[^\\s<>\"')]+")
    , phone_re_("(\\+?1[-. ]?)?\\(?([0-9]{3})\\)?[-. ]?([0-9]{3})[-. ]?([0-9]{4})\\b")
    , proper_noun_re_("\\b[A-Z][A-Za-z0-9&]+(?:[ \\t]+[A-Z][A-Za-z0-9&]+)*\\b")
{
}

ExtractionResult PatternEntityExtractor::extract(const std::string& text) {
    try {
        return ExtractionResult::ok(extract_entities(text), extract_keywords(text));
    } catch (const std::regex_error& e) {
        // libstdc++ raises error_complexity/error_stack on pathological input
        LOG_WARN("[Extract] regex failure: %s", e.what());
        return ExtractionResult::fail(ErrorCode::EXTERNAL_FAILURE,
                                      std::string("entity extraction failed: ") + e.what());
    }
}

std::string PatternEntityExtractor::classify_phrase(const std::string& phrase) const {
    std::vector<Token> words = tokenize(phrase);
    for (size_t i = 0; i < words.size(); ++i) {
        if (word_in(words[i].lower, PERSON_INDICATORS)) return entity_category::PERSON;
    }
    for (size_t i = 0; i < words.size(); ++i) {
        if (word_in(words[i].lower, ORG_INDICATORS) || word_ends_with(words[i].lower, ORG_INDICATORS)) {
            return entity_category::ORGANIZATION;
        }
    }
    for (size_t i = 0; i < words.size(); ++i) {
        if (word_in(words[i].lower, LOCATION_INDICATORS)) return entity_category::LOCATION;
    }
    return "";
}

EntityMap PatternEntityExtractor::extract_entities(const std::string& input) const {
    EntityMap entities;
    const std::string text = regex_safe_input(input);

    std::sregex_iterator end;
    for (std::sregex_iterator it(text.begin(), text.end(), email_re_); it != end; ++it) {
        entities[entity_category::EMAIL].insert(to_lower(it->str()));
    }

    for (std::sregex_iterator it(text.begin(), text.end(), url_re_); it != end; ++it) {
        std::string url = it->str();
        while (!url.empty() && (url[url.size() - 1] == '.' || url[url.size() - 1] == ',')) {
            url.erase(url.size() - 1);
        }
        entities[entity_category::URL].insert(url);
    }
    std::string without_urls = std::regex_replace(text, url_re_, " ");

    for (std::sregex_iterator it(without_urls.begin(), without_urls.end(), phone_re_); it != end; ++it) {
        // Digits only, country prefix dropped
        entities[entity_category::PHONE].insert((*it)[2].str() + (*it)[3].str() + (*it)[4].str());
    }

    for (std::sregex_iterator it(without_urls.begin(), without_urls.end(), proper_noun_re_); it != end; ++it) {
        std::string phrase = it->str();
        std::string category = classify_phrase(phrase);
        if (!category.empty()) {
            entities[category].insert(phrase);
        }
    }
    return entities;
}

std::vector<std::string> PatternEntityExtractor::extract_keywords(const std::string& text) const {
    std::vector<Token> tokens = tokenize(text);
    std::map<std::string, size_t> slot;
    std::vector<KeywordStat> stats;

    for (size_t i = 0; i < tokens.size(); ++i) {
        const Token& tok = tokens[i];
        bool eligible = (tok.text.size() >= 3 && all_alpha(tok.text)) || is_acronym(tok.text);
        if (!eligible || is_stop_word(tok.lower)) continue;

        std::map<std::string, size_t>::iterator found = slot.find(tok.lower);
        if (found != slot.end()) {
            stats[found->second].count++;
            continue;
        }
        KeywordStat s;
        s.word = tok.lower;
        s.first = i;
        s.count = 1;
        slot[tok.lower] = stats.size();
        stats.push_back(s);
    }

    std::stable_sort(stats.begin(), stats.end(), keyword_before);

    std::vector<std::string> keywords;
    for (size_t i = 0; i < stats.size() && keywords.size() < max_keywords_; ++i) {
        keywords.push_back(stats[i].word);
    }
    return keywords;
}

} // namespace engram
