/*
 * Engram C++11 - Entity and keyword extraction
 */
#ifndef ENGRAM_PROVIDERS_ENTITY_EXTRACTOR_HPP
#define ENGRAM_PROVIDERS_ENTITY_EXTRACTOR_HPP

#include <engram/core/errors.hpp>
#include <engram/memory/types.hpp>
#include <regex>
#include <string>
#include <vector>

namespace engram {

struct ExtractionResult {
    bool success;
    ErrorCode code;
    std::string error;
    EntityMap entities;
    std::vector<std::string> keywords;

    ExtractionResult() : success(false), code(ErrorCode::NONE) {}

    static ExtractionResult ok(const EntityMap& entities, const std::vector<std::string>& keywords) {
        ExtractionResult r;
        r.success = true;
        r.entities = entities;
        r.keywords = keywords;
        return r;
    }

    static ExtractionResult fail(ErrorCode code, const std::string& err) {
        ExtractionResult r;
        r.code = code;
        r.error = err;
        return r;
    }
};

class EntityExtractor {
public:
    virtual ~EntityExtractor() {}

    virtual std::string extractor_id() const = 0;

    // Empty entity maps and keyword lists are valid results
    virtual ExtractionResult extract(const std::string& text) = 0;
};

// Regex NER for emails, URLs and phone numbers; capitalised phrases are
// classified as person, organization or location by indicator words.
// Keywords are lowercase non-stop-words of three or more letters (plus
// upper-case acronyms such as "AI"), ranked by frequency then first
// occurrence.
class PatternEntityExtractor : public EntityExtractor {
public:
    explicit PatternEntityExtractor(size_t max_keywords = 10);

    std::string extractor_id() const { return "pattern"; }
    ExtractionResult extract(const std::string& text);

    EntityMap extract_entities(const std::string& text) const;
    std::vector<std::string> extract_keywords(const std::string& text) const;

private:
    size_t max_keywords_;
    std::regex email_re_;
    std::regex url_re_;
    std::regex phone_re_;
    std::regex proper_noun_re_;

    std::string classify_phrase(const std::string& phrase) const;
};

} // namespace engram

#endif // ENGRAM_PROVIDERS_ENTITY_EXTRACTOR_HPP
