/*
 * Engram C++11 - Text helpers shared by extraction, embedding and
 * relationship classification
 */
#ifndef ENGRAM_MEMORY_TEXT_ANALYSIS_HPP
#define ENGRAM_MEMORY_TEXT_ANALYSIS_HPP

#include <set>
#include <string>
#include <vector>

namespace engram {

struct Token {
    std::string text;       // as written
    std::string lower;
    size_t offset;

    Token() : offset(0) {}
};

// Runs of ASCII letters/digits (apostrophes inside a word are dropped).
// Non-ASCII bytes are treated as letters so UTF-8 words stay whole.
std::vector<Token> tokenize(const std::string& text);

bool is_stop_word(const std::string& lower_word);

// Decimal numbers as written ("3", "2.5"), with trailing ".0" forms collapsed
std::set<std::string> extract_numbers(const std::string& text);

// Case-insensitive whole-word/phrase match on token boundaries
bool contains_phrase(const std::string& text, const std::string& phrase);

// Intersection over union, case-insensitive; 0 when both are empty
double jaccard(const std::vector<std::string>& a, const std::vector<std::string>& b);

std::vector<std::string> intersection(const std::vector<std::string>& a, const std::vector<std::string>& b);

} // namespace engram

#endif // ENGRAM_MEMORY_TEXT_ANALYSIS_HPP
