#include <engram/memory/text_analysis.hpp>
#include <engram/core/utils.hpp>
#include <cctype>

namespace engram {

namespace {

const char* STOP_WORDS[] = {
    "the", "a", "an", "and", "or", "but", "in", "on", "at", "to", "for",
    "of", "with", "is", "was", "are", "were", "been", "be", "have", "has",
    "had", "do", "does", "did", "will", "would", "should", "could", "may",
    "might", "must", "can", "this", "that", "these", "those", "i", "you",
    "he", "she", "it", "we", "they", "what", "which", "who", "when", "where",
    "why", "how", "as", "by", "from", "am", "my", "me", "our", "your", "its",
    "their", "his", "her", "not", "also", "just", "into", "about", "than",
    "then", "there", "here", "all", "any", "some", "very", "so", "if", "no",
    "yes", "up", "out", "over", "such", "only", "own", "same", "too", "them",
    "us", "him", "being", "because", "while", "after", "before", "again"
};

const std::set<std::string>& stop_words() {
    static const std::set<std::string> words(
        STOP_WORDS, STOP_WORDS + sizeof(STOP_WORDS) / sizeof(STOP_WORDS[0]));
    return words;
}

bool is_word_byte(unsigned char c) {
    return std::isalnum(c) || c >= 0x80;
}

std::set<std::string> lowered_set(const std::vector<std::string>& v) {
    std::set<std::string> out;
    for (size_t i = 0; i < v.size(); ++i) {
        out.insert(to_lower(v[i]));
    }
    return out;
}

} // anonymous namespace

std::vector<Token> tokenize(const std::string& text) {
    std::vector<Token> tokens;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && !is_word_byte(static_cast<unsigned char>(text[i]))) ++i;
        if (i >= text.size()) break;

        Token tok;
        tok.offset = i;
        while (i < text.size()) {
            unsigned char c = static_cast<unsigned char>(text[i]);
            if (is_word_byte(c)) {
                tok.text += static_cast<char>(c);
                ++i;
            } else if (c == '\'' && i + 1 < text.size() &&
                       is_word_byte(static_cast<unsigned char>(text[i + 1])) && !tok.text.empty()) {
                ++i;  // don't -> dont
            } else {
                break;
            }
        }
        tok.lower = to_lower(tok.text);
        tokens.push_back(tok);
    }
    return tokens;
}

bool is_stop_word(const std::string& lower_word) {
    return stop_words().count(lower_word) > 0;
}

std::set<std::string> extract_numbers(const std::string& text) {
    std::set<std::string> numbers;
    size_t i = 0;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        bool word_start = i == 0 || !std::isalpha(static_cast<unsigned char>(text[i - 1]));
        if (!std::isdigit(c) || !word_start) {
            ++i;
            continue;
        }
        size_t start = i;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) ++i;
        if (i + 1 < text.size() && text[i] == '.' && std::isdigit(static_cast<unsigned char>(text[i + 1]))) {
            ++i;
            while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) ++i;
        }
        // Digits glued to letters ("3d", "mp3") are identifiers, not quantities
        if (i < text.size() && std::isalpha(static_cast<unsigned char>(text[i]))) {
            while (i < text.size() && std::isalnum(static_cast<unsigned char>(text[i]))) ++i;
            continue;
        }

        std::string num = text.substr(start, i - start);
        size_t dot = num.find('.');
        if (dot != std::string::npos) {
            size_t last = num.find_last_not_of('0');
            num = num.substr(0, last + 1);
            if (num[num.size() - 1] == '.') num.erase(num.size() - 1);
        }
        size_t nz = num.find_first_not_of('0');
        if (nz == std::string::npos) {
            num = "0";
        } else if (nz > 0 && num[nz] != '.') {
            num = num.substr(nz);
        }
        numbers.insert(num);
    }
    return numbers;
}

bool contains_phrase(const std::string& text, const std::string& phrase) {
    std::vector<Token> phrase_tokens = tokenize(phrase);
    if (phrase_tokens.empty()) return false;

    std::vector<Token> tokens = tokenize(text);
    if (tokens.size() < phrase_tokens.size()) return false;

    for (size_t i = 0; i + phrase_tokens.size() <= tokens.size(); ++i) {
        bool match = true;
        for (size_t j = 0; j < phrase_tokens.size(); ++j) {
            if (tokens[i + j].lower != phrase_tokens[j].lower) {
                match = false;
                break;
            }
        }
        if (match) return true;
    }
    return false;
}

double jaccard(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    std::set<std::string> sa = lowered_set(a);
    std::set<std::string> sb = lowered_set(b);
    if (sa.empty() && sb.empty()) return 0.0;

    size_t common = 0;
    for (std::set<std::string>::const_iterator it = sa.begin(); it != sa.end(); ++it) {
        if (sb.count(*it)) ++common;
    }
    size_t uni = sa.size() + sb.size() - common;
    return uni == 0 ? 0.0 : static_cast<double>(common) / static_cast<double>(uni);
}

std::vector<std::string> intersection(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    std::set<std::string> sb = lowered_set(b);
    std::set<std::string> seen;
    std::vector<std::string> out;
    for (size_t i = 0; i < a.size(); ++i) {
        std::string lower = to_lower(a[i]);
        if (sb.count(lower) && seen.insert(lower).second) {
            out.push_back(lower);
        }
    }
    return out;
}

} // namespace engram
