#include <engram/memory/chunker.hpp>
#include <engram/core/utils.hpp>
#include <cctype>

namespace engram {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_closing(char c) {
    return c == '"' || c == '\'' || c == ')' || c == ']';
}

// Joins the lines of a paragraph with single spaces
std::string unwrap(const std::string& paragraph) {
    std::string out;
    bool pending_space = false;
    for (size_t i = 0; i < paragraph.size(); ++i) {
        char c = paragraph[i];
        if (is_space(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out += c;
    }
    return out;
}

} // anonymous namespace

TextChunker::TextChunker(const ChunkingConfig& config)
    : max_chars_(config.max_chars > 0 ? static_cast<size_t>(config.max_chars) : 500)
{
}

std::string TextChunker::normalize_line_endings(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            out += '\n';
            if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
        } else {
            out += text[i];
        }
    }
    return out;
}

std::vector<std::string> TextChunker::split_paragraphs(const std::string& text) {
    std::vector<std::string> paragraphs;
    std::vector<std::string> lines = split(normalize_line_endings(text), '\n');
    std::string current;

    for (size_t i = 0; i < lines.size(); ++i) {
        if (trim(lines[i]).empty()) {
            if (!trim(current).empty()) {
                paragraphs.push_back(unwrap(current));
            }
            current.clear();
            continue;
        }
        if (!current.empty()) current += '\n';
        current += lines[i];
    }
    if (!trim(current).empty()) {
        paragraphs.push_back(unwrap(current));
    }
    return paragraphs;
}

std::vector<std::string> TextChunker::split_sentences(const std::string& paragraph) {
    std::vector<std::string> sentences;
    size_t start = 0;
    size_t i = 0;
    while (i < paragraph.size()) {
        char c = paragraph[i];
        if (c == '.' || c == '!' || c == '?') {
            size_t end = i + 1;
            while (end < paragraph.size() &&
                   (paragraph[end] == '.' || paragraph[end] == '!' || paragraph[end] == '?' ||
                    is_closing(paragraph[end]))) {
                ++end;
            }
            if (end >= paragraph.size() || is_space(paragraph[end])) {
                std::string sentence = trim(paragraph.substr(start, end - start));
                if (!sentence.empty()) sentences.push_back(sentence);
                start = end;
                i = end;
                continue;
            }
            i = end;
            continue;
        }
        ++i;
    }
    std::string tail = trim(paragraph.substr(start < paragraph.size() ? start : paragraph.size()));
    if (!tail.empty()) sentences.push_back(tail);
    return sentences;
}

void TextChunker::split_long_sentence(const std::string& sentence, std::vector<std::string>& out) const {
    size_t pos = 0;
    while (pos < sentence.size()) {
        while (pos < sentence.size() && is_space(sentence[pos])) ++pos;
        if (pos >= sentence.size()) break;

        if (sentence.size() - pos <= max_chars_) {
            out.push_back(sentence.substr(pos));
            break;
        }

        size_t cut = sentence.rfind(' ', pos + max_chars_);
        if (cut == std::string::npos || cut <= pos) {
            // One word longer than the limit: hard cut
            cut = pos + max_chars_;
        }
        out.push_back(trim(sentence.substr(pos, cut - pos)));
        pos = cut;
    }
}

std::vector<std::string> TextChunker::chunk(const std::string& text) const {
    std::vector<std::string> chunks;
    std::vector<std::string> paragraphs = split_paragraphs(text);
    std::string current;

    for (size_t p = 0; p < paragraphs.size(); ++p) {
        std::vector<std::string> sentences = split_sentences(paragraphs[p]);
        for (size_t s = 0; s < sentences.size(); ++s) {
            std::vector<std::string> pieces;
            if (sentences[s].size() > max_chars_) {
                split_long_sentence(sentences[s], pieces);
            } else {
                pieces.push_back(sentences[s]);
            }

            for (size_t k = 0; k < pieces.size(); ++k) {
                const char* sep = (s == 0 && k == 0) ? "\n\n" : " ";
                if (current.empty()) {
                    current = pieces[k];
                } else if (current.size() + std::string(sep).size() + pieces[k].size() <= max_chars_) {
                    current += sep;
                    current += pieces[k];
                } else {
                    chunks.push_back(current);
                    current = pieces[k];
                }
            }
        }
    }
    if (!current.empty()) {
        chunks.push_back(current);
    }
    return chunks;
}

} // namespace engram
