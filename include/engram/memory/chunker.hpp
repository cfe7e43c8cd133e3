/*
 * Engram C++11 - Text chunker
 *
 * Splits document text into memory-sized chunks on sentence boundaries.
 */
#ifndef ENGRAM_MEMORY_CHUNKER_HPP
#define ENGRAM_MEMORY_CHUNKER_HPP

#include "types.hpp"
#include <string>
#include <vector>

namespace engram {

class TextChunker {
public:
    explicit TextChunker(const ChunkingConfig& config);

    // Paragraphs (blank-line separated) are split into sentences, which are
    // packed greedily into chunks of at most max_chars. Paragraph breaks
    // inside a chunk are kept as "\n\n". A sentence longer than max_chars is
    // cut at the last whitespace before the limit; a single word longer than
    // the limit is cut every max_chars. No chunk exceeds max_chars. Empty
    // input yields no chunks.
    std::vector<std::string> chunk(const std::string& text) const;

    static std::string normalize_line_endings(const std::string& text);
    static std::vector<std::string> split_paragraphs(const std::string& text);
    static std::vector<std::string> split_sentences(const std::string& paragraph);

private:
    size_t max_chars_;

    void split_long_sentence(const std::string& sentence, std::vector<std::string>& out) const;
};

} // namespace engram

#endif // ENGRAM_MEMORY_CHUNKER_HPP
