#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace scenereel {

// Row-major [batch_size, sequence_length] token matrix with its mask
struct TokenBatch {
    std::vector<int64_t> input_ids;
    std::vector<int64_t> attention_mask;
    int64_t batch_size = 0;
    int64_t sequence_length = 0;
};

// Byte-level BPE tokenizer for CLIP text encoders, read from a HuggingFace
// tokenizer.json.
class ClipTokenizer {
public:
    explicit ClipTokenizer(const std::string& tokenizer_json_path, int context_length = 77);

    // BPE tokens for `text`, without special tokens
    std::vector<std::string> tokenize(const std::string& text) const;

    // <|startoftext|> ids <|endoftext|>, zero-padded to the context length.
    // Throws std::invalid_argument if the phrase does not fit.
    std::vector<int64_t> encode(const std::string& text) const;

    TokenBatch encode_batch(const std::vector<std::string>& texts) const;

    int64_t start_token_id() const { return start_token_id_; }
    int64_t end_token_id() const { return end_token_id_; }
    int context_length() const { return context_length_; }
    size_t vocab_size() const { return vocab_.size(); }

private:
    void load_tokenizer_json(const std::string& tokenizer_json_path);
    std::vector<std::string> bpe(const std::string& word) const;
    int64_t token_id(const std::string& token) const;

    std::unordered_map<std::string, int64_t> vocab_;
    std::map<std::pair<std::string, std::string>, size_t> merge_ranks_;
    std::vector<std::string> byte_encoder_; // byte -> printable UTF-8 symbol
    int64_t start_token_id_ = -1;
    int64_t end_token_id_ = -1;
    int64_t unknown_token_id_ = -1;
    int context_length_;
};

// Lowercases and collapses runs of whitespace to a single space
std::string normalize_text(const std::string& text);

} // namespace scenereel
