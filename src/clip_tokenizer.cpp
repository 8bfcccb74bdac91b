#include "clip_tokenizer.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <fstream>
#include <iostream>
#include <limits>
#include <regex>
#include <stdexcept>

namespace scenereel {

namespace {

const char* const kStartToken = "<|startoftext|>";
const char* const kEndToken = "<|endoftext|>";
const char* const kEndOfWord = "</w>";

std::string encode_utf8(uint32_t code_point) {
    std::string out;
    if (code_point < 0x80) {
        out += static_cast<char>(code_point);
    } else if (code_point < 0x800) {
        out += static_cast<char>(0xC0 | (code_point >> 6));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (code_point >> 12));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    }
    return out;
}

// GPT-2 style reversible byte -> unicode table; printable bytes map to
// themselves, the rest are shifted above U+0100.
std::vector<std::string> build_byte_encoder() {
    std::vector<bool> printable(256, false);
    for (int b = '!'; b <= '~'; ++b) printable[b] = true;
    for (int b = 0xA1; b <= 0xAC; ++b) printable[b] = true;
    for (int b = 0xAE; b <= 0xFF; ++b) printable[b] = true;

    std::vector<std::string> table(256);
    uint32_t shifted = 0;
    for (int b = 0; b < 256; ++b) {
        table[b] = printable[b] ? encode_utf8(static_cast<uint32_t>(b)) : encode_utf8(256 + shifted++);
    }
    return table;
}

} // namespace

std::string normalize_text(const std::string& text) {
    std::string result;
    bool pending_space = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result += ' ';
            pending_space = false;
        }
        result += static_cast<char>(std::tolower(c));
    }
    return result;
}

ClipTokenizer::ClipTokenizer(const std::string& tokenizer_json_path, int context_length)
    : byte_encoder_(build_byte_encoder()), context_length_(context_length) {
    if (context_length_ < 2) {
        throw std::invalid_argument("Context length must leave room for start and end tokens");
    }
    load_tokenizer_json(tokenizer_json_path);
    std::cout << "CLIP tokenizer loaded: " << vocab_.size() << " tokens, "
              << merge_ranks_.size() << " merges" << std::endl;
}

void ClipTokenizer::load_tokenizer_json(const std::string& tokenizer_json_path) {
    std::ifstream file(tokenizer_json_path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open tokenizer.json: " + tokenizer_json_path);
    }

    nlohmann::json tokenizer_json;
    try {
        file >> tokenizer_json;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse tokenizer.json: " + std::string(e.what()));
    }

    if (!tokenizer_json.contains("model") || !tokenizer_json["model"].contains("vocab")) {
        throw std::runtime_error("tokenizer.json has no model.vocab: " + tokenizer_json_path);
    }
    const auto& model = tokenizer_json["model"];

    for (auto it = model["vocab"].begin(); it != model["vocab"].end(); ++it) {
        vocab_[it.key()] = it.value().get<int64_t>();
    }

    // Merges are either "a b" strings or ["a", "b"] pairs depending on the exporter
    if (model.contains("merges")) {
        size_t rank = 0;
        for (const auto& merge : model["merges"]) {
            if (merge.is_string()) {
                std::string text = merge.get<std::string>();
                size_t space = text.find(' ');
                if (space == std::string::npos) continue;
                merge_ranks_[{text.substr(0, space), text.substr(space + 1)}] = rank++;
            } else if (merge.is_array() && merge.size() == 2) {
                merge_ranks_[{merge[0].get<std::string>(), merge[1].get<std::string>()}] = rank++;
            }
        }
    }

    if (tokenizer_json.contains("added_tokens")) {
        for (const auto& token : tokenizer_json["added_tokens"]) {
            if (token.contains("content") && token.contains("id")) {
                vocab_.emplace(token["content"].get<std::string>(), token["id"].get<int64_t>());
            }
        }
    }

    auto start = vocab_.find(kStartToken);
    auto end = vocab_.find(kEndToken);
    if (start == vocab_.end() || end == vocab_.end()) {
        throw std::runtime_error("tokenizer.json is missing CLIP start/end tokens");
    }
    start_token_id_ = start->second;
    end_token_id_ = end->second;

    if (model.contains("unk_token") && model["unk_token"].is_string()) {
        auto unk = vocab_.find(model["unk_token"].get<std::string>());
        if (unk != vocab_.end()) {
            unknown_token_id_ = unk->second;
        }
    }
}

std::vector<std::string> ClipTokenizer::bpe(const std::string& word) const {
    std::vector<std::string> symbols;
    for (unsigned char byte : word) {
        symbols.push_back(byte_encoder_[byte]);
    }
    if (symbols.empty()) {
        return symbols;
    }
    symbols.back() += kEndOfWord;

    while (symbols.size() > 1) {
        size_t best_rank = std::numeric_limits<size_t>::max();
        size_t best_pos = 0;
        for (size_t i = 0; i + 1 < symbols.size(); ++i) {
            auto it = merge_ranks_.find({symbols[i], symbols[i + 1]});
            if (it != merge_ranks_.end() && it->second < best_rank) {
                best_rank = it->second;
                best_pos = i;
            }
        }
        if (best_rank == std::numeric_limits<size_t>::max()) {
            break;
        }

        // Merge every occurrence of the winning pair in one pass
        const std::string first = symbols[best_pos];
        const std::string second = symbols[best_pos + 1];
        std::vector<std::string> merged;
        merged.reserve(symbols.size());
        for (size_t i = 0; i < symbols.size(); ++i) {
            if (i + 1 < symbols.size() && symbols[i] == first && symbols[i + 1] == second) {
                merged.push_back(first + second);
                ++i;
            } else {
                merged.push_back(symbols[i]);
            }
        }
        symbols = std::move(merged);
    }

    return symbols;
}

std::vector<std::string> ClipTokenizer::tokenize(const std::string& text) const {
    static const std::regex pattern(R"('s|'t|'re|'ve|'m|'ll|'d|[a-z]+|[0-9]|[^\sa-z0-9]+)");

    std::string cleaned = normalize_text(text);
    std::vector<std::string> tokens;
    for (auto it = std::sregex_iterator(cleaned.begin(), cleaned.end(), pattern);
         it != std::sregex_iterator(); ++it) {
        for (auto& piece : bpe(it->str())) {
            tokens.push_back(std::move(piece));
        }
    }
    return tokens;
}

int64_t ClipTokenizer::token_id(const std::string& token) const {
    auto it = vocab_.find(token);
    if (it != vocab_.end()) {
        return it->second;
    }
    if (unknown_token_id_ >= 0) {
        return unknown_token_id_;
    }
    throw std::runtime_error("Token not in vocabulary: " + token);
}

std::vector<int64_t> ClipTokenizer::encode(const std::string& text) const {
    auto tokens = tokenize(text);
    if (tokens.size() + 2 > static_cast<size_t>(context_length_)) {
        throw std::invalid_argument("Phrase is too long for context length " +
                                    std::to_string(context_length_) + ": " + text);
    }

    std::vector<int64_t> ids(static_cast<size_t>(context_length_), 0);
    size_t pos = 0;
    ids[pos++] = start_token_id_;
    for (const auto& token : tokens) {
        ids[pos++] = token_id(token);
    }
    ids[pos] = end_token_id_;
    return ids;
}

TokenBatch ClipTokenizer::encode_batch(const std::vector<std::string>& texts) const {
    TokenBatch batch;
    batch.batch_size = static_cast<int64_t>(texts.size());
    batch.sequence_length = context_length_;
    batch.input_ids.reserve(texts.size() * context_length_);
    batch.attention_mask.reserve(texts.size() * context_length_);

    for (const auto& text : texts) {
        auto ids = encode(text);
        // Live tokens run up to and including the end token
        size_t live = tokenize(text).size() + 2;
        for (size_t i = 0; i < ids.size(); ++i) {
            batch.input_ids.push_back(ids[i]);
            batch.attention_mask.push_back(i < live ? 1 : 0);
        }
    }
    return batch;
}

} // namespace scenereel
