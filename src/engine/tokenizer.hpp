#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <fstream>
#include <cctype>
#include <cstdint>

namespace vellum::engine {

    /**
     * @brief Uncased BERT WordPiece tokenizer driven by a vocab.txt file.
     *
     * Lowercases, splits on whitespace and punctuation (punctuation becomes its
     * own token), then applies greedy longest-match-first WordPiece.
     */
    class Tokenizer {
    public:
        explicit Tokenizer(const std::string& vocab_path) {
            std::ifstream file(vocab_path);
            std::string line;
            int64_t id = 0;
            while (std::getline(file, line)) {
                if (!line.empty() && line.back() == '\r') line.pop_back();
                m_vocab.emplace(line, id++);
            }
            m_cls = lookup("[CLS]", 101);
            m_sep = lookup("[SEP]", 102);
            m_unk = lookup("[UNK]", 100);
        }

        bool is_loaded() const { return !m_vocab.empty(); }

        std::vector<int64_t> encode(const std::string& text, size_t max_length = 512) const {
            std::vector<int64_t> ids;
            ids.push_back(m_cls);

            for (const auto& word : split(text)) {
                append_wordpieces(word, ids);
                if (ids.size() >= max_length - 1) break;
            }

            if (ids.size() > max_length - 1) ids.resize(max_length - 1);
            ids.push_back(m_sep);
            return ids;
        }

    private:
        std::unordered_map<std::string, int64_t> m_vocab;
        int64_t m_cls = 101;
        int64_t m_sep = 102;
        int64_t m_unk = 100;

        int64_t lookup(const std::string& token, int64_t fallback) const {
            auto it = m_vocab.find(token);
            return it == m_vocab.end() ? fallback : it->second;
        }

        static std::vector<std::string> split(const std::string& text) {
            std::vector<std::string> words;
            std::string current;
            for (unsigned char c : text) {
                if (std::isspace(c)) {
                    if (!current.empty()) words.push_back(std::move(current));
                    current.clear();
                } else if (std::ispunct(c)) {
                    if (!current.empty()) words.push_back(std::move(current));
                    current.clear();
                    words.emplace_back(1, static_cast<char>(c));
                } else {
                    current += static_cast<char>(std::tolower(c));
                }
            }
            if (!current.empty()) words.push_back(std::move(current));
            return words;
        }

        void append_wordpieces(const std::string& word, std::vector<int64_t>& ids) const {
            // Very long words are not worth the quadratic search
            if (word.length() > 100) {
                ids.push_back(m_unk);
                return;
            }

            std::vector<int64_t> pieces;
            size_t start = 0;
            while (start < word.length()) {
                size_t end = word.length();
                int64_t piece = -1;
                while (start < end) {
                    std::string candidate = word.substr(start, end - start);
                    if (start > 0) candidate = "##" + candidate;
                    auto it = m_vocab.find(candidate);
                    if (it != m_vocab.end()) {
                        piece = it->second;
                        break;
                    }
                    --end;
                }
                if (piece == -1) {
                    ids.push_back(m_unk);
                    return;
                }
                pieces.push_back(piece);
                start = end;
            }
            ids.insert(ids.end(), pieces.begin(), pieces.end());
        }
    };

}
