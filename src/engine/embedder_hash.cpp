#include "embedder.hpp"
#include "vellum/errors.hpp"
#include <cctype>
#include <cmath>
#include <cstdint>

namespace vellum::engine {

    namespace {
        // FNV-1a; std::hash is not stable across standard libraries and the
        // vectors end up in snapshots.
        uint64_t fnv1a(const std::string& s) {
            uint64_t h = 1469598103934665603ULL;
            for (unsigned char c : s) {
                h ^= c;
                h *= 1099511628211ULL;
            }
            return h;
        }
    }

    /**
     * @brief Bag-of-words feature hashing. Deterministic and model-free, for
     * offline use and smoke tests. Sign hashing keeps collisions unbiased.
     */
    class HashEmbedder : public Embedder {
    public:
        explicit HashEmbedder(size_t dimension) : m_dimension(dimension) {
            if (m_dimension == 0) throw ModelFailure("hash embedder dimension must be positive");
        }

        std::vector<float> embed(const std::string& text) override {
            std::vector<float> vec(m_dimension, 0.0f);

            std::string token;
            auto flush = [&]() {
                if (token.empty()) return;
                uint64_t h = fnv1a(token);
                float sign = ((h >> 63) & 1) ? -1.0f : 1.0f;
                vec[h % m_dimension] += sign;
                token.clear();
            };

            for (char c : text) {
                if (std::isalnum(static_cast<unsigned char>(c))) {
                    token += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                } else {
                    flush();
                }
            }
            flush();

            float norm = 0.0f;
            for (float v : vec) norm += v * v;
            if (norm > 0.0f) {
                norm = std::sqrt(norm);
                for (float& v : vec) v /= norm;
            }
            return vec;
        }

        size_t dimension() const override { return m_dimension; }

    private:
        size_t m_dimension;
    };

    std::unique_ptr<Embedder> create_hash_embedder(size_t dimension) {
        return std::make_unique<HashEmbedder>(dimension);
    }

}
