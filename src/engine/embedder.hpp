#pragma once

#include <string>
#include <vector>
#include <memory>
#include "vellum/types.hpp"

namespace vellum::engine {

    struct Config;

    /**
     * @brief Abstract base class for embedding backends.
     */
    class Embedder {
    public:
        virtual ~Embedder() = default;

        /**
         * @brief Generates an embedding vector for the given text.
         * @param text The input text.
         * @return The embedding, or an empty vector if the backend failed.
         * Backends may also throw ModelFailure.
         */
        virtual std::vector<float> embed(const std::string& text) = 0;

        /**
         * @brief Returns the dimension of the vectors produced by this embedder.
         * 0 if the backend only learns it from its first response.
         */
        virtual size_t dimension() const = 0;
    };

    /**
     * @brief Validating front of an Embedder: text -> Vector.
     *
     * Probes the backend once at construction to fix the output dimension.
     * Every vector handed out afterwards has exactly that dimension.
     */
    class EmbeddingGenerator {
    public:
        /**
         * @throws ModelFailure if the backend is missing or cannot embed the probe text.
         */
        explicit EmbeddingGenerator(std::unique_ptr<Embedder> embedder);

        /**
         * @brief Encodes text into a vector.
         * @throws EmptyInputError if text is empty after trimming.
         * @throws ModelFailure if the backend fails or returns a malformed vector.
         */
        Vector encode(const std::string& text);

        size_t dimension() const { return m_dim; }

    private:
        std::unique_ptr<Embedder> m_embedder;
        size_t m_dim = 0;
    };

    /**
     * @brief True if text contains anything besides whitespace.
     */
    bool has_content(const std::string& text);

    std::unique_ptr<Embedder> create_ollama_embedder(const std::string& model, const std::string& endpoint);
    std::unique_ptr<Embedder> create_onnx_embedder(const std::string& model_path, const std::string& vocab_path);
    std::unique_ptr<Embedder> create_openai_embedder(const std::string& api_key, const std::string& model = "text-embedding-3-small");
    std::unique_ptr<Embedder> create_hash_embedder(size_t dimension);

    /**
     * @brief Builds the backend named by config.embedding_backend.
     * @throws ModelFailure for an unknown backend name.
     */
    std::unique_ptr<Embedder> create_embedder(const Config& config);

}
