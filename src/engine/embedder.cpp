#include "embedder.hpp"
#include "config.hpp"
#include "vellum/errors.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace vellum::engine {

    namespace {
        const char* PROBE_TEXT = "embedding dimension probe";
    }

    bool has_content(const std::string& text) {
        return std::any_of(text.begin(), text.end(),
            [](unsigned char c) { return !std::isspace(c); });
    }

    EmbeddingGenerator::EmbeddingGenerator(std::unique_ptr<Embedder> embedder)
        : m_embedder(std::move(embedder)) {
        if (!m_embedder) throw ModelFailure("no embedding backend configured");

        std::vector<float> probe;
        try {
            probe = m_embedder->embed(PROBE_TEXT);
        } catch (const ModelFailure&) {
            throw;
        } catch (const std::exception& e) {
            throw ModelFailure(std::string("embedding model failed to load: ") + e.what());
        }
        if (probe.empty()) throw ModelFailure("embedding model produced no output");

        size_t declared = m_embedder->dimension();
        if (declared != 0 && declared != probe.size()) {
            throw ModelFailure("embedding model declares dimension " + std::to_string(declared) +
                               " but produced " + std::to_string(probe.size()));
        }
        m_dim = probe.size();
        std::cout << "[EmbeddingGenerator] Model ready, dimension " << m_dim << "\n";
    }

    Vector EmbeddingGenerator::encode(const std::string& text) {
        if (!has_content(text)) throw EmptyInputError();

        std::vector<float> embedding;
        try {
            embedding = m_embedder->embed(text);
        } catch (const ModelFailure&) {
            throw;
        } catch (const std::exception& e) {
            throw ModelFailure(std::string("embedding failed: ") + e.what());
        }

        if (embedding.empty()) throw ModelFailure("embedding model produced no output");
        if (embedding.size() != m_dim) {
            throw ModelFailure("embedding dimension changed from " + std::to_string(m_dim) +
                               " to " + std::to_string(embedding.size()));
        }
        return embedding;
    }

    std::unique_ptr<Embedder> create_embedder(const Config& config) {
        const std::string& backend = config.embedding_backend;
        if (backend == "openai") {
            if (config.openai_key.empty()) throw ModelFailure("openai backend selected but no API key set");
            std::cout << "[Embedder] Using OpenAI Embedder.\n";
            return create_openai_embedder(config.openai_key);
        }
        if (backend == "onnx") {
            std::cout << "[Embedder] Using Local ONNX Embedder.\n";
            return create_onnx_embedder(config.onnx_model_path, config.onnx_vocab_path);
        }
        if (backend == "ollama") {
            std::cout << "[Embedder] Using Ollama Embedder (" << config.embedding_model << ").\n";
            return create_ollama_embedder(config.embedding_model, config.embedding_endpoint);
        }
        if (backend == "hash") {
            std::cout << "[Embedder] Using hashing embedder.\n";
            return create_hash_embedder(config.hash_dimension);
        }
        throw ModelFailure("unknown embedding backend: " + backend);
    }

}
