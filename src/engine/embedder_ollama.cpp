#include "embedder.hpp"
#include "http_client.hpp"
#include <iostream>

using json = nlohmann::json;

namespace vellum::engine {

    class OllamaEmbedder : public Embedder {
    public:
        OllamaEmbedder(const std::string& model, const std::string& endpoint)
            : m_model(model), m_endpoint(endpoint), m_http("OllamaEmbedder") {}

        std::vector<float> embed(const std::string& text) override {
            std::vector<float> embedding;
            json body = {
                {"model", m_model},
                {"prompt", text}
            };

            auto resp = m_http.post_json(m_endpoint, body);
            if (!resp) return embedding;

            try {
                if (resp->contains("embedding")) {
                    embedding = (*resp)["embedding"].get<std::vector<float>>();
                    if (m_dimension == 0) m_dimension = embedding.size();
                } else if (resp->contains("error")) {
                    std::cerr << "[OllamaEmbedder] " << (*resp)["error"].dump() << "\n";
                }
            } catch (const json::exception& e) {
                std::cerr << "[OllamaEmbedder] Unexpected response: " << e.what() << "\n";
            }
            return embedding;
        }

        size_t dimension() const override { return m_dimension; }

    private:
        std::string m_model;
        std::string m_endpoint;
        HttpClient m_http;
        size_t m_dimension = 0;
    };

    std::unique_ptr<Embedder> create_ollama_embedder(const std::string& model, const std::string& endpoint) {
        return std::make_unique<OllamaEmbedder>(model, endpoint);
    }

}
