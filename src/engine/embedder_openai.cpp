#include "embedder.hpp"
#include "http_client.hpp"
#include <iostream>

using json = nlohmann::json;

namespace vellum::engine {

    class OpenAIEmbedder : public Embedder {
    public:
        OpenAIEmbedder(const std::string& api_key, const std::string& model)
            : m_api_key(api_key), m_model(model), m_http("OpenAIEmbedder") {}

        std::vector<float> embed(const std::string& text) override {
            std::vector<float> embedding;
            json body = {
                {"model", m_model},
                {"input", text}
            };

            auto resp = m_http.post_json("https://api.openai.com/v1/embeddings", body,
                                         {"Authorization: Bearer " + m_api_key});
            if (!resp) return embedding;

            try {
                if (resp->contains("error")) {
                    std::cerr << "[OpenAIEmbedder] API Error: " << (*resp)["error"].dump() << "\n";
                } else if (resp->contains("data") && !(*resp)["data"].empty()) {
                    embedding = (*resp)["data"][0]["embedding"].get<std::vector<float>>();
                    if (m_dimension == 0) m_dimension = embedding.size();
                }
            } catch (const json::exception& e) {
                std::cerr << "[OpenAIEmbedder] Unexpected response: " << e.what() << "\n";
            }
            return embedding;
        }

        size_t dimension() const override { return m_dimension; }

    private:
        std::string m_api_key;
        std::string m_model;
        HttpClient m_http;
        size_t m_dimension = 0;
    };

    std::unique_ptr<Embedder> create_openai_embedder(const std::string& api_key, const std::string& model) {
        return std::make_unique<OpenAIEmbedder>(api_key, model);
    }

}
