#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace vellum::engine {

    /**
     * @brief Minimal blocking JSON-over-HTTP POST on top of libcurl.
     *
     * Owns the curl global state for its lifetime. Errors are logged with the
     * given tag and reported as std::nullopt.
     */
    class HttpClient {
    public:
        explicit HttpClient(std::string tag, long timeout_seconds = 60);
        ~HttpClient();

        HttpClient(const HttpClient&) = delete;
        HttpClient& operator=(const HttpClient&) = delete;

        std::optional<nlohmann::json> post_json(const std::string& url,
                                                const nlohmann::json& body,
                                                const std::vector<std::string>& headers = {}) const;

    private:
        std::string m_tag;
        long m_timeout;
    };

}
