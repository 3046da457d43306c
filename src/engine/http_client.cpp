#include "http_client.hpp"
#include <curl/curl.h>
#include <iostream>

namespace vellum::engine {

    namespace {
        size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
            static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
            return size * nmemb;
        }
    }

    HttpClient::HttpClient(std::string tag, long timeout_seconds)
        : m_tag(std::move(tag)), m_timeout(timeout_seconds) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    HttpClient::~HttpClient() {
        curl_global_cleanup();
    }

    std::optional<nlohmann::json> HttpClient::post_json(const std::string& url,
                                                        const nlohmann::json& body,
                                                        const std::vector<std::string>& headers) const {
        std::string json_str;
        try {
            json_str = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[" << m_tag << "] JSON serialization error: " << e.what() << "\n";
            return std::nullopt;
        }

        CURL* curl = curl_easy_init();
        if (!curl) {
            std::cerr << "[" << m_tag << "] curl_easy_init() failed\n";
            return std::nullopt;
        }

        struct curl_slist* header_list = nullptr;
        header_list = curl_slist_append(header_list, "Content-Type: application/json");
        for (const auto& h : headers) {
            header_list = curl_slist_append(header_list, h.c_str());
        }

        std::string response_string;
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_str.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_string);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, m_timeout);

        std::optional<nlohmann::json> result;
        CURLcode res = curl_easy_perform(curl);
        if (res != CURLE_OK) {
            std::cerr << "[" << m_tag << "] curl_easy_perform() failed: " << curl_easy_strerror(res) << "\n";
        } else {
            long status = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
            try {
                auto resp_json = nlohmann::json::parse(response_string);
                if (status >= 400) {
                    std::cerr << "[" << m_tag << "] HTTP " << status << ": " << resp_json.dump() << "\n";
                } else {
                    result = std::move(resp_json);
                }
            } catch (const nlohmann::json::exception& e) {
                std::cerr << "[" << m_tag << "] JSON parse error (HTTP " << status << "): " << e.what() << "\n";
            }
        }

        curl_slist_free_all(header_list);
        curl_easy_cleanup(curl);
        return result;
    }

}
