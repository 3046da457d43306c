#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace vellum::engine {

    using Vector = std::vector<float>;

    // Index-local handle. Always positive; 0 is never assigned.
    using InternalId = int64_t;

    enum class IndexVariant {
        Exact,     // brute-force scan, always trained
        Clustered  // inverted file over k-means centroids, needs training
    };

    struct DocumentRef {
        std::string key;
        std::string text;
    };

    struct DocumentRecord {
        std::string key;
        int version = 1;
        std::string title;
        std::string authors;   // JSON array text
        std::string abstract;
        std::optional<std::string> text_path;
        bool is_indexed = false;
    };

    struct SearchHit {
        std::string key;
        float distance;
    };

    struct IndexStats {
        IndexVariant variant;
        bool trained;
        bool degraded;
        size_t dimension;
        size_t count;
        size_t clusters;
        InternalId next_id;
    };

    struct UpdateResult {
        size_t added = 0;
        size_t failed = 0;
        size_t skipped = 0;          // no usable text
        bool trained = false;        // training ran during this update
        bool degraded_training = false;
        size_t checkpoints = 0;
        std::string persist_error;   // empty when every save succeeded
    };

    inline const char* to_string(IndexVariant variant) {
        return variant == IndexVariant::Exact ? "flat" : "ivf";
    }

}
