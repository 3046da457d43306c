#include "faiss_index.hpp"
#include <faiss/impl/IDSelector.h>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace vellum::engine {

    bool FaissIndex::remove(InternalId id) {
        if (!contains(id)) return false;
        faiss::idx_t label = id;
        faiss::IDSelectorArray selector(1, &label);
        return mutable_native().remove_ids(selector) == 1;
    }

    std::optional<Vector> FaissIndex::get(InternalId id) const {
        if (!contains(id)) return std::nullopt;
        Vector out(m_dim);
        native().reconstruct(id, out.data());
        return out;
    }

    std::vector<Neighbor> FaissIndex::search(const Vector& query, size_t k) const {
        std::vector<Neighbor> results;
        if (query.size() != m_dim) {
            std::cerr << "[" << m_tag << "] Query dimension mismatch. Expected " << m_dim << ", got " << query.size() << "\n";
            return results;
        }

        const size_t total = count();
        const size_t n = std::min(k, total);
        if (n == 0 || !is_trained()) return results;

        // faiss breaks ties by storage order, so fetch past the k-th
        // distance until no equally distant vector can be left out.
        size_t fetch = std::min(n + 1, total);
        while (true) {
            std::vector<float> distances(fetch);
            std::vector<faiss::idx_t> labels(fetch);
            native().search(1, query.data(), static_cast<faiss::idx_t>(fetch), distances.data(), labels.data());

            results.clear();
            for (size_t i = 0; i < fetch && labels[i] >= 0; ++i) {
                // Squared L2; clamp rounding noise before the root.
                results.push_back({ static_cast<InternalId>(labels[i]), std::sqrt(std::max(distances[i], 0.0f)) });
            }

            const bool exhausted = results.size() < fetch || fetch == total;
            if (exhausted || results.size() <= n || results.back().distance != results[n - 1].distance) break;
            fetch = std::min(fetch * 2, total);
        }

        finalize_neighbors(results, n);
        return results;
    }

    size_t FaissIndex::count() const {
        return static_cast<size_t>(native().ntotal);
    }

    void FaissIndex::for_each(const std::function<void(InternalId, const Vector&)>& callback) const {
        std::vector<InternalId> ids = stored_ids();
        std::sort(ids.begin(), ids.end());
        Vector buffer(m_dim);
        for (InternalId id : ids) {
            native().reconstruct(id, buffer.data());
            callback(id, buffer);
        }
    }

}
