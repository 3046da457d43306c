#include "vector_index.hpp"
#include "flat_index.hpp"
#include "clustered_index.hpp"
#include <algorithm>

namespace vellum::engine {

    std::unique_ptr<VectorIndex> create_index(IndexVariant variant, size_t dim, const IndexOptions& options) {
        if (variant == IndexVariant::Clustered) {
            return std::make_unique<ClusteredIndex>(dim, options.nlist, options.nprobe, options.kmeans_iterations);
        }
        return std::make_unique<FlatIndex>(dim);
    }

    void finalize_neighbors(std::vector<Neighbor>& neighbors, size_t k) {
        std::sort(neighbors.begin(), neighbors.end(), [](const Neighbor& a, const Neighbor& b) {
            if (a.distance != b.distance) return a.distance < b.distance;
            return a.id < b.id;
        });
        if (neighbors.size() > k) neighbors.resize(k);
    }

}
