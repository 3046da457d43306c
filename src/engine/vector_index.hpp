#pragma once

#include <vector>
#include <memory>
#include <optional>
#include <functional>
#include "vellum/types.hpp"

namespace vellum::engine {

    struct Neighbor {
        InternalId id;
        float distance; // Euclidean
    };

    /**
     * @brief Similarity-search structure keyed by caller-assigned internal ids.
     *
     * Results are ordered by ascending L2 distance; equal distances are ordered
     * by ascending id. Not thread-safe; the owner serializes access.
     */
    class VectorIndex {
    public:
        virtual ~VectorIndex() = default;

        virtual IndexVariant variant() const = 0;
        virtual size_t dimension() const = 0;
        virtual bool is_trained() const = 0;

        /**
         * @brief True if training ran on fewer vectors than the configured cluster count.
         */
        virtual bool is_degraded() const { return false; }

        /**
         * @brief Number of clusters in use (0 for the exact variant).
         */
        virtual size_t clusters() const { return 0; }

        /**
         * @brief One-time training step. No-op once trained.
         * @param allow_degraded Train with fewer clusters instead of throwing
         *        when the sample is smaller than the cluster count.
         * @throws InsufficientTrainingDataError
         */
        virtual void train(const std::vector<Vector>& sample, bool allow_degraded = false) = 0;

        /**
         * @throws IndexNotTrainedError, DimensionMismatchError,
         *         std::invalid_argument if the id is already present.
         */
        virtual void add(const Vector& vector, InternalId id) = 0;

        /**
         * @return false if the id was not present.
         */
        virtual bool remove(InternalId id) = 0;

        virtual bool contains(InternalId id) const = 0;
        virtual std::optional<Vector> get(InternalId id) const = 0;

        /**
         * @brief At most min(k, count()) neighbors. A query of the wrong
         * dimension is logged and yields nothing.
         */
        virtual std::vector<Neighbor> search(const Vector& query, size_t k) const = 0;

        virtual size_t count() const = 0;

        /**
         * @brief Visits every stored vector in ascending id order.
         */
        virtual void for_each(const std::function<void(InternalId, const Vector&)>& callback) const = 0;
    };

    struct IndexOptions {
        size_t nlist = 100;  // target cluster count
        size_t nprobe = 8;
        size_t kmeans_iterations = 25;
    };

    /**
     * @brief Builds an empty index of the given variant.
     */
    std::unique_ptr<VectorIndex> create_index(IndexVariant variant, size_t dim, const IndexOptions& options);

    /**
     * @brief Sorts by (distance, id) and keeps the first k.
     */
    void finalize_neighbors(std::vector<Neighbor>& neighbors, size_t k);

}
