#pragma once

#include "faiss_index.hpp"
#include <faiss/IndexIVFFlat.h>
#include <memory>

namespace vellum::engine {

    /**
     * @brief Inverted-file index: vectors are bucketed under their nearest
     * k-means centroid and a query scans only the nprobe closest buckets.
     *
     * Backed by faiss::IndexIVFFlat, which stores caller ids in its inverted
     * lists. A hashtable direct map serves get() and remove(). Untrained
     * until train() runs; training is one-shot.
     */
    class ClusteredIndex : public FaissIndex {
    public:
        /**
         * @param nlist target cluster count; degraded training may use fewer.
         */
        ClusteredIndex(size_t dim, size_t nlist, size_t nprobe = 8, size_t kmeans_iterations = 25);

        /**
         * @brief Adopts a deserialized index, trained or not.
         * @param nlist target cluster count the snapshot is judged against.
         */
        ClusteredIndex(std::unique_ptr<faiss::IndexIVFFlat> index, size_t nlist, size_t nprobe,
                       size_t kmeans_iterations);

        IndexVariant variant() const override { return IndexVariant::Clustered; }
        bool is_trained() const override { return m_index->is_trained; }
        bool is_degraded() const override;
        size_t clusters() const override;

        void train(const std::vector<Vector>& sample, bool allow_degraded = false) override;
        void add(const Vector& vector, InternalId id) override;
        bool contains(InternalId id) const override;

        size_t nlist() const { return m_nlist; }
        size_t nprobe() const { return m_nprobe; }

        /**
         * @brief Trained centroids, one per cluster (empty when untrained).
         */
        std::vector<Vector> centroids() const;

        const faiss::Index& native() const override { return *m_index; }

    protected:
        faiss::Index& mutable_native() override { return *m_index; }
        std::vector<InternalId> stored_ids() const override;

    private:
        std::unique_ptr<faiss::IndexIVFFlat> m_index;
        size_t m_nlist;
        size_t m_nprobe;
        size_t m_kmeans_iterations;

        void configure();
        static std::unique_ptr<faiss::IndexIVFFlat> make_ivf(size_t dim, size_t nlist);
    };

}
