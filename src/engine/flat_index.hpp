#pragma once

#include "faiss_index.hpp"
#include <faiss/IndexIDMap.h>
#include <memory>

namespace vellum::engine {

    /**
     * @brief Exact L2 search by linear scan. Always trained.
     *
     * A faiss::IndexFlatL2 wrapped in an IndexIDMap2, which keeps the
     * reverse map needed for get() and contains().
     */
    class FlatIndex : public FaissIndex {
    public:
        explicit FlatIndex(size_t dim);

        /**
         * @brief Adopts a deserialized index.
         * @throws std::invalid_argument unless it wraps an IndexFlatL2.
         */
        explicit FlatIndex(std::unique_ptr<faiss::IndexIDMap2> index);

        IndexVariant variant() const override { return IndexVariant::Exact; }
        bool is_trained() const override { return true; }

        void train(const std::vector<Vector>& sample, bool allow_degraded = false) override;
        void add(const Vector& vector, InternalId id) override;
        bool contains(InternalId id) const override;

        const faiss::Index& native() const override { return *m_index; }

    protected:
        faiss::Index& mutable_native() override { return *m_index; }
        std::vector<InternalId> stored_ids() const override;

    private:
        std::unique_ptr<faiss::IndexIDMap2> m_index;
    };

}
