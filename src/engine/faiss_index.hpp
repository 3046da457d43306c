#pragma once

#include "vector_index.hpp"
#include <faiss/Index.h>

namespace vellum::engine {

    /**
     * @brief VectorIndex over a faiss index that stores caller ids as labels.
     *
     * Subclasses own the concrete faiss structure and report which ids it
     * holds; searching, removal, reconstruction and counting go through the
     * faiss::Index interface. Equal distances are ordered by ascending id,
     * including at the k-th position.
     */
    class FaissIndex : public VectorIndex {
    public:
        size_t dimension() const override { return m_dim; }

        bool remove(InternalId id) override;
        std::optional<Vector> get(InternalId id) const override;
        std::vector<Neighbor> search(const Vector& query, size_t k) const override;
        size_t count() const override;
        void for_each(const std::function<void(InternalId, const Vector&)>& callback) const override;

        /**
         * @brief The underlying faiss index, for faiss::write_index.
         */
        virtual const faiss::Index& native() const = 0;

    protected:
        FaissIndex(size_t dim, const char* tag) : m_dim(dim), m_tag(tag) {}

        virtual faiss::Index& mutable_native() = 0;

        /**
         * @brief Every stored id, in no particular order.
         */
        virtual std::vector<InternalId> stored_ids() const = 0;

        size_t m_dim;
        const char* m_tag; // log prefix
    };

}
