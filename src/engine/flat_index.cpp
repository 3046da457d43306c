#include "flat_index.hpp"
#include "vellum/errors.hpp"
#include <faiss/IndexFlat.h>
#include <stdexcept>

namespace vellum::engine {

    FlatIndex::FlatIndex(size_t dim) : FaissIndex(dim, "FlatIndex") {
        auto flat = std::make_unique<faiss::IndexFlatL2>(static_cast<faiss::idx_t>(dim));
        m_index = std::make_unique<faiss::IndexIDMap2>(flat.get());
        m_index->own_fields = true;
        flat.release();
    }

    FlatIndex::FlatIndex(std::unique_ptr<faiss::IndexIDMap2> index)
        : FaissIndex(index ? static_cast<size_t>(index->d) : 0, "FlatIndex"), m_index(std::move(index)) {
        if (!m_index || !dynamic_cast<const faiss::IndexFlatL2*>(m_index->index)) {
            throw std::invalid_argument("exact index must be an IndexFlatL2 behind an IndexIDMap2");
        }
    }

    void FlatIndex::train(const std::vector<Vector>&, bool) {
        // Exact search has nothing to learn.
    }

    void FlatIndex::add(const Vector& vector, InternalId id) {
        if (vector.size() != m_dim) throw DimensionMismatchError(m_dim, vector.size());
        if (contains(id)) throw std::invalid_argument("duplicate internal id " + std::to_string(id));

        faiss::idx_t label = id;
        m_index->add_with_ids(1, vector.data(), &label);
    }

    bool FlatIndex::contains(InternalId id) const {
        return m_index->rev_map.count(id) > 0;
    }

    std::vector<InternalId> FlatIndex::stored_ids() const {
        return std::vector<InternalId>(m_index->id_map.begin(), m_index->id_map.end());
    }

}
