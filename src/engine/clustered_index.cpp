#include "clustered_index.hpp"
#include "vellum/errors.hpp"
#include <faiss/IndexFlat.h>
#include <faiss/invlists/InvertedLists.h>
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace vellum::engine {

    ClusteredIndex::ClusteredIndex(size_t dim, size_t nlist, size_t nprobe, size_t kmeans_iterations)
        : FaissIndex(dim, "ClusteredIndex"),
          m_nlist(std::max<size_t>(nlist, 1)),
          m_nprobe(std::max<size_t>(nprobe, 1)),
          m_kmeans_iterations(kmeans_iterations) {
        m_index = make_ivf(dim, m_nlist);
        configure();
    }

    ClusteredIndex::ClusteredIndex(std::unique_ptr<faiss::IndexIVFFlat> index, size_t nlist, size_t nprobe,
                                   size_t kmeans_iterations)
        : FaissIndex(index ? static_cast<size_t>(index->d) : 0, "ClusteredIndex"),
          m_index(std::move(index)),
          m_nlist(std::max<size_t>(nlist, 1)),
          m_nprobe(std::max<size_t>(nprobe, 1)),
          m_kmeans_iterations(kmeans_iterations) {
        if (!m_index || !m_index->quantizer || m_index->metric_type != faiss::METRIC_L2) {
            throw std::invalid_argument("clustered index must be an L2 IndexIVFFlat");
        }
        configure();
    }

    std::unique_ptr<faiss::IndexIVFFlat> ClusteredIndex::make_ivf(size_t dim, size_t nlist) {
        auto quantizer = std::make_unique<faiss::IndexFlatL2>(static_cast<faiss::idx_t>(dim));
        auto ivf = std::make_unique<faiss::IndexIVFFlat>(quantizer.get(), dim, nlist, faiss::METRIC_L2);
        ivf->own_fields = true;
        quantizer.release();
        return ivf;
    }

    void ClusteredIndex::configure() {
        m_index->nprobe = std::min(m_nprobe, m_index->nlist);
        m_index->cp.niter = static_cast<int>(m_kmeans_iterations);
        m_index->set_direct_map_type(faiss::DirectMap::Hashtable);
    }

    bool ClusteredIndex::is_degraded() const {
        return is_trained() && m_index->nlist < m_nlist;
    }

    size_t ClusteredIndex::clusters() const {
        return is_trained() ? m_index->nlist : 0;
    }

    void ClusteredIndex::train(const std::vector<Vector>& sample, bool allow_degraded) {
        if (is_trained()) return;

        for (const auto& v : sample) {
            if (v.size() != m_dim) throw DimensionMismatchError(m_dim, v.size());
        }

        size_t k = m_nlist;
        if (sample.size() < m_nlist) {
            if (!allow_degraded || sample.empty()) {
                throw InsufficientTrainingDataError(sample.size(), m_nlist);
            }
            k = sample.size();
            std::cerr << "[ClusteredIndex] Warning: training " << k << " clusters instead of " << m_nlist
                      << " (only " << sample.size() << " sample vectors). Search quality is degraded.\n";
        }

        // nlist is fixed at construction
        if (k != m_index->nlist) {
            m_index = make_ivf(m_dim, k);
            configure();
        }

        std::vector<float> data;
        data.reserve(sample.size() * m_dim);
        for (const auto& v : sample) data.insert(data.end(), v.begin(), v.end());

        m_index->train(static_cast<faiss::idx_t>(sample.size()), data.data());
        std::cout << "[ClusteredIndex] Trained " << k << " clusters on " << sample.size() << " vectors\n";
    }

    void ClusteredIndex::add(const Vector& vector, InternalId id) {
        if (!is_trained()) throw IndexNotTrainedError();
        if (vector.size() != m_dim) throw DimensionMismatchError(m_dim, vector.size());
        if (contains(id)) throw std::invalid_argument("duplicate internal id " + std::to_string(id));

        faiss::idx_t label = id;
        m_index->add_with_ids(1, vector.data(), &label);
    }

    bool ClusteredIndex::contains(InternalId id) const {
        return m_index->direct_map.hashtable.count(id) > 0;
    }

    std::vector<Vector> ClusteredIndex::centroids() const {
        std::vector<Vector> out;
        if (!is_trained()) return out;
        out.reserve(m_index->nlist);
        for (size_t c = 0; c < m_index->nlist; ++c) {
            Vector centroid(m_dim);
            m_index->quantizer->reconstruct(static_cast<faiss::idx_t>(c), centroid.data());
            out.push_back(std::move(centroid));
        }
        return out;
    }

    std::vector<InternalId> ClusteredIndex::stored_ids() const {
        std::vector<InternalId> ids;
        ids.reserve(count());
        for (size_t list_no = 0; list_no < m_index->nlist; ++list_no) {
            size_t size = m_index->invlists->list_size(list_no);
            if (size == 0) continue;
            faiss::InvertedLists::ScopedIds list_ids(m_index->invlists, list_no);
            ids.insert(ids.end(), list_ids.get(), list_ids.get() + size);
        }
        return ids;
    }

}
