#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <mutex>
#include <shared_mutex>
#include "vellum/types.hpp"
#include "config.hpp"
#include "embedder.hpp"
#include "vector_index.hpp"
#include "id_map.hpp"
#include "database.hpp"
#include "text_source.hpp"

namespace vellum::engine {

    /**
     * @brief Owns the vector index and the id <-> key bijection.
     *
     * Create one instance at startup, call initialize(), and hand it to every
     * caller by reference. Searches may run concurrently; mutations and
     * persistence are exclusive. Calls before initialize() or after
     * shutdown() throw std::logic_error.
     */
    class IndexManager {
    public:
        IndexManager(Config config, EmbeddingGenerator& generator, MetadataStore& store, TextSource& text_source);

        IndexManager(const IndexManager&) = delete;
        IndexManager& operator=(const IndexManager&) = delete;

        /**
         * @brief Loads the snapshot from config.index_dir, or starts empty.
         * @throws PersistenceError if loading fails under LoadFailurePolicy::FAIL.
         */
        void initialize();

        /**
         * @brief Saves unsaved changes and releases the index.
         * @throws PersistenceError if the final save fails (the index is kept).
         */
        void shutdown();

        bool is_initialized() const;

        /**
         * @brief Indexes text under key, replacing any previous entry for key.
         *
         * Vector insert, id-map update and mark_indexed() are applied together
         * or not at all.
         * @return false if encoding, insertion or the store notification failed.
         * @throws IndexNotTrainedError if the clustered index has not been trained.
         */
        bool add_document(const std::string& key, const std::string& text);

        /**
         * @return true if the key is gone afterwards (including when it was never indexed).
         */
        bool remove_document(const std::string& key);

        std::vector<SearchHit> find_similar_by_vector(const Vector& vector, size_t k) const;

        /**
         * @brief Neighbors of a stored document, re-embedded from its current text.
         * Never contains key itself.
         * @throws DocumentNotFoundError, NoTextError, ModelFailure
         */
        std::vector<SearchHit> find_similar_by_key(const std::string& key, size_t k);

        /**
         * @throws EmptyQueryError, ModelFailure
         */
        std::vector<SearchHit> find_similar_by_text(const std::string& text, size_t k);

        /**
         * @brief Indexes up to batch_size of the pending documents, training the
         * clustered index first if needed. Per-document failures are counted
         * and skipped. Checkpoints every config.checkpoint_interval additions
         * and once at the end.
         * @throws InsufficientTrainingDataError under TrainingPolicy::STRICT.
         */
        UpdateResult update_index(const std::vector<DocumentRef>& pending, size_t batch_size);

        /**
         * @brief Same, with the pending set taken from MetadataStore::list_unindexed().
         */
        UpdateResult update_index(size_t batch_size);

        /**
         * @throws PersistenceError; in-memory state is unaffected.
         */
        void save();

        /**
         * @brief Replaces in-memory state with the snapshot on disk.
         * @throws PersistenceError under LoadFailurePolicy::FAIL.
         */
        void load();

        IndexStats stats() const;
        bool contains(const std::string& key) const;
        std::vector<std::string> keys() const;
        size_t size() const;

        /**
         * @brief Checks the bijection between index and id map.
         */
        bool is_consistent() const;

        const Config& config() const { return m_config; }

    private:
        Config m_config;
        EmbeddingGenerator& m_generator;
        MetadataStore& m_store;
        TextSource& m_text_source;

        mutable std::shared_mutex m_mutex;
        std::mutex m_encode_mutex;

        std::unique_ptr<VectorIndex> m_index;
        IdMap m_ids;
        InternalId m_next_id = 1;
        bool m_dirty = false;

        std::optional<Vector> try_encode(const std::string& key, const std::string& text);
        Vector encode(const std::string& text);

        // The *_locked helpers expect m_mutex to be held exclusively.
        bool add_locked(const std::string& key, const Vector& vector);
        bool remove_locked(const std::string& key);
        bool notify_store(const std::string& key, bool indexed);
        void save_locked();
        void load_locked();
        void reset_locked();
        bool checkpoint_locked(UpdateResult& result);

        std::vector<SearchHit> search_locked(const Vector& vector, size_t k) const;
        void require_initialized() const;
        IndexOptions index_options() const;
    };

}
