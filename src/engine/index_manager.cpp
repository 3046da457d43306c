#include "index_manager.hpp"
#include "persistence.hpp"
#include "vellum/errors.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace fs = std::filesystem;

namespace vellum::engine {

    IndexManager::IndexManager(Config config, EmbeddingGenerator& generator, MetadataStore& store, TextSource& text_source)
        : m_config(std::move(config)), m_generator(generator), m_store(store), m_text_source(text_source) {}

    void IndexManager::initialize() {
        std::unique_lock lock(m_mutex);

        std::error_code ec;
        fs::create_directories(m_config.index_dir, ec);
        if (ec) {
            std::string msg = "cannot create index directory " + m_config.index_dir.string() + ": " + ec.message();
            if (m_config.load_failure_policy == Config::LoadFailurePolicy::FAIL) throw PersistenceError(msg);
            std::cerr << "[IndexManager] " << msg << "\n";
        }

        load_locked();
        std::cout << "[IndexManager] Ready: " << m_ids.size() << " documents ("
                  << to_string(m_index->variant()) << ", dim " << m_index->dimension() << ")\n";
    }

    void IndexManager::shutdown() {
        std::unique_lock lock(m_mutex);
        if (!m_index) return;
        if (m_dirty) save_locked();
        m_index.reset();
        m_ids.clear();
        m_next_id = 1;
        std::cout << "[IndexManager] Shut down.\n";
    }

    bool IndexManager::is_initialized() const {
        std::shared_lock lock(m_mutex);
        return m_index != nullptr;
    }

    Vector IndexManager::encode(const std::string& text) {
        std::lock_guard<std::mutex> lock(m_encode_mutex);
        return m_generator.encode(text);
    }

    std::optional<Vector> IndexManager::try_encode(const std::string& key, const std::string& text) {
        try {
            return encode(text);
        } catch (const EmptyInputError&) {
            std::cerr << "[IndexManager] No text for " << key << ", skipping.\n";
        } catch (const ModelFailure& e) {
            std::cerr << "[IndexManager] Failed to embed " << key << ": " << e.what() << "\n";
        }
        return std::nullopt;
    }

    bool IndexManager::add_document(const std::string& key, const std::string& text) {
        auto vector = try_encode(key, text);
        if (!vector) return false;

        std::unique_lock lock(m_mutex);
        require_initialized();
        return add_locked(key, *vector);
    }

    bool IndexManager::add_locked(const std::string& key, const Vector& vector) {
        if (!m_index->is_trained()) throw IndexNotTrainedError();

        // Replacing: take the old entry out, keep it for rollback.
        std::optional<std::pair<InternalId, Vector>> previous;
        if (auto old_id = m_ids.id_of(key)) {
            if (auto old_vector = m_index->get(*old_id)) {
                previous.emplace(*old_id, std::move(*old_vector));
            }
            m_index->remove(*old_id);
            m_ids.erase(*old_id);
        }

        auto restore_previous = [&]() {
            if (!previous) return;
            m_index->add(previous->second, previous->first);
            m_ids.insert(previous->first, key);
        };

        const InternalId id = m_next_id;
        try {
            m_index->add(vector, id);
        } catch (const std::exception& e) {
            std::cerr << "[IndexManager] Failed to insert " << key << ": " << e.what() << "\n";
            restore_previous();
            return false;
        }
        ++m_next_id;
        m_ids.insert(id, key);

        if (!notify_store(key, true)) {
            m_ids.erase(id);
            m_index->remove(id);
            restore_previous();
            std::cerr << "[IndexManager] Rolled back " << key << "\n";
            return false;
        }

        m_dirty = true;
        if (previous) {
            std::cout << "[IndexManager] Replaced " << key << " (id " << previous->first << " -> " << id << ")\n";
        } else {
            std::cout << "[IndexManager] Added " << key << " as id " << id << "\n";
        }
        return true;
    }

    bool IndexManager::remove_document(const std::string& key) {
        std::unique_lock lock(m_mutex);
        require_initialized();
        return remove_locked(key);
    }

    bool IndexManager::remove_locked(const std::string& key) {
        auto id = m_ids.id_of(key);
        if (!id) return true;

        auto vector = m_index->get(*id);
        m_index->remove(*id);
        m_ids.erase(*id);

        if (!notify_store(key, false)) {
            if (vector) {
                m_index->add(*vector, *id);
                m_ids.insert(*id, key);
            }
            std::cerr << "[IndexManager] Rolled back removal of " << key << "\n";
            return false;
        }

        m_dirty = true;
        std::cout << "[IndexManager] Removed " << key << " (id " << *id << ")\n";
        return true;
    }

    bool IndexManager::notify_store(const std::string& key, bool indexed) {
        try {
            if (m_store.mark_indexed(key, indexed)) return true;
            std::cerr << "[IndexManager] Metadata store did not record " << key
                      << (indexed ? " as indexed" : " as unindexed") << "\n";
        } catch (const std::exception& e) {
            std::cerr << "[IndexManager] Metadata store failed for " << key << ": " << e.what() << "\n";
        }
        return false;
    }

    std::vector<SearchHit> IndexManager::find_similar_by_vector(const Vector& vector, size_t k) const {
        std::shared_lock lock(m_mutex);
        require_initialized();
        return search_locked(vector, k);
    }

    std::vector<SearchHit> IndexManager::find_similar_by_key(const std::string& key, size_t k) {
        {
            std::shared_lock lock(m_mutex);
            require_initialized();
        }

        auto record = m_store.get_document(key);
        if (!record) throw DocumentNotFoundError(key);

        auto text = m_text_source.get_text(*record);
        if (!text || !has_content(*text)) throw NoTextError(key);

        // Always re-embedded so a changed text is honored.
        Vector query = encode(*text);

        std::shared_lock lock(m_mutex);
        require_initialized();
        // One extra slot for the document itself.
        const size_t fetch = k == std::numeric_limits<size_t>::max() ? k : k + 1;
        auto hits = search_locked(query, fetch);
        hits.erase(std::remove_if(hits.begin(), hits.end(),
                                  [&](const SearchHit& hit) { return hit.key == key; }),
                   hits.end());
        if (hits.size() > k) hits.resize(k);
        return hits;
    }

    std::vector<SearchHit> IndexManager::find_similar_by_text(const std::string& text, size_t k) {
        if (!has_content(text)) throw EmptyQueryError();
        {
            std::shared_lock lock(m_mutex);
            require_initialized();
        }

        Vector query = encode(text);

        std::shared_lock lock(m_mutex);
        require_initialized();
        return search_locked(query, k);
    }

    std::vector<SearchHit> IndexManager::search_locked(const Vector& vector, size_t k) const {
        std::vector<SearchHit> hits;
        if (k == 0 || m_index->count() == 0) return hits;

        for (const auto& neighbor : m_index->search(vector, k)) {
            auto key = m_ids.key_of(neighbor.id);
            if (!key) {
                std::cerr << "[IndexManager] Dropping stale id " << neighbor.id << " from results\n";
                continue;
            }
            hits.push_back({*key, neighbor.distance});
        }
        return hits;
    }

    UpdateResult IndexManager::update_index(const std::vector<DocumentRef>& pending, size_t batch_size) {
        bool needs_training = false;
        {
            std::shared_lock lock(m_mutex);
            require_initialized();
            needs_training = !m_index->is_trained();
        }

        UpdateResult result;
        const size_t limit = std::min(batch_size, pending.size());
        if (limit == 0) return result;

        std::vector<std::optional<Vector>> encoded(limit);
        std::vector<bool> attempted(limit, false);

        if (needs_training) {
            const size_t sample_size = std::min(pending.size(), m_config.training_sample_limit);
            std::vector<Vector> sample;
            sample.reserve(sample_size);

            std::cout << "[IndexManager] Encoding " << sample_size << " documents for training...\n";
            for (size_t i = 0; i < sample_size; ++i) {
                auto vector = try_encode(pending[i].key, pending[i].text);
                if (vector) sample.push_back(*vector);
                if (i < limit) {
                    attempted[i] = true;
                    encoded[i] = std::move(vector);
                }
            }

            std::unique_lock lock(m_mutex);
            require_initialized();
            if (!m_index->is_trained()) {
                const bool allow_degraded = m_config.training_policy == Config::TrainingPolicy::DEGRADED;
                if (sample.empty()) {
                    if (!allow_degraded) throw InsufficientTrainingDataError(0, m_config.nlist);
                    std::cerr << "[IndexManager] No usable training vectors, nothing indexed.\n";
                    result.failed = limit;
                    return result;
                }

                m_index->train(sample, allow_degraded);
                m_dirty = true;
                result.trained = true;
                result.degraded_training = m_index->is_degraded();
                std::cout << "[IndexManager] Trained on " << sample.size() << " vectors, "
                          << m_index->clusters() << " clusters\n";
            }
        }

        for (size_t i = 0; i < limit; ++i) {
            const auto& doc = pending[i];
            std::optional<Vector> vector = attempted[i] ? std::move(encoded[i]) : try_encode(doc.key, doc.text);
            if (!vector) {
                ++result.failed;
                continue;
            }

            std::unique_lock lock(m_mutex);
            require_initialized();
            if (!add_locked(doc.key, *vector)) {
                ++result.failed;
                continue;
            }
            ++result.added;

            if (m_config.checkpoint_interval > 0 && result.added % m_config.checkpoint_interval == 0) {
                checkpoint_locked(result);
            }
        }

        if (result.added > 0) {
            std::unique_lock lock(m_mutex);
            require_initialized();
            checkpoint_locked(result);
        }

        std::cout << "[IndexManager] Update finished: " << result.added << " added, "
                  << result.failed << " failed\n";
        return result;
    }

    UpdateResult IndexManager::update_index(size_t batch_size) {
        {
            std::shared_lock lock(m_mutex);
            require_initialized();
        }

        std::vector<DocumentRef> pending;
        size_t skipped = 0;
        for (auto& record : m_store.list_unindexed(batch_size)) {
            auto text = m_text_source.get_text(record);
            if (!text || !has_content(*text)) {
                std::cerr << "[IndexManager] No text for " << record.key << ", skipping.\n";
                ++skipped;
                continue;
            }
            pending.push_back({record.key, std::move(*text)});
        }

        UpdateResult result = update_index(pending, batch_size);
        result.skipped += skipped;
        return result;
    }

    bool IndexManager::checkpoint_locked(UpdateResult& result) {
        try {
            save_locked();
            ++result.checkpoints;
            return true;
        } catch (const PersistenceError& e) {
            std::cerr << "[IndexManager] Checkpoint failed: " << e.what() << "\n";
            result.persist_error = e.what();
            return false;
        }
    }

    void IndexManager::save() {
        std::unique_lock lock(m_mutex);
        require_initialized();
        save_locked();
    }

    void IndexManager::save_locked() {
        std::error_code ec;
        fs::create_directories(m_config.index_dir, ec);
        if (ec) {
            throw PersistenceError("cannot create index directory " + m_config.index_dir.string() + ": " + ec.message());
        }

        // Vector snapshot first: a crash in between leaves orphans, which load prunes.
        PersistenceCodec::write_index(*m_index, m_config.index_file());
        PersistenceCodec::write_id_map(m_ids, m_next_id, m_index->dimension(), m_index->variant(),
                                       m_config.id_map_file());
        m_dirty = false;
        std::cout << "[IndexManager] Saved " << m_ids.size() << " documents to " << m_config.index_dir << "\n";
    }

    void IndexManager::load() {
        std::unique_lock lock(m_mutex);
        require_initialized();
        load_locked();
    }

    void IndexManager::load_locked() {
        const fs::path index_path = m_config.index_file();
        const fs::path map_path = m_config.id_map_file();
        std::error_code index_ec;
        std::error_code map_ec;
        const bool has_index = fs::exists(index_path, index_ec);
        const bool has_map = fs::exists(map_path, map_ec);

        std::string failure;
        try {
            if (index_ec) throw PersistenceError("cannot access " + index_path.string() + ": " + index_ec.message());
            if (map_ec) throw PersistenceError("cannot access " + map_path.string() + ": " + map_ec.message());

            if (!has_index && !has_map) {
                std::cout << "[IndexManager] No snapshot in " << m_config.index_dir << ", starting empty.\n";
                reset_locked();
                return;
            }

            if (!has_index) throw PersistenceError("id map present but vector snapshot missing: " + index_path.string());

            auto index = PersistenceCodec::read_index(index_path, index_options());
            if (index->dimension() != m_generator.dimension()) {
                throw DimensionMismatchError(m_generator.dimension(), index->dimension());
            }

            IdMapSnapshot snapshot;
            if (has_map) {
                snapshot = PersistenceCodec::read_id_map(map_path);
                if (snapshot.dimension != 0 && snapshot.dimension != index->dimension()) {
                    throw DimensionMismatchError(index->dimension(), snapshot.dimension);
                }
            }

            std::vector<InternalId> orphans;
            InternalId max_id = 0;
            index->for_each([&](InternalId id, const Vector&) {
                max_id = std::max(max_id, id);
                if (!snapshot.map.contains_id(id)) orphans.push_back(id);
            });
            for (InternalId id : orphans) index->remove(id);

            std::vector<InternalId> dangling;
            snapshot.map.for_each([&](InternalId id, const std::string&) {
                if (!index->contains(id)) dangling.push_back(id);
            });
            for (InternalId id : dangling) snapshot.map.erase(id);

            if (!orphans.empty() || !dangling.empty()) {
                std::cerr << "[IndexManager] Pruned " << orphans.size() << " orphan vectors and "
                          << dangling.size() << " dangling id-map entries\n";
            }
            if (index->variant() != m_config.index_type) {
                std::cerr << "[IndexManager] Snapshot is " << to_string(index->variant())
                          << " but config asks for " << to_string(m_config.index_type)
                          << "; keeping the snapshot. Remove " << m_config.index_dir << " to rebuild.\n";
            }

            m_index = std::move(index);
            m_ids = std::move(snapshot.map);
            m_next_id = std::max<InternalId>({snapshot.next_id, max_id + 1, 1});
            m_dirty = !orphans.empty() || !dangling.empty();

            std::cout << "[IndexManager] Loaded " << m_ids.size() << " documents, next id " << m_next_id << "\n";
            return;
        } catch (const PersistenceError& e) {
            if (m_config.load_failure_policy == Config::LoadFailurePolicy::FAIL) {
                std::cerr << "[IndexManager] Failed to load index: " << e.what() << "\n";
                throw;
            }
            failure = e.what();
        } catch (const std::exception& e) {
            // Filesystem, allocation and library errors get the same policy.
            failure = e.what();
        }

        std::cerr << "[IndexManager] Failed to load index: " << failure;
        if (m_config.load_failure_policy == Config::LoadFailurePolicy::FAIL) {
            std::cerr << "\n";
            throw PersistenceError(failure);
        }
        std::cerr << ". Starting with an empty index.\n";
        reset_locked();
    }

    void IndexManager::reset_locked() {
        m_index = create_index(m_config.index_type, m_generator.dimension(), index_options());
        m_ids.clear();
        m_next_id = 1;
        m_dirty = false;
    }

    IndexStats IndexManager::stats() const {
        std::shared_lock lock(m_mutex);
        require_initialized();
        return IndexStats{
            m_index->variant(),
            m_index->is_trained(),
            m_index->is_degraded(),
            m_index->dimension(),
            m_index->count(),
            m_index->clusters(),
            m_next_id
        };
    }

    bool IndexManager::contains(const std::string& key) const {
        std::shared_lock lock(m_mutex);
        require_initialized();
        return m_ids.contains_key(key);
    }

    std::vector<std::string> IndexManager::keys() const {
        std::shared_lock lock(m_mutex);
        require_initialized();
        return m_ids.keys();
    }

    size_t IndexManager::size() const {
        std::shared_lock lock(m_mutex);
        require_initialized();
        return m_index->count();
    }

    bool IndexManager::is_consistent() const {
        std::shared_lock lock(m_mutex);
        require_initialized();
        if (m_index->count() != m_ids.size()) return false;

        bool consistent = true;
        m_ids.for_each([&](InternalId id, const std::string&) {
            if (!m_index->contains(id)) consistent = false;
        });
        m_index->for_each([&](InternalId id, const Vector&) {
            if (!m_ids.contains_id(id)) consistent = false;
        });
        return consistent;
    }

    void IndexManager::require_initialized() const {
        if (!m_index) throw std::logic_error("IndexManager used before initialize()");
    }

    IndexOptions IndexManager::index_options() const {
        IndexOptions options;
        options.nlist = m_config.nlist;
        options.nprobe = m_config.nprobe;
        options.kmeans_iterations = m_config.kmeans_iterations;
        return options;
    }

}
