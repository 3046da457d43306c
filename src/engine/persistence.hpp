#pragma once

#include <filesystem>
#include <memory>
#include "vector_index.hpp"
#include "id_map.hpp"

namespace vellum::engine {

    struct IdMapSnapshot {
        IdMap map;
        InternalId next_id = 1;
        size_t dimension = 0;
        IndexVariant variant = IndexVariant::Exact;
    };

    /**
     * @brief (De)serialization of the vector index and the id map.
     *
     * Vector snapshot: faiss's own index format (faiss::write_index), an
     * IndexIDMap2 over IndexFlatL2 for the exact variant or an IndexIVFFlat
     * for the clustered one.
     *
     * Id-map snapshot: CBOR object
     *   { format, version, next_id, dimension, variant, entries: [[id, key], ...] }
     *
     * Both files are replaced atomically via <file>.tmp + rename.
     * Every failure surfaces as PersistenceError.
     */
    class PersistenceCodec {
    public:
        static constexpr int ID_MAP_VERSION = 1;

        static void write_index(const VectorIndex& index, const std::filesystem::path& path);

        /**
         * @param options target nlist, nprobe and kmeans_iterations applied to a
         *        clustered snapshot; its trained cluster count comes from the file.
         */
        static std::unique_ptr<VectorIndex> read_index(const std::filesystem::path& path, const IndexOptions& options);

        static void write_id_map(const IdMap& map, InternalId next_id, size_t dimension, IndexVariant variant,
                                 const std::filesystem::path& path);
        static IdMapSnapshot read_id_map(const std::filesystem::path& path);

        /**
         * @brief Writes bytes to path.tmp, then renames over path.
         */
        static void write_atomically(const std::filesystem::path& path, const void* data, size_t size);
    };

}
