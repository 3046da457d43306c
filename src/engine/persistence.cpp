#include "persistence.hpp"
#include "clustered_index.hpp"
#include "flat_index.hpp"
#include "vellum/errors.hpp"
#include <faiss/index_io.h>
#include <faiss/impl/FaissException.h>
#include <faiss/impl/io.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iterator>

using json = nlohmann::json;

namespace vellum::engine {

    namespace {
        const char* ID_MAP_FORMAT = "vellum-idmap";

        std::string read_file(const std::filesystem::path& path) {
            std::ifstream in(path, std::ios::binary);
            if (!in) throw PersistenceError("cannot open " + path.string());
            std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
            if (in.bad()) throw PersistenceError("read error on " + path.string());
            return data;
        }
    }

    void PersistenceCodec::write_atomically(const std::filesystem::path& path, const void* data, size_t size) {
        std::error_code ec;
        if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) throw PersistenceError("cannot create " + path.parent_path().string() + ": " + ec.message());

        std::filesystem::path tmp = path;
        tmp += ".tmp";
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) throw PersistenceError("cannot open " + tmp.string() + " for writing");
            out.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
            out.flush();
            if (!out) {
                out.close();
                std::filesystem::remove(tmp, ec);
                throw PersistenceError("write failed on " + tmp.string());
            }
        }

        std::filesystem::rename(tmp, path, ec);
        if (ec) {
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            throw PersistenceError("cannot replace " + path.string() + ": " + ec.message());
        }
    }

    void PersistenceCodec::write_index(const VectorIndex& index, const std::filesystem::path& path) {
        const auto* native = dynamic_cast<const FaissIndex*>(&index);
        if (!native) throw PersistenceError("index variant " + to_string(index.variant()) + " cannot be serialized");

        faiss::VectorIOWriter writer;
        try {
            faiss::write_index(&native->native(), &writer);
        } catch (const faiss::FaissException& e) {
            throw PersistenceError(std::string("cannot serialize index: ") + e.what());
        }
        write_atomically(path, writer.data.data(), writer.data.size());
    }

    std::unique_ptr<VectorIndex> PersistenceCodec::read_index(const std::filesystem::path& path, const IndexOptions& options) {
        std::string raw = read_file(path);

        faiss::VectorIOReader reader;
        reader.data.assign(raw.begin(), raw.end());

        std::unique_ptr<faiss::Index> loaded;
        try {
            loaded.reset(faiss::read_index(&reader));
        } catch (const faiss::FaissException& e) {
            throw PersistenceError("corrupt index snapshot " + path.string() + ": " + e.what());
        }
        if (reader.rp != reader.data.size()) throw PersistenceError("trailing bytes in index snapshot " + path.string());

        try {
            if (auto* map = dynamic_cast<faiss::IndexIDMap2*>(loaded.get())) {
                std::unique_ptr<faiss::IndexIDMap2> owned(map);
                loaded.release();
                return std::make_unique<FlatIndex>(std::move(owned));
            }
            if (auto* ivf = dynamic_cast<faiss::IndexIVFFlat*>(loaded.get())) {
                std::unique_ptr<faiss::IndexIVFFlat> owned(ivf);
                loaded.release();
                return std::make_unique<ClusteredIndex>(std::move(owned), options.nlist, options.nprobe,
                                                        options.kmeans_iterations);
            }
        } catch (const std::invalid_argument& e) {
            throw PersistenceError("unexpected index layout in " + path.string() + ": " + e.what());
        }
        throw PersistenceError(path.string() + " holds an index type this build does not use");
    }

    void PersistenceCodec::write_id_map(const IdMap& map, InternalId next_id, size_t dimension, IndexVariant variant,
                                        const std::filesystem::path& path) {
        json entries = json::array();
        map.for_each([&](InternalId id, const std::string& key) {
            entries.push_back(json::array({ id, key }));
        });

        json j = {
            {"format", ID_MAP_FORMAT},
            {"version", ID_MAP_VERSION},
            {"next_id", next_id},
            {"dimension", dimension},
            {"variant", to_string(variant)},
            {"entries", std::move(entries)}
        };

        std::vector<uint8_t> bytes = json::to_cbor(j);
        write_atomically(path, bytes.data(), bytes.size());
    }

    IdMapSnapshot PersistenceCodec::read_id_map(const std::filesystem::path& path) {
        std::string raw = read_file(path);

        IdMapSnapshot snapshot;
        try {
            json j = json::from_cbor(raw.begin(), raw.end());
            if (j.value("format", "") != ID_MAP_FORMAT) throw PersistenceError(path.string() + " is not an id-map snapshot");
            int version = j.at("version").get<int>();
            if (version != ID_MAP_VERSION) throw PersistenceError("unsupported id-map version " + std::to_string(version));

            snapshot.next_id = j.at("next_id").get<InternalId>();
            snapshot.dimension = j.at("dimension").get<size_t>();
            snapshot.variant = j.at("variant").get<std::string>() == "ivf" ? IndexVariant::Clustered : IndexVariant::Exact;

            for (const auto& entry : j.at("entries")) {
                InternalId id = entry.at(0).get<InternalId>();
                std::string key = entry.at(1).get<std::string>();
                if (id <= 0) throw PersistenceError("invalid internal id " + std::to_string(id));
                if (!snapshot.map.insert(id, key)) {
                    throw PersistenceError("id-map snapshot repeats id " + std::to_string(id) + " or key " + key);
                }
            }
        } catch (const json::exception& e) {
            throw PersistenceError("corrupt id-map snapshot " + path.string() + ": " + e.what());
        }

        if (snapshot.next_id <= snapshot.map.max_id()) snapshot.next_id = snapshot.map.max_id() + 1;
        return snapshot;
    }

}
