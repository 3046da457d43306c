#pragma once

#include <string>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include "vellum/types.hpp"

namespace vellum::engine {

    struct Config {
        enum class TrainingPolicy {
            DEGRADED, // Train fewer clusters on an undersized sample, flag it
            STRICT    // Refuse to train, raise InsufficientTrainingDataError
        };

        enum class LoadFailurePolicy {
            RESET, // Start from an empty index (snapshot is overwritten on next save)
            FAIL   // Propagate PersistenceError, leave files for manual recovery
        };

        std::filesystem::path index_dir = "./data/index";
        std::filesystem::path database_path = "./data/papers.db";

        IndexVariant index_type = IndexVariant::Clustered;
        size_t nlist = 100;
        size_t nprobe = 8;
        size_t kmeans_iterations = 25;
        size_t training_sample_limit = 100;
        TrainingPolicy training_policy = TrainingPolicy::DEGRADED;

        size_t batch_size = 50;
        size_t checkpoint_interval = 10;
        LoadFailurePolicy load_failure_policy = LoadFailurePolicy::RESET;

        std::string embedding_backend = "onnx"; // onnx, ollama, openai, hash
        std::string embedding_model = "all-minilm";
        std::string embedding_endpoint = "http://localhost:11434/api/embeddings"; // for ollama
        std::string openai_key = "";
        std::string onnx_model_path = "model.onnx";
        std::string onnx_vocab_path = "vocab.txt";
        size_t hash_dimension = 384;

        bool use_full_text = false;

        std::filesystem::path index_file() const { return index_dir / "vectors.index"; }
        std::filesystem::path id_map_file() const { return index_dir / "id_map.cbor"; }

        static Config load(const std::filesystem::path& path) {
            Config cfg;
            std::error_code ec;
            if (std::filesystem::exists(path, ec)) {
                try {
                    std::ifstream f(path);
                    nlohmann::json j = nlohmann::json::parse(f);
                    cfg.apply(j);
                } catch (const nlohmann::json::exception& e) {
                    std::cerr << "[Config] Ignoring " << path << ": " << e.what() << "\n";
                }
            }
            cfg.apply_env();
            return cfg;
        }

        void apply(const nlohmann::json& j) {
            if (j.contains("index_dir")) index_dir = j["index_dir"].get<std::string>();
            if (j.contains("database_path")) database_path = j["database_path"].get<std::string>();
            if (j.contains("index_type")) index_type = parse_variant(j["index_type"].get<std::string>());
            if (j.contains("nlist")) nlist = j["nlist"];
            if (j.contains("nprobe")) nprobe = j["nprobe"];
            if (j.contains("kmeans_iterations")) kmeans_iterations = j["kmeans_iterations"];
            if (j.contains("training_sample_limit")) training_sample_limit = j["training_sample_limit"];
            if (j.contains("training_policy")) training_policy = parse_training_policy(j["training_policy"].get<std::string>());
            if (j.contains("batch_size")) batch_size = j["batch_size"];
            if (j.contains("checkpoint_interval")) checkpoint_interval = j["checkpoint_interval"];
            if (j.contains("load_failure_policy")) load_failure_policy = parse_load_policy(j["load_failure_policy"].get<std::string>());
            if (j.contains("embedding_backend")) embedding_backend = j["embedding_backend"].get<std::string>();
            if (j.contains("embedding_model")) embedding_model = j["embedding_model"].get<std::string>();
            if (j.contains("embedding_endpoint")) embedding_endpoint = j["embedding_endpoint"].get<std::string>();
            if (j.contains("openai_key")) openai_key = j["openai_key"].get<std::string>();
            if (j.contains("onnx_model_path")) onnx_model_path = j["onnx_model_path"].get<std::string>();
            if (j.contains("onnx_vocab_path")) onnx_vocab_path = j["onnx_vocab_path"].get<std::string>();
            if (j.contains("hash_dimension")) hash_dimension = j["hash_dimension"];
            if (j.contains("use_full_text")) use_full_text = j["use_full_text"];
        }

        void apply_env() {
            if (const char* v = std::getenv("VELLUM_INDEX_DIR")) index_dir = v;
            if (const char* v = std::getenv("VELLUM_DATABASE")) database_path = v;
            if (const char* v = std::getenv("VELLUM_INDEX_TYPE")) index_type = parse_variant(v);
            if (const char* v = std::getenv("VELLUM_NLIST")) nlist = parse_size(v, nlist);
            if (const char* v = std::getenv("VELLUM_NPROBE")) nprobe = parse_size(v, nprobe);
            if (const char* v = std::getenv("VELLUM_TRAINING_POLICY")) training_policy = parse_training_policy(v);
            if (const char* v = std::getenv("VELLUM_BATCH_SIZE")) batch_size = parse_size(v, batch_size);
            if (const char* v = std::getenv("VELLUM_EMBEDDING_BACKEND")) embedding_backend = v;
            if (const char* v = std::getenv("OPENAI_API_KEY")) openai_key = v;
            if (const char* v = std::getenv("VELLUM_USE_FULL_TEXT")) {
                std::string s = v;
                use_full_text = (s == "1" || s == "true" || s == "True" || s == "t");
            }
        }

        void save(const std::filesystem::path& path) const {
            nlohmann::json j;
            j["index_dir"] = index_dir.string();
            j["database_path"] = database_path.string();
            j["index_type"] = to_string(index_type);
            j["nlist"] = nlist;
            j["nprobe"] = nprobe;
            j["kmeans_iterations"] = kmeans_iterations;
            j["training_sample_limit"] = training_sample_limit;
            j["training_policy"] = (training_policy == TrainingPolicy::STRICT) ? "strict" : "degraded";
            j["batch_size"] = batch_size;
            j["checkpoint_interval"] = checkpoint_interval;
            j["load_failure_policy"] = (load_failure_policy == LoadFailurePolicy::FAIL) ? "fail" : "reset";
            j["embedding_backend"] = embedding_backend;
            j["embedding_model"] = embedding_model;
            j["embedding_endpoint"] = embedding_endpoint;
            j["onnx_model_path"] = onnx_model_path;
            j["onnx_vocab_path"] = onnx_vocab_path;
            j["hash_dimension"] = hash_dimension;
            j["use_full_text"] = use_full_text;
            if (!openai_key.empty()) j["openai_key"] = openai_key;

            std::ofstream f(path);
            f << j.dump(4);
        }

    private:
        static IndexVariant parse_variant(const std::string& s) {
            if (s == "flat" || s == "Flat") return IndexVariant::Exact;
            if (s == "ivf" || s == "IVFFlat") return IndexVariant::Clustered;
            std::cerr << "[Config] Unknown index type '" << s << "', using flat.\n";
            return IndexVariant::Exact;
        }

        static TrainingPolicy parse_training_policy(const std::string& s) {
            if (s == "strict") return TrainingPolicy::STRICT;
            if (s != "degraded") std::cerr << "[Config] Unknown training policy '" << s << "', using degraded.\n";
            return TrainingPolicy::DEGRADED;
        }

        static LoadFailurePolicy parse_load_policy(const std::string& s) {
            if (s == "fail") return LoadFailurePolicy::FAIL;
            if (s != "reset") std::cerr << "[Config] Unknown load failure policy '" << s << "', using reset.\n";
            return LoadFailurePolicy::RESET;
        }

        static size_t parse_size(const char* s, size_t fallback) {
            char* end = nullptr;
            unsigned long long v = std::strtoull(s, &end, 10);
            if (end == s || *end != '\0') {
                std::cerr << "[Config] Ignoring non-numeric value '" << s << "'.\n";
                return fallback;
            }
            return static_cast<size_t>(v);
        }
    };

}
