#include <iostream>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "vellum/errors.hpp"
#include "engine/config.hpp"
#include "engine/database.hpp"
#include "engine/embedder.hpp"
#include "engine/index_manager.hpp"
#include "engine/text_source.hpp"
#include <nlohmann/json.hpp>

namespace {

    void print_usage() {
        std::cerr << "Usage: vellum [--config <path>] <command> [options]\n";
        std::cerr << "Commands:\n";
        std::cerr << "  init                              - Write a default config file\n";
        std::cerr << "  add --key K --title T --abstract A [--authors JSON] [--text-path P]\n";
        std::cerr << "                                    - Insert or update a paper record\n";
        std::cerr << "  update [--batch N]                - Index papers not yet in the index\n";
        std::cerr << "  remove --key K                    - Drop a paper from the index and database\n";
        std::cerr << "  similar --key K [-k N]            - Papers similar to a stored paper\n";
        std::cerr << "  query <text> [-k N]               - Papers similar to free text\n";
        std::cerr << "  status                            - Index statistics\n";
    }

    struct Args {
        std::string command;
        std::vector<std::string> positional;
        std::map<std::string, std::string> options;

        std::string get(const std::string& name, const std::string& fallback = "") const {
            auto it = options.find(name);
            return it == options.end() ? fallback : it->second;
        }

        size_t get_size(const std::string& name, size_t fallback) const {
            auto it = options.find(name);
            if (it == options.end()) return fallback;
            try {
                return static_cast<size_t>(std::stoul(it->second));
            } catch (const std::exception&) {
                std::cerr << "[Vellum] Invalid value for " << name << ": " << it->second << "\n";
                return fallback;
            }
        }
    };

    bool parse_args(int argc, char* argv[], Args& args) {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg.rfind("-", 0) == 0 && arg.size() > 1) {
                if (i + 1 >= argc) {
                    std::cerr << "Error: missing value for " << arg << "\n";
                    return false;
                }
                args.options[arg] = argv[++i];
            } else if (args.command.empty()) {
                args.command = arg;
            } else {
                args.positional.push_back(arg);
            }
        }
        return !args.command.empty();
    }

    nlohmann::json hits_to_json(const std::vector<vellum::engine::SearchHit>& hits) {
        nlohmann::json res = nlohmann::json::array();
        for (const auto& hit : hits) {
            res.push_back({{"key", hit.key}, {"distance", hit.distance}});
        }
        return res;
    }

    int run(const Args& args, vellum::engine::Config& config, const std::filesystem::path& config_path) {
        using namespace vellum::engine;

        if (args.command == "init") {
            if (std::filesystem::exists(config_path)) {
                std::cout << "[Vellum] Config already exists: " << config_path << "\n";
            } else {
                config.save(config_path);
                std::cout << "[Vellum] Wrote default config to " << config_path << "\n";
            }
            Database db;
            if (!db.open(config.database_path)) return 1;
            std::cout << "[Vellum] Database ready at " << config.database_path << "\n";
            return 0;
        }

        Database db;
        if (!db.open(config.database_path)) {
            std::cerr << "[Vellum] Failed to open database.\n";
            return 1;
        }

        if (args.command == "add") {
            DocumentRecord record;
            record.key = args.get("--key");
            record.title = args.get("--title");
            record.abstract = args.get("--abstract");
            record.authors = args.get("--authors", "[]");
            std::string text_path = args.get("--text-path");
            if (!text_path.empty()) record.text_path = text_path;

            if (record.key.empty() || record.title.empty()) {
                std::cerr << "Error: add needs --key and --title\n";
                return 1;
            }
            if (!db.upsert_document(record)) return 1;
            std::cout << "[Vellum] Stored " << record.key << "\n";
            return 0;
        }

        // Everything below needs the index.
        EmbeddingGenerator generator(create_embedder(config));
        PaperTextSource text_source(config.use_full_text);
        IndexManager manager(config, generator, db, text_source);
        manager.initialize();

        int status = 0;
        nlohmann::json out;

        if (args.command == "update") {
            auto result = manager.update_index(args.get_size("--batch", config.batch_size));
            out = {
                {"added", result.added},
                {"failed", result.failed},
                {"skipped", result.skipped},
                {"trained", result.trained},
                {"degraded_training", result.degraded_training},
                {"checkpoints", result.checkpoints}
            };
            if (!result.persist_error.empty()) {
                out["persist_error"] = result.persist_error;
                status = 1;
            }
        } else if (args.command == "remove") {
            std::string key = args.get("--key");
            if (key.empty()) {
                std::cerr << "Error: remove needs --key\n";
                status = 1;
            } else if (!manager.remove_document(key)) {
                status = 1;
            } else {
                out = {{"removed", key}, {"database", db.remove_document(key)}};
            }
        } else if (args.command == "similar") {
            std::string key = args.get("--key");
            if (key.empty()) {
                std::cerr << "Error: similar needs --key\n";
                status = 1;
            } else {
                out = hits_to_json(manager.find_similar_by_key(key, args.get_size("-k", 5)));
            }
        } else if (args.command == "query") {
            if (args.positional.empty()) {
                std::cerr << "Error: missing query\n";
                status = 1;
            } else {
                std::string text;
                for (const auto& word : args.positional) {
                    if (!text.empty()) text += " ";
                    text += word;
                }
                out = hits_to_json(manager.find_similar_by_text(text, args.get_size("-k", 5)));
            }
        } else if (args.command == "status") {
            auto stats = manager.stats();
            out = {
                {"index_type", to_string(stats.variant)},
                {"trained", stats.trained},
                {"degraded", stats.degraded},
                {"dimension", stats.dimension},
                {"count", stats.count},
                {"clusters", stats.clusters},
                {"next_id", stats.next_id},
                {"documents", db.count_documents()},
                {"documents_indexed", db.count_documents(true)},
                {"consistent", manager.is_consistent()}
            };
        } else {
            std::cerr << "Error: unknown command " << args.command << "\n";
            print_usage();
            status = 1;
        }

        manager.shutdown();
        if (!out.is_null()) std::cout << out.dump(2) << "\n";
        return status;
    }

}

int main(int argc, char* argv[]) {
    Args args;
    if (!parse_args(argc, argv, args)) {
        print_usage();
        return 1;
    }

    std::filesystem::path config_path = args.get("--config", "vellum.json");
    auto config = vellum::engine::Config::load(config_path);

    try {
        return run(args, config, config_path);
    } catch (const vellum::engine::Error& e) {
        std::cerr << "[Vellum] Error: " << e.what() << "\n";
    } catch (const std::logic_error& e) {
        std::cerr << "[Vellum] Internal error: " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[Vellum] Unexpected error: " << e.what() << "\n";
    }
    return 1;
}
