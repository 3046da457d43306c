#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <sqlite3.h>
#include "vellum/types.hpp"

namespace vellum::engine {

    /**
     * @brief Document metadata consumed by the index manager.
     */
    class MetadataStore {
    public:
        virtual ~MetadataStore() = default;

        virtual std::optional<DocumentRecord> get_document(const std::string& key) = 0;

        /**
         * @brief Documents whose is_indexed flag is not set, oldest first.
         */
        virtual std::vector<DocumentRecord> list_unindexed(size_t limit) = 0;

        /**
         * @brief Records whether the document is present in the vector index.
         * @return false if the store could not be updated.
         */
        virtual bool mark_indexed(const std::string& key, bool indexed) = 0;
    };

    /**
     * @brief SQLite-backed metadata store (table `papers`).
     */
    class Database : public MetadataStore {
    public:
        Database();
        ~Database() override;

        Database(const Database&) = delete;
        Database& operator=(const Database&) = delete;

        bool open(const std::filesystem::path& path);
        void close();

        /**
         * @brief Initializes the schema if it doesn't exist.
         */
        bool initialize_schema();

        /**
         * @brief Inserts or updates a document. A changed abstract or text
         * path clears is_indexed so the next update re-embeds it.
         */
        bool upsert_document(const DocumentRecord& record);

        /**
         * @brief Deletes a document row.
         */
        bool remove_document(const std::string& key);

        /**
         * @brief Number of documents, optionally only the indexed ones.
         */
        size_t count_documents(bool indexed_only = false);

        std::optional<DocumentRecord> get_document(const std::string& key) override;
        std::vector<DocumentRecord> list_unindexed(size_t limit) override;
        bool mark_indexed(const std::string& key, bool indexed) override;

    private:
        sqlite3* m_db = nullptr;

        static DocumentRecord read_row(sqlite3_stmt* stmt);
    };

}
