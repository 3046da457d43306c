#include "database.hpp"
#include <iostream>
#include <chrono>

namespace vellum::engine {

    namespace {
        const char* SELECT_COLUMNS = "SELECT key, version, title, authors, abstract, text_path, is_indexed FROM papers ";

        int64_t now_millis() {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
        }

        std::string column_text(sqlite3_stmt* stmt, int col) {
            const unsigned char* text = sqlite3_column_text(stmt, col);
            return text ? reinterpret_cast<const char*>(text) : "";
        }
    }

    Database::Database() = default;
    Database::~Database() { close(); }

    bool Database::open(const std::filesystem::path& path) {
        close();
        if (path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
        }
        if (sqlite3_open(path.c_str(), &m_db) != SQLITE_OK) {
            std::cerr << "[Database] Failed to open: " << sqlite3_errmsg(m_db) << "\n";
            close();
            return false;
        }
        return initialize_schema();
    }

    void Database::close() {
        if (m_db) {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
    }

    bool Database::initialize_schema() {
        const char* sql =
            "CREATE TABLE IF NOT EXISTS papers ("
            "  key TEXT PRIMARY KEY,"
            "  version INTEGER DEFAULT 1,"
            "  title TEXT NOT NULL,"
            "  authors TEXT NOT NULL,"
            "  abstract TEXT NOT NULL,"
            "  text_path TEXT,"
            "  is_indexed INTEGER DEFAULT 0,"
            "  created_at INTEGER,"
            "  updated_at INTEGER"
            ");"
            "CREATE INDEX IF NOT EXISTS idx_papers_indexed ON papers(is_indexed);";
        char* err_msg = nullptr;
        if (sqlite3_exec(m_db, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
            std::cerr << "[Database] Schema error: " << (err_msg ? err_msg : "unknown") << "\n";
            sqlite3_free(err_msg);
            return false;
        }
        return true;
    }

    bool Database::upsert_document(const DocumentRecord& record) {
        const char* sql =
            "INSERT INTO papers (key, version, title, authors, abstract, text_path, is_indexed, created_at, updated_at) "
            "VALUES (?, ?, ?, ?, ?, ?, 0, ?, ?) "
            "ON CONFLICT(key) DO UPDATE SET "
            "version = excluded.version, "
            "title = excluded.title, "
            "authors = excluded.authors, "
            "is_indexed = CASE WHEN papers.abstract IS excluded.abstract AND papers.text_path IS excluded.text_path "
            "                  THEN papers.is_indexed ELSE 0 END, "
            "abstract = excluded.abstract, "
            "text_path = excluded.text_path, "
            "updated_at = excluded.updated_at;";

        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            std::cerr << "[Database] Prepare failed: " << sqlite3_errmsg(m_db) << "\n";
            return false;
        }

        int64_t now = now_millis();
        sqlite3_bind_text(stmt, 1, record.key.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_int(stmt, 2, record.version);
        sqlite3_bind_text(stmt, 3, record.title.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 4, record.authors.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 5, record.abstract.c_str(), -1, SQLITE_STATIC);
        if (record.text_path) {
            sqlite3_bind_text(stmt, 6, record.text_path->c_str(), -1, SQLITE_STATIC);
        } else {
            sqlite3_bind_null(stmt, 6);
        }
        sqlite3_bind_int64(stmt, 7, now);
        sqlite3_bind_int64(stmt, 8, now);

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        if (!success) std::cerr << "[Database] Upsert failed for " << record.key << ": " << sqlite3_errmsg(m_db) << "\n";
        sqlite3_finalize(stmt);
        return success;
    }

    bool Database::remove_document(const std::string& key) {
        const char* sql = "DELETE FROM papers WHERE key = ?;";
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) return false;

        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_STATIC);

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);
        return success;
    }

    size_t Database::count_documents(bool indexed_only) {
        const char* sql = indexed_only ? "SELECT COUNT(*) FROM papers WHERE is_indexed = 1;"
                                       : "SELECT COUNT(*) FROM papers;";
        sqlite3_stmt* stmt;
        size_t count = 0;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
            if (sqlite3_step(stmt) == SQLITE_ROW) {
                count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
            }
            sqlite3_finalize(stmt);
        }
        return count;
    }

    std::optional<DocumentRecord> Database::get_document(const std::string& key) {
        std::string sql = std::string(SELECT_COLUMNS) + "WHERE key = ?;";
        sqlite3_stmt* stmt;
        std::optional<DocumentRecord> record;

        if (sqlite3_prepare_v2(m_db, sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK) {
            sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_STATIC);
            if (sqlite3_step(stmt) == SQLITE_ROW) {
                record = read_row(stmt);
            }
            sqlite3_finalize(stmt);
        } else {
            std::cerr << "[Database] Prepare failed: " << sqlite3_errmsg(m_db) << "\n";
        }
        return record;
    }

    std::vector<DocumentRecord> Database::list_unindexed(size_t limit) {
        std::string sql = std::string(SELECT_COLUMNS) + "WHERE is_indexed = 0 ORDER BY created_at, key LIMIT ?;";
        sqlite3_stmt* stmt;
        std::vector<DocumentRecord> records;

        if (sqlite3_prepare_v2(m_db, sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK) {
            sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(limit));
            while (sqlite3_step(stmt) == SQLITE_ROW) {
                records.push_back(read_row(stmt));
            }
            sqlite3_finalize(stmt);
        } else {
            std::cerr << "[Database] Prepare failed: " << sqlite3_errmsg(m_db) << "\n";
        }
        return records;
    }

    bool Database::mark_indexed(const std::string& key, bool indexed) {
        const char* sql = "UPDATE papers SET is_indexed = ? WHERE key = ?;";
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) return false;

        sqlite3_bind_int(stmt, 1, indexed ? 1 : 0);
        sqlite3_bind_text(stmt, 2, key.c_str(), -1, SQLITE_STATIC);

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);
        return success;
    }

    DocumentRecord Database::read_row(sqlite3_stmt* stmt) {
        DocumentRecord record;
        record.key = column_text(stmt, 0);
        record.version = sqlite3_column_int(stmt, 1);
        record.title = column_text(stmt, 2);
        record.authors = column_text(stmt, 3);
        record.abstract = column_text(stmt, 4);
        if (sqlite3_column_type(stmt, 5) != SQLITE_NULL) record.text_path = column_text(stmt, 5);
        record.is_indexed = sqlite3_column_int(stmt, 6) != 0;
        return record;
    }

}
