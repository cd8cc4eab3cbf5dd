/*
 * lgctl - SQLite state store
 */
#include <lgctl/state/store.hpp>
#include <lgctl/core/logger.hpp>
#include <lgctl/core/utils.hpp>

namespace lgctl {

namespace {
const char* const STATE_KEYS[] = { "devices", "directives", "plugins", "params" };
}

SqliteStateStore::SqliteStateStore() : db_(nullptr) {}

SqliteStateStore::~SqliteStateStore() {
    close();
}

bool SqliteStateStore::open(const std::string& db_path) {
    if (db_) {
        close();
    }
    path_ = db_path;

    if (!create_parent_directory(db_path)) {
        last_error_ = "cannot create parent directory for " + db_path;
        LOG_ERROR("[StateStore] %s", last_error_.c_str());
        return false;
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        last_error_ = std::string("cannot open ") + db_path + ": " +
                      (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
        LOG_ERROR("[StateStore] %s", last_error_.c_str());
        if (db_) {
            sqlite3_close(db_);
        }
        db_ = nullptr;
        return false;
    }

    exec_sql("PRAGMA busy_timeout=5000");

    if (!init_tables()) {
        LOG_ERROR("[StateStore] Failed to initialize tables: %s", last_error_.c_str());
        close();
        return false;
    }

    LOG_DEBUG("[StateStore] Database opened: %s", db_path.c_str());
    return true;
}

void SqliteStateStore::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SqliteStateStore::exec_sql(const std::string& sql) {
    if (!db_) {
        last_error_ = "database not open";
        return false;
    }

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);

    if (rc != SQLITE_OK) {
        last_error_ = err_msg ? err_msg : sqlite3_errstr(rc);
        LOG_DEBUG("[StateStore] SQL error: %s\n  Query: %s", last_error_.c_str(), sql.c_str());
        if (err_msg) sqlite3_free(err_msg);
        return false;
    }
    return true;
}

void SqliteStateStore::set_error_from_db() const {
    last_error_ = db_ ? sqlite3_errmsg(db_) : "database not open";
}

bool SqliteStateStore::init_tables() {
    return exec_sql(
        "CREATE TABLE IF NOT EXISTS state ("
        "  key TEXT PRIMARY KEY,"
        "  value TEXT NOT NULL,"
        "  updated_at INTEGER NOT NULL"
        ")") &&
    exec_sql(
        "CREATE TABLE IF NOT EXISTS cache ("
        "  key TEXT PRIMARY KEY,"
        "  value TEXT NOT NULL,"
        "  expires_at INTEGER NOT NULL DEFAULT 0"
        ")");
}

// ============================================================================
// State documents
// ============================================================================

bool SqliteStateStore::put_state(const std::string& key, const Json& value) {
    if (!db_) {
        last_error_ = "database not open";
        return false;
    }

    const char* sql =
        "INSERT INTO state (key, value, updated_at) VALUES (?, ?, ?) "
        "ON CONFLICT(key) DO UPDATE SET value = excluded.value, updated_at = excluded.updated_at";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }

    std::string text = value.dump();
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, current_timestamp());

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        set_error_from_db();
        return false;
    }
    return true;
}

bool SqliteStateStore::get_state(const std::string& key, Json& out) const {
    out = Json();
    if (!db_) {
        last_error_ = "database not open";
        return false;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT value FROM state WHERE key = ?", -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(stmt);
        return true;    // Absent: null document
    }
    if (rc != SQLITE_ROW) {
        set_error_from_db();
        sqlite3_finalize(stmt);
        return false;
    }

    const char* col_text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
    std::string text = col_text ? col_text : "";
    sqlite3_finalize(stmt);

    try {
        out = Json::parse(text);
    } catch (const Json::parse_error& e) {
        last_error_ = "state '" + key + "' is not valid JSON: " + e.what();
        return false;
    }
    return true;
}

int SqliteStateStore::import_state(const Json& section) {
    if (!section.is_object()) {
        return 0;
    }

    int written = 0;
    for (size_t i = 0; i < sizeof(STATE_KEYS) / sizeof(STATE_KEYS[0]); ++i) {
        const char* key = STATE_KEYS[i];
        if (!section.contains(key)) {
            continue;
        }
        if (!put_state(key, section[key])) {
            LOG_ERROR("[StateStore] Failed to store '%s': %s", key, last_error_.c_str());
            return -1;
        }
        ++written;
    }
    return written;
}

EntityCollection SqliteStateStore::load_collection(const std::string& key) const {
    EntityCollection out;
    Json doc;
    if (!get_state(key, doc)) {
        LOG_ERROR("[StateStore] Failed to read %s: %s", key.c_str(), last_error_.c_str());
        return out;
    }

    std::string error;
    if (!parse_collection(doc, out, error)) {
        LOG_ERROR("[StateStore] Invalid %s: %s", key.c_str(), error.c_str());
        out.clear();
    }
    return out;
}

EntityCollection SqliteStateStore::devices() const {
    return load_collection("devices");
}

EntityCollection SqliteStateStore::directives() const {
    return load_collection("directives");
}

EntityCollection SqliteStateStore::plugins(PluginType type) const {
    EntityCollection all = load_collection("plugins");
    EntityCollection out;
    std::string wanted = plugin_type_name(type);

    for (size_t i = 0; i < all.size(); ++i) {
        const Json& fields = all[i].fields;
        if (fields.contains("type") && fields["type"].is_string() &&
            fields["type"].get<std::string>() == wanted) {
            out.push_back(all[i]);
        }
    }
    return out;
}

Json SqliteStateStore::params() const {
    Json doc;
    if (!get_state("params", doc)) {
        LOG_ERROR("[StateStore] Failed to read params: %s", last_error_.c_str());
        return Json::object();
    }
    if (!doc.is_object()) {
        return Json::object();
    }
    return doc;
}

// ============================================================================
// Cache
// ============================================================================

bool SqliteStateStore::cache_put(const std::string& key, const std::string& value, int64_t ttl_seconds) {
    if (!db_) {
        last_error_ = "database not open";
        return false;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "INSERT OR REPLACE INTO cache (key, value, expires_at) VALUES (?, ?, ?)",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }

    int64_t expires_at = ttl_seconds > 0 ? current_timestamp() + ttl_seconds : 0;
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, expires_at);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        set_error_from_db();
        return false;
    }
    return true;
}

int SqliteStateStore::cache_count() const {
    if (!db_) return -1;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM cache", -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return -1;
    }

    int count = -1;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

bool SqliteStateStore::clear() {
    if (!exec_sql("DELETE FROM cache")) {
        return false;
    }
    LOG_DEBUG("[StateStore] Cache cleared (%d rows)", sqlite3_changes(db_));
    return true;
}

} // namespace lgctl
