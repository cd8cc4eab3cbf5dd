/*
 * lgctl - State store
 *
 * StateStore is the read side the CLI consumes: entity collections, the
 * runtime parameter tree, and clear() for the shared response cache.
 *
 * SqliteStateStore keeps both in one SQLite database:
 *   state(key, value)             - JSON documents: devices, directives, plugins, params
 *   cache(key, value, expires_at) - cached query responses
 */
#ifndef lgctl_STATE_STORE_HPP
#define lgctl_STATE_STORE_HPP

#include <lgctl/core/entity.hpp>
#include <lgctl/core/json.hpp>
#include <string>
#include <vector>
#include <cstdint>
#include <sqlite3.h>

namespace lgctl {

class StateStore {
public:
    virtual ~StateStore() {}

    virtual EntityCollection devices() const = 0;
    virtual EntityCollection directives() const = 0;
    virtual EntityCollection plugins(PluginType type) const = 0;

    // Runtime parameter tree (an object; empty when nothing is stored)
    virtual Json params() const = 0;

    // Drop every cached response
    virtual bool clear() = 0;

    virtual std::string last_error() const = 0;
};

class SqliteStateStore : public StateStore {
public:
    SqliteStateStore();
    ~SqliteStateStore();

    bool open(const std::string& db_path);
    void close();
    bool is_open() const { return db_ != nullptr; }
    const std::string& path() const { return path_; }

    // StateStore
    EntityCollection devices() const override;
    EntityCollection directives() const override;
    EntityCollection plugins(PluginType type) const override;
    Json params() const override;
    bool clear() override;
    std::string last_error() const override { return last_error_; }

    // Writers, used by the installer and tests
    bool put_state(const std::string& key, const Json& value);
    bool get_state(const std::string& key, Json& out) const;

    // Copies devices/directives/plugins/params from `section` when present.
    // Returns the number of documents written, -1 on error.
    int import_state(const Json& section);

    bool cache_put(const std::string& key, const std::string& value, int64_t ttl_seconds);
    int cache_count() const;

private:
    SqliteStateStore(const SqliteStateStore&);
    SqliteStateStore& operator=(const SqliteStateStore&);

    bool init_tables();
    bool exec_sql(const std::string& sql);
    EntityCollection load_collection(const std::string& key) const;
    void set_error_from_db() const;

    sqlite3* db_;
    std::string path_;
    mutable std::string last_error_;
};

} // namespace lgctl

#endif // lgctl_STATE_STORE_HPP
