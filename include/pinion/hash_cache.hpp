#pragma once

#include <pinion/result.hpp>
#include <memory>
#include <string>
#include <vector>

namespace pinion {

// Persistent key -> artifact hash list store, backed by SQLite.
// Keys are "name==version" for index packages and absolute paths for
// local artifacts.
class HashCache {
public:
    HashCache();
    ~HashCache();

    HashCache(HashCache&&) noexcept;
    HashCache& operator=(HashCache&&) noexcept;
    HashCache(const HashCache&) = delete;
    HashCache& operator=(const HashCache&) = delete;

    // Opens (creating if needed) the database. A corrupt file is removed
    // and recreated.
    Status open(const std::string& db_path);
    void close();
    bool is_open() const;

    // NotFound when the key has never been stored
    Result<std::vector<std::string>> lookup(const std::string& key);
    Status store(const std::string& key, const std::vector<std::string>& hashes);
    Status remove(const std::string& key);
    Status clear();
    Result<int64_t> count();

    // $HOME/.pinion/cache/hashes.db
    static std::string default_cache_path();

    static std::string package_key(const std::string& name, const std::string& version);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace pinion
