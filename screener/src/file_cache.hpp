#pragma once

#include "clock.hpp"
#include <string>
#include <optional>
#include <memory>
#include <filesystem>
#include <nlohmann/json.hpp>

class CacheStore {
public:
    virtual ~CacheStore() = default;

    // nullopt on miss (absent, unreadable or expired)
    virtual std::optional<nlohmann::json> get(const std::string& key) = 0;
    virtual void set(const std::string& key, const nlohmann::json& value) = 0;
};

// One JSON file per key: {"ts": <epoch seconds>, "value": <payload>}.
// Expiry is checked on read; nothing is swept.
class FileCache : public CacheStore {
public:
    FileCache(const std::filesystem::path& root, int ttl_seconds,
              std::shared_ptr<Clock> clock);

    std::optional<nlohmann::json> get(const std::string& key) override;
    void set(const std::string& key, const nlohmann::json& value) override;

    std::filesystem::path path_for(const std::string& key) const;

private:
    std::filesystem::path root_;
    int ttl_seconds_;
    std::shared_ptr<Clock> clock_;
};
