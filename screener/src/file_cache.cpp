#include "file_cache.hpp"
#include <spdlog/spdlog.h>
#include <fstream>

FileCache::FileCache(const std::filesystem::path& root, int ttl_seconds,
                     std::shared_ptr<Clock> clock)
    : root_(root)
    , ttl_seconds_(ttl_seconds)
    , clock_(std::move(clock))
{
    std::filesystem::create_directories(root_);
}

std::filesystem::path FileCache::path_for(const std::string& key) const {
    std::string safe = key;
    for (auto& c : safe) {
        if (c == '/' || c == ':') c = '_';
    }
    return root_ / (safe + ".json");
}

std::optional<nlohmann::json> FileCache::get(const std::string& key) {
    auto path = path_for(key);
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }

    try {
        auto payload = nlohmann::json::parse(in);
        double ts = payload.value("ts", 0.0);
        if (clock_->now() - ts > ttl_seconds_) {
            spdlog::debug("Cache expired for {}", key);
            return std::nullopt;
        }
        if (!payload.contains("value")) {
            return std::nullopt;
        }
        spdlog::debug("Cache hit for {}", key);
        return payload["value"];
    } catch (const std::exception& e) {
        spdlog::warn("Unreadable cache entry {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

void FileCache::set(const std::string& key, const nlohmann::json& value) {
    auto path = path_for(key);
    nlohmann::json payload = {
        {"ts", clock_->now()},
        {"value", value}
    };

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        spdlog::warn("Failed to write cache entry {}", path.string());
        return;
    }
    out << payload.dump();
}
