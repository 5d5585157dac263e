/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "nmcp/types.hpp"

namespace nmcp {

enum class WatchEventType : std::uint8_t { Added, Modified, Deleted };

struct StoredObject {
    std::string kind;
    std::string name;
    std::uint64_t resourceVersion = 0;
    // Bumped on spec writes only; status writes leave it alone.
    std::uint64_t generation = 0;
    nlohmann::json spec;
    nlohmann::json status;
};

using WatchCallback = std::function<void(WatchEventType, const StoredObject&)>;

// Generic object API of the orchestration substrate: JSON documents keyed by
// (kind, name), optimistic concurrency on resourceVersion, and a watch.
// With a workspace the objects are mirrored to <workspace>/objects/<kind>/<name>.json.
class ObjectStore {
public:
    explicit ObjectStore(std::filesystem::path workspace = {});

    ObjectStore(const ObjectStore&) = delete;
    ObjectStore& operator=(const ObjectStore&) = delete;
    ObjectStore(ObjectStore&&) = delete;
    ObjectStore& operator=(ObjectStore&&) = delete;

    // Reload persisted objects. No-op for an in-memory store.
    [[nodiscard]] bool load();

    [[nodiscard]] Result<StoredObject> get(const std::string& kind, const std::string& name) const;
    [[nodiscard]] std::vector<StoredObject> list(const std::string& kind) const;

    [[nodiscard]] Result<StoredObject> create(const std::string& kind, const std::string& name,
                                              nlohmann::json spec, nlohmann::json status);
    [[nodiscard]] Result<StoredObject> replaceSpec(const std::string& kind, const std::string& name,
                                                   nlohmann::json spec, std::uint64_t expectedVersion);
    [[nodiscard]] Result<StoredObject> replaceStatus(const std::string& kind, const std::string& name,
                                                     nlohmann::json status, std::uint64_t expectedVersion);
    [[nodiscard]] Error remove(const std::string& kind, const std::string& name);

    int watch(WatchCallback callback);
    void unwatch(int id);

    [[nodiscard]] const std::filesystem::path& workspace() const noexcept { return workspace_; }

private:
    using Key = std::pair<std::string, std::string>;

    [[nodiscard]] bool persist(const StoredObject& obj) const noexcept;
    [[nodiscard]] bool unpersist(const std::string& kind, const std::string& name) const noexcept;
    [[nodiscard]] std::filesystem::path objectPath(const std::string& kind, const std::string& name) const;
    void notify(WatchEventType type, const StoredObject& obj);

    std::filesystem::path workspace_;

    mutable std::mutex mutex_;
    std::map<Key, StoredObject> objects_;
    std::uint64_t version_ = 0;

    std::mutex watchMutex_;
    std::map<int, WatchCallback> watchers_;
    int nextWatchId_ = 1;
};

}
