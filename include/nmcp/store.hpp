/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "nmcp/object_store.hpp"
#include "nmcp/resources.hpp"

namespace nmcp {

enum class ResourceKind : std::uint8_t { Pool, Server };

using ResourceWatch = std::function<void(ResourceKind, WatchEventType, const std::string& name)>;

// Typed view of the substrate object store for the two resource kinds.
class ResourceStore {
public:
    explicit ResourceStore(ObjectStore& objects) noexcept;

    ResourceStore(const ResourceStore&) = delete;
    ResourceStore& operator=(const ResourceStore&) = delete;

    [[nodiscard]] Result<Pool> getPool(const std::string& name) const;
    [[nodiscard]] std::vector<Pool> listPools() const;
    [[nodiscard]] Result<Pool> createPool(const Pool& pool);
    [[nodiscard]] Result<Pool> updatePoolSpec(const Pool& pool);
    [[nodiscard]] Result<Pool> updatePoolStatus(const Pool& pool);
    [[nodiscard]] Error deletePool(const std::string& name);

    [[nodiscard]] Result<Server> getServer(const std::string& name) const;
    [[nodiscard]] std::vector<Server> listServers() const;
    [[nodiscard]] std::vector<Server> listServersInPool(const std::string& pool) const;
    [[nodiscard]] Result<Server> createServer(const Server& server);
    [[nodiscard]] Result<Server> updateServerSpec(const Server& server);
    // Writes server.status if server.resourceVersion is still current.
    [[nodiscard]] Result<Server> updateServerStatus(const Server& server);
    [[nodiscard]] Error deleteServer(const std::string& name);

    int watch(ResourceWatch callback);
    void unwatch(int id);

    static constexpr const char* PoolKind = "Pool";
    static constexpr const char* ServerKind = "Server";

private:
    [[nodiscard]] static Result<Pool> decodePool(const StoredObject& obj);
    [[nodiscard]] static Result<Server> decodeServer(const StoredObject& obj);

    ObjectStore& objects_;
};

}
