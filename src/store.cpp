/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nmcp/store.hpp"
#include "nmcp/logger.hpp"

namespace nmcp {

ResourceStore::ResourceStore(ObjectStore& objects) noexcept : objects_(objects) {
}

Result<Pool> ResourceStore::decodePool(const StoredObject& obj) {
    try {
        Pool pool;
        pool.name = obj.name;
        pool.resourceVersion = obj.resourceVersion;
        pool.generation = obj.generation;
        pool.spec = obj.spec.get<PoolSpec>();
        if (!obj.status.is_null()) {
            pool.status = obj.status.get<PoolStatus>();
        }
        return Result<Pool>::success(std::move(pool));
    } catch (const std::exception& e) {
        return Result<Pool>::failure(ErrorKind::InvalidSpec, "malformed Pool '" + obj.name + "': " + e.what());
    }
}

Result<Server> ResourceStore::decodeServer(const StoredObject& obj) {
    try {
        Server server;
        server.name = obj.name;
        server.resourceVersion = obj.resourceVersion;
        server.generation = obj.generation;
        server.spec = obj.spec.get<ServerSpec>();
        if (!obj.status.is_null()) {
            server.status = obj.status.get<ServerStatus>();
        }
        return Result<Server>::success(std::move(server));
    } catch (const std::exception& e) {
        return Result<Server>::failure(ErrorKind::InvalidSpec, "malformed Server '" + obj.name + "': " + e.what());
    }
}

Result<Pool> ResourceStore::getPool(const std::string& name) const {
    auto obj = objects_.get(PoolKind, name);
    if (!obj) {
        return Result<Pool>::failure(obj.error);
    }
    return decodePool(obj.value);
}

std::vector<Pool> ResourceStore::listPools() const {
    std::vector<Pool> pools;
    for (const auto& obj : objects_.list(PoolKind)) {
        auto decoded = decodePool(obj);
        if (decoded) {
            pools.push_back(std::move(decoded.value));
        } else {
            LOG_WARN(decoded.error.message);
        }
    }
    return pools;
}

Result<Pool> ResourceStore::createPool(const Pool& pool) {
    auto obj = objects_.create(PoolKind, pool.name, nlohmann::json(pool.spec), nlohmann::json(pool.status));
    if (!obj) {
        return Result<Pool>::failure(obj.error);
    }
    return decodePool(obj.value);
}

Result<Pool> ResourceStore::updatePoolSpec(const Pool& pool) {
    auto obj = objects_.replaceSpec(PoolKind, pool.name, nlohmann::json(pool.spec), pool.resourceVersion);
    if (!obj) {
        return Result<Pool>::failure(obj.error);
    }
    return decodePool(obj.value);
}

Result<Pool> ResourceStore::updatePoolStatus(const Pool& pool) {
    auto obj = objects_.replaceStatus(PoolKind, pool.name, nlohmann::json(pool.status), pool.resourceVersion);
    if (!obj) {
        return Result<Pool>::failure(obj.error);
    }
    return decodePool(obj.value);
}

Error ResourceStore::deletePool(const std::string& name) {
    return objects_.remove(PoolKind, name);
}

Result<Server> ResourceStore::getServer(const std::string& name) const {
    auto obj = objects_.get(ServerKind, name);
    if (!obj) {
        return Result<Server>::failure(obj.error);
    }
    return decodeServer(obj.value);
}

std::vector<Server> ResourceStore::listServers() const {
    std::vector<Server> servers;
    for (const auto& obj : objects_.list(ServerKind)) {
        auto decoded = decodeServer(obj);
        if (decoded) {
            servers.push_back(std::move(decoded.value));
        } else {
            LOG_WARN(decoded.error.message);
        }
    }
    return servers;
}

std::vector<Server> ResourceStore::listServersInPool(const std::string& pool) const {
    std::vector<Server> members;
    for (auto& server : listServers()) {
        if (server.spec.pool == pool) {
            members.push_back(std::move(server));
        }
    }
    return members;
}

Result<Server> ResourceStore::createServer(const Server& server) {
    auto obj = objects_.create(ServerKind, server.name, nlohmann::json(server.spec), nlohmann::json(server.status));
    if (!obj) {
        return Result<Server>::failure(obj.error);
    }
    return decodeServer(obj.value);
}

Result<Server> ResourceStore::updateServerSpec(const Server& server) {
    auto obj = objects_.replaceSpec(ServerKind, server.name, nlohmann::json(server.spec), server.resourceVersion);
    if (!obj) {
        return Result<Server>::failure(obj.error);
    }
    return decodeServer(obj.value);
}

Result<Server> ResourceStore::updateServerStatus(const Server& server) {
    auto obj = objects_.replaceStatus(ServerKind, server.name, nlohmann::json(server.status), server.resourceVersion);
    if (!obj) {
        return Result<Server>::failure(obj.error);
    }
    return decodeServer(obj.value);
}

Error ResourceStore::deleteServer(const std::string& name) {
    return objects_.remove(ServerKind, name);
}

int ResourceStore::watch(ResourceWatch callback) {
    return objects_.watch([callback = std::move(callback)](WatchEventType type, const StoredObject& obj) {
        if (obj.kind == PoolKind) {
            callback(ResourceKind::Pool, type, obj.name);
        } else if (obj.kind == ServerKind) {
            callback(ResourceKind::Server, type, obj.name);
        }
    });
}

void ResourceStore::unwatch(int id) {
    objects_.unwatch(id);
}

}
