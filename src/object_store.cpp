/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nmcp/object_store.hpp"
#include "nmcp/logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>

namespace nmcp {

namespace {
bool isValidName(const std::string& name) {
    if (name.empty() || name.size() > 253) return false;
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '.' || c == '_';
    });
}
}

ObjectStore::ObjectStore(std::filesystem::path workspace) : workspace_(std::move(workspace)) {
    LOG_DEBUG("ObjectStore created: " + (workspace_.empty() ? std::string("(memory)") : workspace_.string()));
}

bool ObjectStore::load() {
    if (workspace_.empty()) {
        return true;
    }

    try {
        auto root = workspace_ / "objects";
        std::filesystem::create_directories(root);

        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t loaded = 0;
        for (const auto& kindDir : std::filesystem::directory_iterator(root)) {
            if (!kindDir.is_directory()) continue;
            for (const auto& entry : std::filesystem::directory_iterator(kindDir.path())) {
                if (!entry.is_regular_file() || entry.path().extension() != ".json") {
                    continue;
                }
                std::ifstream file(entry.path(), std::ios::binary);
                if (!file) {
                    LOG_WARN("Skipping unreadable object: " + entry.path().string());
                    continue;
                }
                nlohmann::json doc = nlohmann::json::parse(file, nullptr, false);
                if (doc.is_discarded() || !doc.is_object()) {
                    LOG_WARN("Skipping malformed object: " + entry.path().string());
                    continue;
                }

                StoredObject obj;
                obj.kind = doc.value("kind", kindDir.path().filename().string());
                obj.name = doc.value("name", entry.path().stem().string());
                obj.resourceVersion = doc.value("resourceVersion", std::uint64_t{0});
                obj.generation = doc.value("generation", std::uint64_t{1});
                obj.spec = doc.value("spec", nlohmann::json::object());
                obj.status = doc.value("status", nlohmann::json::object());
                version_ = std::max(version_, obj.resourceVersion);
                objects_[{obj.kind, obj.name}] = std::move(obj);
                ++loaded;
            }
        }

        LOG_INFO("Loaded " + std::to_string(loaded) + " object(s) from " + root.string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to load object store: " + std::string(e.what()));
        return false;
    }
}

Result<StoredObject> ObjectStore::get(const std::string& kind, const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find({kind, name});
    if (it == objects_.end()) {
        return Result<StoredObject>::failure(ErrorKind::NotFound, kind + " '" + name + "' not found");
    }
    return Result<StoredObject>::success(it->second);
}

std::vector<StoredObject> ObjectStore::list(const std::string& kind) const {
    std::vector<StoredObject> out;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = objects_.lower_bound({kind, std::string()});
         it != objects_.end() && it->first.first == kind; ++it) {
        out.push_back(it->second);
    }
    return out;
}

Result<StoredObject> ObjectStore::create(const std::string& kind, const std::string& name,
                                         nlohmann::json spec, nlohmann::json status) {
    if (!isValidName(name)) {
        return Result<StoredObject>::failure(ErrorKind::InvalidSpec, "invalid name: '" + name + "'");
    }

    StoredObject created;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (objects_.count({kind, name}) > 0) {
            return Result<StoredObject>::failure(ErrorKind::AlreadyExists,
                                                 kind + " '" + name + "' already exists");
        }
        created.kind = kind;
        created.name = name;
        created.resourceVersion = version_ + 1;
        created.generation = 1;
        created.spec = std::move(spec);
        created.status = std::move(status);
        if (!persist(created)) {
            return Result<StoredObject>::failure(ErrorKind::SubstrateError,
                                                 "failed to persist " + kind + " '" + name + "'");
        }
        ++version_;
        objects_[{kind, name}] = created;
    }

    LOG_DEBUG("Created " + kind + "/" + name + " rv=" + std::to_string(created.resourceVersion));
    notify(WatchEventType::Added, created);
    return Result<StoredObject>::success(std::move(created));
}

Result<StoredObject> ObjectStore::replaceSpec(const std::string& kind, const std::string& name,
                                              nlohmann::json spec, std::uint64_t expectedVersion) {
    StoredObject updated;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = objects_.find({kind, name});
        if (it == objects_.end()) {
            return Result<StoredObject>::failure(ErrorKind::NotFound, kind + " '" + name + "' not found");
        }
        if (it->second.resourceVersion != expectedVersion) {
            return Result<StoredObject>::failure(ErrorKind::Conflict,
                kind + " '" + name + "' changed (have " + std::to_string(expectedVersion) +
                ", current " + std::to_string(it->second.resourceVersion) + ")");
        }
        updated = it->second;
        if (updated.spec == spec) {
            return Result<StoredObject>::success(std::move(updated));
        }
        updated.spec = std::move(spec);
        updated.generation += 1;
        updated.resourceVersion = version_ + 1;
        if (!persist(updated)) {
            return Result<StoredObject>::failure(ErrorKind::SubstrateError,
                                                 "failed to persist " + kind + " '" + name + "'");
        }
        ++version_;
        it->second = updated;
    }

    notify(WatchEventType::Modified, updated);
    return Result<StoredObject>::success(std::move(updated));
}

Result<StoredObject> ObjectStore::replaceStatus(const std::string& kind, const std::string& name,
                                                nlohmann::json status, std::uint64_t expectedVersion) {
    StoredObject updated;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = objects_.find({kind, name});
        if (it == objects_.end()) {
            return Result<StoredObject>::failure(ErrorKind::NotFound, kind + " '" + name + "' not found");
        }
        if (it->second.resourceVersion != expectedVersion) {
            return Result<StoredObject>::failure(ErrorKind::Conflict,
                kind + " '" + name + "' changed (have " + std::to_string(expectedVersion) +
                ", current " + std::to_string(it->second.resourceVersion) + ")");
        }
        updated = it->second;
        if (updated.status == status) {
            return Result<StoredObject>::success(std::move(updated));
        }
        updated.status = std::move(status);
        updated.resourceVersion = version_ + 1;
        if (!persist(updated)) {
            return Result<StoredObject>::failure(ErrorKind::SubstrateError,
                                                 "failed to persist " + kind + " '" + name + "'");
        }
        ++version_;
        it->second = updated;
    }

    LOG_TRACE("Status of " + kind + "/" + name + " now rv=" + std::to_string(updated.resourceVersion));
    notify(WatchEventType::Modified, updated);
    return Result<StoredObject>::success(std::move(updated));
}

Error ObjectStore::remove(const std::string& kind, const std::string& name) {
    StoredObject removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = objects_.find({kind, name});
        if (it == objects_.end()) {
            return {ErrorKind::NotFound, kind + " '" + name + "' not found"};
        }
        if (!unpersist(kind, name)) {
            return {ErrorKind::SubstrateError, "failed to remove persisted " + kind + " '" + name + "'"};
        }
        removed = std::move(it->second);
        objects_.erase(it);
        ++version_;
    }

    LOG_DEBUG("Deleted " + kind + "/" + name);
    notify(WatchEventType::Deleted, removed);
    return {};
}

int ObjectStore::watch(WatchCallback callback) {
    std::lock_guard<std::mutex> lock(watchMutex_);
    int id = nextWatchId_++;
    watchers_[id] = std::move(callback);
    return id;
}

void ObjectStore::unwatch(int id) {
    std::lock_guard<std::mutex> lock(watchMutex_);
    watchers_.erase(id);
}

void ObjectStore::notify(WatchEventType type, const StoredObject& obj) {
    std::vector<WatchCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(watchMutex_);
        callbacks.reserve(watchers_.size());
        for (const auto& [id, cb] : watchers_) {
            callbacks.push_back(cb);
        }
    }
    // Callbacks run without any store lock held; they may read back into the store.
    for (const auto& cb : callbacks) {
        try {
            cb(type, obj);
        } catch (const std::exception& e) {
            LOG_ERROR("Watch callback failed for " + obj.kind + "/" + obj.name + ": " + e.what());
        }
    }
}

std::filesystem::path ObjectStore::objectPath(const std::string& kind, const std::string& name) const {
    return workspace_ / "objects" / kind / (name + ".json");
}

bool ObjectStore::persist(const StoredObject& obj) const noexcept {
    if (workspace_.empty()) {
        return true;
    }

    try {
        auto finalPath = objectPath(obj.kind, obj.name);
        std::filesystem::create_directories(finalPath.parent_path());

        nlohmann::json doc = {{"kind", obj.kind},
                              {"name", obj.name},
                              {"resourceVersion", obj.resourceVersion},
                              {"generation", obj.generation},
                              {"spec", obj.spec},
                              {"status", obj.status}};

        // Write beside the target, then rename into place
        auto tempPath = finalPath;
        tempPath += ".tmp";
        {
            std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
            if (!file) return false;
            file << doc.dump(2);
            file.flush();
            if (!file.good()) return false;
        }
        std::filesystem::rename(tempPath, finalPath);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to persist " + obj.kind + "/" + obj.name + ": " + e.what());
        return false;
    }
}

bool ObjectStore::unpersist(const std::string& kind, const std::string& name) const noexcept {
    if (workspace_.empty()) {
        return true;
    }
    std::error_code ec;
    std::filesystem::remove(objectPath(kind, name), ec);
    if (ec) {
        LOG_ERROR("Failed to remove " + kind + "/" + name + ": " + ec.message());
        return false;
    }
    return true;
}

}
