/*
 * nmcp - MCP Server Pool Operator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "nmcp/operator.hpp"
#include "nmcp/activity.hpp"
#include "nmcp/bridge.hpp"
#include "nmcp/controller.hpp"
#include "nmcp/gateway.hpp"
#include "nmcp/logger.hpp"
#include "nmcp/object_store.hpp"
#include "nmcp/process_runtime.hpp"
#include "nmcp/store.hpp"
#include "nmcp/workload.hpp"
#include <filesystem>

namespace nmcp {

// Signal handling is done by the daemon (nmcpd.cpp), not here

Operator::Operator(const Config& config) : config_(config) {
    objects_ = std::make_unique<ObjectStore>(config_.workspace);
    store_ = std::make_unique<ResourceStore>(*objects_);
    runtime_ = std::make_unique<ProcessRuntime>(config_.terminationGrace);
    workloads_ = std::make_unique<WorkloadManager>(*runtime_);
    activity_ = std::make_unique<ActivityTracker>();
    controller_ = std::make_unique<Controller>(*store_, *workloads_, *activity_, config_);
    bridge_ = std::make_unique<Bridge>(*controller_, *store_, *workloads_, *activity_, config_);
    gateway_ = std::make_unique<HttpGateway>(*bridge_, config_);
    LOG_DEBUG("Operator created - " + config_.describe());
}

Operator::~Operator() {
    shutdown();
}

bool Operator::start() {
    if (running_.load()) {
        LOG_WARN("Operator already running");
        return false;
    }

    LOG_INFO("Starting nmcp operator...");
    setThreadName("Main");

    if (!config_.workspace.empty()) {
        if (!createWorkspace()) {
            LOG_ERROR("Failed to create workspace");
            return false;
        }
        if (!objects_->load()) {
            LOG_WARN("Some persisted objects could not be loaded");
        }
    }

    LOG_DEBUG("========================================");
    LOG_DEBUG("nmcp Operator Starting");
    LOG_DEBUG("========================================");
    LOG_DEBUG(config_.describe());
    LOG_DEBUG("========================================");

    if (!controller_->start()) {
        LOG_ERROR("Failed to start controller");
        return false;
    }
    if (!gateway_->start()) {
        LOG_ERROR("Failed to start gateway");
        controller_->stop();
        return false;
    }

    running_.store(true);
    LOG_DEBUG("Operator started successfully");
    return true;
}

void Operator::shutdown() noexcept {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("Shutting down operator...");

    gateway_->stop();
    bridge_->closeAll();
    controller_->stop();
    runtime_->shutdown();

    LOG_INFO("Operator shutdown complete");
}

bool Operator::createWorkspace() noexcept {
    try {
        std::filesystem::create_directories(config_.workspace / "objects");
        LOG_DEBUG("Workspace ready: " + config_.workspace.string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create workspace: " + std::string(e.what()));
        return false;
    }
}

}
