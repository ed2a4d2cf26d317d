/**
 * @file metrics.cpp
 * @brief Implementation of counter collection for the command runner service
 */

#include "logging/metrics.h"

#include "logging/logger.h"

namespace cmdrunner {
namespace metrics {

// ============================================================
// LocalCounterManager
// ============================================================

void LocalCounterManager::incrementCounter(const std::string& name, int64_t delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[name] += delta;
}

void LocalCounterManager::resetCounter(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[name] = 0;
}

void LocalCounterManager::addStatsCounter(const std::string& name,
                                          const std::vector<std::string>& statTypes) {
    // Only plain counters are kept; derived statistics are not computed here
    if (!statTypes.empty()) {
        LOG_INFO("stats counter not supported: {} ({} stat types)", name, statTypes.size());
    }
    resetCounter(name);
}

int64_t LocalCounterManager::getCounter(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(name);
    return it != counters_.end() ? it->second : 0;
}

std::map<std::string, int64_t> LocalCounterManager::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_;
}

// ============================================================
// CounterRegistry
// ============================================================

void CounterRegistry::declare(const std::string& name) {
    std::shared_ptr<CounterManager> manager;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!declared_.insert(name).second) {
            return;
        }
        manager = manager_;
    }
    if (manager) {
        manager->resetCounter(name);
    }
}

void CounterRegistry::declare(const std::vector<std::string>& names) {
    for (const auto& name : names) {
        declare(name);
    }
}

void CounterRegistry::attach(std::shared_ptr<CounterManager> manager) {
    std::set<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        manager_ = manager;
        names = declared_;
    }
    if (!manager) {
        return;
    }
    LOG_INFO("Registering counter manager ({} counters)", names.size());
    for (const auto& name : names) {
        manager->resetCounter(name);
    }
}

std::shared_ptr<CounterManager> CounterRegistry::manager() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return manager_;
}

void CounterRegistry::increment(const std::string& name, int64_t delta) {
    auto current = manager();
    if (!current) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        return;
    }
    current->incrementCounter(name, delta);
}

std::vector<std::string> CounterRegistry::declaredCounters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {declared_.begin(), declared_.end()};
}

nlohmann::json CounterRegistry::toJson() const {
    std::set<std::string> names;
    std::shared_ptr<CounterManager> current;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        names = declared_;
        current = manager_;
    }

    nlohmann::json counters = nlohmann::json::object();
    for (const auto& name : names) {
        counters[name] = current ? current->getCounter(name) : 0;
    }

    nlohmann::json result;
    result["counters"] = counters;
    result["collectorAttached"] = static_cast<bool>(current);
    result["droppedIncrements"] = dropped_.load(std::memory_order_relaxed);
    return result;
}

}  // namespace metrics
}  // namespace cmdrunner
