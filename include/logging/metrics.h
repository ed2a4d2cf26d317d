/**
 * @file metrics.h
 * @brief Counter collection API for the command runner service
 *
 * Components declare named counters into a CounterRegistry. The registry
 * forwards increments to whichever CounterManager (stats collector) is
 * attached; until one is attached, increments are dropped.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>

namespace cmdrunner {
namespace metrics {

/**
 * @brief Stats collector contract
 *
 * Implement this to forward counters to an external monitoring system.
 */
class CounterManager {
   public:
    virtual ~CounterManager() = default;

    virtual void incrementCounter(const std::string& name, int64_t delta = 1) = 0;
    virtual void resetCounter(const std::string& name) = 0;

    /**
     * @brief Register a counter that exports derived statistics
     *
     * @param statTypes Requested aggregations (e.g. "sum", "rate"); collectors
     *                  that only support plain counters may ignore them
     */
    virtual void addStatsCounter(const std::string& name,
                                 const std::vector<std::string>& statTypes) = 0;

    virtual int64_t getCounter(const std::string& name) const = 0;
    virtual std::map<std::string, int64_t> snapshot() const = 0;
};

/**
 * @brief In-process CounterManager keeping plain counters in memory
 */
class LocalCounterManager : public CounterManager {
   public:
    void incrementCounter(const std::string& name, int64_t delta = 1) override;
    void resetCounter(const std::string& name) override;
    void addStatsCounter(const std::string& name,
                         const std::vector<std::string>& statTypes) override;
    int64_t getCounter(const std::string& name) const override;
    std::map<std::string, int64_t> snapshot() const override;

   private:
    mutable std::mutex mutex_;
    std::map<std::string, int64_t> counters_;
};

/**
 * @brief Registry of declared counters with a swappable collector
 *
 * Thread-safe. Counters declared before attach() are reset on the collector
 * when it is attached; counters declared afterwards are reset immediately.
 */
class CounterRegistry {
   public:
    void declare(const std::string& name);
    void declare(const std::vector<std::string>& names);

    void attach(std::shared_ptr<CounterManager> manager);
    std::shared_ptr<CounterManager> manager() const;

    void increment(const std::string& name, int64_t delta = 1);

    std::vector<std::string> declaredCounters() const;

    /**
     * @brief Declared counters with their current values
     *
     * Values are 0 when no collector is attached.
     */
    nlohmann::json toJson() const;

   private:
    mutable std::mutex mutex_;
    std::set<std::string> declared_;
    std::shared_ptr<CounterManager> manager_;
    std::atomic<uint64_t> dropped_{0};
};

}  // namespace metrics
}  // namespace cmdrunner
