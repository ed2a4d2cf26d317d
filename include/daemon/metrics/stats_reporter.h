#pragma once

#include "daemon/core/periodic_task.h"

#include <chrono>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>

namespace cmdrunner {
namespace metrics {
class CounterRegistry;
}
}  // namespace cmdrunner

namespace daemon_metrics {

/**
 * @brief Periodically writes a counter snapshot to a JSON file
 *
 * The file is replaced atomically (write to "<path>.tmp", then rename) so
 * readers never see a partial document.
 */
class StatsReporter : public daemon_core::PeriodicTask {
   public:
    using ExtraProvider = std::function<nlohmann::json()>;

    StatsReporter(std::string path, std::chrono::milliseconds interval,
                  const cmdrunner::metrics::CounterRegistry& registry,
                  std::string serviceName = "cmdrunner");
    ~StatsReporter() override;

    /**
     * @brief Merge provider() into every snapshot under "service"
     */
    void setExtraProvider(ExtraProvider provider);

    nlohmann::json buildSnapshot() const;

    const std::string& path() const {
        return path_;
    }

    void removeIfExists() const;
    bool writeJsonAtomically(const nlohmann::json& payload) const;

   protected:
    void run(const daemon_core::CancellationToken& token) override;

   private:
    std::string path_;
    const cmdrunner::metrics::CounterRegistry& registry_;
    std::string serviceName_;
    ExtraProvider extraProvider_;
};

}  // namespace daemon_metrics
