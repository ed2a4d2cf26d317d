#include "daemon/metrics/stats_reporter.h"

#include "core/error_codes.h"
#include "logging/logger.h"
#include "logging/metrics.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace daemon_metrics {

StatsReporter::StatsReporter(std::string path, std::chrono::milliseconds interval,
                             const cmdrunner::metrics::CounterRegistry& registry,
                             std::string serviceName)
    : PeriodicTask("stats_reporter", interval),
      path_(std::move(path)),
      registry_(registry),
      serviceName_(std::move(serviceName)) {
    if (path_.empty()) {
        throw cmdrunner::ConfigError("Stats file path is empty");
    }
}

StatsReporter::~StatsReporter() {
    stop();
}

void StatsReporter::setExtraProvider(ExtraProvider provider) {
    extraProvider_ = std::move(provider);
}

nlohmann::json StatsReporter::buildSnapshot() const {
    nlohmann::json payload = registry_.toJson();
    payload["service"] = {{"name", serviceName_}};
    if (extraProvider_) {
        payload["service"].update(extraProvider_());
    }
    payload["timestamp"] = std::chrono::duration_cast<std::chrono::seconds>(
                               std::chrono::system_clock::now().time_since_epoch())
                               .count();
    return payload;
}

void StatsReporter::run(const daemon_core::CancellationToken& /*token*/) {
    if (!writeJsonAtomically(buildSnapshot())) {
        throw cmdrunner::ServiceError(cmdrunner::ErrorCode::INTERNAL_UNKNOWN,
                                      "Failed to write stats file " + path_);
    }
    LOG_TRACE("Stats written to {}", path_);
    markReady();
}

void StatsReporter::removeIfExists() const {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        LOG_WARN("Failed to remove stats file {}: {}", path_, ec.message());
    }
}

bool StatsReporter::writeJsonAtomically(const nlohmann::json& payload) const {
    std::string tmpPath = path_ + ".tmp";
    {
        std::ofstream ofs(tmpPath);
        if (!ofs) {
            return false;
        }
        ofs << payload.dump(2);
        if (!ofs) {
            return false;
        }
    }
    return (std::rename(tmpPath.c_str(), path_.c_str()) == 0);
}

}  // namespace daemon_metrics
