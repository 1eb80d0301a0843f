#pragma once
#include "RouterDevice.hpp"
#include "SnmpService.hpp"
#include "StatisticsService.hpp"
#include <mutex>
#include <set>
#include <string>

namespace router_monitor {
namespace testing {

template <typename Interface>
class FakeMonitor : public Interface {
public:
    void startMonitoring(std::shared_ptr<RouterDevice> router) override {
        std::lock_guard<std::mutex> lock(mutex_);
        monitored_.insert(router->id());
    }

    void stopMonitoring(std::shared_ptr<RouterDevice> router) override {
        std::lock_guard<std::mutex> lock(mutex_);
        monitored_.erase(router->id());
    }

    bool isMonitoring(const RouterDevice& router) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return monitored_.count(router.id()) > 0;
    }

private:
    mutable std::mutex mutex_;
    std::set<std::string> monitored_;
};

using FakeSnmpService = FakeMonitor<SnmpService>;
using FakeStatisticsService = FakeMonitor<StatisticsService>;

} // namespace testing
} // namespace router_monitor
