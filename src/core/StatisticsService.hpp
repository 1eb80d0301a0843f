#pragma once
#include <memory>

namespace router_monitor {

class RouterDevice;

class StatisticsService {
public:
    virtual ~StatisticsService() = default;

    virtual void startMonitoring(std::shared_ptr<RouterDevice> router) = 0;
    virtual void stopMonitoring(std::shared_ptr<RouterDevice> router) = 0;
    virtual bool isMonitoring(const RouterDevice& router) const = 0;
};

}
