#pragma once
#include <memory>

namespace router_monitor {

class RouterDevice;

// Polling-protocol client. Only routers with useSnmp enabled are expected
// to be handed to it.
class SnmpService {
public:
    virtual ~SnmpService() = default;

    virtual void startMonitoring(std::shared_ptr<RouterDevice> router) = 0;
    virtual void stopMonitoring(std::shared_ptr<RouterDevice> router) = 0;
    virtual bool isMonitoring(const RouterDevice& router) const = 0;
};

}
