#pragma once
#include <future>
#include <memory>

namespace router_monitor {

class RouterDevice;

// Request/response client for a router's management API.
//
// Implementations write fetched data into the router's own data slots and
// report failures by storing an exception in the returned future. They may
// change the router's connection state but never touch registry membership.
class RouterApiService {
public:
    virtual ~RouterApiService() = default;

    // Resolves to false when the router refused or was unreachable; the
    // router's connection state then carries the reason.
    virtual std::future<bool> connectAsync(std::shared_ptr<RouterDevice> router) = 0;

    // Synchronous and idempotent.
    virtual void disconnect(std::shared_ptr<RouterDevice> router) = 0;

    virtual std::future<void> getSystemInfoAsync(std::shared_ptr<RouterDevice> router) = 0;
    virtual std::future<void> getNetworkInterfacesAsync(std::shared_ptr<RouterDevice> router) = 0;
    virtual std::future<void> getDhcpLeasesAsync(std::shared_ptr<RouterDevice> router) = 0;
    virtual std::future<void> getLogEntriesAsync(std::shared_ptr<RouterDevice> router, int count) = 0;
};

}
