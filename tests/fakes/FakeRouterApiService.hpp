#pragma once
#include "RouterApiService.hpp"
#include "RouterDevice.hpp"
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace router_monitor {
namespace testing {

// Thrown for calls named in nonStandardFailures. Not a std::exception.
struct NonStandardError {
    std::string call;
};

// Records every call in order. Futures are deferred, so the work runs on
// the coordinator's worker thread when it calls get().
class FakeRouterApiService : public RouterApiService {
public:
    bool connectSucceeds = true;
    std::string connectFailureReason = "Timeout";
    std::string connectError;                          // thrown from connect when set
    std::string disconnectError;                       // thrown from disconnect when set
    std::map<std::string, std::string> failingFetches; // call name -> error text
    std::shared_future<void> connectGate;              // connect waits on it when valid
    std::set<std::string> nonStandardFailures;         // call names that throw NonStandardError

    std::future<bool> connectAsync(std::shared_ptr<RouterDevice> router) override {
        record("connect");
        router->setConnectionState(ConnectionState::Connecting);

        auto gate = connectGate;
        auto error = connectError;
        auto succeeds = connectSucceeds;
        auto reason = connectFailureReason;
        auto nonStandard = nonStandardFailures.count("connect") > 0;
        auto finish = [gate, error, succeeds, reason, nonStandard, router]() -> bool {
            if (gate.valid()) {
                gate.wait();
            }
            if (nonStandard) {
                throw NonStandardError{"connect"};
            }
            if (!error.empty()) {
                router->setConnectionState(ConnectionState::Failed, error);
                throw std::runtime_error(error);
            }
            if (!succeeds) {
                router->setConnectionState(ConnectionState::Failed, reason);
                return false;
            }
            router->setConnectionState(ConnectionState::Connected);
            return true;
        };

        if (gate.valid()) {
            return std::async(std::launch::async, finish);
        }
        return std::async(std::launch::deferred, finish);
    }

    void disconnect(std::shared_ptr<RouterDevice> router) override {
        record("disconnect");
        if (!disconnectError.empty()) {
            throw std::runtime_error(disconnectError);
        }
        router->setConnectionState(ConnectionState::Disconnected);
    }

    std::future<void> getSystemInfoAsync(std::shared_ptr<RouterDevice> router) override {
        return fetch("systemInfo", [router] {
            SystemInfo info;
            info.identity = "fake-" + router->name();
            info.version = "7.14";
            router->setSystemInfo(info);
        });
    }

    std::future<void> getNetworkInterfacesAsync(std::shared_ptr<RouterDevice> router) override {
        return fetch("interfaces", [router] {
            NetworkInterface ether1;
            ether1.name = "ether1";
            ether1.running = true;
            router->setNetworkInterfaces({ether1});
        });
    }

    std::future<void> getDhcpLeasesAsync(std::shared_ptr<RouterDevice> router) override {
        return fetch("leases", [router] {
            DhcpLease lease;
            lease.address = "192.168.88.10";
            router->setDhcpLeases({lease});
        });
    }

    std::future<void> getLogEntriesAsync(std::shared_ptr<RouterDevice> router, int count) override {
        return fetch("logEntries", [router, count] {
            router->setLogEntries(std::vector<RouterLogEntry>(static_cast<size_t>(count)));
        }, ":" + std::to_string(count));
    }

    std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    int callCount(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        int count = 0;
        for (const auto& call : calls_) {
            if (call == name) {
                ++count;
            }
        }
        return count;
    }

private:
    void record(const std::string& call) {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(call);
    }

    std::future<void> fetch(const std::string& name,
                            std::function<void()> apply,
                            const std::string& suffix = "") {
        record(name + suffix);
        auto it = failingFetches.find(name);
        std::string error = (it != failingFetches.end()) ? it->second : std::string();
        bool nonStandard = nonStandardFailures.count(name) > 0;
        return std::async(std::launch::deferred, [name, error, nonStandard, apply] {
            if (nonStandard) {
                throw NonStandardError{name};
            }
            if (!error.empty()) {
                throw std::runtime_error(error);
            }
            apply();
        });
    }

    mutable std::mutex mutex_;
    std::vector<std::string> calls_;
};

} // namespace testing
} // namespace router_monitor
