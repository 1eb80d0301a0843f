#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <chrono>

namespace router_monitor {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Failed
};

enum class GatedAction {
    Remove,
    Connect,
    Disconnect,
    Refresh
};

enum class CoordinatorField {
    SelectedRouter,
    Busy,
    StatusMessage
};

// How the four post-connect / refresh fetches react to a failing step.
enum class FetchPolicy {
    AbortOnFirstFailure,
    ContinueOnFailure
};

enum class ActionOutcome {
    Succeeded,
    Failed,
    Rejected
};

struct ActionResult {
    ActionOutcome outcome{ActionOutcome::Rejected};
    std::string message;
    std::vector<std::string> failedSteps;

    bool succeeded() const { return outcome == ActionOutcome::Succeeded; }
};

struct CoordinatorSnapshot {
    std::string selectedRouterId;   // empty when nothing is selected
    bool busy{false};
    std::string statusMessage;
    bool canRemove{false};
    bool canConnect{false};
    bool canDisconnect{false};
    bool canRefresh{false};
};

struct SystemInfo {
    std::string identity;
    std::string boardName;
    std::string version;
    std::chrono::seconds uptime{0};
    double cpuLoad{0.0};            // percent
    uint64_t freeMemory{0};         // bytes
    uint64_t totalMemory{0};        // bytes
};

struct NetworkInterface {
    std::string name;
    std::string type;
    std::string macAddress;
    bool running{false};
    bool disabled{false};
    uint64_t rxBytes{0};
    uint64_t txBytes{0};
};

struct DhcpLease {
    std::string address;
    std::string macAddress;
    std::string hostName;
    std::string status;
    std::chrono::seconds expiresAfter{0};
};

struct RouterLogEntry {
    std::string time;
    std::string topics;
    std::string message;
};

inline const char* toString(GatedAction action) {
    switch (action) {
        case GatedAction::Remove:     return "remove";
        case GatedAction::Connect:    return "connect";
        case GatedAction::Disconnect: return "disconnect";
        case GatedAction::Refresh:    return "refresh";
    }
    return "unknown";
}

inline const char* toString(CoordinatorField field) {
    switch (field) {
        case CoordinatorField::SelectedRouter: return "selectedRouter";
        case CoordinatorField::Busy:           return "busy";
        case CoordinatorField::StatusMessage:  return "statusMessage";
    }
    return "unknown";
}

}
