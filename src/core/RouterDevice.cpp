#include "RouterDevice.hpp"
#include <QUuid>
#include <mutex>

namespace router_monitor {

class RouterDevice::Private {
public:
    std::string id;
    RouterSettings settings;
    ConnectionState state{ConnectionState::Disconnected};
    std::string failureReason;

    SystemInfo systemInfo;
    std::vector<NetworkInterface> interfaces;
    std::vector<DhcpLease> leases;
    std::vector<RouterLogEntry> logEntries;

    mutable std::mutex mutex;
};

RouterDevice::RouterDevice(const RouterSettings& settings, QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {
    d->id = settings.id.empty() ? generateId() : settings.id;
    d->settings = settings;
    d->settings.id = d->id;
}

RouterDevice::~RouterDevice() = default;

std::string RouterDevice::generateId() {
    return QUuid::createUuid().toString(QUuid::WithoutBraces).toStdString();
}

const std::string& RouterDevice::id() const {
    return d->id;
}

bool RouterDevice::operator==(const RouterDevice& other) const {
    return d->id == other.d->id;
}

bool RouterDevice::operator!=(const RouterDevice& other) const {
    return !(*this == other);
}

RouterSettings RouterDevice::settings() const {
    std::lock_guard<std::mutex> lock(d->mutex);
    return d->settings;
}

void RouterDevice::setSettings(const RouterSettings& settings) {
    {
        std::lock_guard<std::mutex> lock(d->mutex);
        d->settings = settings;
        d->settings.id = d->id;
    }
    emit settingsChanged();
}

std::string RouterDevice::name() const {
    std::lock_guard<std::mutex> lock(d->mutex);
    return d->settings.name;
}

std::string RouterDevice::address() const {
    std::lock_guard<std::mutex> lock(d->mutex);
    return d->settings.address;
}

int RouterDevice::port() const {
    std::lock_guard<std::mutex> lock(d->mutex);
    return d->settings.port;
}

ConnectionState RouterDevice::connectionState() const {
    std::lock_guard<std::mutex> lock(d->mutex);
    return d->state;
}

std::string RouterDevice::failureReason() const {
    std::lock_guard<std::mutex> lock(d->mutex);
    return d->failureReason;
}

std::string RouterDevice::connectionStatusText() const {
    std::lock_guard<std::mutex> lock(d->mutex);
    switch (d->state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting:   return "Connecting";
        case ConnectionState::Connected:    return "Connected";
        case ConnectionState::Failed:
            return d->failureReason.empty() ? "Failed" : d->failureReason;
    }
    return "Unknown";
}

bool RouterDevice::isConnected() const {
    return connectionState() == ConnectionState::Connected;
}

void RouterDevice::setConnectionState(ConnectionState state, const std::string& failureReason) {
    {
        std::lock_guard<std::mutex> lock(d->mutex);
        if (d->state == state && d->failureReason == failureReason) {
            return;
        }
        d->state = state;
        d->failureReason = (state == ConnectionState::Failed) ? failureReason : std::string();
    }
    emit connectionStateChanged(state);
}

void RouterDevice::setSystemInfo(const SystemInfo& info) {
    {
        std::lock_guard<std::mutex> lock(d->mutex);
        d->systemInfo = info;
    }
    emit dataUpdated();
}

void RouterDevice::setNetworkInterfaces(std::vector<NetworkInterface> interfaces) {
    {
        std::lock_guard<std::mutex> lock(d->mutex);
        d->interfaces = std::move(interfaces);
    }
    emit dataUpdated();
}

void RouterDevice::setDhcpLeases(std::vector<DhcpLease> leases) {
    {
        std::lock_guard<std::mutex> lock(d->mutex);
        d->leases = std::move(leases);
    }
    emit dataUpdated();
}

void RouterDevice::setLogEntries(std::vector<RouterLogEntry> entries) {
    {
        std::lock_guard<std::mutex> lock(d->mutex);
        d->logEntries = std::move(entries);
    }
    emit dataUpdated();
}

SystemInfo RouterDevice::systemInfo() const {
    std::lock_guard<std::mutex> lock(d->mutex);
    return d->systemInfo;
}

std::vector<NetworkInterface> RouterDevice::networkInterfaces() const {
    std::lock_guard<std::mutex> lock(d->mutex);
    return d->interfaces;
}

std::vector<DhcpLease> RouterDevice::dhcpLeases() const {
    std::lock_guard<std::mutex> lock(d->mutex);
    return d->leases;
}

std::vector<RouterLogEntry> RouterDevice::logEntries() const {
    std::lock_guard<std::mutex> lock(d->mutex);
    return d->logEntries;
}

} // namespace router_monitor
