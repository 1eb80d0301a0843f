#pragma once
#include <router-monitor/Types.hpp>
#include <QObject>
#include <memory>
#include <string>
#include <vector>

namespace router_monitor {

struct RouterSettings {
    std::string id;             // generated when left empty
    std::string name;
    std::string address;
    int port{0};
    std::string username;
    std::string password;
    bool useSnmp{false};
    std::string snmpCommunity;
    int snmpPort{0};
};

class RouterDevice : public QObject {
    Q_OBJECT

public:
    explicit RouterDevice(const RouterSettings& settings, QObject* parent = nullptr);
    ~RouterDevice();

    static std::string generateId();

    // Identity never changes after construction.
    const std::string& id() const;
    bool operator==(const RouterDevice& other) const;
    bool operator!=(const RouterDevice& other) const;

    RouterSettings settings() const;
    void setSettings(const RouterSettings& settings);
    std::string name() const;
    std::string address() const;
    int port() const;

    ConnectionState connectionState() const;
    std::string failureReason() const;
    std::string connectionStatusText() const;
    bool isConnected() const;

    // Written by the device API implementation.
    void setConnectionState(ConnectionState state, const std::string& failureReason = "");
    void setSystemInfo(const SystemInfo& info);
    void setNetworkInterfaces(std::vector<NetworkInterface> interfaces);
    void setDhcpLeases(std::vector<DhcpLease> leases);
    void setLogEntries(std::vector<RouterLogEntry> entries);

    SystemInfo systemInfo() const;
    std::vector<NetworkInterface> networkInterfaces() const;
    std::vector<DhcpLease> dhcpLeases() const;
    std::vector<RouterLogEntry> logEntries() const;

signals:
    void connectionStateChanged(ConnectionState state);
    void settingsChanged();
    void dataUpdated();

private:
    class Private;
    std::unique_ptr<Private> d;
};

}

Q_DECLARE_METATYPE(router_monitor::ConnectionState)
Q_DECLARE_METATYPE(std::shared_ptr<router_monitor::RouterDevice>)
