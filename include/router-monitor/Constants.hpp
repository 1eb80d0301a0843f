#pragma once

namespace router_monitor {

constexpr int DEFAULT_API_PORT = 8728;
constexpr int DEFAULT_SNMP_PORT = 161;
constexpr int DEFAULT_LOG_ENTRY_COUNT = 100;
constexpr int MAX_LOG_ENTRY_COUNT = 10000;
constexpr int MAX_PORT = 65535;

constexpr const char* DEFAULT_ROUTER_NAME = "New Router";
constexpr const char* DEFAULT_ROUTER_ADDRESS = "192.168.1.1";
constexpr const char* DEFAULT_USERNAME = "admin";
constexpr const char* DEFAULT_SNMP_COMMUNITY = "public";

namespace StatusMessages {
    constexpr const char* READY = "Ready";
    constexpr const char* ADDED = "Added new router";
    constexpr const char* REMOVED = "Removed router";
    constexpr const char* CONNECTING = "Connecting...";
    constexpr const char* CONNECTED = "Connected";
    constexpr const char* DISCONNECTED = "Disconnected";
    constexpr const char* REFRESHING = "Refreshing...";
    constexpr const char* REFRESHED = "Refreshed";
    constexpr const char* CONNECT_FAILED_PREFIX = "Failed to connect: ";
    constexpr const char* CONNECT_ERROR_PREFIX = "Connection error: ";
    constexpr const char* REFRESH_ERROR_PREFIX = "Refresh error: ";
}

}
