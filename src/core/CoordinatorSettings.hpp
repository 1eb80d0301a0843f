#pragma once
#include "RouterDevice.hpp"
#include <router-monitor/Constants.hpp>
#include <router-monitor/Types.hpp>

namespace router_monitor {

struct CoordinatorSettings {
    FetchPolicy fetchPolicy{FetchPolicy::AbortOnFirstFailure};
    int logEntryCount{DEFAULT_LOG_ENTRY_COUNT};
    RouterSettings newRouter{
        "",
        DEFAULT_ROUTER_NAME,
        DEFAULT_ROUTER_ADDRESS,
        DEFAULT_API_PORT,
        DEFAULT_USERNAME,
        "",
        false,
        DEFAULT_SNMP_COMMUNITY,
        DEFAULT_SNMP_PORT
    };
};

}
