#include "ConnectionCoordinator.hpp"
#include "Logger.hpp"
#include "RouterApiService.hpp"
#include "RouterDevice.hpp"
#include "SnmpService.hpp"
#include "StatisticsService.hpp"
#include <router-monitor/Constants.hpp>
#include <algorithm>
#include <iterator>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace router_monitor {

namespace {

constexpr const char* DISCONNECT_ERROR_PREFIX = "Disconnect error: ";
constexpr const char* UNKNOWN_ERROR = "unknown error";

struct ScopeExit {
    std::function<void()> fn;
    ~ScopeExit() { fn(); }
};

std::string describe(const RouterDevice& router) {
    return router.name() + " (" + router.address() + ")";
}

} // namespace

struct ConnectionCoordinator::PendingChanges {
    bool selection{false};
    bool busy{false};
    bool status{false};
    bool selectedState{false};
    std::vector<std::shared_ptr<RouterDevice>> added;
    std::vector<std::shared_ptr<RouterDevice>> removed;

    bool any() const {
        return selection || busy || status || selectedState ||
               !added.empty() || !removed.empty();
    }

    void merge(PendingChanges&& other) {
        selection = selection || other.selection;
        busy = busy || other.busy;
        status = status || other.status;
        selectedState = selectedState || other.selectedState;
        std::move(other.added.begin(), other.added.end(), std::back_inserter(added));
        std::move(other.removed.begin(), other.removed.end(), std::back_inserter(removed));
    }
};

class ConnectionCoordinator::Private {
public:
    std::shared_ptr<RouterApiService> routerApi;
    std::shared_ptr<SnmpService> snmp;
    std::shared_ptr<StatisticsService> statistics;
    CoordinatorSettings settings;

    std::vector<std::shared_ptr<RouterDevice>> routers;
    std::shared_ptr<RouterDevice> selected;
    QMetaObject::Connection selectedStateConnection;
    bool busy{false};
    std::string statusMessage;

    // Changes waiting to be emitted. Only one thread emits at a time; the
    // others queue here and the emitting thread drains the queue.
    PendingChanges queued;
    bool publishing{false};

    int activeTasks{0};
    mutable std::mutex mutex;
    std::condition_variable idle;

    std::vector<std::shared_ptr<RouterDevice>>::iterator find(const std::string& id) {
        return std::find_if(routers.begin(), routers.end(),
            [&id](const std::shared_ptr<RouterDevice>& router) {
                return router->id() == id;
            });
    }
};

ConnectionCoordinator::ConnectionCoordinator(std::shared_ptr<RouterApiService> routerApi,
                                             std::shared_ptr<SnmpService> snmp,
                                             std::shared_ptr<StatisticsService> statistics,
                                             std::vector<std::shared_ptr<RouterDevice>> routers,
                                             CoordinatorSettings settings,
                                             QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {

    if (!routerApi) {
        throw std::invalid_argument("routerApi must not be null");
    }
    if (!snmp) {
        throw std::invalid_argument("snmp must not be null");
    }
    if (!statistics) {
        throw std::invalid_argument("statistics must not be null");
    }
    if (settings.logEntryCount <= 0) {
        throw std::invalid_argument("logEntryCount must be positive");
    }

    qRegisterMetaType<std::string>("std::string");
    qRegisterMetaType<CoordinatorSnapshot>();
    qRegisterMetaType<CoordinatorField>();
    qRegisterMetaType<GatedAction>();
    qRegisterMetaType<ConnectionState>();
    qRegisterMetaType<std::shared_ptr<RouterDevice>>();

    d->routerApi = std::move(routerApi);
    d->snmp = std::move(snmp);
    d->statistics = std::move(statistics);
    d->settings = std::move(settings);

    for (auto& router : routers) {
        if (!router) {
            throw std::invalid_argument("routers must not contain null entries");
        }
        if (d->find(router->id()) != d->routers.end()) {
            RM_LOG_WARNING("Skipping duplicate router id " + router->id());
            continue;
        }
        d->routers.push_back(std::move(router));
    }

    // Nobody can observe the constructor, so the changes are dropped.
    PendingChanges initial;
    std::lock_guard<std::mutex> lock(d->mutex);
    if (!d->routers.empty()) {
        setSelectedLocked(d->routers.front(), initial);
    }
    d->statusMessage = StatusMessages::READY;

    RM_LOG_INFO("Coordinator ready with " + std::to_string(d->routers.size()) + " router(s)");
}

ConnectionCoordinator::~ConnectionCoordinator() {
    std::unique_lock<std::mutex> lock(d->mutex);
    d->idle.wait(lock, [this] { return d->activeTasks == 0; });
    QObject::disconnect(d->selectedStateConnection);
}

std::vector<std::shared_ptr<RouterDevice>> ConnectionCoordinator::routers() const {
    std::lock_guard<std::mutex> lock(d->mutex);
    return d->routers;
}

size_t ConnectionCoordinator::routerCount() const {
    std::lock_guard<std::mutex> lock(d->mutex);
    return d->routers.size();
}

std::shared_ptr<RouterDevice> ConnectionCoordinator::selectedRouter() const {
    std::lock_guard<std::mutex> lock(d->mutex);
    return d->selected;
}

bool ConnectionCoordinator::selectRouter(const std::string& id) {
    PendingChanges changes;
    {
        std::lock_guard<std::mutex> lock(d->mutex);
        auto it = d->find(id);
        if (it == d->routers.end()) {
            return false;
        }
        if (*it == d->selected) {
            return true;
        }
        setSelectedLocked(*it, changes);
    }
    publish(std::move(changes));
    return true;
}

void ConnectionCoordinator::clearSelection() {
    PendingChanges changes;
    {
        std::lock_guard<std::mutex> lock(d->mutex);
        if (!d->selected) {
            return;
        }
        setSelectedLocked(nullptr, changes);
    }
    publish(std::move(changes));
}

bool ConnectionCoordinator::isBusy() const {
    std::lock_guard<std::mutex> lock(d->mutex);
    return d->busy;
}

std::string ConnectionCoordinator::statusMessage() const {
    std::lock_guard<std::mutex> lock(d->mutex);
    return d->statusMessage;
}

CoordinatorSnapshot ConnectionCoordinator::snapshot() const {
    std::lock_guard<std::mutex> lock(d->mutex);
    return snapshotLocked();
}

const CoordinatorSettings& ConnectionCoordinator::settings() const {
    return d->settings;
}

std::shared_ptr<RouterApiService> ConnectionCoordinator::routerApiService() const {
    return d->routerApi;
}

std::shared_ptr<SnmpService> ConnectionCoordinator::snmpService() const {
    return d->snmp;
}

std::shared_ptr<StatisticsService> ConnectionCoordinator::statisticsService() const {
    return d->statistics;
}

bool ConnectionCoordinator::canRemove() const {
    return isActionAvailable(GatedAction::Remove);
}

bool ConnectionCoordinator::canConnect() const {
    return isActionAvailable(GatedAction::Connect);
}

bool ConnectionCoordinator::canDisconnect() const {
    return isActionAvailable(GatedAction::Disconnect);
}

bool ConnectionCoordinator::canRefresh() const {
    return isActionAvailable(GatedAction::Refresh);
}

bool ConnectionCoordinator::isActionAvailable(GatedAction action) const {
    std::lock_guard<std::mutex> lock(d->mutex);
    return isAvailableLocked(action);
}

bool ConnectionCoordinator::isAvailable(GatedAction action,
                                        bool hasSelection,
                                        ConnectionState selectedState,
                                        bool busy) {
    if (!hasSelection) {
        return false;
    }
    const bool connected = selectedState == ConnectionState::Connected;
    switch (action) {
        case GatedAction::Remove:     return true;
        case GatedAction::Connect:    return !connected && !busy;
        case GatedAction::Disconnect: return connected && !busy;
        case GatedAction::Refresh:    return connected && !busy;
    }
    return false;
}

std::shared_ptr<RouterDevice> ConnectionCoordinator::addRouter() {
    RouterSettings defaults = d->settings.newRouter;
    defaults.id.clear();
    auto router = std::make_shared<RouterDevice>(defaults);

    PendingChanges changes;
    {
        std::lock_guard<std::mutex> lock(d->mutex);
        d->routers.push_back(router);
        changes.added.push_back(router);
        setSelectedLocked(router, changes);
        setStatusLocked(StatusMessages::ADDED, changes);
    }
    publish(std::move(changes));

    RM_LOG_INFO("Added router " + router->id());
    return router;
}

ActionResult ConnectionCoordinator::removeSelected() {
    std::shared_ptr<RouterDevice> router;
    {
        std::lock_guard<std::mutex> lock(d->mutex);
        if (!isAvailableLocked(GatedAction::Remove)) {
            return reject(GatedAction::Remove);
        }
        router = d->selected;
    }

    if (router->isConnected()) {
        try {
            d->routerApi->disconnect(router);
        } catch (const std::exception& e) {
            const std::string message = DISCONNECT_ERROR_PREFIX + std::string(e.what());
            RM_LOG_ERROR("Removing " + describe(*router) + " aborted: " + e.what());
            setStatus(message);
            return {ActionOutcome::Failed, message, {}};
        }
    }

    PendingChanges changes;
    {
        std::lock_guard<std::mutex> lock(d->mutex);
        auto it = d->find(router->id());
        if (it != d->routers.end()) {
            d->routers.erase(it);
            changes.removed.push_back(router);
        }
        if (d->selected == router) {
            setSelectedLocked(d->routers.empty() ? nullptr : d->routers.front(), changes);
        }
        setStatusLocked(StatusMessages::REMOVED, changes);
    }
    publish(std::move(changes));

    RM_LOG_INFO("Removed router " + describe(*router));
    return {ActionOutcome::Succeeded, StatusMessages::REMOVED, {}};
}

ActionResult ConnectionCoordinator::disconnectSelected() {
    std::shared_ptr<RouterDevice> router;
    {
        std::lock_guard<std::mutex> lock(d->mutex);
        if (!isAvailableLocked(GatedAction::Disconnect)) {
            return reject(GatedAction::Disconnect);
        }
        router = d->selected;
    }

    try {
        d->routerApi->disconnect(router);
    } catch (const std::exception& e) {
        const std::string message = DISCONNECT_ERROR_PREFIX + std::string(e.what());
        RM_LOG_ERROR("Disconnecting " + describe(*router) + " failed: " + e.what());
        setStatus(message);
        return {ActionOutcome::Failed, message, {}};
    }

    PendingChanges changes;
    {
        std::lock_guard<std::mutex> lock(d->mutex);
        setStatusLocked(StatusMessages::DISCONNECTED, changes);
        changes.selectedState = true;
    }
    publish(std::move(changes));

    RM_LOG_INFO("Disconnected from " + describe(*router));
    return {ActionOutcome::Succeeded, StatusMessages::DISCONNECTED, {}};
}

std::future<ActionResult> ConnectionCoordinator::connectSelected() {
    std::shared_ptr<RouterDevice> router;
    if (!beginOperation(GatedAction::Connect, StatusMessages::CONNECTING, router)) {
        std::promise<ActionResult> rejected;
        rejected.set_value(reject(GatedAction::Connect));
        return rejected.get_future();
    }
    RM_LOG_INFO("Connecting to " + describe(*router));
    return launch([this, router] { return runConnect(router); });
}

std::future<ActionResult> ConnectionCoordinator::refreshSelected() {
    std::shared_ptr<RouterDevice> router;
    if (!beginOperation(GatedAction::Refresh, StatusMessages::REFRESHING, router)) {
        std::promise<ActionResult> rejected;
        rejected.set_value(reject(GatedAction::Refresh));
        return rejected.get_future();
    }
    RM_LOG_INFO("Refreshing " + describe(*router));
    return launch([this, router] { return runRefresh(router); });
}

ActionResult ConnectionCoordinator::runOperation(const std::function<ActionResult()>& body) {
    ActionResult result;
    try {
        result = body();
    } catch (...) {
        finishOperation();
        throw;
    }
    finishOperation();
    return result;
}

ActionResult ConnectionCoordinator::runConnect(const std::shared_ptr<RouterDevice>& router) {
    ActionResult result;

    try {
        const bool connected = d->routerApi->connectAsync(router).get();
        if (!connected) {
            result = {ActionOutcome::Failed,
                      StatusMessages::CONNECT_FAILED_PREFIX + router->connectionStatusText(),
                      {}};
            RM_LOG_WARNING("Connection to " + describe(*router) + " refused: " +
                           router->connectionStatusText());
            setStatus(result.message);
            return result;
        }

        setStatus(StatusMessages::CONNECTED);

        std::string failureText;
        runFetches(router, result.failedSteps, failureText);
        if (failureText.empty()) {
            result.outcome = ActionOutcome::Succeeded;
            result.message = StatusMessages::CONNECTED;
            RM_LOG_INFO("Connected to " + describe(*router));
        } else {
            result.outcome = ActionOutcome::Failed;
            result.message = StatusMessages::CONNECT_ERROR_PREFIX + failureText;
            RM_LOG_WARNING("Initial data for " + describe(*router) + " incomplete: " + failureText);
            setStatus(result.message);
        }
    } catch (const std::exception& e) {
        result.outcome = ActionOutcome::Failed;
        result.message = StatusMessages::CONNECT_ERROR_PREFIX + std::string(e.what());
        RM_LOG_ERROR("Connection to " + describe(*router) + " failed: " + e.what());
        setStatus(result.message);
    } catch (...) {
        RM_LOG_ERROR("Connection to " + describe(*router) + " failed with a non-standard exception");
        setStatus(StatusMessages::CONNECT_ERROR_PREFIX + std::string(UNKNOWN_ERROR));
        throw;
    }
    return result;
}

ActionResult ConnectionCoordinator::runRefresh(const std::shared_ptr<RouterDevice>& router) {
    ActionResult result;

    try {
        std::string failureText;
        runFetches(router, result.failedSteps, failureText);
        if (failureText.empty()) {
            result.outcome = ActionOutcome::Succeeded;
            result.message = StatusMessages::REFRESHED;
            RM_LOG_INFO("Refreshed " + describe(*router));
        } else {
            result.outcome = ActionOutcome::Failed;
            result.message = StatusMessages::REFRESH_ERROR_PREFIX + failureText;
            RM_LOG_WARNING("Refresh of " + describe(*router) + " incomplete: " + failureText);
        }
    } catch (const std::exception& e) {
        result.outcome = ActionOutcome::Failed;
        result.message = StatusMessages::REFRESH_ERROR_PREFIX + std::string(e.what());
        RM_LOG_ERROR("Refresh of " + describe(*router) + " failed: " + e.what());
    } catch (...) {
        RM_LOG_ERROR("Refresh of " + describe(*router) + " failed with a non-standard exception");
        setStatus(StatusMessages::REFRESH_ERROR_PREFIX + std::string(UNKNOWN_ERROR));
        throw;
    }
    setStatus(result.message);
    return result;
}

void ConnectionCoordinator::runFetches(const std::shared_ptr<RouterDevice>& router,
                                       std::vector<std::string>& failedSteps,
                                       std::string& failureText) {
    const int logCount = d->settings.logEntryCount;
    const std::vector<std::pair<const char*, std::function<std::future<void>()>>> steps = {
        {"system info",        [&] { return d->routerApi->getSystemInfoAsync(router); }},
        {"network interfaces", [&] { return d->routerApi->getNetworkInterfacesAsync(router); }},
        {"DHCP leases",        [&] { return d->routerApi->getDhcpLeasesAsync(router); }},
        {"log entries",        [&] { return d->routerApi->getLogEntriesAsync(router, logCount); }}
    };

    for (const auto& [name, fetch] : steps) {
        try {
            fetch().get();
        } catch (const std::exception& e) {
            failedSteps.push_back(name);
            if (d->settings.fetchPolicy == FetchPolicy::AbortOnFirstFailure) {
                throw;
            }
            if (!failureText.empty()) {
                failureText += "; ";
            }
            failureText += std::string(name) + ": " + e.what();
            RM_LOG_WARNING("Fetching " + std::string(name) + " from " + describe(*router) +
                           " failed: " + e.what());
        }
    }
}

bool ConnectionCoordinator::beginOperation(GatedAction action,
                                           const char* startStatus,
                                           std::shared_ptr<RouterDevice>& router) {
    PendingChanges changes;
    {
        std::lock_guard<std::mutex> lock(d->mutex);
        if (!isAvailableLocked(action)) {
            return false;
        }
        router = d->selected;
        d->busy = true;
        ++d->activeTasks;
        changes.busy = true;
        setStatusLocked(startStatus, changes);
    }
    try {
        publish(std::move(changes));
    } catch (...) {
        finishOperation();
        throw;
    }
    return true;
}

void ConnectionCoordinator::finishOperation() {
    // Released even when an observer throws, so the destructor cannot hang.
    ScopeExit release{[this] {
        std::lock_guard<std::mutex> lock(d->mutex);
        --d->activeTasks;
        d->idle.notify_all();
    }};

    PendingChanges changes;
    {
        std::lock_guard<std::mutex> lock(d->mutex);
        d->busy = false;
        changes.busy = true;
    }
    publish(std::move(changes));
}

std::future<ActionResult> ConnectionCoordinator::launch(std::function<ActionResult()> task) {
    std::promise<ActionResult> promise;
    std::future<ActionResult> future = promise.get_future();
    try {
        std::thread([this, task = std::move(task), promise = std::move(promise)]() mutable {
            try {
                promise.set_value(runOperation(task));
            } catch (...) {
                promise.set_exception(std::current_exception());
            }
        }).detach();
    } catch (const std::system_error& e) {
        RM_LOG_CRITICAL("Cannot start worker thread: " + std::string(e.what()));
        finishOperation();
        throw;
    }
    return future;
}

ActionResult ConnectionCoordinator::reject(GatedAction action) const {
    std::string message = std::string(toString(action)) + " is not available";
    RM_LOG_DEBUG("Rejected " + std::string(toString(action)));
    return {ActionOutcome::Rejected, message, {}};
}

void ConnectionCoordinator::setStatus(const std::string& message) {
    PendingChanges changes;
    {
        std::lock_guard<std::mutex> lock(d->mutex);
        setStatusLocked(message, changes);
    }
    publish(std::move(changes));
}

void ConnectionCoordinator::setStatusLocked(const std::string& message, PendingChanges& changes) {
    if (d->statusMessage == message) {
        return;
    }
    d->statusMessage = message;
    changes.status = true;
}

void ConnectionCoordinator::setSelectedLocked(std::shared_ptr<RouterDevice> router,
                                              PendingChanges& changes) {
    QObject::disconnect(d->selectedStateConnection);
    d->selected = std::move(router);
    if (d->selected) {
        const RouterDevice* raw = d->selected.get();
        // Direct: the device API may change the state from a worker thread.
        d->selectedStateConnection = QObject::connect(
            raw, &RouterDevice::connectionStateChanged, this,
            [this, raw](ConnectionState) { onRouterStateChanged(raw); },
            Qt::DirectConnection);
    }
    changes.selection = true;
}

bool ConnectionCoordinator::isAvailableLocked(GatedAction action) const {
    const bool hasSelection = d->selected != nullptr;
    const ConnectionState state = hasSelection
        ? d->selected->connectionState()
        : ConnectionState::Disconnected;
    return isAvailable(action, hasSelection, state, d->busy);
}

CoordinatorSnapshot ConnectionCoordinator::snapshotLocked() const {
    CoordinatorSnapshot snap;
    snap.selectedRouterId = d->selected ? d->selected->id() : std::string();
    snap.busy = d->busy;
    snap.statusMessage = d->statusMessage;
    snap.canRemove = isAvailableLocked(GatedAction::Remove);
    snap.canConnect = isAvailableLocked(GatedAction::Connect);
    snap.canDisconnect = isAvailableLocked(GatedAction::Disconnect);
    snap.canRefresh = isAvailableLocked(GatedAction::Refresh);
    return snap;
}

void ConnectionCoordinator::onRouterStateChanged(const RouterDevice* router) {
    PendingChanges changes;
    {
        std::lock_guard<std::mutex> lock(d->mutex);
        if (d->selected.get() != router) {
            return;
        }
        changes.selectedState = true;
    }
    publish(std::move(changes));
}

void ConnectionCoordinator::publish(PendingChanges changes) {
    std::unique_lock<std::mutex> lock(d->mutex);
    d->queued.merge(std::move(changes));
    if (d->publishing) {
        return;
    }
    d->publishing = true;

    // Each round snapshots after every change queued so far, so the last
    // stateChanged always matches the current state.
    while (d->queued.any()) {
        PendingChanges round = std::move(d->queued);
        d->queued = PendingChanges();
        const CoordinatorSnapshot snap = snapshotLocked();
        const std::shared_ptr<RouterDevice> selected = d->selected;
        lock.unlock();
        try {
            emitChanges(round, snap, selected);
        } catch (...) {
            lock.lock();
            d->publishing = false;
            throw;
        }
        lock.lock();
    }
    d->publishing = false;
}

void ConnectionCoordinator::emitChanges(const PendingChanges& changes,
                                        const CoordinatorSnapshot& snap,
                                        const std::shared_ptr<RouterDevice>& selected) {
    for (const auto& router : changes.added) {
        emit routerAdded(router);
    }
    for (const auto& router : changes.removed) {
        emit routerRemoved(router);
    }

    if (changes.selection) {
        emit selectedRouterChanged(selected);
        emit fieldChanged(CoordinatorField::SelectedRouter);
    }
    if (changes.busy) {
        emit busyChanged(snap.busy);
        emit fieldChanged(CoordinatorField::Busy);
    }
    if (changes.status) {
        emit statusMessageChanged(snap.statusMessage);
        emit fieldChanged(CoordinatorField::StatusMessage);
    }

    // Re-announced even when unchanged so bound controls can re-query.
    if (changes.selection || changes.busy || changes.selectedState) {
        emit actionAvailabilityChanged(GatedAction::Remove, snap.canRemove);
        emit actionAvailabilityChanged(GatedAction::Connect, snap.canConnect);
        emit actionAvailabilityChanged(GatedAction::Disconnect, snap.canDisconnect);
        emit actionAvailabilityChanged(GatedAction::Refresh, snap.canRefresh);
    }

    emit stateChanged(snap);
}

} // namespace router_monitor
