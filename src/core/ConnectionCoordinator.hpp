#pragma once
#include "CoordinatorSettings.hpp"
#include <router-monitor/Types.hpp>
#include <QObject>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace router_monitor {

class RouterDevice;
class RouterApiService;
class SnmpService;
class StatisticsService;

/**
 * Owns the router registry and the single selection, and runs the
 * connect / disconnect / refresh / remove workflows against the selected
 * router.
 *
 * Every gated action has a matching canX() query. Invoking an action while
 * its query is false is a no-op that yields ActionOutcome::Rejected.
 * Connect and refresh run on a worker thread; at most one of them is in
 * flight at a time (the busy flag). The precondition check and the busy
 * flag transition happen atomically, so concurrent callers cannot both
 * start an operation.
 *
 * Signals are emitted after the internal lock is released, one thread at a
 * time. A change made while another thread is emitting is handed to that
 * thread, which emits it next with a fresh snapshot, so the last
 * stateChanged always describes the current state. Receivers living in
 * another thread get queued delivery through Qt's usual rules.
 */
class ConnectionCoordinator : public QObject {
    Q_OBJECT

public:
    // Throws std::invalid_argument for a null collaborator, a null router
    // or an invalid settings value.
    ConnectionCoordinator(std::shared_ptr<RouterApiService> routerApi,
                          std::shared_ptr<SnmpService> snmp,
                          std::shared_ptr<StatisticsService> statistics,
                          std::vector<std::shared_ptr<RouterDevice>> routers,
                          CoordinatorSettings settings = CoordinatorSettings(),
                          QObject* parent = nullptr);

    // Blocks until no connect or refresh is in flight.
    ~ConnectionCoordinator() override;

    std::vector<std::shared_ptr<RouterDevice>> routers() const;
    size_t routerCount() const;
    std::shared_ptr<RouterDevice> selectedRouter() const;

    // Returns false and keeps the current selection if no router has the id.
    bool selectRouter(const std::string& id);
    void clearSelection();

    bool isBusy() const;
    std::string statusMessage() const;
    CoordinatorSnapshot snapshot() const;
    const CoordinatorSettings& settings() const;

    std::shared_ptr<RouterApiService> routerApiService() const;
    std::shared_ptr<SnmpService> snmpService() const;
    std::shared_ptr<StatisticsService> statisticsService() const;

    bool canRemove() const;
    bool canConnect() const;
    bool canDisconnect() const;
    bool canRefresh() const;
    bool isActionAvailable(GatedAction action) const;

    static bool isAvailable(GatedAction action,
                            bool hasSelection,
                            ConnectionState selectedState,
                            bool busy);

    std::shared_ptr<RouterDevice> addRouter();
    ActionResult removeSelected();
    ActionResult disconnectSelected();

    // The returned future becomes ready after the busy flag has been
    // cleared and the final notifications have been emitted or handed to
    // the thread currently emitting. An exception thrown by a collaborator
    // or by an observer on the worker thread is stored in the future.
    std::future<ActionResult> connectSelected();
    std::future<ActionResult> refreshSelected();

signals:
    void fieldChanged(CoordinatorField field);
    void selectedRouterChanged(std::shared_ptr<RouterDevice> router);
    void busyChanged(bool busy);
    void statusMessageChanged(const std::string& message);
    void actionAvailabilityChanged(GatedAction action, bool available);
    void stateChanged(const CoordinatorSnapshot& snapshot);
    void routerAdded(std::shared_ptr<RouterDevice> router);
    void routerRemoved(std::shared_ptr<RouterDevice> router);

private:
    struct PendingChanges;

    // Runs body on the worker thread and always ends the operation, even
    // when body throws.
    ActionResult runOperation(const std::function<ActionResult()>& body);
    ActionResult runConnect(const std::shared_ptr<RouterDevice>& router);
    ActionResult runRefresh(const std::shared_ptr<RouterDevice>& router);
    void runFetches(const std::shared_ptr<RouterDevice>& router,
                    std::vector<std::string>& failedSteps,
                    std::string& failureText);

    bool beginOperation(GatedAction action,
                        const char* startStatus,
                        std::shared_ptr<RouterDevice>& router);
    void finishOperation();
    std::future<ActionResult> launch(std::function<ActionResult()> task);
    ActionResult reject(GatedAction action) const;

    void setStatus(const std::string& message);
    void setStatusLocked(const std::string& message, PendingChanges& changes);
    void setSelectedLocked(std::shared_ptr<RouterDevice> router, PendingChanges& changes);
    bool isAvailableLocked(GatedAction action) const;
    CoordinatorSnapshot snapshotLocked() const;
    void onRouterStateChanged(const RouterDevice* router);
    void publish(PendingChanges changes);
    void emitChanges(const PendingChanges& changes,
                     const CoordinatorSnapshot& snap,
                     const std::shared_ptr<RouterDevice>& selected);

    class Private;
    std::unique_ptr<Private> d;
};

} // namespace router_monitor

Q_DECLARE_METATYPE(router_monitor::CoordinatorSnapshot)
Q_DECLARE_METATYPE(router_monitor::CoordinatorField)
Q_DECLARE_METATYPE(router_monitor::GatedAction)
