#pragma once

#include <QJsonArray>
#include <QString>
#include <QTimer>

#include "petkit_binder.h"
#include "petkit_registry.h"
#include "petkit_session.h"

namespace phicore::petkit::ipc {

inline constexpr const char kRosterApi[] = "discovery/device_roster";

enum class TickState {
    Idle,
    Fetching,
    AuthRetry,
    Reconciling,
    Notifying,
};

// Shared by every coordinator of one context. A blocking request spins a
// local event loop, so another account's timer could otherwise start a tick
// on the shared registry while this one is still fetching.
struct TickGate {
    bool busy = false;
};

inline constexpr int kDeferredTickMs = 1000;

struct TickReport {
    bool fetched = false;
    bool deferred = false;
    bool reauthenticated = false;
    int devices = 0;
    int created = 0;
    QString error;
};

// Fetch, reconcile and notify for one account on a fixed interval. The
// timer is single shot and re-armed only after a tick has finished, so
// ticks never overlap.
class PollingCoordinator
{
public:
    PollingCoordinator(SessionManager *session,
                       DeviceRegistry *registry,
                       EntityBinder *binder,
                       TickGate *gate = nullptr);
    ~PollingCoordinator();

    PollingCoordinator(const PollingCoordinator &) = delete;
    PollingCoordinator &operator=(const PollingCoordinator &) = delete;

    QString name() const;

    // Runs the first refresh synchronously, then enters the periodic loop.
    void start();
    // Cancels the pending timer; a running tick is left to finish.
    void stop();
    bool isRunning() const { return m_running; }
    bool isTimerActive() const { return m_timer.isActive(); }

    // Refused while any tick of the same gate runs; the timer then retries
    // after kDeferredTickMs instead of a full interval.
    TickReport refresh();

    int intervalMs() const { return m_intervalMs; }
    void setIntervalMs(int intervalMs);

    TickState state() const { return m_state; }
    const TickReport &lastReport() const { return m_lastReport; }
    int tickCount() const { return m_tickCount; }
    SessionManager *session() const { return m_session; }

private:
    void onTimeout();
    void scheduleNext();
    QJsonArray fetchRoster(TickReport *report);

    SessionManager *m_session = nullptr;
    DeviceRegistry *m_registry = nullptr;
    EntityBinder *m_binder = nullptr;
    TickGate *m_gate = nullptr;
    QTimer m_timer;
    int m_intervalMs = 0;
    bool m_running = false;
    TickState m_state = TickState::Idle;
    TickReport m_lastReport;
    int m_tickCount = 0;
};

} // namespace phicore::petkit::ipc
