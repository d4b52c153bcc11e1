/*
RangeScope — RequestStage
Role: One debounced, cancellable asynchronous stage of the request pipeline.
Inputs/Outputs: trigger(key) in; {data, loading, error} plus a change callback out.
Threading: Main thread; completions arrive through the Qt event loop.
Performance: One QTimer and at most one in-flight call per stage.
Integration: Owned by RequestOrchestrator, one instance per stage.
Observability: Superseded and stale completions are logged via rsLog_Debug.
Related: RequestOrchestrator.hpp, PoolApi.hpp.
Assumptions: Keys are immutable request values with structural operator==.
*/
#pragma once

#include <QString>
#include <QTimer>
#include <cstdint>
#include <functional>
#include <optional>
#include <utility>

#include "RangeScopeLogging.hpp"
#include "api/PoolApi.hpp"

template <typename Key, typename Data>
class RequestStage {
public:
    using Launcher = std::function<PendingCallPtr(const Key&, ApiCallback<Data>)>;
    using ChangeListener = std::function<void()>;
    using SuccessHook = std::function<void(const Key&, const Data&)>;
    using SettledHook = std::function<void(const Key&)>;

    RequestStage(const char* name, int debounceMs, Launcher launcher, ChangeListener onChanged)
        : m_name(name)
        , m_debounceMs(debounceMs)
        , m_launcher(std::move(launcher))
        , m_onChanged(std::move(onChanged)) {
        m_timer.setSingleShot(true);
        QObject::connect(&m_timer, &QTimer::timeout, &m_timer, [this]() { fire(); });
    }

    ~RequestStage() {
        // Abort silently; no listener may run during teardown
        m_onChanged = nullptr;
        cancel();
    }

    RequestStage(const RequestStage&) = delete;
    RequestStage& operator=(const RequestStage&) = delete;

    void onSuccess(SuccessHook hook) { m_onSuccess = std::move(hook); }
    void onSettled(SettledHook hook) { m_onSettled = std::move(hook); }

    // =========================================================================
    // Reactive state
    // =========================================================================

    const std::optional<Data>& data() const { return m_data; }
    const QString& error() const { return m_error; }
    bool isLoading() const { return m_inFlightKey.has_value() || m_timer.isActive(); }
    bool isDebouncing() const { return m_timer.isActive(); }
    bool isInFlight() const { return m_inFlightKey.has_value(); }

    const std::optional<Key>& inFlightKey() const { return m_inFlightKey; }
    const std::optional<Key>& pendingKey() const { return m_pendingKey; }
    // Key whose completion the current data/error reflects
    const std::optional<Key>& settledKey() const { return m_settledKey; }
    uint64_t generation() const { return m_generation; }
    int debounceMs() const { return m_debounceMs; }

    // =========================================================================
    // Control
    // =========================================================================

    /**
     * Requests data for key. An equal in-flight key, or a key whose data is
     * already shown, drops any pending trigger; otherwise an older in-flight call is cancelled and the
     * key is launched after the debounce interval.
     */
    void trigger(const Key& key) {
        if (m_inFlightKey && *m_inFlightKey == key) {
            if (m_timer.isActive()) {
                m_timer.stop();
                m_pendingKey.reset();
                notify();
            }
            return;
        }
        if (m_settledKey && *m_settledKey == key && m_data) {
            // Current data already describes key; a failed key is fetched again
            if (isLoading()) cancel();
            return;
        }

        if (m_inFlightKey) {
            rsLog_Debug(m_name << "superseded in-flight request, generation" << m_generation);
            abortInFlight();
        }

        m_pendingKey = key;
        if (m_debounceMs <= 0) {
            m_timer.stop();
            fire();
            return;
        }
        m_timer.start(m_debounceMs);
        notify();
    }

    // Drops pending and in-flight work; data and error stay
    void cancel() {
        const bool wasLoading = isLoading();
        m_timer.stop();
        m_pendingKey.reset();
        abortInFlight();
        if (wasLoading) notify();
    }

    // Clears data and error because the inputs they describe are gone
    void invalidate() {
        if (!m_data && m_error.isEmpty() && !m_settledKey) return;
        m_data.reset();
        m_error.clear();
        m_settledKey.reset();
        notify();
    }

    void reset() {
        m_timer.stop();
        m_pendingKey.reset();
        abortInFlight();
        m_data.reset();
        m_error.clear();
        m_settledKey.reset();
        notify();
    }

private:
    void notify() {
        if (m_onChanged) m_onChanged();
    }

    void abortInFlight() {
        // Bumping the generation rejects any completion that slips through
        ++m_generation;
        m_inFlightKey.reset();
        m_call.reset();
    }

    void fire() {
        if (!m_pendingKey) return;
        Key key = std::move(*m_pendingKey);
        m_pendingKey.reset();

        if (m_inFlightKey) abortInFlight();
        const uint64_t generation = ++m_generation;
        m_inFlightKey = key;
        notify();

        PendingCallPtr call = m_launcher(key, [this, generation, key](ApiResult<Data> result) {
            complete(generation, key, std::move(result));
        });
        // A synchronous completion already cleared the in-flight slot
        if (m_generation == generation && m_inFlightKey) {
            m_call = std::move(call);
        }
    }

    void complete(uint64_t generation, const Key& key, ApiResult<Data> result) {
        if (generation != m_generation) {
            rsLog_Debug(m_name << "dropped stale completion, generation" << generation << "current" << m_generation);
            return;
        }

        m_inFlightKey.reset();
        PendingCallPtr finished = std::move(m_call);

        if (result.cancelled) {
            notify();
            return;
        }

        m_settledKey = key;
        if (result.value) {
            m_data = std::move(result.value);
            m_error.clear();
            if (m_onSuccess) m_onSuccess(key, *m_data);
        } else {
            m_data.reset();
            m_error = result.error.isEmpty() ? QStringLiteral("Request failed") : result.error;
            rsLog_Warning(m_name << "failed:" << m_error);
        }
        notify();
        if (m_onSettled) m_onSettled(key);
    }

    const char* m_name;
    int m_debounceMs = 0;
    Launcher m_launcher;
    ChangeListener m_onChanged;
    SuccessHook m_onSuccess;
    SettledHook m_onSettled;

    QTimer m_timer;
    std::optional<Key> m_pendingKey;
    std::optional<Key> m_inFlightKey;
    std::optional<Key> m_settledKey;
    uint64_t m_generation = 0;
    PendingCallPtr m_call;

    std::optional<Data> m_data;
    QString m_error;
};
