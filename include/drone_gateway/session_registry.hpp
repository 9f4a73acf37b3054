// === Session Registry ========================================================
//
// Arena of drone and operator contexts indexed by identifier. The registry is
// the sole owner of connection handles; every other component resolves a
// session by id through it and locks that session's own mutex, so no lock is
// shared between drones and a disconnect can never leave a dangling handle.
//
// Locking rules
// - `map_mutex_` only protects the two maps and is never held while taking a
//   context mutex.
// - A context mutex may be held while taking `map_mutex_` (erase on teardown).
// - Callers must check `active` after locking a context: a context looked up
//   just before a concurrent teardown stays alive but is inactive.

#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "drone_gateway/command.hpp"
#include "drone_gateway/connection.hpp"
#include "drone_gateway/drone_state_machine.hpp"
#include "drone_gateway/logging.hpp"
#include "drone_gateway/types.hpp"

namespace drone_gateway {

/** @brief Command held in a drone's queue until acknowledged or dropped. */
struct PendingCommand final {
    Command command{};
    bool delivered{false};   /**< True once written to the drone connection. */
    TimePoint ack_deadline{}; /**< Valid only when delivered. */
};

/** @brief Everything the gateway knows about one connected drone. */
struct DroneSession final {
    DroneSession(DroneId drone_id, DroneConnectionPtr drone_connection, double ground_tolerance_m, TimePoint now);

    DroneId identifier;
    DroneConnectionPtr connection;
    DroneStateMachine state_machine;
    TimePoint last_seen;
    std::deque<PendingCommand> pending_commands{};
    CommandId last_issued_command_id{0};
    std::optional<SequenceNumber> last_applied_sequence{};
};

/** @brief A connected operator and the drone ids it follows (weak, by id). */
struct OperatorSession final {
    OperatorSession(OperatorId operator_id, OperatorConnectionPtr operator_connection, TimePoint now);

    OperatorId identifier;
    OperatorConnectionPtr connection;
    std::set<DroneId> set_subscriptions{};
    TimePoint last_seen;
};

/** @brief Arena slot for a drone; `mutex` serializes all work on the drone. */
struct DroneContext final {
    DroneContext(DroneId drone_id, DroneConnectionPtr drone_connection, double ground_tolerance_m, TimePoint now);

    std::mutex mutex;
    bool active{true};
    DroneSession session;
};

/** @brief Arena slot for an operator; `mutex` serializes writes to its stream. */
struct OperatorContext final {
    OperatorContext(OperatorId operator_id, OperatorConnectionPtr operator_connection, TimePoint now);

    std::mutex mutex;
    bool active{true};
    OperatorSession session;
};

using DroneContextPtr = std::shared_ptr<DroneContext>;
using OperatorContextPtr = std::shared_ptr<OperatorContext>;

/** @brief Cleanup run under the drone's lock before its session is discarded. */
using DroneTeardownHandler = std::function<void(DroneSession&, StateChangeCause, TimePoint)>;
/** @brief Cleanup run under the operator's lock before its session is discarded. */
using OperatorTeardownHandler = std::function<void(OperatorSession&, StateChangeCause, TimePoint)>;

class SessionRegistry final {
  public:
    SessionRegistry(Duration liveness_timeout, double ground_tolerance_m);

    /** @brief Install disconnect cleanup; call before sessions are registered. */
    void set_teardown_handlers(DroneTeardownHandler drone_handler, OperatorTeardownHandler operator_handler);

    /** @throws GatewayError DuplicateSession when @p drone_id is already active. */
    DroneContextPtr register_drone(const DroneId& drone_id, DroneConnectionPtr connection, TimePoint now);
    /** @throws GatewayError DuplicateSession when @p operator_id is already active. */
    OperatorContextPtr register_operator(const OperatorId& operator_id, OperatorConnectionPtr connection, TimePoint now);

    /**
     * @brief Tear down whichever drone and/or operator session uses @p identifier.
     *
     * Idempotent: unknown or already-removed identifiers are a no-op.
     *
     * @return true when a session was removed by this call.
     */
    bool unregister(const std::string& identifier, TimePoint now, StateChangeCause cause = StateChangeCause::Disconnect);

    /** @throws GatewayError NotFound when no drone session uses @p drone_id. */
    [[nodiscard]] DroneContextPtr lookup_drone(const DroneId& drone_id) const;
    /** @throws GatewayError NotFound when no operator session uses @p operator_id. */
    [[nodiscard]] OperatorContextPtr lookup_operator(const OperatorId& operator_id) const;
    /** @brief Non-throwing lookup; nullptr when absent. */
    [[nodiscard]] DroneContextPtr find_drone(const DroneId& drone_id) const;
    [[nodiscard]] OperatorContextPtr find_operator(const OperatorId& operator_id) const;

    /**
     * @brief Refresh the last-seen time of a drone or operator session.
     *
     * @throws GatewayError NotFound when neither kind of session exists.
     */
    void heartbeat(const std::string& identifier, TimePoint now);

    /**
     * @brief Evict every session silent for longer than the liveness timeout.
     *
     * @return Number of sessions evicted.
     */
    std::size_t sweep(TimePoint now);

    [[nodiscard]] std::vector<DroneId> drone_ids() const;
    [[nodiscard]] std::vector<OperatorId> operator_ids() const;
    [[nodiscard]] std::size_t drone_count() const;
    [[nodiscard]] std::size_t operator_count() const;
    [[nodiscard]] Duration liveness_timeout() const noexcept;

  private:
    /** @brief Run teardown and release the connection. Caller holds the context lock. */
    void teardown_drone_locked(DroneContext& context, StateChangeCause cause, TimePoint now);
    void teardown_operator_locked(OperatorContext& context, StateChangeCause cause, TimePoint now);
    void erase_drone(const DroneId& drone_id, const DroneContext* context);
    void erase_operator(const OperatorId& operator_id, const OperatorContext* context);
    bool is_expired(TimePoint last_seen, TimePoint now) const;

    Duration liveness_timeout_;
    double ground_tolerance_m_;
    DroneTeardownHandler drone_teardown_handler_;
    OperatorTeardownHandler operator_teardown_handler_;
    mutable std::shared_mutex map_mutex_;
    std::unordered_map<DroneId, DroneContextPtr> map_drones_;
    std::unordered_map<OperatorId, OperatorContextPtr> map_operators_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace drone_gateway
