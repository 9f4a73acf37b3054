#include "drone_gateway/session_registry.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "drone_gateway/errors.hpp"

namespace drone_gateway {

DroneSession::DroneSession(DroneId drone_id, DroneConnectionPtr drone_connection, double ground_tolerance_m, TimePoint now)
    : identifier(std::move(drone_id)),
      connection(std::move(drone_connection)),
      state_machine(identifier, ground_tolerance_m),
      last_seen(now) {}

OperatorSession::OperatorSession(OperatorId operator_id, OperatorConnectionPtr operator_connection, TimePoint now)
    : identifier(std::move(operator_id)),
      connection(std::move(operator_connection)),
      last_seen(now) {}

DroneContext::DroneContext(DroneId drone_id, DroneConnectionPtr drone_connection, double ground_tolerance_m, TimePoint now)
    : session(std::move(drone_id), std::move(drone_connection), ground_tolerance_m, now) {}

OperatorContext::OperatorContext(OperatorId operator_id, OperatorConnectionPtr operator_connection, TimePoint now)
    : session(std::move(operator_id), std::move(operator_connection), now) {}

SessionRegistry::SessionRegistry(Duration liveness_timeout, double ground_tolerance_m)
    : liveness_timeout_(liveness_timeout),
      ground_tolerance_m_(ground_tolerance_m),
      logger_(get_logger()) {
    if (liveness_timeout_.count() <= 0.0) {
        throw std::invalid_argument("SessionRegistry liveness timeout must be positive");
    }
}

void SessionRegistry::set_teardown_handlers(DroneTeardownHandler drone_handler, OperatorTeardownHandler operator_handler) {
    drone_teardown_handler_ = std::move(drone_handler);
    operator_teardown_handler_ = std::move(operator_handler);
}

DroneContextPtr SessionRegistry::register_drone(const DroneId& drone_id, DroneConnectionPtr connection, TimePoint now) {
    if (drone_id.empty()) {
        throw std::invalid_argument("Drone identifier cannot be empty");
    }
    if (connection == nullptr) {
        throw std::invalid_argument("Drone " + drone_id + " registered without a connection");
    }

    DroneContextPtr context;
    {
        std::unique_lock lock(map_mutex_);
        if (map_drones_.find(drone_id) != map_drones_.end()) {
            throw GatewayError(ErrorCode::DuplicateSession, "drone " + drone_id + " already has an active session");
        }
        context = std::make_shared<DroneContext>(drone_id, std::move(connection), ground_tolerance_m_, now);
        map_drones_.emplace(drone_id, context);
    }
    logger_->info(R"({{"component":"session_registry","event":"drone_connected","drone":"{}"}})", drone_id);
    return context;
}

OperatorContextPtr SessionRegistry::register_operator(const OperatorId& operator_id, OperatorConnectionPtr connection, TimePoint now) {
    if (operator_id.empty()) {
        throw std::invalid_argument("Operator identifier cannot be empty");
    }
    if (connection == nullptr) {
        throw std::invalid_argument("Operator " + operator_id + " registered without a connection");
    }

    OperatorContextPtr context;
    {
        std::unique_lock lock(map_mutex_);
        if (map_operators_.find(operator_id) != map_operators_.end()) {
            throw GatewayError(ErrorCode::DuplicateSession, "operator " + operator_id + " already has an active session");
        }
        context = std::make_shared<OperatorContext>(operator_id, std::move(connection), now);
        map_operators_.emplace(operator_id, context);
    }
    logger_->info(R"({{"component":"session_registry","event":"operator_connected","operator":"{}"}})", operator_id);
    return context;
}

bool SessionRegistry::unregister(const std::string& identifier, TimePoint now, StateChangeCause cause) {
    bool removed = false;

    if (const DroneContextPtr drone_context = find_drone(identifier); drone_context != nullptr) {
        std::scoped_lock lock(drone_context->mutex);
        if (drone_context->active) {
            teardown_drone_locked(*drone_context, cause, now);
            erase_drone(identifier, drone_context.get());
            removed = true;
        }
    }

    if (const OperatorContextPtr operator_context = find_operator(identifier); operator_context != nullptr) {
        std::scoped_lock lock(operator_context->mutex);
        if (operator_context->active) {
            teardown_operator_locked(*operator_context, cause, now);
            erase_operator(identifier, operator_context.get());
            removed = true;
        }
    }

    return removed;
}

DroneContextPtr SessionRegistry::lookup_drone(const DroneId& drone_id) const {
    DroneContextPtr context = find_drone(drone_id);
    if (context == nullptr) {
        throw GatewayError(ErrorCode::NotFound, "no active session for drone " + drone_id);
    }
    return context;
}

OperatorContextPtr SessionRegistry::lookup_operator(const OperatorId& operator_id) const {
    OperatorContextPtr context = find_operator(operator_id);
    if (context == nullptr) {
        throw GatewayError(ErrorCode::NotFound, "no active session for operator " + operator_id);
    }
    return context;
}

DroneContextPtr SessionRegistry::find_drone(const DroneId& drone_id) const {
    std::shared_lock lock(map_mutex_);
    const auto iterator_context = map_drones_.find(drone_id);
    if (iterator_context == map_drones_.end()) {
        return nullptr;
    }
    return iterator_context->second;
}

OperatorContextPtr SessionRegistry::find_operator(const OperatorId& operator_id) const {
    std::shared_lock lock(map_mutex_);
    const auto iterator_context = map_operators_.find(operator_id);
    if (iterator_context == map_operators_.end()) {
        return nullptr;
    }
    return iterator_context->second;
}

void SessionRegistry::heartbeat(const std::string& identifier, TimePoint now) {
    bool refreshed = false;

    if (const DroneContextPtr drone_context = find_drone(identifier); drone_context != nullptr) {
        std::scoped_lock lock(drone_context->mutex);
        if (drone_context->active) {
            drone_context->session.last_seen = std::max(drone_context->session.last_seen, now);
            refreshed = true;
        }
    }

    if (const OperatorContextPtr operator_context = find_operator(identifier); operator_context != nullptr) {
        std::scoped_lock lock(operator_context->mutex);
        if (operator_context->active) {
            operator_context->session.last_seen = std::max(operator_context->session.last_seen, now);
            refreshed = true;
        }
    }

    if (!refreshed) {
        throw GatewayError(ErrorCode::NotFound, "heartbeat for unknown session " + identifier);
    }
}

std::size_t SessionRegistry::sweep(TimePoint now) {
    std::vector<std::pair<DroneId, DroneContextPtr>> list_drones;
    std::vector<std::pair<OperatorId, OperatorContextPtr>> list_operators;
    {
        std::shared_lock lock(map_mutex_);
        list_drones.assign(map_drones_.begin(), map_drones_.end());
        list_operators.assign(map_operators_.begin(), map_operators_.end());
    }

    std::size_t evicted_count = 0;
    for (const auto& [drone_id, context] : list_drones) {
        std::scoped_lock lock(context->mutex);
        if (!context->active || !is_expired(context->session.last_seen, now)) {
            continue;
        }
        logger_->warn(
            R"({{"component":"session_registry","event":"liveness_timeout","drone":"{}","phase":"{}","silent_s":{:.3f}}})",
            drone_id,
            to_string(context->session.state_machine.phase()),
            elapsed_between(context->session.last_seen, now).count()
        );
        teardown_drone_locked(*context, StateChangeCause::Timeout, now);
        erase_drone(drone_id, context.get());
        ++evicted_count;
    }

    for (const auto& [operator_id, context] : list_operators) {
        std::scoped_lock lock(context->mutex);
        if (!context->active || !is_expired(context->session.last_seen, now)) {
            continue;
        }
        logger_->warn(
            R"({{"component":"session_registry","event":"liveness_timeout","operator":"{}","silent_s":{:.3f}}})",
            operator_id,
            elapsed_between(context->session.last_seen, now).count()
        );
        teardown_operator_locked(*context, StateChangeCause::Timeout, now);
        erase_operator(operator_id, context.get());
        ++evicted_count;
    }

    return evicted_count;
}

std::vector<DroneId> SessionRegistry::drone_ids() const {
    std::shared_lock lock(map_mutex_);
    std::vector<DroneId> list_ids;
    list_ids.reserve(map_drones_.size());
    for (const auto& [drone_id, context] : map_drones_) {
        list_ids.push_back(drone_id);
    }
    return list_ids;
}

std::vector<OperatorId> SessionRegistry::operator_ids() const {
    std::shared_lock lock(map_mutex_);
    std::vector<OperatorId> list_ids;
    list_ids.reserve(map_operators_.size());
    for (const auto& [operator_id, context] : map_operators_) {
        list_ids.push_back(operator_id);
    }
    return list_ids;
}

std::size_t SessionRegistry::drone_count() const {
    std::shared_lock lock(map_mutex_);
    return map_drones_.size();
}

std::size_t SessionRegistry::operator_count() const {
    std::shared_lock lock(map_mutex_);
    return map_operators_.size();
}

Duration SessionRegistry::liveness_timeout() const noexcept {
    return liveness_timeout_;
}

void SessionRegistry::teardown_drone_locked(DroneContext& context, StateChangeCause cause, TimePoint now) {
    context.active = false;
    if (drone_teardown_handler_) {
        try {
            drone_teardown_handler_(context.session, cause, now);
        } catch (const std::exception& exc) {
            logger_->error("Drone {} teardown failed: {}", context.session.identifier, exc.what());
        }
    }
    context.session.pending_commands.clear();
    if (context.session.connection != nullptr) {
        context.session.connection->close();
        context.session.connection.reset();
    }
    logger_->info(
        R"({{"component":"session_registry","event":"drone_disconnected","drone":"{}","cause":"{}"}})",
        context.session.identifier,
        to_string(cause)
    );
}

void SessionRegistry::teardown_operator_locked(OperatorContext& context, StateChangeCause cause, TimePoint now) {
    context.active = false;
    if (operator_teardown_handler_) {
        try {
            operator_teardown_handler_(context.session, cause, now);
        } catch (const std::exception& exc) {
            logger_->error("Operator {} teardown failed: {}", context.session.identifier, exc.what());
        }
    }
    context.session.set_subscriptions.clear();
    if (context.session.connection != nullptr) {
        context.session.connection->close();
        context.session.connection.reset();
    }
    logger_->info(
        R"({{"component":"session_registry","event":"operator_disconnected","operator":"{}","cause":"{}"}})",
        context.session.identifier,
        to_string(cause)
    );
}

void SessionRegistry::erase_drone(const DroneId& drone_id, const DroneContext* context) {
    std::unique_lock lock(map_mutex_);
    const auto iterator_context = map_drones_.find(drone_id);
    if (iterator_context != map_drones_.end() && iterator_context->second.get() == context) {
        map_drones_.erase(iterator_context);
    }
}

void SessionRegistry::erase_operator(const OperatorId& operator_id, const OperatorContext* context) {
    std::unique_lock lock(map_mutex_);
    const auto iterator_context = map_operators_.find(operator_id);
    if (iterator_context != map_operators_.end() && iterator_context->second.get() == context) {
        map_operators_.erase(iterator_context);
    }
}

bool SessionRegistry::is_expired(TimePoint last_seen, TimePoint now) const {
    return elapsed_between(last_seen, now) > liveness_timeout_;
}

}  // namespace drone_gateway
