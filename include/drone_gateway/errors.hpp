// === Errors ==================================================================
//
// Error taxonomy shared by every component. Registry misuse is reported by
// throwing `GatewayError`; command rejections travel back to the caller as
// values carrying an `ErrorCode`.

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace drone_gateway {

/** @brief Every failure the gateway can report to a caller or log. */
enum class ErrorCode {
    DuplicateSession,   /**< An active session already uses the identifier. */
    NotFound,           /**< No active session matches the identifier. */
    UnknownDrone,       /**< Command addressed to a drone that is not connected. */
    IllegalTransition,  /**< Command not permitted from the drone's current phase. */
    StaleCommand,       /**< Command id does not follow the drone's queue head. */
    MalformedPayload,   /**< Command or telemetry payload failed shape checks. */
    DroneUnreachable,   /**< Drone connection unavailable at delivery time. */
    CommandTimedOut,    /**< Drone refused the command or did not acknowledge in time. */
    BufferOverflow      /**< Subscriber buffer full; oldest event dropped. */
};

[[nodiscard]] std::string_view to_string(ErrorCode code) noexcept;

/**
 * @brief Exception thrown for session-level misuse (duplicate or missing ids).
 */
class GatewayError final : public std::runtime_error {
  public:
    GatewayError(ErrorCode code, const std::string& message);

    [[nodiscard]] ErrorCode code() const noexcept;

  private:
    ErrorCode code_;
};

}  // namespace drone_gateway
