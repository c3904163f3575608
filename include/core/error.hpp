#pragma once

#include <stdexcept>
#include <string>

namespace turnstile {

/**
 * @brief Raised when a queued request's deadline elapses before admission
 *
 * The only runtime failure of the limiter. Delivered through the future
 * returned by AdmissionController::await_turn(), or by invoking the
 * request's timeout continuation.
 */
class WaitTimeout : public std::runtime_error {
public:
    static constexpr const char* kMessage = "Limiter timed out.";

    WaitTimeout() : std::runtime_error(kMessage) {}
};

} // namespace turnstile
