/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation signal shared between a session and its caller
 *
 * The control surface cannot abort a guest command by itself. A session owns
 * one token; any thread may raise it. The process runner polls the token
 * while a control command is in flight and kills the command when it fires,
 * after which the session hard-stops and reverts the guest.
 *
 * @date 2025
 */

#pragma once

#include <atomic>

#include "vmsandbox/core/errors.hpp"

namespace vmsandbox {
namespace core {

class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /// Raise the signal. Safe to call from any thread, idempotent.
    void Cancel() noexcept { cancelled_.store(true); }

    bool IsCancelled() const noexcept { return cancelled_.load(); }

    void ThrowIfCancelled() const {
        if (IsCancelled()) {
            throw CancelledError();
        }
    }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace core
} // namespace vmsandbox
