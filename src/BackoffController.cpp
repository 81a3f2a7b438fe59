/**
 * @file BackoffController.cpp
 *
 * This module contains the implementation of the
 * MqttLink::BackoffController class.
 *
 * © 2025 by Hatem Nabli
 */

#include "MqttLink/BackoffController.hpp"

namespace MqttLink
{
    BackoffController::BackoffController(std::chrono::milliseconds initialDelay,
                                         std::chrono::milliseconds maxDelay) :
        initialDelay_(initialDelay), maxDelay_(maxDelay) {}

    std::chrono::milliseconds BackoffController::NextDelay(std::chrono::milliseconds previous,
                                                           std::chrono::milliseconds initialDelay,
                                                           std::chrono::milliseconds maxDelay) {
        std::chrono::milliseconds delay = initialDelay;
        if (previous.count() > 0)
        {
            // Stop doubling once past the ceiling, so the value cannot overflow.
            delay = (previous >= maxDelay) ? maxDelay : previous * 2;
        }
        if (delay > maxDelay)
        { delay = maxDelay; }
        return delay;
    }

    std::chrono::milliseconds BackoffController::Next() {
        currentDelay_ = NextDelay(currentDelay_, initialDelay_, maxDelay_);
        return currentDelay_;
    }

    void BackoffController::Reset() { currentDelay_ = std::chrono::milliseconds(0); }

    std::chrono::milliseconds BackoffController::GetCurrentDelay() const { return currentDelay_; }
}  // namespace MqttLink
