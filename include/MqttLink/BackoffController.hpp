#ifndef MQTTLINK_BACKOFF_CONTROLLER_HPP
#define MQTTLINK_BACKOFF_CONTROLLER_HPP
/**
 * @file BackoffController.hpp
 *
 * This module declares the MqttLink::BackoffController class.
 *
 * © 2025 by Hatem Nabli
 */

#include <chrono>

namespace MqttLink
{
    /**
     * This computes the delay before each reconnection attempt.
     * The delay doubles on every failure, starting at the initial
     * delay, and never exceeds the maximum delay:
     *
     *      delay(k) = min(initial * 2^(k-1), maximum)
     *
     * The controller is not thread-safe; the owning client drives it
     * from its single event context.
     */
    class BackoffController
    {
        // Lifecycle management
    public:
        /**
         * This is the constructor of the class.
         *
         * @param[in] initialDelay
         *      This is the delay used after the first failure.
         *
         * @param[in] maxDelay
         *      This is the ceiling applied to every delay.
         */
        BackoffController(std::chrono::milliseconds initialDelay,
                          std::chrono::milliseconds maxDelay);

        // Methods
    public:
        /**
         * This method computes the delay that follows the given one.
         *
         * @param[in] previous
         *      This is the previous delay, or zero if there was none.
         *
         * @param[in] initialDelay
         *      This is the delay used when there was no previous one.
         *
         * @param[in] maxDelay
         *      This is the ceiling applied to the result.
         *
         * @return
         *      The next delay is returned.
         */
        static std::chrono::milliseconds NextDelay(std::chrono::milliseconds previous,
                                                   std::chrono::milliseconds initialDelay,
                                                   std::chrono::milliseconds maxDelay);

        /**
         * This method records one more failure and returns the delay
         * to wait before the next attempt.
         *
         * @return
         *      The delay before the next attempt is returned.
         */
        std::chrono::milliseconds Next();

        /**
         * This method forgets all recorded failures, so the next call
         * to Next returns the initial delay.
         */
        void Reset();

        /**
         * This method returns the most recent delay handed out by Next,
         * or zero if there was none since construction or Reset.
         */
        std::chrono::milliseconds GetCurrentDelay() const;

    private:
        std::chrono::milliseconds initialDelay_;
        std::chrono::milliseconds maxDelay_;
        std::chrono::milliseconds currentDelay_{0};
    };
}  // namespace MqttLink

#endif /* MQTTLINK_BACKOFF_CONTROLLER_HPP */
