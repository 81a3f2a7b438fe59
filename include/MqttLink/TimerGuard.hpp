#ifndef MQTTLINK_TIMER_GUARD_HPP
#define MQTTLINK_TIMER_GUARD_HPP
/**
 * @file TimerGuard.hpp
 *
 * This module declares the MqttLink::TimerGuard class.
 *
 * © 2025 by Hatem Nabli
 */

#include "Scheduler.hpp"

#include <chrono>
#include <functional>
#include <memory>

namespace MqttLink
{
    /**
     * This owns the three timers of a client connection lifecycle:
     *
     * - the single-shot handshake timeout,
     * - the repeating heartbeat interval,
     * - the single-shot delay before a reconnection attempt.
     *
     * The handshake and heartbeat timers are mutually exclusive: starting
     * one stops the other. A timer that was cancelled never calls its
     * delegate, even if the scheduler fires it afterwards.
     */
    class TimerGuard
    {
        // Types
    public:
        /**
         * This is the delegate called when the handshake timer expires.
         *
         * @param[in] reconnectPhase
         *      This indicates whether the timer was armed for a
         *      reconnection attempt rather than the first attempt.
         */
        typedef std::function<void(bool reconnectPhase)> HandshakeTimeoutDelegate;

        /**
         * This is the delegate called on every heartbeat tick.
         */
        typedef std::function<void()> HeartbeatDelegate;

        /**
         * This is the delegate called when the reconnect delay elapses.
         */
        typedef std::function<void()> ReconnectDelegate;

        // Lifecycle management
    public:
        ~TimerGuard();
        TimerGuard(const TimerGuard&) = delete;
        TimerGuard(TimerGuard&&) = delete;
        TimerGuard& operator=(const TimerGuard&) = delete;
        TimerGuard& operator=(TimerGuard&&) = delete;

        /**
         * This is the constructor of the class.
         *
         * @param[in] scheduler
         *      This is the scheduler that runs the timers.
         *
         * @param[in] handshakeTimeout
         *      This is how long a handshake may take.
         *
         * @param[in] heartbeatInterval
         *      This is the period of the heartbeat timer.
         */
        TimerGuard(std::shared_ptr<Scheduler> scheduler,
                   std::chrono::milliseconds handshakeTimeout,
                   std::chrono::milliseconds heartbeatInterval);

        // Methods
    public:
        /**
         * This method arms the handshake timer, unless it is already armed,
         * and stops the heartbeat.
         *
         * @param[in] reconnectPhase
         *      This is handed back to the delegate on expiry.
         *
         * @param[in] timeoutDelegate
         *      This is the delegate to call on expiry.
         *
         * @return
         *      An indication of whether or not the timer was armed by
         *      this call is returned.
         */
        bool ArmHandshake(bool reconnectPhase, HandshakeTimeoutDelegate timeoutDelegate);

        /**
         * This method disarms the handshake timer.
         */
        void CancelHandshake();

        bool IsHandshakeArmed() const;

        /**
         * This method starts the heartbeat timer, replacing a running one,
         * and disarms the handshake timer.
         *
         * @param[in] heartbeatDelegate
         *      This is the delegate to call once per interval.
         */
        void StartHeartbeat(HeartbeatDelegate heartbeatDelegate);

        /**
         * This method stops the heartbeat timer.
         */
        void StopHeartbeat();

        bool IsHeartbeatRunning() const;

        /**
         * This method schedules a reconnection attempt, replacing any
         * pending one.
         *
         * @param[in] delay
         *      This is how long to wait before calling the delegate.
         *
         * @param[in] reconnectDelegate
         *      This is the delegate to call once the delay elapses.
         */
        void ArmReconnect(std::chrono::milliseconds delay, ReconnectDelegate reconnectDelegate);

        /**
         * This method drops a pending reconnection attempt.
         */
        void CancelReconnect();

        bool IsReconnectPending() const;

        /**
         * This method disarms every timer.
         */
        void CancelAll();

    private:
        /**
         * This is the type of structure that contains the private
         * properties of the instance. It is defined in the implementation
         * and declared here to ensure that it is scoped inside the class.
         */
        struct Impl;

        /**
         * This contains the private properties of the instance.
         */
        std::shared_ptr<Impl> impl_;
    };
}  // namespace MqttLink

#endif /* MQTTLINK_TIMER_GUARD_HPP */
