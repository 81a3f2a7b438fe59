#ifndef MQTTLINK_SCHEDULER_HPP
#define MQTTLINK_SCHEDULER_HPP
/**
 * @file Scheduler.hpp
 *
 * This module declares the Scheduler interface.
 *
 * © 2025 by Hatem Nabli
 */

#include <stdint.h>
#include <chrono>
#include <functional>

namespace MqttLink
{
    /**
     * This represents the timer requirements of MqttLink::MqttClient.
     * To integrate MqttLink::MqttClient into a larger program, implement this
     * interface in terms of the program's event loop. Every delegate must
     * run on the same logical thread that delivers connection events.
     */
    class Scheduler
    {
        // Types
    public:
        /**
         * This identifies one scheduled call. Zero is never handed out.
         */
        typedef uint64_t Token;

        /**
         * This is the delegate called once the delay has elapsed.
         */
        typedef std::function<void()> TimerDelegate;

        // Lifecycle management
    public:
        virtual ~Scheduler() = default;

        // Methods
    public:
        /**
         * This method arranges for the given delegate to be called once,
         * after the given delay.
         *
         * @param[in] delay
         *      This is how long to wait before calling the delegate.
         *
         * @param[in] timerDelegate
         *      This is the delegate to call.
         *
         * @return
         *      A token that can be given to Cancel is returned.
         */
        virtual Token Schedule(std::chrono::milliseconds delay, TimerDelegate timerDelegate) = 0;

        /**
         * This method cancels a scheduled call, if it has not run yet.
         *
         * @param[in] token
         *      This is the token returned by Schedule.
         */
        virtual void Cancel(Token token) = 0;
    };
}  // namespace MqttLink

#endif /* MQTTLINK_SCHEDULER_HPP */
