#ifndef MQTTLINK_TIMEKEEPER_HPP
#define MQTTLINK_TIMEKEEPER_HPP
/**
 * @file TimeKeeper.hpp
 *
 * This module declares the TimeKeeper interface.
 *
 * © 2025 by Hatem Nabli
 */

namespace MqttLink
{
    /**
     * This represents the time-keeping requirements of MqttLink::MqttClient.
     * To integrate MqttLink::MqttClient into a larger program, implement this
     * interface in terms of the program's clock.
     */
    class TimeKeeper
    {
        // Lifecycle management
    public:
        virtual ~TimeKeeper() = default;

        // Methods
    public:
        /**
         * This method returns the current time.
         *
         * @return
         *      The current time is returned in seconds.
         */
        virtual double GetCurrentTime() = 0;
    };
}  // namespace MqttLink

#endif /* MQTTLINK_TIMEKEEPER_HPP */
