#ifndef MQTTLINK_MQTT_OPTIONS_HPP
#define MQTTLINK_MQTT_OPTIONS_HPP
/**
 * @file MqttOptions.hpp
 *
 * This module declares the MqttLink::MqttOptions structure.
 *
 * © 2025 by Hatem Nabli
 */

#include <json/json.h>
#include <stdint.h>
#include <stdexcept>
#include <string>

namespace MqttLink
{
    /**
     * This is thrown by MqttOptions::FromJson for malformed configuration.
     */
    struct ConfigurationError : std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };

    /**
     * These select what happens to the reconnect delay once a
     * reconnection succeeds.
     */
    enum class BackoffPolicy
    {
        /**
         * A successful handshake resets the delay, so the next failure
         * starts again from the initial delay.
         */
        ResetOnSuccess,

        /**
         * The delay is never reset; it keeps growing across failure
         * episodes until it reaches the maximum.
         */
        PersistAcrossEpisodes,
    };

    /**
     * This holds the immutable configuration of an MqttLink::MqttClient.
     */
    struct MqttOptions
    {
        /**
         * This is the client-local identifier. It is folded into the
         * generated session identity and carried by the disconnect signal.
         * Default: ""
         */
        std::string id;

        /**
         * The delay in milliseconds before the first reconnection attempt
         * of a failure episode.
         * Default: 1000 milliseconds
         */
        uint32_t reconnectDelayInitial = 1000;  // milliseconds

        /**
         * The ceiling in milliseconds of the reconnection delay.
         * Default: 60000 milliseconds
         */
        uint32_t reconnectDelayMax = 60000;  // milliseconds

        /**
         * The timeout in milliseconds to wait for the broker to acknowledge
         * a connection.
         * Default: 5000 milliseconds
         */
        uint32_t timeout = 5000;  // milliseconds

        /**
         * The heartbeat period in milliseconds. A connection is considered
         * stale once a ping has gone unanswered for twice this long.
         * Default: 10000 milliseconds
         */
        uint32_t keepalive = 10000;  // milliseconds

        /**
         * What happens to the reconnection delay after a success.
         * Default: BackoffPolicy::ResetOnSuccess
         */
        BackoffPolicy backoffPolicy = BackoffPolicy::ResetOnSuccess;

        /**
         * Set to true to ask the transport for a TLS stream ("mqtts").
         * Default: false
         */
        bool useTLS = false;

        /**
         * This method builds options from a JSON object. Keys that are
         * absent keep their default value.
         *
         * @param[in] config
         *      This is the JSON object holding the configuration.
         *
         * @return
         *      The options are returned.
         *
         * @throws ConfigurationError
         *      This is thrown if a key holds a value of the wrong type,
         *      or a duration is not positive.
         */
        static MqttOptions FromJson(const Json::Value& config);
    };
}  // namespace MqttLink

#endif /* MQTTLINK_MQTT_OPTIONS_HPP */
