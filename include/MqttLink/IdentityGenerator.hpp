#ifndef MQTTLINK_IDENTITY_GENERATOR_HPP
#define MQTTLINK_IDENTITY_GENERATOR_HPP
/**
 * @file IdentityGenerator.hpp
 *
 * This module declares the MqttLink::IdentityGenerator interface and
 * its default implementation.
 *
 * © 2025 by Hatem Nabli
 */

#include <string>

namespace MqttLink
{
    /**
     * This builds the session identity a client presents to the broker.
     */
    class IdentityGenerator
    {
        // Lifecycle management
    public:
        virtual ~IdentityGenerator() = default;

        // Methods
    public:
        /**
         * This method returns a new session identity.
         *
         * @param[in] id
         *      This is the client-local identifier from the options.
         *
         * @return
         *      The session identity is returned.
         */
        virtual std::string GenerateIdentity(const std::string& id) = 0;
    };

    /**
     * This generates "MQTT_ADMIN_<id>_<n>" where n comes from a
     * process-wide counter, so two clients never share an identity.
     */
    class CounterIdentityGenerator : public IdentityGenerator
    {
    public:
        std::string GenerateIdentity(const std::string& id) override;
    };
}  // namespace MqttLink

#endif /* MQTTLINK_IDENTITY_GENERATOR_HPP */
