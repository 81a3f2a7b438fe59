#ifndef MQTTLINK_CLIENT_TRANSPORT_LAYER_HPP
#define MQTTLINK_CLIENT_TRANSPORT_LAYER_HPP

/**
 * @file ClientTransportLayer.hpp
 *
 * This module declares the MqttLink::ClientTransportLayer interface.
 *
 * © 2025 by Hatem Nabli
 */

#include "Connection.hpp"

#include <stdint.h>
#include <memory>
#include <string>

namespace MqttLink
{
    /**
     * This represents the transport layer requirements of the
     * MqttClient. To integrate MqttLink::MqttClient into a larger application,
     * implement this interface in terms of the actual transport layer.
     */
    class ClientTransportLayer
    {
        // Lifecycle management
    public:
        virtual ~ClientTransportLayer() = default;

        // Methods
    public:
        /**
         * This method opens a new byte stream to a broker with
         * the given address and port number.
         *
         * @note
         *     Both delegates must be called from the context that drives
         *     the client's Scheduler.
         *
         * @param[in] scheme
         *     This is the scheme of the target ("mqtt" or "mqtts").
         *
         * @param[in] hostNameOrAddress
         *     This is the host name or IP address of the
         *     broker to which to connect.
         *
         * @param[in] port
         *     This is the port number of the broker to which to connect.
         *
         * @param[in] dataReceivedDelegate
         *     This is the delegate to call whenever data is received
         *     from the remote peer.
         *
         * @param[in] brokenDelegate
         *     This is the delegate to call whenever the stream
         *     has been broken.
         *
         * @return
         *     An object representing the new connection is returned.
         *
         * @retval nullptr
         *     This is returned if a connection could not be established.
         */
        virtual std::shared_ptr<Connection> Connect(
            const std::string& scheme, const std::string& hostNameOrAddress, uint16_t port,
            Connection::DataReceivedDelegate dataReceivedDelegate,
            Connection::BrokenDelegate brokenDelegate) = 0;
    };

}  // namespace MqttLink

#endif /* MQTTLINK_CLIENT_TRANSPORT_LAYER_HPP */
