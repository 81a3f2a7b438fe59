#ifndef MQTTLINK_CONNECTION_HPP
#define MQTTLINK_CONNECTION_HPP

/**
 * @file Connection.hpp
 *
 * This declares the MqttLink::Connection class
 *
 * copyright © 2025 by Hatem Nabli
 */

#include <stdint.h>
#include <functional>
#include <string>
#include <vector>

namespace MqttLink
{
    /**
     * This represents a single byte stream between a broker and an
     * MqttLink client on a transport layer.
     */
    class Connection
    {
        // Types
    public:
        /**
         * This is the delegate used to deliver received data to the owner of
         * this interface.
         *
         * @param[in] data
         *      This is the data that was received from the remote peer.
         */
        typedef std::function<void(const std::vector<uint8_t>& data)> DataReceivedDelegate;

        /**
         * This delegate is used to notify the user that the connection
         * has been broken.
         *
         * @param[in] graceful
         *      This indicates whether the peer closed the stream cleanly
         *      (true) or the stream failed (false).
         */
        typedef std::function<void(bool graceful)> BrokenDelegate;

        // Lifecycle management
    public:
        virtual ~Connection() = default;

        // Methods
    public:
        /**
         * This method returns a string that identifies
         * the peer of this connection in the context of the transport.
         *
         * @return
         *      A string that identifies the peer of this connection
         *      in the context of the transport is returned.
         */
        virtual std::string GetPeerId() = 0;

        /**
         * This method sends the given data to the remote peer.
         *
         * @param[in] data
         *      This is the data to send to the remote peer.
         */
        virtual void SendData(const std::vector<uint8_t>& data) = 0;

        /**
         * This method breaks the connection to the remote peer.
         *
         * @param[in] clean
         *      This flag indicates whether or not to attempt to complete
         *      any data transmission still in progress, before breaking
         *      the connection.
         */
        virtual void Break(bool clean) = 0;
    };

}  // namespace MqttLink

#endif /* MQTTLINK_CONNECTION_HPP */
