#ifndef MQTTLINK_PROTOCOL_CODEC_HPP
#define MQTTLINK_PROTOCOL_CODEC_HPP
/**
 * @file ProtocolCodec.hpp
 *
 * This module declares the MqttLink::ProtocolCodec and
 * MqttLink::CodecFactory interfaces.
 *
 * © 2025 by Hatem Nabli
 */

#include "Connection.hpp"

#include <stdint.h>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace MqttLink
{
    /**
     * This represents the control packet codec sitting on top of one
     * byte stream. It turns raw bytes into typed events and typed
     * commands into raw bytes.
     */
    class ProtocolCodec
    {
        // Types
    public:
        /**
         * These are the kinds of events a codec reports.
         */
        enum class EventType
        {
            ConnectAck,
            Publish,
            PingResponse,
            Disconnect,
            Close,
            Error,
        };

        /**
         * This is one decoded event.
         */
        struct Event
        {
            EventType type = EventType::Error;

            /**
             * This is the topic name (Publish only).
             */
            std::string topic;

            /**
             * This is the raw application payload (Publish only).
             */
            std::vector<uint8_t> payload;
        };

        /**
         * This is the delegate used to deliver decoded events.
         */
        typedef std::function<void(const Event& event)> EventDelegate;

        // Lifecycle management
    public:
        virtual ~ProtocolCodec() = default;

        // Methods
    public:
        /**
         * This method sets the delegate to call for every decoded event.
         *
         * @param[in] eventDelegate
         *      This is the delegate to call for every decoded event.
         */
        virtual void SetEventDelegate(EventDelegate eventDelegate) = 0;

        /**
         * This method feeds bytes received from the stream into the codec.
         *
         * @param[in] data
         *      This is the data received from the remote peer.
         */
        virtual void DataReceived(const std::vector<uint8_t>& data) = 0;

        /**
         * This method emits a connect command carrying the given identity.
         *
         * @param[in] identity
         *      This is the session identity presented to the broker.
         */
        virtual void Connect(const std::string& identity) = 0;

        /**
         * This method emits a publish command.
         *
         * @param[in] topic
         *      This is the topic to publish to.
         *
         * @param[in] payload
         *      This is the encoded application payload.
         */
        virtual void Publish(const std::string& topic, const std::vector<uint8_t>& payload) = 0;

        /**
         * This method emits a ping request.
         */
        virtual void PingRequest() = 0;

        /**
         * This method emits a disconnect command.
         */
        virtual void Disconnect() = 0;
    };

    /**
     * This creates one codec per byte stream.
     */
    class CodecFactory
    {
        // Lifecycle management
    public:
        virtual ~CodecFactory() = default;

        // Methods
    public:
        /**
         * This method builds a codec that writes to the given connection.
         *
         * @param[in] connection
         *      This is the byte stream the codec writes commands to.
         *
         * @return
         *      The new codec is returned.
         */
        virtual std::shared_ptr<ProtocolCodec> CreateCodec(
            std::shared_ptr<Connection> connection) = 0;
    };
}  // namespace MqttLink

#endif /* MQTTLINK_PROTOCOL_CODEC_HPP */
