#ifndef MQTTLINK_MQTTCLIENT_HPP
#define MQTTLINK_MQTTCLIENT_HPP
/**
 * @file MqttClient.hpp
 * @brief this file contains the definition of the MqttClient class.
 * @note This class keeps a publish/subscribe session alive against a broker,
 * reconnecting with exponential backoff whenever the connection is lost.
 * @author Hatem Nabli
 * copyright © 2025 by Hatem Nabli
 *
 */
#include <stdint.h>
#include <chrono>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <json/json.h>
#include <SystemUtils/DiagnosticsSender.hpp>
#include "ClientTransportLayer.hpp"
#include "IdentityGenerator.hpp"
#include "MqttOptions.hpp"
#include "ProtocolCodec.hpp"
#include "Scheduler.hpp"
#include "TimeKeeper.hpp"
#include "TopicRouter.hpp"

namespace MqttLink
{
    /**
     * This is a resilient publish/subscribe client. It connects to one
     * broker, monitors the connection with a heartbeat and, once it has
     * connected at least once, never gives up reconnecting until it is
     * closed.
     *
     * All methods and all delegates handed to the dependencies must be
     * called from the single logical thread that drives the Scheduler.
     * Topic registrations are the exception: they may be changed from
     * any thread.
     */
    class MqttClient
    {
        // Types
    public:
        typedef MqttLink::MqttOptions MqttOptions;

        /**
         * This structure holds all of the dependency objects
         * needed by the client when it's mobilized.
         */
        struct MqttMobilizationDependencies
        {
            /**
             * This is the transport layer implementation to use.
             */
            std::shared_ptr<ClientTransportLayer> transport;

            /**
             * This builds the protocol codec on top of each new connection.
             */
            std::shared_ptr<CodecFactory> codecFactory;

            /**
             * This runs the handshake, heartbeat and reconnect timers.
             */
            std::shared_ptr<Scheduler> scheduler;

            /**
             * This is the object used to track time in the client.
             */
            std::shared_ptr<TimeKeeper> timeKeeper;
        };

        enum class ResultCode : int32_t
        {
            Success = 0,             //!< The method succeeded as expected
            TimedOut = -2,           //!< The broker did not answer in time
            AlreadyConnected = -3,   //!< Already connected to a broker
            BadParameter = -4,       //!< No broker endpoint was given or remembered
            NetworkError = -6,       //!< The connection failed or was lost
            AlreadyConnecting = -8,  //!< A connection attempt is already in flight
            NotMobilized = -9,       //!< Mobilize was not called
            Closed = -10,            //!< The client was closed

            UnknownError = -1,  //!< An unknown error happened
        };

        /**
         * These are the states of the connection lifecycle.
         */
        enum class State
        {
            Disconnected,  //!< Initial state, and between reconnection attempts
            Connecting,    //!< Transport and handshake in flight
            Connected,     //!< Handshake acknowledged, heartbeat running
            Closed,        //!< Terminal, no further transitions
        };

        /**
         * These are the lifecycle notifications given to the application,
         * kept apart from the topic names.
         */
        enum class ControlSignal
        {
            Connect,     //!< The first handshake of the client succeeded
            Reconnect,   //!< A later handshake succeeded
            Disconnect,  //!< The broker asked to disconnect
            Fatal,       //!< The client gave up; it is now closed
        };

        /**
         * This describes one control signal.
         */
        struct ControlEvent
        {
            ControlSignal signal = ControlSignal::Connect;

            /**
             * This is why a Fatal signal was raised; Success otherwise.
             */
            ResultCode reason = ResultCode::Success;

            /**
             * This is the client-local identifier from the options.
             */
            std::string clientId;
        };

        /**
         * This is called with the outcome of Connect. Success is reported
         * only for the very first successful connection of the client.
         */
        typedef std::function<void(ResultCode result)> ConnectDelegate;

        typedef std::function<void(const ControlEvent& event)> ControlSignalDelegate;

        /**
         * This is returned by the Subscribe methods; calling it ends
         * the subscription.
         */
        typedef std::function<void()> UnsubscribeDelegate;

        // Lifecycle management
    public:
        ~MqttClient();
        MqttClient(const MqttClient&) = delete;
        MqttClient(MqttClient&&) = delete;
        MqttClient& operator=(const MqttClient&) = delete;
        MqttClient& operator=(MqttClient&&) = delete;

        // Public Methods
    public:
        /**
         * This is the constructor for the MqttClient class.
         * The session identity is generated here, once.
         *
         * @param[in] options
         *      This is the configuration of the client.
         *
         * @param[in] identityGenerator
         *      This builds the session identity. If null, a
         *      CounterIdentityGenerator is used.
         */
        explicit MqttClient(const MqttOptions& options = MqttOptions(),
                            std::shared_ptr<IdentityGenerator> identityGenerator = nullptr);

        /**
         * This method will set up the client with its dependencies,
         * preparing it to be able to connect to a broker.
         *
         * @param[in] deps
         *     These are all of the dependency objects
         *     needed by the client when it's mobilized.
         *
         * @return
         *     An indication of whether or not the client is mobilized
         *     is returned.
         */
        bool Mobilize(const MqttMobilizationDependencies& deps);

        /**
         * This method drops any connection without notifying the
         * application, cancels all timers and releases the dependencies,
         * returning the client back to the state it was in before
         * Mobilize was called.
         */
        void Demobilize();

        /**
         * This method starts connecting to the given broker. It returns
         * immediately; the outcome is reported later through the delegate
         * and the control signals.
         *
         * @param[in] brokerHost
         *      This is the host name of the broker. If empty, the host
         *      given to an earlier call is used.
         *
         * @param[in] port
         *      This is the port number of the broker. If zero, the port
         *      given to an earlier call is used.
         *
         * @param[in] connectDelegate
         *      This is called with ResultCode::Success once the first
         *      handshake succeeds, or right away with the reason the
         *      attempt could not start.
         *
         * @return
         *      An indication of whether or not a connection attempt
         *      was started is returned.
         */
        bool Connect(const std::string& brokerHost = "", uint16_t port = 0,
                     ConnectDelegate connectDelegate = nullptr);

        /**
         * This method publishes the given message as JSON. Nothing is
         * sent unless the client is connected.
         *
         * @param[in] topic
         *      This is the topic to publish to.
         *
         * @param[in] message
         *      This is the message to publish.
         *
         * @return
         *      An indication of whether or not the message was handed
         *      to the codec is returned.
         */
        bool Send(const std::string& topic, const Json::Value& message);

        /**
         * This method is the same as Close.
         */
        void Disconnect();

        /**
         * This method closes the client for good: it sends a disconnect
         * command on the live connection, if any, and stops every timer,
         * including a pending reconnection. Calling it again does nothing.
         */
        void Close();

        /**
         * This method registers a listener for the messages published on
         * the given topic. Registrations survive reconnections.
         *
         * @param[in] topic
         *      This is the exact topic name to listen to.
         *
         * @param[in] topicDelegate
         *      This is called with each decoded message.
         *
         * @return
         *      A delegate that removes the listener is returned.
         */
        TopicRouter::UnsubscribeDelegate SubscribeToTopic(const std::string& topic,
                                                          TopicRouter::TopicDelegate topicDelegate);

        /**
         * This method registers a delegate for the control signals.
         *
         * @param[in] controlSignalDelegate
         *      This is called with each control signal.
         *
         * @return
         *      A delegate that ends the subscription is returned.
         */
        UnsubscribeDelegate SubscribeToControlSignals(ControlSignalDelegate controlSignalDelegate);

        /**
         * This method forms a new subscription to diagnostic
         * messages published by the client.
         *
         * @param[in] delegate
         *      This is the function to call to deliver messages
         *      to the subscriber.
         *
         * @param[in] minLevel
         *      This is the minimum level of message that this subscriber
         *      desires to receive.
         *
         * @return
         *      A function is returned which may be called
         *      to terminate the subscription.
         */
        SystemUtils::DiagnosticsSender::UnsubscribeDelegate SubscribeToDiagnostics(
            SystemUtils::DiagnosticsSender::DiagnosticMessageDelegate delegate,
            size_t minLevel = 0);

        State GetState() const;

        /**
         * This method returns the session identity presented to the broker.
         */
        std::string GetIdentity() const;

        /**
         * This method returns how many handshakes succeeded so far.
         */
        uint32_t GetSuccessCount() const;

        /**
         * This method returns the most recent reconnection delay.
         */
        std::chrono::milliseconds GetReconnectDelay() const;

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

    /**
     * This is a support function for Google Test to print out
     * values of the MqttClient::State class.
     *
     * @param[in] state
     *     This is the state value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the state value.
     */
    void PrintTo(const MqttClient::State& state, std::ostream* os);

    /**
     * This is a support function for Google Test to print out
     * values of the MqttClient::ResultCode class.
     *
     * @param[in] result
     *     This is the result value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the result value.
     */
    void PrintTo(const MqttClient::ResultCode& result, std::ostream* os);
}  // namespace MqttLink

#endif /* MQTTLINK_MQTTCLIENT_HPP */
