#ifndef MQTTLINK_TOPIC_ROUTER_HPP
#define MQTTLINK_TOPIC_ROUTER_HPP
/**
 * @file TopicRouter.hpp
 *
 * This module declares the MqttLink::TopicRouter class.
 *
 * © 2025 by Hatem Nabli
 */

#include <json/json.h>
#include <stddef.h>
#include <stdint.h>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace MqttLink
{
    /**
     * This maps topic names to the application listeners registered for
     * them, and converts messages between JSON values and payload bytes.
     *
     * Topic names are compared for exact equality. Listeners of a topic
     * are called synchronously, in registration order. Registrations may
     * be added or removed from any thread at any time, including from
     * inside a listener while a dispatch is in progress.
     */
    class TopicRouter
    {
        // Types
    public:
        /**
         * This is the delegate called with every message published on
         * the topic it was registered for.
         *
         * @param[in] message
         *      This is the decoded message.
         */
        typedef std::function<void(const Json::Value& message)> TopicDelegate;

        /**
         * This is returned by Subscribe; calling it removes the listener.
         * Calling it more than once, or after the router is gone, is harmless.
         */
        typedef std::function<void()> UnsubscribeDelegate;

        // Lifecycle management
    public:
        ~TopicRouter();
        TopicRouter(const TopicRouter&) = delete;
        TopicRouter(TopicRouter&&) = delete;
        TopicRouter& operator=(const TopicRouter&) = delete;
        TopicRouter& operator=(TopicRouter&&) = delete;

        TopicRouter();

        // Methods
    public:
        /**
         * This method registers a listener for the given topic.
         *
         * @param[in] topic
         *      This is the exact topic name to listen to.
         *
         * @param[in] topicDelegate
         *      This is the delegate to call for every message on the topic.
         *
         * @return
         *      A delegate that removes the listener is returned.
         */
        UnsubscribeDelegate Subscribe(const std::string& topic, TopicDelegate topicDelegate);

        /**
         * This method calls every listener of the given topic.
         *
         * @param[in] topic
         *      This is the topic the message was published on.
         *
         * @param[in] message
         *      This is the decoded message.
         *
         * @return
         *      The number of listeners called is returned.
         */
        size_t Dispatch(const std::string& topic, const Json::Value& message);

        /**
         * This method returns the number of listeners registered
         * for the given topic.
         */
        size_t GetListenerCount(const std::string& topic) const;

        /**
         * This method parses a payload as JSON.
         *
         * @param[in] payload
         *      This is the raw payload received from the broker.
         *
         * @param[out] message
         *      This is where to store the decoded message.
         *
         * @param[out] errors
         *      This is where to store the parser's complaint, if any.
         *
         * @return
         *      An indication of whether or not the payload was valid
         *      JSON is returned.
         */
        static bool DecodePayload(const std::vector<uint8_t>& payload, Json::Value& message,
                                  std::string& errors);

        /**
         * This method serializes a message as compact JSON.
         *
         * @param[in] message
         *      This is the message to serialize.
         *
         * @return
         *      The payload bytes are returned.
         */
        static std::vector<uint8_t> EncodeMessage(const Json::Value& message);

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

#endif /* MQTTLINK_TOPIC_ROUTER_HPP */
