/**
 * @file TopicRouter.cpp
 *
 * This module contains the implementation of the
 * MqttLink::TopicRouter class.
 *
 * © 2025 by Hatem Nabli
 */

#include "MqttLink/TopicRouter.hpp"

#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>

namespace
{
    /**
     * This is one registration of a topic listener.
     */
    struct Listener
    {
        uint64_t id = 0;

        MqttLink::TopicRouter::TopicDelegate topicDelegate;

        /**
         * This is cleared when the listener is removed, so that a dispatch
         * already holding a snapshot skips it.
         */
        std::atomic<bool> active{true};
    };
}  // namespace

namespace MqttLink
{
    struct TopicRouter::Impl
    {
        /**
         * This is used to synchronize access to the object.
         */
        mutable std::recursive_mutex mutex;

        /**
         * These are the listeners, per topic, in registration order.
         */
        std::map<std::string, std::vector<std::shared_ptr<Listener>>> listeners;

        /**
         * This is the identifier given to the next registration.
         */
        uint64_t nextListenerId = 1;

        void Remove(const std::string& topic, uint64_t id) {
            std::lock_guard<decltype(mutex)> lock(mutex);
            auto topicEntry = listeners.find(topic);
            if (topicEntry == listeners.end())
            { return; }
            auto& topicListeners = topicEntry->second;
            auto listener =
                std::find_if(topicListeners.begin(), topicListeners.end(),
                             [id](const std::shared_ptr<Listener>& entry) { return entry->id == id; });
            if (listener == topicListeners.end())
            { return; }
            (*listener)->active = false;
            topicListeners.erase(listener);
            if (topicListeners.empty())
            { listeners.erase(topicEntry); }
        }
    };

    TopicRouter::~TopicRouter() = default;

    TopicRouter::TopicRouter() : impl_(std::make_shared<Impl>()) {}

    auto TopicRouter::Subscribe(const std::string& topic, TopicDelegate topicDelegate)
        -> UnsubscribeDelegate {
        const auto listener = std::make_shared<Listener>();
        listener->topicDelegate = std::move(topicDelegate);
        {
            std::lock_guard<decltype(impl_->mutex)> lock(impl_->mutex);
            listener->id = impl_->nextListenerId++;
            impl_->listeners[topic].push_back(listener);
        }
        std::weak_ptr<Impl> implWeak(impl_);
        const auto id = listener->id;
        return [implWeak, topic, id]
        {
            const auto impl = implWeak.lock();
            if (impl == nullptr)
            { return; }
            impl->Remove(topic, id);
        };
    }

    size_t TopicRouter::Dispatch(const std::string& topic, const Json::Value& message) {
        std::vector<std::shared_ptr<Listener>> snapshot;
        {
            std::lock_guard<decltype(impl_->mutex)> lock(impl_->mutex);
            const auto topicEntry = impl_->listeners.find(topic);
            if (topicEntry == impl_->listeners.end())
            { return 0; }
            snapshot = topicEntry->second;
        }
        size_t called = 0;
        for (const auto& listener : snapshot)
        {
            if (!listener->active)
            { continue; }
            listener->topicDelegate(message);
            ++called;
        }
        return called;
    }

    size_t TopicRouter::GetListenerCount(const std::string& topic) const {
        std::lock_guard<decltype(impl_->mutex)> lock(impl_->mutex);
        const auto topicEntry = impl_->listeners.find(topic);
        if (topicEntry == impl_->listeners.end())
        { return 0; }
        return topicEntry->second.size();
    }

    bool TopicRouter::DecodePayload(const std::vector<uint8_t>& payload, Json::Value& message,
                                    std::string& errors) {
        if (payload.empty())
        {
            errors = "empty payload";
            return false;
        }
        Json::CharReaderBuilder builder;
        builder["allowComments"] = false;
        builder["failIfExtra"] = true;
        const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        const auto begin = reinterpret_cast<const char*>(payload.data());
        return reader->parse(begin, begin + payload.size(), &message, &errors);
    }

    std::vector<uint8_t> TopicRouter::EncodeMessage(const Json::Value& message) {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "";
        const std::string encoded = Json::writeString(builder, message);
        return std::vector<uint8_t>(encoded.begin(), encoded.end());
    }
}  // namespace MqttLink
