/**
 * @file MqttOptions.cpp
 *
 * This module contains the implementation of the
 * MqttLink::MqttOptions structure.
 *
 * © 2025 by Hatem Nabli
 */

#include "MqttLink/MqttOptions.hpp"
#include <StringUtils/StringUtils.hpp>

namespace
{
    uint32_t ReadDuration(const Json::Value& config, const char* key, uint32_t defaultValue) {
        if (!config.isMember(key))
        { return defaultValue; }
        const auto& value = config[key];
        if (!value.isIntegral() || !value.isInt64() || (value.asLargestInt() <= 0) ||
            (value.asLargestInt() > (Json::LargestInt)UINT32_MAX))
        {
            throw MqttLink::ConfigurationError(
                StringUtils::sprintf("\"%s\" must be a positive number of milliseconds", key));
        }
        return (uint32_t)value.asLargestUInt();
    }
}  // namespace

namespace MqttLink
{
    MqttOptions MqttOptions::FromJson(const Json::Value& config) {
        MqttOptions options;
        if (config.isNull())
        { return options; }
        if (!config.isObject())
        { throw ConfigurationError("configuration must be a JSON object"); }

        if (config.isMember("id"))
        {
            if (!config["id"].isString())
            { throw ConfigurationError("\"id\" must be a string"); }
            options.id = config["id"].asString();
        }
        options.reconnectDelayInitial =
            ReadDuration(config, "reconnectDelayInitial", options.reconnectDelayInitial);
        options.reconnectDelayMax =
            ReadDuration(config, "reconnectDelayMax", options.reconnectDelayMax);
        options.timeout = ReadDuration(config, "timeout", options.timeout);
        options.keepalive = ReadDuration(config, "keepalive", options.keepalive);

        if (config.isMember("backoffPolicy"))
        {
            const auto& policy = config["backoffPolicy"];
            if (policy.isString() && (policy.asString() == "reset"))
            {
                options.backoffPolicy = BackoffPolicy::ResetOnSuccess;
            } else if (policy.isString() && (policy.asString() == "persist"))
            {
                options.backoffPolicy = BackoffPolicy::PersistAcrossEpisodes;
            } else
            { throw ConfigurationError("\"backoffPolicy\" must be \"reset\" or \"persist\""); }
        }
        if (config.isMember("useTLS"))
        {
            if (!config["useTLS"].isBool())
            { throw ConfigurationError("\"useTLS\" must be a boolean"); }
            options.useTLS = config["useTLS"].asBool();
        }
        return options;
    }
}  // namespace MqttLink
