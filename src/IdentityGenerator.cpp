/**
 * @file IdentityGenerator.cpp
 *
 * This module contains the implementation of the
 * MqttLink::CounterIdentityGenerator class.
 *
 * © 2025 by Hatem Nabli
 */

#include "MqttLink/IdentityGenerator.hpp"
#include <StringUtils/StringUtils.hpp>
#include <atomic>
#include <inttypes.h>
#include <stdint.h>

namespace
{
    constexpr const char* IDENTITY_PREFIX = "MQTT_ADMIN_";

    std::atomic<uint64_t> nextSequence{1};
}  // namespace

namespace MqttLink
{
    std::string CounterIdentityGenerator::GenerateIdentity(const std::string& id) {
        const uint64_t sequence = nextSequence.fetch_add(1);
        if (id.empty())
        { return StringUtils::sprintf("%s%" PRIu64, IDENTITY_PREFIX, sequence); }
        return StringUtils::sprintf("%s%s_%" PRIu64, IDENTITY_PREFIX, id.c_str(), sequence);
    }
}  // namespace MqttLink
