/**
 * @file MqttClientTests.cpp
 * @brief This file contains the unit tests of the MqttClient class.
 * @note The client is driven through mock transport, codec and a virtual clock.
 * @author Hatem Nabli
 * copyright © 2025 by Hatem Nabli
 */

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include <MqttLink/MqttClient.hpp>
#include <StringUtils/StringUtils.hpp>
#include <SystemUtils/DiagnosticsSender.hpp>
#include "MqttLinkMocks.hpp"

using namespace MqttLink;
using namespace MqttLinkTests;

namespace
{
    /**
     * This hands out a fixed identity, so the tests can check it.
     */
    struct FixedIdentityGenerator : public IdentityGenerator
    {
        std::string GenerateIdentity(const std::string& id) override {
            return "fixed-" + id;
        }
    };
}  // namespace

struct MqttClientTests : public ::testing::Test
{
protected:
    MqttOptions options;

    std::shared_ptr<MockTransport> transport;

    std::shared_ptr<MockCodecFactory> codecFactory;

    std::shared_ptr<VirtualScheduler> scheduler;

    std::unique_ptr<MqttClient> client;

    std::vector<MqttClient::ControlEvent> controlEvents;

    std::vector<MqttClient::ResultCode> connectResults;

    std::vector<std::string> diagnosticMessages;

    SystemUtils::DiagnosticsSender::UnsubscribeDelegate diagnosticUnsubscribeDelegate;

    void SetUp() override {
        options.id = "tester";
        options.timeout = 1000;
        options.keepalive = 2000;
        options.reconnectDelayInitial = 1000;
        options.reconnectDelayMax = 5000;
        transport = std::make_shared<MockTransport>();
        codecFactory = std::make_shared<MockCodecFactory>();
        scheduler = std::make_shared<VirtualScheduler>();
        MakeClient();
    }

    void TearDown() override {
        client->Demobilize();
        diagnosticUnsubscribeDelegate();
    }

    /**
     * This replaces the client with a new one built from the current
     * options, mobilized against the fixture's mocks.
     */
    void MakeClient(bool mobilize = true) {
        if (client != nullptr)
        {
            client->Demobilize();
            diagnosticUnsubscribeDelegate();
        }
        client.reset(new MqttClient(options));
        if (mobilize)
        {
            MqttClient::MqttMobilizationDependencies deps;
            deps.transport = transport;
            deps.codecFactory = codecFactory;
            deps.scheduler = scheduler;
            deps.timeKeeper = scheduler;
            ASSERT_TRUE(client->Mobilize(deps));
        }
        (void)client->SubscribeToControlSignals(
            [this](const MqttClient::ControlEvent& event) { controlEvents.push_back(event); });
        diagnosticUnsubscribeDelegate = client->SubscribeToDiagnostics(
            [this](std::string senderName, size_t level, std::string message)
            {
                diagnosticMessages.push_back(StringUtils::sprintf("%s[%zu]: %s", senderName.c_str(),
                                                                  level, message.c_str()));
            },
            0);
    }

    bool StartConnect() {
        return client->Connect("broker.test", 1883, [this](MqttClient::ResultCode result)
                               { connectResults.push_back(result); });
    }

    void ConnectAndAcknowledge() {
        ASSERT_TRUE(StartConnect());
        ASSERT_NE(nullptr, codec());
        codec()->Emit(ProtocolCodec::EventType::ConnectAck);
        ASSERT_EQ(MqttClient::State::Connected, client->GetState());
    }

    std::shared_ptr<MockCodec> codec() const { return codecFactory->LastCodec(); }

    std::shared_ptr<MockConnection> connection() const { return transport->LastConnection(); }

    bool HasDiagnostic(const std::string& fragment) const {
        for (const auto& message : diagnosticMessages)
        {
            if (message.find(fragment) != std::string::npos)
            { return true; }
        }
        return false;
    }

    std::vector<MqttClient::ControlSignal> Signals() const {
        std::vector<MqttClient::ControlSignal> signals;
        for (const auto& event : controlEvents)
        { signals.push_back(event.signal); }
        return signals;
    }
};

TEST_F(MqttClientTests, ConnectOpensTransportAndPresentsIdentity_test) {
    ASSERT_TRUE(StartConnect());
    ASSERT_NE(nullptr, connection());
    EXPECT_EQ("mqtt", connection()->scheme);
    EXPECT_EQ("broker.test", connection()->hostNameOrIpAddress);
    EXPECT_EQ(1883, connection()->port);
    ASSERT_NE(nullptr, codec());
    EXPECT_EQ(connection(), codec()->connection);
    ASSERT_EQ(1u, codec()->connectIdentities.size());
    EXPECT_EQ(client->GetIdentity(), codec()->connectIdentities[0]);
    EXPECT_EQ(0u, client->GetIdentity().find("MQTT_ADMIN_tester_"));
    EXPECT_EQ(MqttClient::State::Connecting, client->GetState());
    EXPECT_EQ(1u, scheduler->pending.size());
}

TEST_F(MqttClientTests, InjectedIdentityGeneratorIsUsed_test) {
    MqttClient custom(options, std::make_shared<FixedIdentityGenerator>());
    EXPECT_EQ("fixed-tester", custom.GetIdentity());
}

TEST_F(MqttClientTests, TransportDataIsFedToCodec_test) {
    ASSERT_TRUE(StartConnect());
    connection()->SimulateIncoming({0x20, 0x02, 0x00, 0x00});
    ASSERT_EQ(1u, codec()->received.size());
    EXPECT_EQ((std::vector<uint8_t>{0x20, 0x02, 0x00, 0x00}), codec()->received[0]);
}

TEST_F(MqttClientTests, TlsOptionSelectsSecureScheme_test) {
    options.useTLS = true;
    MakeClient();
    ASSERT_TRUE(StartConnect());
    EXPECT_EQ("mqtts", connection()->scheme);
}

TEST_F(MqttClientTests, FirstConnectCallbackFiresExactlyOnce_test) {
    ConnectAndAcknowledge();
    codec()->Emit(ProtocolCodec::EventType::ConnectAck);
    EXPECT_EQ((std::vector<MqttClient::ResultCode>{MqttClient::ResultCode::Success}),
              connectResults);
    EXPECT_EQ((std::vector<MqttClient::ControlSignal>{MqttClient::ControlSignal::Connect}),
              Signals());
    EXPECT_EQ(1u, client->GetSuccessCount());

    // A reconnection does not call the original callback again.
    codec()->Emit(ProtocolCodec::EventType::Close);
    scheduler->Advance(1000);
    codec()->Emit(ProtocolCodec::EventType::ConnectAck);
    EXPECT_EQ(1u, connectResults.size());
    EXPECT_EQ(2u, client->GetSuccessCount());
    EXPECT_EQ((std::vector<MqttClient::ControlSignal>{MqttClient::ControlSignal::Connect,
                                                       MqttClient::ControlSignal::Reconnect}),
              Signals());
}

TEST_F(MqttClientTests, ConnectWhileConnectedReportsAlreadyConnected_test) {
    ConnectAndAcknowledge();
    connectResults.clear();
    EXPECT_FALSE(StartConnect());
    EXPECT_EQ((std::vector<MqttClient::ResultCode>{MqttClient::ResultCode::AlreadyConnected}),
              connectResults);
    EXPECT_EQ(1u, transport->connectCount);
    EXPECT_EQ(MqttClient::State::Connected, client->GetState());
}

TEST_F(MqttClientTests, ConnectWhileConnectingReportsAlreadyConnecting_test) {
    ASSERT_TRUE(StartConnect());
    EXPECT_FALSE(StartConnect());
    EXPECT_EQ((std::vector<MqttClient::ResultCode>{MqttClient::ResultCode::AlreadyConnecting}),
              connectResults);
    EXPECT_EQ(1u, transport->connectCount);
    EXPECT_EQ(1u, scheduler->pending.size());
}

TEST_F(MqttClientTests, ConnectWithoutEndpointReportsBadParameter_test) {
    MqttClient::ResultCode result = MqttClient::ResultCode::Success;
    EXPECT_FALSE(client->Connect("", 0, [&result](MqttClient::ResultCode r) { result = r; }));
    EXPECT_EQ(MqttClient::ResultCode::BadParameter, result);
    EXPECT_EQ(0u, transport->connectCount);
    EXPECT_EQ(MqttClient::State::Disconnected, client->GetState());
}

TEST_F(MqttClientTests, ConnectBeforeMobilizeReportsNotMobilized_test) {
    MakeClient(false);
    MqttClient::ResultCode result = MqttClient::ResultCode::Success;
    EXPECT_FALSE(client->Connect("broker.test", 1883,
                                 [&result](MqttClient::ResultCode r) { result = r; }));
    EXPECT_EQ(MqttClient::ResultCode::NotMobilized, result);
    EXPECT_EQ(0u, transport->connectCount);
    EXPECT_TRUE(HasDiagnostic("NotMobilized"));
}

TEST_F(MqttClientTests, MobilizeRequiresAllDependencies_test) {
    MqttClient other(options);
    MqttClient::MqttMobilizationDependencies deps;
    deps.transport = transport;
    deps.scheduler = scheduler;
    EXPECT_FALSE(other.Mobilize(deps));
}

// A first attempt that is never acknowledged gives up for good.
TEST_F(MqttClientTests, FirstHandshakeTimeoutIsFatal_test) {
    ASSERT_TRUE(StartConnect());
    scheduler->Advance(999);
    EXPECT_EQ(MqttClient::State::Connecting, client->GetState());
    scheduler->Advance(1);
    EXPECT_EQ(MqttClient::State::Closed, client->GetState());
    ASSERT_EQ(1u, controlEvents.size());
    EXPECT_EQ(MqttClient::ControlSignal::Fatal, controlEvents[0].signal);
    EXPECT_EQ(MqttClient::ResultCode::TimedOut, controlEvents[0].reason);
    EXPECT_TRUE(connectResults.empty());
    EXPECT_EQ(1u, connection()->breakCount);
    EXPECT_TRUE(scheduler->pending.empty());
    EXPECT_TRUE(HasDiagnostic("giving up"));

    // Nothing is retried later either.
    scheduler->Advance(60000);
    EXPECT_EQ(1u, transport->connectCount);
}

TEST_F(MqttClientTests, TransportFailureOnFirstAttemptIsFatal_test) {
    transport->refuseConnections = true;
    ASSERT_TRUE(StartConnect());
    EXPECT_EQ(MqttClient::State::Closed, client->GetState());
    ASSERT_EQ(1u, controlEvents.size());
    EXPECT_EQ(MqttClient::ControlSignal::Fatal, controlEvents[0].signal);
    EXPECT_EQ(MqttClient::ResultCode::NetworkError, controlEvents[0].reason);
    EXPECT_TRUE(scheduler->pending.empty());
}

TEST_F(MqttClientTests, MissingCodecOnFirstAttemptIsFatal_test) {
    codecFactory->refuseCodecs = true;
    ASSERT_TRUE(StartConnect());
    EXPECT_EQ(MqttClient::State::Closed, client->GetState());
    ASSERT_EQ(1u, connection()->breakCount);
    ASSERT_EQ(1u, controlEvents.size());
    EXPECT_EQ(MqttClient::ControlSignal::Fatal, controlEvents[0].signal);
}

TEST_F(MqttClientTests, SocketErrorBeforeFirstSuccessIsFatal_test) {
    ASSERT_TRUE(StartConnect());
    connection()->SimulateBroken();
    EXPECT_EQ(MqttClient::State::Closed, client->GetState());
    ASSERT_EQ(1u, controlEvents.size());
    EXPECT_EQ(MqttClient::ResultCode::NetworkError, controlEvents[0].reason);
}

TEST_F(MqttClientTests, StaleHeartbeatForcesCloseAndReconnects_test) {
    ConnectAndAcknowledge();
    scheduler->AdvanceTo(2000);
    EXPECT_EQ(1u, codec()->pingCount);

    // The ping is outstanding, but not yet for longer than twice the keepalive.
    scheduler->AdvanceTo(6000);
    EXPECT_EQ(1u, codec()->pingCount);
    EXPECT_EQ(MqttClient::State::Connected, client->GetState());

    scheduler->AdvanceTo(8000);
    EXPECT_EQ(MqttClient::State::Disconnected, client->GetState());
    EXPECT_EQ(1u, connection()->breakCount);
    EXPECT_EQ(std::chrono::milliseconds(1000), client->GetReconnectDelay());
    EXPECT_TRUE(HasDiagnostic("no ping response"));

    scheduler->AdvanceTo(8999);
    EXPECT_EQ(1u, transport->connectCount);
    scheduler->AdvanceTo(9000);
    EXPECT_EQ(2u, transport->connectCount);
    EXPECT_EQ(MqttClient::State::Connecting, client->GetState());
    codec()->Emit(ProtocolCodec::EventType::ConnectAck);
    EXPECT_EQ(MqttClient::State::Connected, client->GetState());
    EXPECT_EQ((std::vector<MqttClient::ControlSignal>{MqttClient::ControlSignal::Connect,
                                                       MqttClient::ControlSignal::Reconnect}),
              Signals());
}

TEST_F(MqttClientTests, AnsweredPingKeepsConnectionAlive_test) {
    ConnectAndAcknowledge();
    for (uint64_t tick = 1; tick <= 10; ++tick)
    {
        scheduler->AdvanceTo(tick * 2000);
        codec()->Emit(ProtocolCodec::EventType::PingResponse);
    }
    EXPECT_EQ(10u, codec()->pingCount);
    EXPECT_EQ(MqttClient::State::Connected, client->GetState());
    EXPECT_EQ(0u, connection()->breakCount);
}

TEST_F(MqttClientTests, SocketCloseHandlingRunsOncePerGeneration_test) {
    ConnectAndAcknowledge();
    const auto firstCodec = codec();
    const auto firstConnection = connection();
    firstCodec->Emit(ProtocolCodec::EventType::Close);
    firstConnection->SimulateBroken();
    firstCodec->Emit(ProtocolCodec::EventType::Error);
    EXPECT_EQ(MqttClient::State::Disconnected, client->GetState());
    EXPECT_EQ(std::chrono::milliseconds(1000), client->GetReconnectDelay());
    EXPECT_EQ(1u, scheduler->pending.size());

    // Events from the old generation are ignored once a new one exists.
    scheduler->Advance(1000);
    EXPECT_EQ(2u, transport->connectCount);
    firstCodec->Emit(ProtocolCodec::EventType::ConnectAck);
    EXPECT_EQ(MqttClient::State::Connecting, client->GetState());
}

TEST_F(MqttClientTests, ReconnectHandshakeTimeoutIsRecoverable_test) {
    ConnectAndAcknowledge();
    codec()->Emit(ProtocolCodec::EventType::Close);
    scheduler->Advance(1000);
    ASSERT_EQ(2u, transport->connectCount);
    const auto attempt = connection();

    scheduler->Advance(1000);
    EXPECT_EQ(MqttClient::State::Disconnected, client->GetState());
    EXPECT_EQ(1u, attempt->breakCount);
    EXPECT_EQ(std::chrono::milliseconds(2000), client->GetReconnectDelay());
    EXPECT_TRUE(HasDiagnostic("timed out"));

    scheduler->Advance(2000);
    EXPECT_EQ(3u, transport->connectCount);
    for (const auto& event : controlEvents)
    { EXPECT_NE(MqttClient::ControlSignal::Fatal, event.signal); }
}

TEST_F(MqttClientTests, ConsecutiveReconnectFailuresBackOff_test) {
    ConnectAndAcknowledge();
    transport->refuseConnections = true;
    codec()->Emit(ProtocolCodec::EventType::Close);
    EXPECT_EQ(std::chrono::milliseconds(1000), client->GetReconnectDelay());
    scheduler->Advance(1000);
    EXPECT_EQ(std::chrono::milliseconds(2000), client->GetReconnectDelay());
    scheduler->Advance(2000);
    EXPECT_EQ(std::chrono::milliseconds(4000), client->GetReconnectDelay());
    scheduler->Advance(4000);
    EXPECT_EQ(std::chrono::milliseconds(5000), client->GetReconnectDelay());
    scheduler->Advance(5000);
    EXPECT_EQ(std::chrono::milliseconds(5000), client->GetReconnectDelay());
    EXPECT_EQ(5u, transport->connectCount);
    EXPECT_EQ(MqttClient::State::Disconnected, client->GetState());
}

TEST_F(MqttClientTests, SuccessResetsBackoffByDefault_test) {
    ConnectAndAcknowledge();
    transport->refuseConnections = true;
    codec()->Emit(ProtocolCodec::EventType::Close);
    scheduler->Advance(1000);
    transport->refuseConnections = false;
    scheduler->Advance(2000);
    codec()->Emit(ProtocolCodec::EventType::ConnectAck);
    EXPECT_EQ(std::chrono::milliseconds(0), client->GetReconnectDelay());
    codec()->Emit(ProtocolCodec::EventType::Close);
    EXPECT_EQ(std::chrono::milliseconds(1000), client->GetReconnectDelay());
}

TEST_F(MqttClientTests, PersistPolicyKeepsBackoffAcrossSuccess_test) {
    options.backoffPolicy = BackoffPolicy::PersistAcrossEpisodes;
    MakeClient();
    ConnectAndAcknowledge();
    transport->refuseConnections = true;
    codec()->Emit(ProtocolCodec::EventType::Close);
    scheduler->Advance(1000);
    transport->refuseConnections = false;
    scheduler->Advance(2000);
    codec()->Emit(ProtocolCodec::EventType::ConnectAck);
    EXPECT_EQ(std::chrono::milliseconds(2000), client->GetReconnectDelay());
    codec()->Emit(ProtocolCodec::EventType::Close);
    EXPECT_EQ(std::chrono::milliseconds(4000), client->GetReconnectDelay());
}

TEST_F(MqttClientTests, AtMostOneTimerArmedAcrossCycles_test) {
    ASSERT_TRUE(StartConnect());
    EXPECT_EQ(1u, scheduler->pending.size());
    codec()->Emit(ProtocolCodec::EventType::ConnectAck);
    EXPECT_EQ(1u, scheduler->pending.size());
    for (int cycle = 0; cycle < 5; ++cycle)
    {
        scheduler->Advance(2000);
        EXPECT_EQ(1u, scheduler->pending.size());
        codec()->Emit(ProtocolCodec::EventType::Error);
        EXPECT_EQ(1u, scheduler->pending.size());
        scheduler->AdvanceTo(scheduler->pending.begin()->second.due);
        EXPECT_EQ(MqttClient::State::Connecting, client->GetState());
        EXPECT_EQ(1u, scheduler->pending.size());
        codec()->Emit(ProtocolCodec::EventType::ConnectAck);
        EXPECT_EQ(1u, scheduler->pending.size());
    }
}

TEST_F(MqttClientTests, BrokerDisconnectSignalsIdAndReconnects_test) {
    ConnectAndAcknowledge();
    codec()->Emit(ProtocolCodec::EventType::Disconnect);
    ASSERT_EQ(2u, controlEvents.size());
    EXPECT_EQ(MqttClient::ControlSignal::Disconnect, controlEvents[1].signal);
    EXPECT_EQ("tester", controlEvents[1].clientId);
    EXPECT_EQ(MqttClient::State::Disconnected, client->GetState());
    scheduler->Advance(1000);
    EXPECT_EQ(2u, transport->connectCount);
}

TEST_F(MqttClientTests, PublishedMessagesReachTopicListeners_test) {
    std::vector<Json::Value> fooMessages;
    size_t barCalls = 0;
    (void)client->SubscribeToTopic("foo", [&fooMessages](const Json::Value& message)
                                   { fooMessages.push_back(message); });
    (void)client->SubscribeToTopic("bar", [&barCalls](const Json::Value&) { ++barCalls; });
    ConnectAndAcknowledge();
    codec()->Emit(ProtocolCodec::EventType::Publish, "foo", "{\"x\":1}");
    ASSERT_EQ(1u, fooMessages.size());
    ASSERT_TRUE(fooMessages[0].isObject());
    EXPECT_EQ(1, fooMessages[0]["x"].asInt());
    EXPECT_EQ(0u, barCalls);
}

TEST_F(MqttClientTests, TopicListenersSurviveReconnection_test) {
    size_t calls = 0;
    (void)client->SubscribeToTopic("foo", [&calls](const Json::Value&) { ++calls; });
    ConnectAndAcknowledge();
    codec()->Emit(ProtocolCodec::EventType::Close);
    scheduler->Advance(1000);
    codec()->Emit(ProtocolCodec::EventType::ConnectAck);
    codec()->Emit(ProtocolCodec::EventType::Publish, "foo", "[1,2]");
    EXPECT_EQ(1u, calls);
}

TEST_F(MqttClientTests, UndecodablePayloadIsDropped_test) {
    size_t calls = 0;
    (void)client->SubscribeToTopic("foo", [&calls](const Json::Value&) { ++calls; });
    ConnectAndAcknowledge();
    codec()->Emit(ProtocolCodec::EventType::Publish, "foo", "{not json");
    EXPECT_EQ(0u, calls);
    EXPECT_TRUE(HasDiagnostic("undecodable"));
    EXPECT_EQ(MqttClient::State::Connected, client->GetState());
}

TEST_F(MqttClientTests, SendPublishesJson_test) {
    ConnectAndAcknowledge();
    Json::Value message(Json::objectValue);
    message["a"] = 1;
    EXPECT_TRUE(client->Send("topic/a", message));
    ASSERT_EQ(1u, codec()->published.size());
    EXPECT_EQ("topic/a", codec()->published[0].topic);
    EXPECT_EQ("{\"a\":1}", codec()->published[0].payload);
}

TEST_F(MqttClientTests, SendWhileDisconnectedIsDropped_test) {
    EXPECT_FALSE(client->Send("topic/a", Json::Value(1)));
    ASSERT_TRUE(StartConnect());
    EXPECT_FALSE(client->Send("topic/a", Json::Value(1)));
    EXPECT_TRUE(codec()->published.empty());
    EXPECT_TRUE(HasDiagnostic("not connected"));
}

TEST_F(MqttClientTests, CloseDisconnectsAndStopsEverything_test) {
    ConnectAndAcknowledge();
    client->Close();
    EXPECT_EQ(MqttClient::State::Closed, client->GetState());
    EXPECT_EQ(1u, codec()->disconnectCount);
    EXPECT_EQ(1u, connection()->breakCount);
    EXPECT_TRUE(connection()->lastBreakClean);
    EXPECT_TRUE(scheduler->pending.empty());

    client->Close();
    client->Disconnect();
    EXPECT_EQ(1u, codec()->disconnectCount);
    EXPECT_EQ(1u, connection()->breakCount);

    connectResults.clear();
    EXPECT_FALSE(StartConnect());
    EXPECT_EQ((std::vector<MqttClient::ResultCode>{MqttClient::ResultCode::Closed}),
              connectResults);
    EXPECT_EQ(1u, controlEvents.size());
}

TEST_F(MqttClientTests, CloseCancelsPendingReconnect_test) {
    ConnectAndAcknowledge();
    codec()->Emit(ProtocolCodec::EventType::Close);
    ASSERT_EQ(1u, scheduler->pending.size());
    client->Disconnect();
    EXPECT_EQ(MqttClient::State::Closed, client->GetState());
    EXPECT_TRUE(scheduler->pending.empty());
    scheduler->Advance(60000);
    EXPECT_EQ(1u, transport->connectCount);
}

TEST_F(MqttClientTests, DemobilizeDropsConnectionQuietly_test) {
    ConnectAndAcknowledge();
    const auto signalCount = controlEvents.size();
    client->Demobilize();
    EXPECT_EQ(MqttClient::State::Disconnected, client->GetState());
    EXPECT_EQ(1u, connection()->breakCount);
    EXPECT_TRUE(scheduler->pending.empty());
    EXPECT_EQ(signalCount, controlEvents.size());
}

TEST_F(MqttClientTests, ControlSignalUnsubscribe_test) {
    size_t calls = 0;
    const auto unsubscribe =
        client->SubscribeToControlSignals([&calls](const MqttClient::ControlEvent&) { ++calls; });
    unsubscribe();
    ConnectAndAcknowledge();
    EXPECT_EQ(0u, calls);
    EXPECT_EQ(1u, controlEvents.size());
}

TEST_F(MqttClientTests, StreamErrorInsidePublishIsHandled_test) {
    codecFactory->retainCodecs = false;
    ASSERT_TRUE(StartConnect());
    {
        const auto created = codecFactory->lastCreated.lock();
        ASSERT_NE(nullptr, created);
        created->failCommands = true;
        created->Emit(ProtocolCodec::EventType::ConnectAck);
    }
    ASSERT_EQ(MqttClient::State::Connected, client->GetState());
    EXPECT_TRUE(client->Send("topic/a", Json::Value(1)));
    EXPECT_EQ(MqttClient::State::Disconnected, client->GetState());
    EXPECT_EQ(std::chrono::milliseconds(1000), client->GetReconnectDelay());
    scheduler->Advance(1000);
    EXPECT_EQ(2u, transport->connectCount);
}

TEST_F(MqttClientTests, StreamErrorInsidePingIsHandled_test) {
    codecFactory->retainCodecs = false;
    ASSERT_TRUE(StartConnect());
    {
        const auto created = codecFactory->lastCreated.lock();
        ASSERT_NE(nullptr, created);
        created->failCommands = true;
        created->Emit(ProtocolCodec::EventType::ConnectAck);
    }
    scheduler->AdvanceTo(2000);
    EXPECT_EQ(MqttClient::State::Disconnected, client->GetState());
    EXPECT_EQ(1u, scheduler->pending.size());
    scheduler->AdvanceTo(3000);
    EXPECT_EQ(2u, transport->connectCount);
    EXPECT_EQ(MqttClient::State::Connecting, client->GetState());
}

TEST_F(MqttClientTests, StreamErrorInsideCloseIsIgnored_test) {
    codecFactory->retainCodecs = false;
    ASSERT_TRUE(StartConnect());
    {
        const auto created = codecFactory->lastCreated.lock();
        ASSERT_NE(nullptr, created);
        created->failCommands = true;
        created->Emit(ProtocolCodec::EventType::ConnectAck);
    }
    client->Close();
    EXPECT_EQ(MqttClient::State::Closed, client->GetState());
    EXPECT_EQ(1u, connection()->breakCount);
    EXPECT_TRUE(scheduler->pending.empty());
    EXPECT_EQ(1u, controlEvents.size());
}

TEST_F(MqttClientTests, DestroyedClientIsNeverCalledBack_test) {
    ConnectAndAcknowledge();
    const auto lastCodec = codec();
    const auto lastConnection = connection();
    diagnosticUnsubscribeDelegate();
    diagnosticUnsubscribeDelegate = [] {};
    client.reset(new MqttClient(options));
    lastCodec->Emit(ProtocolCodec::EventType::Close);
    lastConnection->SimulateBroken();
    scheduler->Advance(60000);
    EXPECT_EQ(1u, transport->connectCount);
}
