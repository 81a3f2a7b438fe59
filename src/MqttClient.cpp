/**
 * @file MqttClient.cpp
 * @brief This file contains the implementation of the MqttClient class.
 * @note This class keeps a publish/subscribe session alive against a broker,
 * reconnecting with exponential backoff whenever the connection is lost.
 * @author Hatem Nabli
 * copyright © 2025 by Hatem Nabli
 */

#include "MqttLink/MqttClient.hpp"
#include "MqttLink/BackoffController.hpp"
#include "MqttLink/TimerGuard.hpp"
#include <map>
#include <string>
#include <memory>
#include <vector>

namespace
{
    const char* ResultCodeName(MqttLink::MqttClient::ResultCode result) {
        switch (result)
        {
        case MqttLink::MqttClient::ResultCode::Success:
            return "Success";
        case MqttLink::MqttClient::ResultCode::TimedOut:
            return "TimedOut";
        case MqttLink::MqttClient::ResultCode::AlreadyConnected:
            return "AlreadyConnected";
        case MqttLink::MqttClient::ResultCode::BadParameter:
            return "BadParameter";
        case MqttLink::MqttClient::ResultCode::NetworkError:
            return "NetworkError";
        case MqttLink::MqttClient::ResultCode::AlreadyConnecting:
            return "AlreadyConnecting";
        case MqttLink::MqttClient::ResultCode::NotMobilized:
            return "NotMobilized";
        case MqttLink::MqttClient::ResultCode::Closed:
            return "Closed";
        default:
            return "UnknownError";
        }
    }

    const char* StateName(MqttLink::MqttClient::State state) {
        switch (state)
        {
        case MqttLink::MqttClient::State::Disconnected:
            return "Disconnected";
        case MqttLink::MqttClient::State::Connecting:
            return "Connecting";
        case MqttLink::MqttClient::State::Connected:
            return "Connected";
        case MqttLink::MqttClient::State::Closed:
            return "Closed";
        default:
            return "???";
        }
    }
}  // namespace

namespace MqttLink
{
    /**
     * This holds onto everything that belongs to one connection attempt:
     * the byte stream and the codec built on top of it.
     */
    struct SocketGeneration
    {
        /**
         * This tells generations apart in diagnostic messages.
         */
        uint64_t number = 0;

        std::shared_ptr<Connection> connection;

        std::shared_ptr<ProtocolCodec> codec;

        /**
         * This is set once the generation has been torn down. Nothing
         * coming from the generation is acted upon after that.
         */
        bool closed = false;
    };

    struct MqttClient::Impl : public std::enable_shared_from_this<MqttClient::Impl>
    {
        /**
         * This is the delegate to generate diagnostic messages
         * for the client.
         */
        SystemUtils::DiagnosticsSender diagnosticsSender;

        /**
         * This is the configuration of the client.
         */
        const MqttOptions options;

        /**
         * This is the session identity presented to the broker.
         */
        const std::string identity;

        // This is used to track if the client is mobilized
        bool mobilized = false;

        // This is the transport layer implementation to use.
        std::shared_ptr<ClientTransportLayer> transport;

        // This builds a codec for every new connection.
        std::shared_ptr<CodecFactory> codecFactory;

        // This runs the timers of the client.
        std::shared_ptr<Scheduler> scheduler;

        // This is the object used to track time in the client.
        std::shared_ptr<TimeKeeper> timeKeeper;

        // These are the handshake, heartbeat and reconnect timers.
        std::unique_ptr<TimerGuard> timers;

        BackoffController backoff;

        TopicRouter router;

        State state = State::Disconnected;

        /**
         * This is the broker endpoint, remembered for reconnections.
         */
        std::string host;
        uint16_t port = 0;

        /**
         * This is the live connection attempt, if any.
         */
        std::shared_ptr<SocketGeneration> socket;

        /**
         * This keeps the most recently torn down connection attempt alive,
         * since its codec or connection may still be on the call stack.
         * It is replaced when the next attempt is torn down.
         */
        std::shared_ptr<SocketGeneration> retiredSocket;

        uint64_t nextGenerationNumber = 0;

        /**
         * This counts the handshakes that succeeded over the lifetime
         * of the client.
         */
        uint32_t successCount = 0;

        /**
         * These are the times, in seconds, at which the last ping was sent
         * and the last pong received. Negative means unset.
         */
        double lastPingAt = -1.0;
        double lastPongAt = -1.0;

        /**
         * This is the delegate given to the first Connect call.
         */
        ConnectDelegate firstConnectDelegate;

        std::map<uint64_t, ControlSignalDelegate> controlSignalDelegates;

        uint64_t nextControlSignalSubscriptionId = 1;

        // Lifecycle management

        ~Impl() noexcept = default;
        Impl(const Impl&) = delete;
        Impl(Impl&&) noexcept = delete;
        Impl& operator=(const Impl&) = delete;
        Impl& operator=(Impl&&) noexcept = delete;

        // Methods

        /**
         * This is the constructor for the structure.
         */
        Impl(const MqttOptions& options, const std::string& identity) :
            diagnosticsSender("MqttLink::MqttClient"),
            options(options),
            identity(identity),
            backoff(std::chrono::milliseconds(options.reconnectDelayInitial),
                    std::chrono::milliseconds(options.reconnectDelayMax)) {}

        void EmitSignal(ControlSignal signal, ResultCode reason = ResultCode::Success) {
            ControlEvent event;
            event.signal = signal;
            event.reason = reason;
            event.clientId = options.id;
            std::vector<ControlSignalDelegate> subscribers;
            subscribers.reserve(controlSignalDelegates.size());
            for (const auto& subscriber : controlSignalDelegates)
            { subscribers.push_back(subscriber.second); }
            for (const auto& subscriber : subscribers)
            { subscriber(event); }
        }

        /**
         * This opens a new connection to the remembered endpoint,
         * replacing whatever connection came before.
         *
         * @param[in] reconnectPhase
         *      This indicates whether the client connected successfully
         *      before, which makes a handshake timeout recoverable.
         */
        void StartAttempt(bool reconnectPhase) {
            timers->CancelReconnect();
            state = State::Connecting;
            const auto generation = std::make_shared<SocketGeneration>();
            generation->number = ++nextGenerationNumber;
            socket = generation;

            std::weak_ptr<Impl> implWeak(shared_from_this());
            std::weak_ptr<SocketGeneration> generationWeak(generation);
            (void)timers->ArmHandshake(reconnectPhase,
                                       [implWeak](bool timeoutInReconnectPhase)
                                       {
                                           const auto impl = implWeak.lock();
                                           if (impl == nullptr)
                                           { return; }
                                           impl->OnHandshakeTimeout(timeoutInReconnectPhase);
                                       });

            diagnosticsSender.SendDiagnosticInformationFormatted(
                0, "connecting to %s:%u (attempt %llu, %s)", host.c_str(), (unsigned int)port,
                (unsigned long long)generation->number, reconnectPhase ? "reconnect" : "first");
            const auto connection = transport->Connect(
                options.useTLS ? "mqtts" : "mqtt", host, port,
                [implWeak, generationWeak](const std::vector<uint8_t>& data)
                {
                    const auto impl = implWeak.lock();
                    const auto generation = generationWeak.lock();
                    if ((impl == nullptr) || (generation == nullptr))
                    { return; }
                    if (generation->closed || (generation->codec == nullptr))
                    { return; }
                    generation->codec->DataReceived(data);
                },
                [implWeak, generationWeak](bool graceful)
                {
                    const auto impl = implWeak.lock();
                    const auto generation = generationWeak.lock();
                    if ((impl == nullptr) || (generation == nullptr))
                    { return; }
                    if (!generation->closed)
                    {
                        impl->diagnosticsSender.SendDiagnosticInformationFormatted(
                            SystemUtils::DiagnosticsSender::Levels::WARNING,
                            "connection to %s:%u broken (%s)", impl->host.c_str(),
                            (unsigned int)impl->port, graceful ? "closed" : "error");
                    }
                    impl->OnSocketClosed(generation, ResultCode::NetworkError);
                });
            if (generation->closed)
            { return; }
            if (connection == nullptr)
            {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    SystemUtils::DiagnosticsSender::Levels::WARNING,
                    "unable to open a connection to %s:%u", host.c_str(), (unsigned int)port);
                OnSocketClosed(generation, ResultCode::NetworkError);
                return;
            }
            generation->connection = connection;
            generation->codec = codecFactory->CreateCodec(connection);
            if (generation->codec == nullptr)
            {
                diagnosticsSender.SendDiagnosticInformationString(
                    SystemUtils::DiagnosticsSender::Levels::WARNING,
                    "codec factory returned no codec");
                ForceClose(generation, ResultCode::NetworkError);
                return;
            }
            generation->codec->SetEventDelegate(
                [implWeak, generationWeak](const ProtocolCodec::Event& event)
                {
                    const auto impl = implWeak.lock();
                    const auto generation = generationWeak.lock();
                    if ((impl == nullptr) || (generation == nullptr))
                    { return; }
                    impl->HandleCodecEvent(generation, event);
                });
            generation->codec->Connect(identity);
        }

        void HandleCodecEvent(const std::shared_ptr<SocketGeneration>& generation,
                              const ProtocolCodec::Event& event) {
            if (generation->closed || (generation != socket))
            { return; }
            switch (event.type)
            {
            case ProtocolCodec::EventType::ConnectAck:
                OnConnectAck();
                break;
            case ProtocolCodec::EventType::Publish:
                OnPublish(event);
                break;
            case ProtocolCodec::EventType::PingResponse:
                lastPongAt = timeKeeper->GetCurrentTime();
                break;
            case ProtocolCodec::EventType::Disconnect:
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    SystemUtils::DiagnosticsSender::Levels::WARNING,
                    "broker %s:%u asked to disconnect", host.c_str(), (unsigned int)port);
                EmitSignal(ControlSignal::Disconnect);
                OnSocketClosed(generation, ResultCode::NetworkError);
                break;
            case ProtocolCodec::EventType::Close:
            case ProtocolCodec::EventType::Error:
            default:
                OnSocketClosed(generation, ResultCode::NetworkError);
                break;
            }
        }

        void OnConnectAck() {
            if (state == State::Connected)
            { return; }
            state = State::Connected;
            timers->CancelReconnect();
            lastPingAt = -1.0;
            lastPongAt = -1.0;
            std::weak_ptr<Impl> implWeak(shared_from_this());
            timers->StartHeartbeat(
                [implWeak]
                {
                    const auto impl = implWeak.lock();
                    if (impl == nullptr)
                    { return; }
                    impl->CheckKeepAlive();
                });
            ++successCount;
            if (options.backoffPolicy == BackoffPolicy::ResetOnSuccess)
            { backoff.Reset(); }
            diagnosticsSender.SendDiagnosticInformationFormatted(
                0, "connected to %s:%u as %s (success %u)", host.c_str(), (unsigned int)port,
                identity.c_str(), (unsigned int)successCount);
            if (successCount == 1)
            {
                EmitSignal(ControlSignal::Connect);
                const auto connectDelegate = std::move(firstConnectDelegate);
                firstConnectDelegate = nullptr;
                if (connectDelegate)
                { connectDelegate(ResultCode::Success); }
            } else
            { EmitSignal(ControlSignal::Reconnect); }
        }

        void OnPublish(const ProtocolCodec::Event& event) {
            Json::Value message;
            std::string errors;
            if (!TopicRouter::DecodePayload(event.payload, message, errors))
            {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    SystemUtils::DiagnosticsSender::Levels::WARNING,
                    "dropping undecodable message on topic \"%s\": %s", event.topic.c_str(),
                    errors.c_str());
                return;
            }
            (void)router.Dispatch(event.topic, message);
        }

        /**
         * This tears down the given connection attempt. It does something
         * only the first time it is called for a generation.
         *
         * @param[in] generation
         *      This is the connection attempt to tear down.
         *
         * @param[in] breakConnection
         *      This indicates whether the byte stream must be broken,
         *      because the stream itself has not failed.
         *
         * @return
         *      An indication of whether or not the generation was torn
         *      down by this call is returned.
         */
        bool ReleaseSocket(std::shared_ptr<SocketGeneration> generation, bool breakConnection) {
            if ((generation == nullptr) || generation->closed)
            { return false; }
            generation->closed = true;
            retiredSocket = generation;
            timers->StopHeartbeat();
            timers->CancelHandshake();
            lastPingAt = -1.0;
            lastPongAt = -1.0;
            if (state != State::Closed)
            { state = State::Disconnected; }
            if (socket == generation)
            { socket = nullptr; }
            if (breakConnection && (generation->connection != nullptr))
            { generation->connection->Break(false); }
            return true;
        }

        /**
         * This is the shared handling of a connection that went away,
         * whatever the reason.
         */
        void OnSocketClosed(std::shared_ptr<SocketGeneration> generation, ResultCode reason) {
            if (!ReleaseSocket(generation, false))
            { return; }
            AfterSocketLost(reason);
        }

        /**
         * This tears down a connection that is still up as far as the
         * transport knows, then handles it like a lost connection.
         */
        void ForceClose(std::shared_ptr<SocketGeneration> generation, ResultCode reason) {
            if (!ReleaseSocket(generation, true))
            { return; }
            AfterSocketLost(reason);
        }

        void AfterSocketLost(ResultCode reason) {
            if (state == State::Closed)
            { return; }
            if (successCount > 0)
            {
                ScheduleReconnect();
            } else
            { Fatal(reason); }
        }

        void OnHandshakeTimeout(bool reconnectPhase) {
            const auto generation = socket;
            if (reconnectPhase)
            {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    SystemUtils::DiagnosticsSender::Levels::WARNING,
                    "reconnection to %s:%u timed out after %u ms", host.c_str(),
                    (unsigned int)port, (unsigned int)options.timeout);
                if (!ReleaseSocket(generation, true))
                { return; }
                ScheduleReconnect();
            } else
            {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    SystemUtils::DiagnosticsSender::Levels::ERROR,
                    "connection to %s:%u timed out after %u ms", host.c_str(), (unsigned int)port,
                    (unsigned int)options.timeout);
                (void)ReleaseSocket(generation, true);
                Fatal(ResultCode::TimedOut);
            }
        }

        void ScheduleReconnect() {
            if (state == State::Closed)
            { return; }
            const auto delay = backoff.Next();
            diagnosticsSender.SendDiagnosticInformationFormatted(
                0, "reconnecting to %s:%u in %lld ms", host.c_str(), (unsigned int)port,
                (long long)delay.count());
            std::weak_ptr<Impl> implWeak(shared_from_this());
            timers->ArmReconnect(delay,
                                 [implWeak]
                                 {
                                     const auto impl = implWeak.lock();
                                     if (impl == nullptr)
                                     { return; }
                                     if (impl->state != State::Disconnected)
                                     { return; }
                                     impl->StartAttempt(true);
                                 });
        }

        void CheckKeepAlive() {
            const auto generation = socket;
            if ((state != State::Connected) || (generation == nullptr))
            { return; }
            const double now = timeKeeper->GetCurrentTime();
            const double staleAfterSeconds = (double)options.keepalive * 2.0 / 1000.0;
            if ((lastPingAt < 0.0) || (lastPongAt >= lastPingAt))
            {
                lastPingAt = now;
                generation->codec->PingRequest();
                return;
            }
            if (now - lastPingAt > staleAfterSeconds)
            {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    SystemUtils::DiagnosticsSender::Levels::WARNING,
                    "no ping response from %s:%u for %u ms; dropping connection", host.c_str(),
                    (unsigned int)port, (unsigned int)(options.keepalive * 2));
                ForceClose(generation, ResultCode::TimedOut);
            }
        }

        void Fatal(ResultCode reason) {
            state = State::Closed;
            timers->CancelAll();
            firstConnectDelegate = nullptr;
            diagnosticsSender.SendDiagnosticInformationFormatted(
                SystemUtils::DiagnosticsSender::Levels::ERROR,
                "unable to establish a session with %s:%u (%s); giving up", host.c_str(),
                (unsigned int)port, ResultCodeName(reason));
            EmitSignal(ControlSignal::Fatal, reason);
        }

        /**
         * This drops the live connection, if any, without raising anything
         * for the application.
         */
        void DropSocketQuietly() {
            const auto generation = socket;
            socket = nullptr;
            if ((generation == nullptr) || generation->closed)
            { return; }
            generation->closed = true;
            if (generation->connection != nullptr)
            { generation->connection->Break(false); }
        }
    };

    MqttClient::~MqttClient() { Demobilize(); }

    MqttClient::MqttClient(const MqttOptions& options,
                           std::shared_ptr<IdentityGenerator> identityGenerator) {
        if (identityGenerator == nullptr)
        { identityGenerator = std::make_shared<CounterIdentityGenerator>(); }
        impl_ = std::make_shared<Impl>(options, identityGenerator->GenerateIdentity(options.id));
    }

    bool MqttClient::Mobilize(const MqttMobilizationDependencies& deps) {
        if (impl_->mobilized)
        { return true; }
        if ((deps.transport == nullptr) || (deps.codecFactory == nullptr) ||
            (deps.scheduler == nullptr) || (deps.timeKeeper == nullptr))
        {
            impl_->diagnosticsSender.SendDiagnosticInformationString(
                SystemUtils::DiagnosticsSender::Levels::ERROR,
                "MqttClient::Mobilize called with missing dependencies");
            return false;
        }
        impl_->transport = deps.transport;
        impl_->codecFactory = deps.codecFactory;
        impl_->scheduler = deps.scheduler;
        impl_->timeKeeper = deps.timeKeeper;
        impl_->timers.reset(new TimerGuard(impl_->scheduler,
                                           std::chrono::milliseconds(impl_->options.timeout),
                                           std::chrono::milliseconds(impl_->options.keepalive)));
        impl_->mobilized = true;
        return true;
    }

    void MqttClient::Demobilize() {
        if (!impl_->mobilized)
        { return; }
        impl_->timers->CancelAll();
        impl_->DropSocketQuietly();
        impl_->lastPingAt = -1.0;
        impl_->lastPongAt = -1.0;
        if (impl_->state != State::Closed)
        { impl_->state = State::Disconnected; }
        impl_->timers = nullptr;
        impl_->timeKeeper = nullptr;
        impl_->scheduler = nullptr;
        impl_->codecFactory = nullptr;
        impl_->transport = nullptr;
        impl_->mobilized = false;
    }

    bool MqttClient::Connect(const std::string& brokerHost, uint16_t port,
                             ConnectDelegate connectDelegate) {
        auto result = ResultCode::Success;
        if (!impl_->mobilized)
        {
            result = ResultCode::NotMobilized;
        } else if (impl_->state == State::Connected)
        {
            result = ResultCode::AlreadyConnected;
        } else if (impl_->state == State::Connecting)
        {
            result = ResultCode::AlreadyConnecting;
        } else if (impl_->state == State::Closed)
        { result = ResultCode::Closed; }
        if (result == ResultCode::Success)
        {
            if (!brokerHost.empty())
            { impl_->host = brokerHost; }
            if (port != 0)
            { impl_->port = port; }
            if (impl_->host.empty() || (impl_->port == 0))
            { result = ResultCode::BadParameter; }
        }
        if (result != ResultCode::Success)
        {
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                SystemUtils::DiagnosticsSender::Levels::WARNING,
                "MqttClient::Connect refused in state %s: %s", StateName(impl_->state),
                ResultCodeName(result));
            if (connectDelegate)
            { connectDelegate(result); }
            return false;
        }
        if (impl_->successCount == 0)
        { impl_->firstConnectDelegate = std::move(connectDelegate); }
        impl_->StartAttempt(impl_->successCount > 0);
        return true;
    }

    bool MqttClient::Send(const std::string& topic, const Json::Value& message) {
        const auto generation = impl_->socket;
        if ((impl_->state != State::Connected) || (generation == nullptr))
        {
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                SystemUtils::DiagnosticsSender::Levels::WARNING,
                "not connected; dropping message on topic \"%s\"", topic.c_str());
            return false;
        }
        generation->codec->Publish(topic, TopicRouter::EncodeMessage(message));
        return true;
    }

    void MqttClient::Disconnect() { Close(); }

    void MqttClient::Close() {
        if (impl_->state == State::Closed)
        { return; }
        impl_->state = State::Closed;
        impl_->firstConnectDelegate = nullptr;
        impl_->lastPingAt = -1.0;
        impl_->lastPongAt = -1.0;
        if (impl_->timers != nullptr)
        { impl_->timers->CancelAll(); }
        const auto generation = impl_->socket;
        impl_->socket = nullptr;
        impl_->diagnosticsSender.SendDiagnosticInformationString(0, "closing client");
        if ((generation == nullptr) || generation->closed)
        { return; }
        generation->closed = true;
        if (generation->codec != nullptr)
        { generation->codec->Disconnect(); }
        if (generation->connection != nullptr)
        { generation->connection->Break(true); }
    }

    TopicRouter::UnsubscribeDelegate MqttClient::SubscribeToTopic(
        const std::string& topic, TopicRouter::TopicDelegate topicDelegate) {
        return impl_->router.Subscribe(topic, std::move(topicDelegate));
    }

    auto MqttClient::SubscribeToControlSignals(ControlSignalDelegate controlSignalDelegate)
        -> UnsubscribeDelegate {
        const auto id = impl_->nextControlSignalSubscriptionId++;
        impl_->controlSignalDelegates[id] = std::move(controlSignalDelegate);
        std::weak_ptr<Impl> implWeak(impl_);
        return [implWeak, id]
        {
            const auto impl = implWeak.lock();
            if (impl == nullptr)
            { return; }
            (void)impl->controlSignalDelegates.erase(id);
        };
    }

    SystemUtils::DiagnosticsSender::UnsubscribeDelegate MqttClient::SubscribeToDiagnostics(
        SystemUtils::DiagnosticsSender::DiagnosticMessageDelegate delegate, size_t minLevel) {
        return impl_->diagnosticsSender.SubscribeToDiagnostics(delegate, minLevel);
    }

    auto MqttClient::GetState() const -> State { return impl_->state; }

    std::string MqttClient::GetIdentity() const { return impl_->identity; }

    uint32_t MqttClient::GetSuccessCount() const { return impl_->successCount; }

    std::chrono::milliseconds MqttClient::GetReconnectDelay() const {
        return impl_->backoff.GetCurrentDelay();
    }

    void PrintTo(const MqttClient::State& state, std::ostream* os) { *os << StateName(state); }

    void PrintTo(const MqttClient::ResultCode& result, std::ostream* os) {
        *os << ResultCodeName(result);
    }
}  // namespace MqttLink
