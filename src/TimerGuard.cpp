/**
 * @file TimerGuard.cpp
 *
 * This module contains the implementation of the
 * MqttLink::TimerGuard class.
 *
 * © 2025 by Hatem Nabli
 */

#include "MqttLink/TimerGuard.hpp"

#include <stdint.h>

namespace
{
    /**
     * This tracks one timer. The generation changes every time the
     * timer is armed, so a stale expiry can be told apart from a live one.
     */
    struct TimerSlot
    {
        MqttLink::Scheduler::Token token = 0;
        uint64_t generation = 0;
        bool armed = false;
    };
}  // namespace

namespace MqttLink
{
    struct TimerGuard::Impl : public std::enable_shared_from_this<TimerGuard::Impl>
    {
        // Properties

        std::shared_ptr<Scheduler> scheduler;

        std::chrono::milliseconds handshakeTimeout;

        std::chrono::milliseconds heartbeatInterval;

        TimerSlot handshake;

        TimerSlot heartbeat;

        TimerSlot reconnect;

        /**
         * This is handed back to the handshake delegate on expiry.
         */
        bool handshakeReconnectPhase = false;

        HandshakeTimeoutDelegate handshakeDelegate;

        HeartbeatDelegate heartbeatDelegate;

        ReconnectDelegate reconnectDelegate;

        /**
         * This is the source of timer generations.
         */
        uint64_t nextGeneration = 0;

        // Methods

        Impl(std::shared_ptr<Scheduler> scheduler, std::chrono::milliseconds handshakeTimeout,
             std::chrono::milliseconds heartbeatInterval) :
            scheduler(std::move(scheduler)),
            handshakeTimeout(handshakeTimeout),
            heartbeatInterval(heartbeatInterval) {}

        void Disarm(TimerSlot& slot) {
            if (!slot.armed)
            { return; }
            slot.armed = false;
            scheduler->Cancel(slot.token);
            slot.token = 0;
        }

        uint64_t Arm(TimerSlot& slot) {
            Disarm(slot);
            slot.armed = true;
            slot.generation = ++nextGeneration;
            return slot.generation;
        }

        static bool IsLive(const TimerSlot& slot, uint64_t generation) {
            return slot.armed && (slot.generation == generation);
        }

        void ScheduleHeartbeatTick(uint64_t generation) {
            std::weak_ptr<Impl> implWeak(shared_from_this());
            heartbeat.token = scheduler->Schedule(heartbeatInterval,
                                                  [implWeak, generation]
                                                  {
                                                      const auto impl = implWeak.lock();
                                                      if (impl == nullptr)
                                                      { return; }
                                                      impl->HeartbeatFired(generation);
                                                  });
        }

        void HandshakeFired(uint64_t generation) {
            if (!IsLive(handshake, generation))
            { return; }
            handshake.armed = false;
            handshake.token = 0;
            const auto timeoutDelegate = handshakeDelegate;
            handshakeDelegate = nullptr;
            if (timeoutDelegate)
            { timeoutDelegate(handshakeReconnectPhase); }
        }

        void HeartbeatFired(uint64_t generation) {
            if (!IsLive(heartbeat, generation))
            { return; }

            // The next tick is queued before the delegate runs, so the
            // delegate may stop the heartbeat and cancel it.
            ScheduleHeartbeatTick(generation);
            const auto tickDelegate = heartbeatDelegate;
            if (tickDelegate)
            { tickDelegate(); }
        }

        void ReconnectFired(uint64_t generation) {
            if (!IsLive(reconnect, generation))
            { return; }
            reconnect.armed = false;
            reconnect.token = 0;
            const auto attemptDelegate = reconnectDelegate;
            reconnectDelegate = nullptr;
            if (attemptDelegate)
            { attemptDelegate(); }
        }
    };

    TimerGuard::~TimerGuard() { CancelAll(); }

    TimerGuard::TimerGuard(std::shared_ptr<Scheduler> scheduler,
                           std::chrono::milliseconds handshakeTimeout,
                           std::chrono::milliseconds heartbeatInterval) :
        impl_(std::make_shared<Impl>(std::move(scheduler), handshakeTimeout, heartbeatInterval)) {}

    bool TimerGuard::ArmHandshake(bool reconnectPhase, HandshakeTimeoutDelegate timeoutDelegate) {
        if (impl_->handshake.armed)
        { return false; }
        StopHeartbeat();
        const auto generation = impl_->Arm(impl_->handshake);
        impl_->handshakeReconnectPhase = reconnectPhase;
        impl_->handshakeDelegate = std::move(timeoutDelegate);
        std::weak_ptr<Impl> implWeak(impl_);
        impl_->handshake.token = impl_->scheduler->Schedule(impl_->handshakeTimeout,
                                                            [implWeak, generation]
                                                            {
                                                                const auto impl = implWeak.lock();
                                                                if (impl == nullptr)
                                                                { return; }
                                                                impl->HandshakeFired(generation);
                                                            });
        return true;
    }

    void TimerGuard::CancelHandshake() {
        impl_->Disarm(impl_->handshake);
        impl_->handshakeDelegate = nullptr;
    }

    bool TimerGuard::IsHandshakeArmed() const { return impl_->handshake.armed; }

    void TimerGuard::StartHeartbeat(HeartbeatDelegate heartbeatDelegate) {
        CancelHandshake();
        const auto generation = impl_->Arm(impl_->heartbeat);
        impl_->heartbeatDelegate = std::move(heartbeatDelegate);
        impl_->ScheduleHeartbeatTick(generation);
    }

    void TimerGuard::StopHeartbeat() {
        impl_->Disarm(impl_->heartbeat);
        impl_->heartbeatDelegate = nullptr;
    }

    bool TimerGuard::IsHeartbeatRunning() const { return impl_->heartbeat.armed; }

    void TimerGuard::ArmReconnect(std::chrono::milliseconds delay,
                                  ReconnectDelegate reconnectDelegate) {
        const auto generation = impl_->Arm(impl_->reconnect);
        impl_->reconnectDelegate = std::move(reconnectDelegate);
        std::weak_ptr<Impl> implWeak(impl_);
        impl_->reconnect.token = impl_->scheduler->Schedule(delay,
                                                            [implWeak, generation]
                                                            {
                                                                const auto impl = implWeak.lock();
                                                                if (impl == nullptr)
                                                                { return; }
                                                                impl->ReconnectFired(generation);
                                                            });
    }

    void TimerGuard::CancelReconnect() {
        impl_->Disarm(impl_->reconnect);
        impl_->reconnectDelegate = nullptr;
    }

    bool TimerGuard::IsReconnectPending() const { return impl_->reconnect.armed; }

    void TimerGuard::CancelAll() {
        CancelHandshake();
        StopHeartbeat();
        CancelReconnect();
    }
}  // namespace MqttLink
