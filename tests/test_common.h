/**
 * @file test_common.h
 * @brief Fakes for the two sockets a BridgeSession talks to, plus helpers.
 */

#ifndef RTBRIDGE_TESTS_TEST_COMMON_H
#define RTBRIDGE_TESTS_TEST_COMMON_H

#include "base64.h"
#include "bounded_queue.h"
#include "bridge_session.h"
#include "model_events.h"
#include "realtime_transport.h"
#include "telephony_channel.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace rtbridge {
namespace test {

using json = nlohmann::json;

inline bool waitUntil(const std::function<bool()>& pred,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

inline std::string messageType(const std::string& text)
{
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        return "";
    if (j.contains("type"))
        return j["type"].get<std::string>();
    if (j.contains("event"))
        return j["event"].get<std::string>();
    return "";
}

const double PI = 3.14159265358979323846;

// PCM16 sine at `rate`, `samples` long.
inline std::string sinePcm(size_t samples, unsigned rate, double hz = 440.0, double amplitude = 8000.0)
{
    std::vector<int16_t> out(samples);
    for (size_t i = 0; i < samples; i++)
        out[i] = static_cast<int16_t>(amplitude * std::sin(2.0 * PI * hz * i / rate));
    return std::string(reinterpret_cast<const char*>(out.data()), out.size() * 2);
}

// Records what the bridge sends towards the carrier.
class FakeChannel : public TelephonyChannel
{
public:
    bool sendText(const std::string& message) override
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (failSends)
            return false;
        sent.push_back(message);
        return true;
    }

    void close() override { closeCalls++; }

    std::vector<std::string> messages(const std::string& event = "") const
    {
        std::lock_guard<std::mutex> lock(mtx);
        std::vector<std::string> out;
        for (const auto& m : sent)
            if (event.empty() || messageType(m) == event)
                out.push_back(m);
        return out;
    }

    size_t count(const std::string& event) const { return messages(event).size(); }

    void setFailSends(bool fail)
    {
        std::lock_guard<std::mutex> lock(mtx);
        failSends = fail;
    }

    std::atomic<int> closeCalls{0};

private:
    mutable std::mutex mtx;
    std::vector<std::string> sent;
    bool failSends = false;
};

// Model side shared between a test and the FakeTransport the session owns.
struct FakeModel
{
    bool opens = true;
    std::function<bool(const std::string& type)> acceptSend; // empty: accept all

    std::atomic<int> startCalls{0};
    std::atomic<int> closeCalls{0};
    std::atomic<int> factoryCalls{0};

    BoundedQueue<InboundMessage> inbound{4096};

    void releaseOpen()
    {
        {
            std::lock_guard<std::mutex> lock(mtx);
            released = true;
        }
        cv.notify_all();
    }

    void holdOpen()
    {
        std::lock_guard<std::mutex> lock(mtx);
        released = false;
    }

    void push(const std::string& text) { inbound.push(InboundMessage{false, text}); }

    void pushDelta(const std::string& pcm16)
    {
        push(json{{"type", "response.audio.delta"}, {"delta", base64Encode(pcm16)}}.dump());
    }

    std::vector<std::string> sent(const std::string& type = "") const
    {
        std::lock_guard<std::mutex> lock(mtx);
        std::vector<std::string> out;
        for (const auto& m : sentMessages)
            if (type.empty() || messageType(m) == type)
                out.push_back(m);
        return out;
    }

    size_t count(const std::string& type) const { return sent(type).size(); }

    TransportFactory factory(const std::shared_ptr<FakeModel>& self);

    mutable std::mutex mtx;
    std::condition_variable cv;
    bool released = true;
    bool closed = false;
    std::vector<std::string> sentMessages;
};

class FakeTransport : public RealtimeTransport
{
public:
    explicit FakeTransport(std::shared_ptr<FakeModel> model_) : model(std::move(model_)) {}

    void start() override { model->startCalls++; }

    bool waitOpen(std::chrono::milliseconds timeout) override
    {
        std::unique_lock<std::mutex> lock(model->mtx);
        model->cv.wait_for(lock, timeout, [this] { return model->released || model->closed; });
        return model->opens && model->released && !model->closed;
    }

    bool send(const std::string& message) override
    {
        if (model->acceptSend && !model->acceptSend(messageType(message)))
            return false;
        std::lock_guard<std::mutex> lock(model->mtx);
        if (model->closed)
            return false;
        model->sentMessages.push_back(message);
        return true;
    }

    bool receive(InboundMessage& out) override { return model->inbound.pop(out); }

    void close() override
    {
        model->closeCalls++;
        {
            std::lock_guard<std::mutex> lock(model->mtx);
            if (model->closed)
                return;
            model->closed = true;
        }
        model->cv.notify_all();
        model->inbound.push(InboundMessage{false, makeTransportClosed(1000, "closed by client")});
        model->inbound.close();
    }

    ConnectionState state() const override
    {
        std::lock_guard<std::mutex> lock(model->mtx);
        if (model->closed)
            return ConnectionState::Closed;
        return model->released && model->opens ? ConnectionState::Open : ConnectionState::Connecting;
    }

private:
    std::shared_ptr<FakeModel> model;
};

inline TransportFactory FakeModel::factory(const std::shared_ptr<FakeModel>& self)
{
    return [self](const BridgeConfig&) -> std::unique_ptr<RealtimeTransport> {
        self->factoryCalls++;
        return std::unique_ptr<RealtimeTransport>(new FakeTransport(self));
    };
}

} // namespace test
} // namespace rtbridge

#endif // RTBRIDGE_TESTS_TEST_COMMON_H
