#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include "Core/Link/ConnectionManager.hpp"
#include "TestSupport.hpp"

using namespace std::chrono_literals;

TEST(ConnectionManager, StartIsNonBlockingAndConnects) {
    auto dev = std::make_shared<FakeDevice>();
    RecordingSink sink;
    ConnectionManager conn(FastLinkConfig(), std::make_unique<FakeTransport>(dev), &sink);

    EXPECT_EQ(conn.state(), LinkState::Disconnected);
    ASSERT_TRUE(conn.start());
    EXPECT_FALSE(conn.start());   // gia' avviato

    ASSERT_TRUE(WaitUntil([&] { return conn.isConnected(); }));
    EXPECT_EQ(conn.portName(), "/dev/ttyFAKE0");

    conn.stop();
    EXPECT_EQ(conn.state(), LinkState::Disconnected);
    EXPECT_FALSE(dev->isOpen());
    EXPECT_EQ(sink.states(), (std::vector<LinkState>{
        LinkState::Connecting, LinkState::Connected, LinkState::Closing, LinkState::Disconnected }));
}

TEST(ConnectionManager, RetriesOpenUntilItSucceeds) {
    auto dev = std::make_shared<FakeDevice>();
    dev->failNextOpens(3);
    RecordingSink sink;
    ConnectionManager conn(FastLinkConfig(), std::make_unique<FakeTransport>(dev), &sink);

    ASSERT_TRUE(conn.start());
    ASSERT_TRUE(WaitUntil([&] { return conn.isConnected(); }));
    EXPECT_EQ(dev->openCalls(), 4);
    EXPECT_TRUE(conn.isRunning());

    // un Connecting per ogni tentativo, poi Connected
    EXPECT_EQ(sink.states(), (std::vector<LinkState>{
        LinkState::Connecting, LinkState::Connecting, LinkState::Connecting, LinkState::Connecting,
        LinkState::Connected }));
    conn.stop();
}

TEST(ConnectionManager, ReadErrorTriggersReconnect) {
    auto dev = std::make_shared<FakeDevice>();
    RecordingSink sink;
    std::atomic<int> lost{ 0 };
    ConnectionManager::Callbacks cbs;
    cbs.onConnectionLost = [&](const std::string&) { ++lost; };
    ConnectionManager conn(FastLinkConfig(), std::make_unique<FakeTransport>(dev), &sink, cbs);

    ASSERT_TRUE(conn.start());
    ASSERT_TRUE(WaitUntil([&] { return conn.isConnected(); }));

    dev->failNextRead();
    ASSERT_TRUE(WaitUntil([&] { return dev->openCalls() == 2 && conn.isConnected(); }));
    EXPECT_EQ(lost.load(), 1);
    EXPECT_EQ(dev->closeCalls(), 1);

    // il link riceve ancora dopo la riconnessione
    dev->push("AFTER\r\n");
    ASSERT_TRUE(WaitUntil([&] { return !sink.messages().empty(); }));
    EXPECT_EQ(sink.messages().back(), "AFTER");

    const auto states = sink.states();
    EXPECT_EQ(std::count(states.begin(), states.end(), LinkState::Connected), 2);
    conn.stop();
}

TEST(ConnectionManager, WriteErrorTriggersReconnect) {
    auto dev = std::make_shared<FakeDevice>();
    ConnectionManager conn(FastLinkConfig(), std::make_unique<FakeTransport>(dev));

    ASSERT_TRUE(conn.start());
    ASSERT_TRUE(WaitUntil([&] { return conn.isConnected(); }));

    dev->failNextWrite();
    std::string err;
    ASSERT_TRUE(conn.write("AT\n", err));
    ASSERT_TRUE(WaitUntil([&] { return dev->openCalls() == 2 && conn.isConnected(); }));
    EXPECT_TRUE(dev->written().empty());

    ASSERT_TRUE(conn.write("AT\n", err));
    ASSERT_TRUE(WaitUntil([&] { return dev->written().size() == 1; }));
    EXPECT_EQ(dev->written()[0], "AT\n");
    conn.stop();
}

TEST(ConnectionManager, WriteRefusedWhenNotConnected) {
    auto dev = std::make_shared<FakeDevice>();
    dev->failNextOpens(1000000);
    ConnectionManager conn(FastLinkConfig(), std::make_unique<FakeTransport>(dev));

    std::string err;
    EXPECT_FALSE(conn.write("AT\n", err));
    EXPECT_EQ(err, "not_connected");

    ASSERT_TRUE(conn.start());
    EXPECT_FALSE(conn.write("AT\n", err));
    conn.stop();
}

TEST(ConnectionManager, ForceReconnectReopensTransport) {
    auto dev = std::make_shared<FakeDevice>();
    RecordingSink sink;
    ConnectionManager conn(FastLinkConfig(), std::make_unique<FakeTransport>(dev), &sink);

    ASSERT_TRUE(conn.start());
    ASSERT_TRUE(WaitUntil([&] { return conn.isConnected(); }));

    conn.forceReconnect();
    ASSERT_TRUE(WaitUntil([&] { return dev->openCalls() == 2 && conn.isConnected(); }));
    EXPECT_EQ(dev->closeCalls(), 1);
    conn.stop();
}

TEST(ConnectionManager, ThrowingSinkDoesNotStopTheLoop) {
    auto dev = std::make_shared<FakeDevice>();
    ThrowingSink sink;
    std::atomic<int> received{ 0 };
    ConnectionManager::Callbacks cbs;
    cbs.onMessage = [&](const DecodedMessage&) { ++received; };
    ConnectionManager conn(FastLinkConfig(), std::make_unique<FakeTransport>(dev), &sink, cbs);

    ASSERT_TRUE(conn.start());
    ASSERT_TRUE(WaitUntil([&] { return conn.isConnected(); }));

    dev->push("ONE\r\n\x01\r\nTWO\r\n");
    ASSERT_TRUE(WaitUntil([&] { return received.load() == 2; }));
    EXPECT_TRUE(conn.isConnected());
    conn.stop();
}

TEST(ConnectionManager, NonStandardSinkExceptionDoesNotStopTheLoop) {
    auto dev = std::make_shared<FakeDevice>();
    ThrowingSink sink{ true };
    std::atomic<int> received{ 0 };
    ConnectionManager::Callbacks cbs;
    cbs.onMessage = [&](const DecodedMessage&) { ++received; };
    ConnectionManager conn(FastLinkConfig(), std::make_unique<FakeTransport>(dev), &sink, cbs);

    ASSERT_TRUE(conn.start());
    ASSERT_TRUE(WaitUntil([&] { return conn.isConnected(); }));

    dev->push("ONE\r\n\x01\r\nTWO\r\n");
    ASSERT_TRUE(WaitUntil([&] { return received.load() == 2; }));
    EXPECT_TRUE(conn.isRunning());
    conn.stop();
    EXPECT_EQ(conn.state(), LinkState::Disconnected);
}

TEST(ConnectionManager, DecodeErrorsReachTheSink) {
    auto dev = std::make_shared<FakeDevice>();
    RecordingSink sink;
    ConnectionManager conn(FastLinkConfig(), std::make_unique<FakeTransport>(dev), &sink);

    ASSERT_TRUE(conn.start());
    ASSERT_TRUE(WaitUntil([&] { return conn.isConnected(); }));

    dev->push("\x01\r\nOK\r\n");
    ASSERT_TRUE(WaitUntil([&] { return !sink.messages().empty(); }));
    EXPECT_EQ(sink.errors(), (std::vector<std::string>{ "Illegal character(s)" }));
    EXPECT_EQ(sink.messages(), (std::vector<std::string>{ "OK" }));
    conn.stop();
}

TEST(ConnectionManager, StopWhileRetryingIsPrompt) {
    auto dev = std::make_shared<FakeDevice>();
    dev->failNextOpens(1000000);
    auto cfg = FastLinkConfig();
    cfg.reconnectDelay = 10s;
    cfg.maxReconnectDelay = 10s;
    ConnectionManager conn(cfg, std::make_unique<FakeTransport>(dev));

    ASSERT_TRUE(conn.start());
    ASSERT_TRUE(WaitUntil([&] { return dev->openCalls() >= 1; }));

    const auto t0 = std::chrono::steady_clock::now();
    conn.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 2s);
    EXPECT_FALSE(conn.isRunning());
    EXPECT_EQ(conn.state(), LinkState::Disconnected);

    conn.stop();   // idempotente
}

TEST(ConnectionManager, BackoffGrowsUpToMaximum) {
    auto dev = std::make_shared<FakeDevice>();
    dev->failNextOpens(1000000);
    auto cfg = FastLinkConfig();
    cfg.reconnectDelay = 20ms;
    cfg.maxReconnectDelay = 80ms;
    ConnectionManager conn(cfg, std::make_unique<FakeTransport>(dev));

    ASSERT_TRUE(conn.start());
    // 20 + 40 + 80 + 80 = 220 ms per arrivare al quinto tentativo
    std::this_thread::sleep_for(150ms);
    EXPECT_LE(dev->openCalls(), 4);
    ASSERT_TRUE(WaitUntil([&] { return dev->openCalls() >= 5; }, 2s));
    conn.stop();
}

TEST(ConnectionManager, CanBeRestartedAfterStop) {
    auto dev = std::make_shared<FakeDevice>();
    ConnectionManager conn(FastLinkConfig(), std::make_unique<FakeTransport>(dev));

    ASSERT_TRUE(conn.start());
    ASSERT_TRUE(WaitUntil([&] { return conn.isConnected(); }));
    conn.stop();

    ASSERT_TRUE(conn.start());
    ASSERT_TRUE(WaitUntil([&] { return conn.isConnected(); }));
    EXPECT_EQ(dev->openCalls(), 2);
    conn.stop();
}
