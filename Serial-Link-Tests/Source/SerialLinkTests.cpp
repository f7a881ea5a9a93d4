#include <gtest/gtest.h>
#include <future>
#include "Core/Link/SerialLink.hpp"
#include "TestSupport.hpp"

using namespace std::chrono_literals;

namespace {

struct LinkFixture : public ::testing::Test {
    std::shared_ptr<FakeDevice> dev = std::make_shared<FakeDevice>();
    RecordingSink sink;
    std::unique_ptr<SerialLink> link;

    void startLink(LinkConfig cfg = FastLinkConfig()) {
        link = std::make_unique<SerialLink>(cfg, std::make_unique<FakeTransport>(dev), &sink);
        ASSERT_TRUE(link->start());
        ASSERT_TRUE(WaitUntil([&] { return link->isConnected(); }));
    }

    void TearDown() override {
        if (link) link->stop();
    }
};

} // namespace

TEST_F(LinkFixture, RequestIsWrittenWithTerminatorAndResolved) {
    dev->setResponder([](const std::string& w) -> std::vector<std::string> {
        if (w == "AT\n") return { "OK THIS IS GOOD\r\n" };
        return {};
        });
    startLink();

    auto r = link->queueRequestWaitResponse("AT", "OK", 1s);
    ASSERT_TRUE(std::holds_alternative<DecodedMessage>(r));
    EXPECT_EQ(std::get<DecodedMessage>(r).content, "OK THIS IS GOOD");
    EXPECT_EQ(dev->written(), (std::vector<std::string>{ "AT\n" }));
}

TEST_F(LinkFixture, NonMatchingMessagesGoToSinkOnly) {
    dev->setResponder([](const std::string&) -> std::vector<std::string> {
        return { "ERROR\r\n", "OK ready\r\n" };
        });
    startLink();

    auto r = link->queueRequestWaitResponse("AT", "OK", 1s);
    ASSERT_TRUE(std::holds_alternative<DecodedMessage>(r));
    EXPECT_EQ(std::get<DecodedMessage>(r).content, "OK ready");

    // il sink vede tutto, anche il messaggio che ha risolto la richiesta
    ASSERT_TRUE(WaitUntil([&] { return sink.messages().size() == 2; }));
    EXPECT_EQ(sink.messages(), (std::vector<std::string>{ "ERROR", "OK ready" }));
}

TEST_F(LinkFixture, OnlyPrefixCountsNotSubstring) {
    dev->setResponder([](const std::string&) -> std::vector<std::string> { return { "NOT OK\r\n" }; });
    startLink();

    auto r = link->queueRequestWaitResponse("AT", "OK", 100ms);
    ASSERT_TRUE(std::holds_alternative<TimeoutError>(r));
    EXPECT_EQ(std::get<TimeoutError>(r).request, "AT");
}

TEST_F(LinkFixture, TimeoutHonoursRequestedDuration) {
    startLink();

    const auto t0 = std::chrono::steady_clock::now();
    auto r = link->queueRequestWaitResponse("AT+1234", "HELLO", 200ms);
    const auto elapsed = std::chrono::steady_clock::now() - t0;

    EXPECT_TRUE(std::holds_alternative<TimeoutError>(r));
    EXPECT_GE(elapsed, 200ms);
    EXPECT_LT(elapsed, 700ms);
    EXPECT_EQ(dev->written(), (std::vector<std::string>{ "AT+1234\n" }));
}

TEST_F(LinkFixture, DefaultTimeoutFromConfig) {
    auto cfg = FastLinkConfig();
    cfg.defaultTimeout = 50ms;
    startLink(cfg);

    const auto t0 = std::chrono::steady_clock::now();
    auto r = link->queueRequestWaitResponse("AT", "HELLO");
    EXPECT_TRUE(std::holds_alternative<TimeoutError>(r));
    EXPECT_GE(std::chrono::steady_clock::now() - t0, 50ms);
}

TEST_F(LinkFixture, ConcurrentRequestIsBusy) {
    startLink();

    auto first = std::async(std::launch::async, [&] { return link->queueRequestWaitResponse("AT", "OK", 2s); });
    ASSERT_TRUE(WaitUntil([&] { return dev->written().size() == 1; }));

    auto second = link->queueRequestWaitResponse("ATI", "OK", 2s);
    EXPECT_TRUE(std::holds_alternative<BusyError>(second));

    dev->push("OK\r\n");
    EXPECT_TRUE(std::holds_alternative<DecodedMessage>(first.get()));
    EXPECT_EQ(dev->written().size(), 1u);
}

TEST_F(LinkFixture, StopWakesPendingRequest) {
    startLink();

    auto pending = std::async(std::launch::async, [&] { return link->queueRequestWaitResponse("AT", "OK", 10s); });
    ASSERT_TRUE(WaitUntil([&] { return dev->written().size() == 1; }));

    const auto t0 = std::chrono::steady_clock::now();
    link->stop();
    auto r = pending.get();
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 2s);
    EXPECT_TRUE(std::holds_alternative<DisconnectedError>(r));
    EXPECT_EQ(link->state(), LinkState::Disconnected);
}

TEST_F(LinkFixture, ConnectionDropWakesPendingRequest) {
    startLink();

    auto pending = std::async(std::launch::async, [&] { return link->queueRequestWaitResponse("AT", "OK", 10s); });
    ASSERT_TRUE(WaitUntil([&] { return dev->written().size() == 1; }));

    dev->failNextRead();
    auto r = pending.get();
    ASSERT_TRUE(std::holds_alternative<DisconnectedError>(r));
    EXPECT_NE(std::get<DisconnectedError>(r).reason.find("read error"), std::string::npos);

    // dopo la riconnessione le richieste funzionano di nuovo
    ASSERT_TRUE(WaitUntil([&] { return dev->openCalls() == 2 && link->isConnected(); }));
    dev->setResponder([](const std::string&) -> std::vector<std::string> { return { "OK\r\n" }; });
    EXPECT_TRUE(std::holds_alternative<DecodedMessage>(link->queueRequestWaitResponse("AT", "OK", 1s)));
}

TEST_F(LinkFixture, AnyOfSeveralPrefixes) {
    dev->setResponder([](const std::string&) -> std::vector<std::string> { return { "+CME ERROR: 10\r\n" }; });
    startLink();

    auto r = link->queueRequestWaitAnyResponse("AT+CPIN?", { "+CPIN:", "+CME ERROR" }, 1s);
    ASSERT_TRUE(std::holds_alternative<DecodedMessage>(r));
    EXPECT_EQ(std::get<DecodedMessage>(r).content, "+CME ERROR: 10");
}

TEST_F(LinkFixture, SendDoesNotWait) {
    startLink();

    std::string err;
    EXPECT_TRUE(link->send("AT+RST", &err));
    ASSERT_TRUE(WaitUntil([&] { return dev->written().size() == 1; }));
    EXPECT_EQ(dev->written()[0], "AT+RST\n");
}

TEST_F(LinkFixture, CustomTerminatorAndDelimiter) {
    auto cfg = FastLinkConfig();
    cfg.requestTerminator = "\r";
    cfg.delimiter = "\n";
    dev->setResponder([](const std::string& w) -> std::vector<std::string> {
        if (w == "PING\r") return { "PONG 1\n" };
        return {};
        });
    startLink(cfg);

    auto r = link->queueRequestWaitResponse("PING", "PONG", 1s);
    ASSERT_TRUE(std::holds_alternative<DecodedMessage>(r));
    EXPECT_EQ(std::get<DecodedMessage>(r).content, "PONG 1");
}

TEST(SerialLink, RequestWhileNotConnectedIsDisconnected) {
    auto dev = std::make_shared<FakeDevice>();
    dev->failNextOpens(1000000);
    SerialLink link(FastLinkConfig(), std::make_unique<FakeTransport>(dev));

    auto r = link.queueRequestWaitResponse("AT", "OK", 1s);
    ASSERT_TRUE(std::holds_alternative<DisconnectedError>(r));
    EXPECT_EQ(std::get<DisconnectedError>(r).reason, "not_connected");

    ASSERT_TRUE(link.start());
    EXPECT_TRUE(std::holds_alternative<DisconnectedError>(link.queueRequestWaitResponse("AT", "OK", 1s)));

    std::string err;
    EXPECT_FALSE(link.send("AT", &err));
    EXPECT_EQ(err, "not_connected");
    link.stop();
}

TEST(SerialLink, DestructorStopsTheLoop) {
    auto dev = std::make_shared<FakeDevice>();
    {
        SerialLink link(FastLinkConfig(), std::make_unique<FakeTransport>(dev));
        ASSERT_TRUE(link.start());
        ASSERT_TRUE(WaitUntil([&] { return link.isConnected(); }));
    }
    EXPECT_FALSE(dev->isOpen());
}
