#include "server/include/session.hpp"
#include "server/include/dispatcher.hpp"
#include "server/include/connection_manager.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

class SessionTest : public ::testing::Test {
protected:
    struct Client {
        std::shared_ptr<FakeChannel> channel;
        SessionPtr session;

        void send(const std::string& data) { session->on_data(data); }
        std::string last() const { return channel->last(); }
    };

    ServerConfig config;
    ConnectionManager manager;
    ManualTimerService timers;
    std::unique_ptr<Dispatcher> disp;

    void SetUp() override {
        rebuild();
    }

    // 改了 config 之后调用
    void rebuild() {
        disp = std::make_unique<Dispatcher>(&manager, &timers, config);
    }

    Client connect(const std::string& endpoint = "127.0.0.1:40000") {
        Client c{std::make_shared<FakeChannel>(endpoint), nullptr};
        c.session = std::make_shared<ChatSession>(c.channel, *disp);
        c.session->start();
        return c;
    }

    Client login(const std::string& name) {
        Client c = connect();
        c.send("IDENT " + name + "\n");
        EXPECT_EQ(c.last(), "OK IDENT " + name);
        return c;
    }
};

TEST_F(SessionTest, GreetsOnConnect) {
    auto c = connect();
    ASSERT_EQ(c.channel->count(), 1u);
    EXPECT_EQ(c.last(), "INIT Welcome to the server 1.4");
    EXPECT_EQ(c.session->state(), ChatSession::State::Unidentified);
    EXPECT_TRUE(manager.has_connection(c.session.get()));
    EXPECT_EQ(manager.stats().connections, 1u);
}

TEST_F(SessionTest, GreetingUsesConfiguredVersion) {
    config.version = "9.9";
    rebuild();
    auto c = connect();
    EXPECT_EQ(c.last(), "INIT Welcome to the server 9.9");
}

TEST_F(SessionTest, LoginRegistersUser) {
    auto c = login("Valid_1");
    EXPECT_EQ(c.session->state(), ChatSession::State::Identified);
    EXPECT_EQ(c.session->username(), "Valid_1");
    EXPECT_EQ(manager.get_user("Valid_1"), c.session);
    EXPECT_TRUE(c.session->heartbeat_running());
}

TEST_F(SessionTest, SecondLoginOnSameConnectionFails) {
    auto c = login("Alice");
    c.send("IDENT Bobby\n");
    EXPECT_EQ(c.last(), "FAIL04 User cannot login twice");
    EXPECT_EQ(c.session->username(), "Alice");
    EXPECT_FALSE(manager.user_exists("Bobby"));
    EXPECT_EQ(manager.stats().users, 1u);
}

TEST_F(SessionTest, UppercaseNamesKeepFirstIdentity) {
    auto c = connect();
    c.send("IDENT ALICE\nIDENT BOB\n");
    auto lines = c.channel->sent();
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[1], "OK IDENT ALICE");
    EXPECT_EQ(lines[2], "FAIL04 User cannot login twice");
    EXPECT_FALSE(manager.user_exists("BOB"));
}

TEST_F(SessionTest, AlreadyLoggedInCheckedBeforeFormat) {
    auto c = login("Alice");
    c.send("IDENT x\n");
    EXPECT_EQ(c.last(), "FAIL04 User cannot login twice");
}

TEST_F(SessionTest, TakenNameIsRejected) {
    auto first = login("Alice");
    auto second = connect();
    second.send("IDENT Alice\n");
    EXPECT_EQ(second.last(), "FAIL01 User already logged in");
    EXPECT_EQ(second.session->state(), ChatSession::State::Unidentified);
    EXPECT_EQ(manager.get_user("Alice"), first.session);
    EXPECT_EQ(manager.stats().users, 1u);
}

TEST_F(SessionTest, InvalidNamesAreRejected) {
    auto c = connect();
    for (const char* line : {"IDENT ab\n", "IDENT this-name-is-too-long-xx\n",
                             "IDENT abcdefghijklmno\n", "IDENT bad name\n",
                             "IDENT bad-name\n", "IDENT\n", "IDENT \n"}) {
        c.send(line);
        EXPECT_EQ(c.last(), "FAIL02 Username has an invalid format or length") << line;
    }
    EXPECT_EQ(c.session->state(), ChatSession::State::Unidentified);
    EXPECT_EQ(manager.stats().users, 0u);
}

TEST_F(SessionTest, BroadcastReachesOthersAndConfirmsSender) {
    auto alice = login("Alice");
    auto bob = login("Bob");
    auto carol = login("Carol");
    auto lurker = connect();
    size_t lurker_count = lurker.channel->count();

    alice.send("BCST hello  world \n");
    EXPECT_EQ(alice.last(), "OK BCST hello  world ");
    EXPECT_EQ(bob.last(), "BCST Alice hello  world ");
    EXPECT_EQ(carol.last(), "BCST Alice hello  world ");
    EXPECT_EQ(lurker.channel->count(), lurker_count);

    for (const auto& line : alice.channel->sent()) {
        EXPECT_NE(line.rfind("BCST Alice", 0), 0u) << "sender got its own broadcast";
    }
}

TEST_F(SessionTest, BroadcastWithSingleUserOnlyConfirms) {
    auto alice = login("Alice");
    size_t before = alice.channel->count();
    alice.send("BCST anyone?\n");
    EXPECT_EQ(alice.channel->count(), before + 1);
    EXPECT_EQ(alice.last(), "OK BCST anyone?");
}

TEST_F(SessionTest, BroadcastRequiresLogin) {
    auto bob = login("Bob");
    size_t bob_count = bob.channel->count();
    auto anon = connect();
    anon.send("BCST hi\n");
    EXPECT_EQ(anon.last(), "FAIL03 Please log in first");
    EXPECT_EQ(bob.channel->count(), bob_count);
}

TEST_F(SessionTest, UnknownCommandKeepsConnectionOpen) {
    auto c = connect();
    for (const char* line : {"HELLO\n", "ident Alice\n", "PING\n", "\n", " IDENT Alice\n"}) {
        c.send(line);
        EXPECT_EQ(c.last(), "FAIL00 Unknown command") << line;
    }
    EXPECT_FALSE(c.channel->destroyed());
    EXPECT_EQ(c.session->state(), ChatSession::State::Unidentified);
}

TEST_F(SessionTest, QuitSaysGoodbyeAndCloses) {
    auto c = login("Alice");
    c.send("QUIT\n");
    EXPECT_EQ(c.last(), "OK Goodbye");
    EXPECT_TRUE(c.channel->destroyed());
    EXPECT_EQ(c.session->state(), ChatSession::State::Closed);
    EXPECT_FALSE(c.session->heartbeat_running());
}

TEST_F(SessionTest, QuitWithoutLogin) {
    auto c = connect();
    c.send("QUIT\n");
    EXPECT_EQ(c.last(), "OK Goodbye");
    EXPECT_TRUE(c.channel->destroyed());
}

TEST_F(SessionTest, LinesAfterCloseAreNotDispatched) {
    auto alice = login("Alice");
    auto bob = login("Bob");
    size_t bob_count = bob.channel->count();

    alice.send("QUIT\nBCST too late\n");
    EXPECT_EQ(alice.last(), "OK Goodbye");
    EXPECT_EQ(bob.channel->count(), bob_count);

    alice.send("BCST later\n");
    EXPECT_EQ(bob.channel->count(), bob_count);
}

TEST_F(SessionTest, MixedTerminatorsInOneChunk) {
    auto alice = login("Alice");
    auto bob = connect();
    bob.send("IDENT Bob\r\nBCST one\rBCST two\n");
    auto lines = bob.channel->sent();
    ASSERT_GE(lines.size(), 4u);
    EXPECT_EQ(lines[lines.size() - 3], "OK IDENT Bob");
    EXPECT_EQ(lines[lines.size() - 2], "OK BCST one");
    EXPECT_EQ(lines[lines.size() - 1], "OK BCST two");
    EXPECT_EQ(alice.last(), "BCST Bob two");
}

TEST_F(SessionTest, CommandSplitAcrossChunks) {
    auto c = connect();
    c.send("IDE");
    c.send("NT Alice\r");
    EXPECT_EQ(c.last(), "OK IDENT Alice");
    c.send("\nQUIT\n");
    EXPECT_EQ(c.last(), "OK Goodbye");
}

TEST_F(SessionTest, OverflowDisconnects) {
    auto c = connect();
    c.send(std::string(1025, 'x'));
    EXPECT_EQ(c.last(), "DSCN Unterminated message");
    EXPECT_TRUE(c.channel->destroyed());
    EXPECT_EQ(c.session->state(), ChatSession::State::Closed);
}

TEST_F(SessionTest, PendingAtLimitIsTolerated) {
    auto c = connect();
    c.send(std::string(1024, 'x'));
    EXPECT_FALSE(c.channel->destroyed());
    c.send("\n");
    EXPECT_EQ(c.last(), "FAIL00 Unknown command");
}

TEST_F(SessionTest, OverflowAcrossChunks) {
    auto c = connect();
    c.send(std::string(600, 'x'));
    EXPECT_FALSE(c.channel->destroyed());
    c.send(std::string(600, 'x'));
    EXPECT_EQ(c.last(), "DSCN Unterminated message");
    EXPECT_TRUE(c.channel->destroyed());
}

TEST_F(SessionTest, CompleteLinesBeforeOverflowAreHandled) {
    auto c = connect();
    c.send("IDENT Alice\n" + std::string(2000, 'z'));
    auto lines = c.channel->sent();
    ASSERT_GE(lines.size(), 2u);
    EXPECT_EQ(lines[lines.size() - 2], "OK IDENT Alice");
    EXPECT_EQ(lines.back(), "DSCN Unterminated message");
}

TEST_F(SessionTest, OverflowLimitFollowsConfig) {
    config.max_pending = 16;
    rebuild();
    auto c = connect();
    c.send(std::string(17, 'x'));
    EXPECT_EQ(c.last(), "DSCN Unterminated message");
}

TEST_F(SessionTest, NoHeartbeatBeforeLogin) {
    auto c = connect();
    EXPECT_FALSE(c.session->heartbeat_running());
    timers.advance(60000ms);
    EXPECT_EQ(c.channel->count(), 1u);
    EXPECT_EQ(timers.active(), 0u);
}

TEST_F(SessionTest, PingAfterIntervalAndPongAccepted) {
    auto c = login("Alice");
    size_t before = c.channel->count();
    timers.advance(10000ms);
    ASSERT_EQ(c.channel->count(), before + 1);
    EXPECT_EQ(c.last(), "PING");
    EXPECT_TRUE(c.session->awaiting_pong());

    c.send("PONG\n");
    EXPECT_EQ(c.channel->count(), before + 1);
    EXPECT_FALSE(c.session->awaiting_pong());

    timers.advance(3000ms);
    EXPECT_FALSE(c.channel->destroyed());
    EXPECT_EQ(c.last(), "PING");

    timers.advance(7000ms);
    EXPECT_EQ(c.channel->count(), before + 2);
    EXPECT_EQ(c.last(), "PING");
}

TEST_F(SessionTest, PongWithoutPingFails) {
    auto c = login("Alice");
    c.send("PONG\n");
    EXPECT_EQ(c.last(), "FAIL05 Pong without ping");

    auto anon = connect();
    anon.send("PONG\n");
    EXPECT_EQ(anon.last(), "FAIL05 Pong without ping");
}

TEST_F(SessionTest, SecondPongFails) {
    auto c = login("Alice");
    timers.advance(10000ms);
    c.send("PONG\nPONG\n");
    EXPECT_EQ(c.last(), "FAIL05 Pong without ping");
}

TEST_F(SessionTest, MissingPongDisconnects) {
    auto c = login("Alice");
    timers.advance(10000ms);
    EXPECT_EQ(c.last(), "PING");
    timers.advance(2999ms);
    EXPECT_FALSE(c.channel->destroyed());
    timers.advance(1ms);
    EXPECT_EQ(c.last(), "DSCN Pong timeout");
    EXPECT_TRUE(c.channel->destroyed());
    EXPECT_EQ(c.session->state(), ChatSession::State::Closed);
    EXPECT_EQ(timers.active(), 0u);

    size_t count = c.channel->count();
    c.send("PONG\n");
    EXPECT_EQ(c.channel->count(), count);
}

TEST_F(SessionTest, HeartbeatCanBeDisabled) {
    config.heartbeat_enabled = false;
    rebuild();
    auto c = login("Alice");
    EXPECT_FALSE(c.session->heartbeat_running());
    size_t before = c.channel->count();
    timers.advance(60000ms);
    EXPECT_EQ(c.channel->count(), before);
    c.send("PONG\n");
    EXPECT_EQ(c.last(), "FAIL05 Pong without ping");
}

TEST_F(SessionTest, PeerEndClosesSession) {
    auto c = login("Alice");
    c.session->on_end();
    EXPECT_TRUE(c.channel->destroyed());
    EXPECT_EQ(c.session->state(), ChatSession::State::Closed);
}

TEST_F(SessionTest, ErrorIsOnlyLogged) {
    auto c = login("Alice");
    c.session->on_error("transmission error: Connection reset by peer");
    EXPECT_FALSE(c.channel->destroyed());
    EXPECT_EQ(c.session->state(), ChatSession::State::Identified);
}

TEST_F(SessionTest, CloseReleasesNameAndConnection) {
    auto alice = login("Alice");
    auto bob = login("Bob");
    alice.send("QUIT\n");
    alice.session->on_close(false);

    EXPECT_FALSE(manager.user_exists("Alice"));
    EXPECT_FALSE(manager.has_connection(alice.session.get()));
    auto stats = manager.stats();
    EXPECT_EQ(stats.connections, 1u);
    EXPECT_EQ(stats.users, 1u);

    size_t bob_count = bob.channel->count();
    bob.send("BCST still here\n");
    EXPECT_EQ(bob.channel->count(), bob_count + 1);
    EXPECT_EQ(bob.last(), "OK BCST still here");
}

TEST_F(SessionTest, CloseWithoutLoginOnlyLeavesConnectionSet) {
    auto owner = login("Alice");
    auto anon = connect();
    anon.session->on_close(true);
    EXPECT_FALSE(manager.has_connection(anon.session.get()));
    EXPECT_EQ(manager.get_user("Alice"), owner.session);
}

TEST_F(SessionTest, CloseIsIdempotent) {
    auto c = login("Alice");
    c.session->on_close(false);
    c.session->on_close(true);
    EXPECT_EQ(c.session->state(), ChatSession::State::Closed);
    EXPECT_EQ(manager.stats().connections, 0u);
    EXPECT_EQ(manager.stats().users, 0u);
}

TEST_F(SessionTest, CloseWhileAwaitingPongCancelsTimers) {
    auto c = login("Alice");
    timers.advance(10000ms);
    EXPECT_TRUE(c.session->awaiting_pong());
    c.session->on_close(false);
    EXPECT_EQ(timers.active(), 0u);
    size_t count = c.channel->count();
    timers.advance(60000ms);
    EXPECT_EQ(c.channel->count(), count);
}

TEST_F(SessionTest, NameReusableAfterClose) {
    auto first = login("Alice");
    first.session->on_close(false);
    auto second = connect();
    second.send("IDENT Alice\n");
    EXPECT_EQ(second.last(), "OK IDENT Alice");
    EXPECT_EQ(manager.get_user("Alice"), second.session);
}

TEST_F(SessionTest, LateCloseDoesNotEvictNewOwner) {
    auto first = login("Alice");
    // 名字先被释放再被别人拿走, 旧会话的关闭通知晚到
    manager.remove_user("Alice");
    auto second = login("Alice");
    first.session->on_close(false);
    EXPECT_EQ(manager.get_user("Alice"), second.session);
}

TEST_F(SessionTest, ConcurrentLoginsPickOneOwner) {
    // ManualTimerService 不是线程安全的
    config.heartbeat_enabled = false;
    rebuild();
    const int clients = 8;
    std::vector<Client> all;
    for (int i = 0; i < clients; ++i) {
        all.push_back(connect());
    }
    std::vector<std::thread> threads;
    for (auto& c : all) {
        threads.emplace_back([&c]() { c.send("IDENT Shared\n"); });
    }
    for (auto& t : threads) {
        t.join();
    }
    int ok = 0;
    int taken = 0;
    for (const auto& c : all) {
        if (c.last() == "OK IDENT Shared") {
            ++ok;
        } else if (c.last() == "FAIL01 User already logged in") {
            ++taken;
        }
    }
    EXPECT_EQ(ok, 1);
    EXPECT_EQ(taken, clients - 1);
}
