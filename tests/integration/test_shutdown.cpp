#include <gtest/gtest.h>
#include "capwire/server.hpp"
#include "capwire/client.hpp"
#include "capwire/dispatcher.hpp"
#include "capwire/error.hpp"
#include "capwire/session.hpp"
#include "integration/loopback.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <thread>
#include <vector>

using namespace capwire;
using capwire::test_support::make_loopback;

namespace {

/// Registers "sleep", which holds a worker for `ms` milliseconds.
void add_sleep_tool(CapabilityRegistry& registry, std::atomic<int>& finished) {
    ToolDefinition def;
    def.name = "sleep";
    def.input_schema = {
        {"type", "object"},
        {"properties", {{"ms", {{"type", "integer"}}}}},
        {"required", {"ms"}}
    };
    registry.add_tool(def, [&finished](const nlohmann::json& args) -> CallToolResult {
        std::this_thread::sleep_for(std::chrono::milliseconds(args.at("ms").get<int>()));
        ++finished;
        CallToolResult r;
        r.content.push_back(TextContent{"slept"});
        return r;
    });
}

JsonRpcRequest sleep_request(int ms) {
    JsonRpcRequest req;
    req.method = "tools/call";
    req.params = nlohmann::json{{"name", "sleep"}, {"arguments", {{"ms", ms}}}};
    return req;
}

} // namespace

TEST(Shutdown, InFlightHandlersComplete) {
    std::atomic<int> finished{0};
    Server server;
    add_sleep_tool(server.registry(), finished);

    auto [server_end, client_end] = make_loopback();
    std::thread server_thread([&server, t = std::move(server_end)]() mutable {
        server.serve(std::move(t));
    });

    Client client;
    client.connect(std::move(client_end));
    (void)client.initialize();

    auto slow = std::async(std::launch::async, [&client] {
        return client.call_tool("sleep", {{"ms", 300}});
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    server.shutdown();

    auto result = slow.get();
    EXPECT_EQ(std::get<TextContent>(result.content[0]).text, "slept");
    EXPECT_EQ(finished.load(), 1);

    server_thread.join();
    client.disconnect();
}

TEST(Shutdown, NewRequestsRefusedWhileClosing) {
    std::atomic<int> finished{0};
    CapabilityRegistry registry;
    add_sleep_tool(registry, finished);
    Dispatcher dispatcher(registry);

    auto [server_end, client_end] = make_loopback();
    Session server(std::move(server_end), dispatcher);
    server.start();

    CapabilityRegistry client_registry;
    Dispatcher client_dispatcher(client_registry);
    Session client(std::move(client_end), client_dispatcher);
    client.start();

    auto slow = std::async(std::launch::async, [&client] {
        auto req = sleep_request(500);
        return client.request(req.method, req.params, std::chrono::milliseconds(5000));
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    ASSERT_EQ(server.in_flight(), 1u);

    auto closing = std::async(std::launch::async, [&server] { server.shutdown(std::chrono::milliseconds(5000)); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(server.state(), SessionState::Closing);

    auto refused = client.request("ping", std::nullopt, std::chrono::milliseconds(2000));
    ASSERT_TRUE(refused.error.has_value());
    EXPECT_EQ(refused.error->code, error::InternalError);
    EXPECT_EQ(refused.error->kind(), "shutting_down");

    auto slow_resp = slow.get();
    EXPECT_FALSE(slow_resp.error.has_value());
    closing.get();
    EXPECT_EQ(server.state(), SessionState::Closed);
    EXPECT_EQ(finished.load(), 1);

    client.wait();
    client.abort();
}

TEST(Shutdown, AbortFailsPendingCalls) {
    std::atomic<int> finished{0};
    CapabilityRegistry registry;
    add_sleep_tool(registry, finished);
    Dispatcher dispatcher(registry);

    auto [server_end, client_end] = make_loopback();
    Session server(std::move(server_end), dispatcher);
    server.start();

    CapabilityRegistry client_registry;
    Dispatcher client_dispatcher(client_registry);
    Session client(std::move(client_end), client_dispatcher);
    client.start();

    auto pending = std::async(std::launch::async, [&client] {
        auto req = sleep_request(300);
        return client.request(req.method, req.params, std::chrono::milliseconds(5000));
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    client.abort();

    try {
        (void)pending.get();
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.kind(), TransportError::Kind::Disconnected);
    }
    EXPECT_EQ(client.state(), SessionState::Closed);
    EXPECT_THROW((void)client.request("ping"), TransportError);

    server.wait();
    server.shutdown();
}

TEST(Shutdown, PeerDisconnectFailsPendingCalls) {
    std::atomic<int> finished{0};
    CapabilityRegistry registry;
    add_sleep_tool(registry, finished);
    Dispatcher dispatcher(registry);

    auto [server_end, client_end] = make_loopback();
    Session server(std::move(server_end), dispatcher);
    server.start();

    CapabilityRegistry client_registry;
    Dispatcher client_dispatcher(client_registry);
    Session client(std::move(client_end), client_dispatcher);
    client.start();

    auto pending = std::async(std::launch::async, [&client] {
        auto req = sleep_request(200);
        return client.request(req.method, req.params, std::chrono::milliseconds(5000));
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    server.abort();

    EXPECT_THROW((void)pending.get(), TransportError);
    client.wait();
    EXPECT_NE(client.state(), SessionState::Ready);
    client.shutdown();
}

TEST(Shutdown, TimeoutLeavesSessionUsable) {
    std::atomic<int> finished{0};
    Server server;
    add_sleep_tool(server.registry(), finished);

    auto [server_end, client_end] = make_loopback();
    std::thread server_thread([&server, t = std::move(server_end)]() mutable {
        server.serve(std::move(t));
    });

    Client::Options copts;
    copts.request_timeout = std::chrono::milliseconds(100);
    Client client{copts};
    client.connect(std::move(client_end));
    (void)client.initialize();

    try {
        (void)client.call_tool("sleep", {{"ms", 300}});
        FAIL() << "expected CorrelationError";
    } catch (const CorrelationError& e) {
        EXPECT_EQ(e.kind(), CorrelationError::Kind::Timeout);
    }

    // Let the late response arrive and be discarded.
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    EXPECT_NO_THROW(client.ping());
    EXPECT_EQ(finished.load(), 1);

    client.disconnect();
    server_thread.join();
}

TEST(Shutdown, ServerRefusesSessionsAfterShutdown) {
    Server server;
    server.shutdown();

    auto [server_end, client_end] = make_loopback();
    server.serve(std::move(server_end));
    EXPECT_FALSE(server.is_running());
}

TEST(Shutdown, SessionStartTwice) {
    CapabilityRegistry registry;
    Dispatcher dispatcher(registry);
    auto [a, b] = make_loopback();
    Session session(std::move(a), dispatcher);
    session.start();
    EXPECT_THROW(session.start(), TransportError);
    session.abort();
    EXPECT_EQ(session.state(), SessionState::Closed);
    EXPECT_EQ(to_string(session.state()), "closed");
}

TEST(Shutdown, NonStandardThrowKeepsSessionUsable) {
    CapabilityRegistry registry;
    ToolDefinition boom;
    boom.name = "boom";
    registry.add_tool(boom, [](const nlohmann::json&) -> CallToolResult { throw 42; });
    Dispatcher dispatcher(registry);

    auto [server_end, client_end] = make_loopback();
    Session server(std::move(server_end), dispatcher);
    server.start();

    CapabilityRegistry client_registry;
    Dispatcher client_dispatcher(client_registry);
    Session client(std::move(client_end), client_dispatcher);
    client.start();

    auto resp = client.request("tools/call", nlohmann::json{{"name", "boom"}},
                               std::chrono::milliseconds(2000));
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::InternalError);
    EXPECT_EQ(resp.error->kind(), "internal_error");

    auto pong = client.request("ping", std::nullopt, std::chrono::milliseconds(2000));
    EXPECT_FALSE(pong.error.has_value());
    EXPECT_EQ(server.in_flight(), 0u);

    // A leaked in-flight count would stall this until the deadline.
    auto started = std::chrono::steady_clock::now();
    server.shutdown(std::chrono::milliseconds(3000));
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(1500));
    EXPECT_EQ(server.state(), SessionState::Closed);

    client.wait();
    client.abort();
}

TEST(Shutdown, HandlerShutsDownItsOwnSession) {
    CapabilityRegistry registry;
    std::unique_ptr<Session> server;
    std::atomic<bool> returned{false};

    ToolDefinition quit;
    quit.name = "quit";
    registry.add_tool(quit, [&server, &returned](const nlohmann::json&) {
        server->shutdown(std::chrono::milliseconds(50));
        // Keep running after shutdown() returned, on a worker the session no longer waits for.
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        returned = true;
        CallToolResult r;
        r.content.push_back(TextContent{"bye"});
        return r;
    });
    Dispatcher dispatcher(registry);

    auto [server_end, client_end] = make_loopback();
    server = std::make_unique<Session>(std::move(server_end), dispatcher);
    server->start();

    CapabilityRegistry client_registry;
    Dispatcher client_dispatcher(client_registry);
    Session client(std::move(client_end), client_dispatcher);
    client.start();

    EXPECT_THROW((void)client.request("tools/call", nlohmann::json{{"name", "quit"}},
                                      std::chrono::milliseconds(2000)),
                 TransportError);

    server->wait();
    EXPECT_EQ(server->state(), SessionState::Closed);
    EXPECT_TRUE(returned.load());
    EXPECT_EQ(server->in_flight(), 0u);
    server.reset();

    client.wait();
    client.abort();
}

TEST(Shutdown, ServerSessionsShareOneGracePeriod) {
    std::atomic<int> finished{0};
    Server::Options opts;
    opts.shutdown_grace = std::chrono::milliseconds(2000);
    Server server{opts};
    add_sleep_tool(server.registry(), finished);

    constexpr int kSessions = 3;
    std::vector<std::thread> serving;
    std::vector<std::unique_ptr<Client>> clients;
    std::vector<std::future<CallToolResult>> calls;
    for (int i = 0; i < kSessions; ++i) {
        auto [server_end, client_end] = make_loopback();
        serving.emplace_back([&server, t = std::move(server_end)]() mutable {
            server.serve(std::move(t));
        });
        clients.push_back(std::make_unique<Client>());
        clients.back()->connect(std::move(client_end));
        (void)clients.back()->initialize();
    }
    for (auto& client : clients) {
        calls.push_back(std::async(std::launch::async, [c = client.get()] {
            return c->call_tool("sleep", {{"ms", 600}});
        }));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(server.metrics().active_connections, static_cast<uint64_t>(kSessions));

    auto started = std::chrono::steady_clock::now();
    auto stopping = std::async(std::launch::async, [&server] { server.shutdown(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    // Every session is closing at once, not only the first one being drained.
    for (auto& client : clients) {
        try {
            client->ping();
            FAIL() << "expected DispatchError";
        } catch (const DispatchError& e) {
            EXPECT_EQ(e.kind(), "shutting_down");
        }
    }

    for (auto& call : calls) {
        auto result = call.get();
        EXPECT_EQ(std::get<TextContent>(result.content[0]).text, "slept");
    }
    stopping.get();
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(2000));

    for (auto& t : serving) t.join();
    EXPECT_EQ(finished.load(), kSessions);
    EXPECT_EQ(server.metrics().active_connections, 0u);
    EXPECT_FALSE(server.is_running());

    for (auto& client : clients) client->disconnect();
}
