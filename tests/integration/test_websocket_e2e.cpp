#include <gtest/gtest.h>
#include "capwire/server.hpp"
#include "capwire/client.hpp"
#include "capwire/dispatcher.hpp"
#include "capwire/error.hpp"
#include "capwire/session.hpp"
#include "capwire/transport/websocket_transport.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <thread>

using namespace capwire;

class WebSocketE2ETest : public ::testing::Test {
protected:
    std::unique_ptr<Server> server_;
    std::thread server_thread_;
    static constexpr uint16_t port_ = 18941;

    void SetUp() override {
        Server::Options sopts;
        sopts.server_info = {"ws-test-server", "1.0"};
        server_ = std::make_unique<Server>(sopts);

        ToolDefinition add;
        add.name = "add";
        add.input_schema = {
            {"type", "object"},
            {"properties", {{"a", {{"type", "number"}}}, {"b", {{"type", "number"}}}}},
            {"required", {"a", "b"}}
        };
        server_->add_tool(add, [](const nlohmann::json& args) -> CallToolResult {
            CallToolResult result;
            result.content.push_back(TextContent{std::to_string(args.at("a").get<int>() + args.at("b").get<int>())});
            return result;
        });

        PromptDefinition summary;
        summary.name = "summary";
        summary.arguments = {{"topic", std::nullopt, false}};
        server_->add_prompt(summary, [](const std::string&, const nlohmann::json& args) -> GetPromptResult {
            GetPromptResult result;
            result.description = "Summary prompt";
            result.messages.push_back(PromptMessage{"user", TextContent{"Summarize " + args.value("topic", std::string("everything"))}});
            return result;
        });

        server_thread_ = std::thread([this]() {
            server_->serve_websocket("127.0.0.1", port_);
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    void TearDown() override {
        server_->shutdown();
        if (server_thread_.joinable()) server_thread_.join();
    }

    std::string url() const { return "ws://127.0.0.1:" + std::to_string(port_) + "/"; }
};

TEST_F(WebSocketE2ETest, FullExchange) {
    Client client;
    client.connect_websocket(url());

    auto init = client.initialize();
    EXPECT_EQ(init.server_info.name, "ws-test-server");
    EXPECT_TRUE(init.capabilities.tools.has_value());
    EXPECT_TRUE(init.capabilities.prompts.has_value());
    EXPECT_FALSE(init.capabilities.resources.has_value());

    auto sum = client.call_tool("add", {{"a", 2}, {"b", 40}});
    EXPECT_EQ(std::get<TextContent>(sum.content[0]).text, "42");

    auto prompts = client.list_prompts();
    ASSERT_EQ(prompts.items.size(), 1u);
    EXPECT_EQ(prompts.items[0].name, "summary");

    auto prompt = client.get_prompt("summary", {{"topic", "sockets"}});
    EXPECT_EQ(prompt.description, std::optional<std::string>("Summary prompt"));
    EXPECT_EQ(std::get<TextContent>(prompt.messages[0].content).text, "Summarize sockets");

    auto stats = client.transport_stats();
    EXPECT_GE(stats.messages_sent, 4u);
    EXPECT_GT(stats.bytes_sent, 0u);

    client.disconnect();
}

TEST_F(WebSocketE2ETest, TypeMismatchIsInvalidParams) {
    Client client;
    client.connect_websocket(url());
    (void)client.initialize();
    try {
        (void)client.call_tool("add", {{"a", "two"}, {"b", 2}});
        FAIL() << "expected DispatchError";
    } catch (const DispatchError& e) {
        EXPECT_EQ(e.code(), error::InvalidParams);
        EXPECT_EQ(e.kind(), "invalid_params");
    }
    client.disconnect();
}

TEST_F(WebSocketE2ETest, IndependentSessions) {
    Client first;
    Client second;
    first.connect_websocket(url());
    second.connect_websocket(url());
    (void)first.initialize();
    (void)second.initialize();

    first.disconnect();
    // The other session is unaffected.
    auto sum = second.call_tool("add", {{"a", 1}, {"b", 1}});
    EXPECT_EQ(std::get<TextContent>(sum.content[0]).text, "2");
    second.disconnect();
}

TEST(WebSocketTransport, ConnectRefused) {
    try {
        WebSocketTransport t("ws://127.0.0.1:1/");
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.kind(), TransportError::Kind::ConnectionFailed);
    }
}

TEST(WebSocketTransport, RawFramesBothWays) {
    WebSocketListener listener("127.0.0.1", 0);
    ASSERT_GT(listener.port(), 0);

    auto accepted = std::async(std::launch::async, [&listener] { return listener.accept(); });
    WebSocketTransport client("ws://127.0.0.1:" + std::to_string(listener.port()) + "/");
    auto server = accepted.get();
    ASSERT_NE(server, nullptr);
    EXPECT_EQ(server->transport_type(), "websocket");

    client.send("{\"hello\":1}");
    EXPECT_EQ(server->receive(), std::optional<std::string>("{\"hello\":1}"));
    server->send("{\"world\":2}");
    EXPECT_EQ(client.receive(), std::optional<std::string>("{\"world\":2}"));

    client.close();
    EXPECT_FALSE(server->receive().has_value());
    EXPECT_FALSE(client.is_connected());
    EXPECT_THROW(client.send("late"), TransportError);
}

TEST(WebSocketTransport, ListenerCloseWakesAccept) {
    WebSocketListener listener("127.0.0.1", 0);
    auto accepted = std::async(std::launch::async, [&listener] { return listener.accept(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    listener.close();
    EXPECT_EQ(accepted.get(), nullptr);
}

// Requests and notifications originate from the server side of a session.
TEST(WebSocketSession, ServerInitiatedTraffic) {
    WebSocketListener listener("127.0.0.1", 0);
    auto accepted = std::async(std::launch::async, [&listener] { return listener.accept(); });

    Client client;
    std::mutex mutex;
    std::condition_variable cv;
    std::string message;
    client.on_notification("notifications/message", [&](const nlohmann::json& params, const CallContext&) {
        std::lock_guard<std::mutex> lock(mutex);
        message = params.value("text", std::string());
        cv.notify_all();
    });
    client.connect_websocket("ws://127.0.0.1:" + std::to_string(listener.port()) + "/");

    CapabilityRegistry registry;
    Dispatcher dispatcher(registry);
    Session session(accepted.get(), dispatcher);
    session.start();

    // The client answers ping on its own.
    auto pong = session.request("ping", nlohmann::json::object(), std::chrono::milliseconds(2000));
    EXPECT_FALSE(pong.error.has_value());

    auto unknown = session.request("sampling/createMessage", std::nullopt, std::chrono::milliseconds(2000));
    ASSERT_TRUE(unknown.error.has_value());
    EXPECT_EQ(unknown.error->code, error::MethodNotFound);

    session.notify("notifications/message", nlohmann::json{{"text", "from server"}});
    {
        std::unique_lock<std::mutex> lock(mutex);
        EXPECT_TRUE(cv.wait_for(lock, std::chrono::seconds(2), [&] { return !message.empty(); }));
    }
    EXPECT_EQ(message, "from server");

    client.disconnect();
    session.wait();
    session.shutdown();
    EXPECT_EQ(session.state(), SessionState::Closed);
}

TEST_F(WebSocketE2ETest, ConnectionsComeAndGo) {
    constexpr int kRounds = 10;
    for (int i = 0; i < kRounds; ++i) {
        Client client;
        client.connect_websocket(url());
        (void)client.initialize();
        auto sum = client.call_tool("add", {{"a", i}, {"b", 1}});
        EXPECT_EQ(std::get<TextContent>(sum.content[0]).text, std::to_string(i + 1));
        client.disconnect();
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (server_->metrics().active_connections > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    auto metrics = server_->metrics();
    EXPECT_EQ(metrics.active_connections, 0u);
    EXPECT_EQ(metrics.successful_requests, static_cast<uint64_t>(2 * kRounds));
    EXPECT_EQ(metrics.failed_requests, 0u);

    Client late;
    late.connect_websocket(url());
    (void)late.initialize();
    EXPECT_NO_THROW(late.ping());
    EXPECT_TRUE(server_->is_running());
    late.disconnect();
}
