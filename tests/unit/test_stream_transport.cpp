#include <gtest/gtest.h>
#include "capwire/transport/stream_transport.hpp"
#include "capwire/error.hpp"
#include <unistd.h>
#include <thread>

using namespace capwire;

namespace {

const std::vector<std::string> kEchoArgs = {
    "-c", "while IFS= read -r l; do printf 'Echo: %s\\n' \"$l\"; done"
};

} // namespace

TEST(StreamTransport, SpawnEchoRoundTrip) {
    auto transport = StreamTransport::spawn("/bin/sh", kEchoArgs);
    ASSERT_TRUE(transport->is_connected());
    EXPECT_GT(transport->pid(), 0);
    EXPECT_EQ(transport->transport_type(), "stdio");

    const std::string frame = R"({"jsonrpc":"2.0","method":"ping","id":1})";
    transport->send(frame);
    auto line = transport->receive();
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(*line, "Echo: " + frame);

    auto stats = transport->stats();
    EXPECT_EQ(stats.messages_sent, 1u);
    EXPECT_EQ(stats.messages_received, 1u);
    EXPECT_EQ(stats.bytes_sent, frame.size());
    EXPECT_EQ(stats.bytes_received, line->size());
    EXPECT_TRUE(stats.connection_time.has_value());

    transport->close();
    EXPECT_FALSE(transport->is_connected());
}

TEST(StreamTransport, SpawnFailure) {
    try {
        (void)StreamTransport::spawn("/nonexistent/capwire-peer");
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.kind(), TransportError::Kind::ConnectionFailed);
    }
}

TEST(StreamTransport, CloseTwice) {
    auto transport = StreamTransport::spawn("/bin/cat");
    transport->close();
    EXPECT_NO_THROW(transport->close());
    EXPECT_THROW(transport->send("late"), TransportError);
}

TEST(StreamTransport, CloseUnblocksReceive) {
    auto transport = StreamTransport::spawn("/bin/cat");
    std::optional<std::string> got{"sentinel"};
    std::thread reader([&] { got = transport->receive(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    transport->close();
    reader.join();
    EXPECT_FALSE(got.has_value());
}

TEST(StreamTransport, KillChild) {
    auto transport = StreamTransport::spawn("/bin/cat");
    transport->kill();
    EXPECT_FALSE(transport->is_connected());
}

TEST(StreamTransport, UnattachedIsNotReady) {
    StreamTransport transport;
    EXPECT_FALSE(transport.is_connected());
    try {
        transport.send("x");
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.kind(), TransportError::Kind::NotReady);
    }
    EXPECT_THROW((void)transport.receive(), TransportError);
    EXPECT_THROW(transport.kill(), TransportError);
}

TEST(StreamTransport, PipePairSplitsLines) {
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    StreamTransport reader(fds[0], -1);

    const std::string chunk = "first\r\n\nsecond\nthird";
    ASSERT_EQ(::write(fds[1], chunk.data(), chunk.size()), static_cast<ssize_t>(chunk.size()));
    ::close(fds[1]);

    EXPECT_EQ(reader.receive(), std::optional<std::string>("first"));
    EXPECT_EQ(reader.receive(), std::optional<std::string>("second"));
    EXPECT_EQ(reader.receive(), std::optional<std::string>("third"));
    EXPECT_FALSE(reader.receive().has_value());
}

TEST(StreamTransport, ByteCountsExcludeDelimiter) {
    int a_to_b[2];
    ASSERT_EQ(::pipe(a_to_b), 0);
    StreamTransport sender(-1, a_to_b[1]);
    StreamTransport receiver(a_to_b[0], -1);

    sender.send("abc");
    sender.send(R"({"id":2})");
    ASSERT_TRUE(receiver.receive().has_value());
    ASSERT_TRUE(receiver.receive().has_value());

    EXPECT_EQ(sender.stats().bytes_sent, 11u);
    EXPECT_EQ(receiver.stats().bytes_received, sender.stats().bytes_sent);
    EXPECT_EQ(receiver.stats().messages_received, 2u);
}

TEST(StreamTransport, PeerExitEndsStream) {
    auto transport = StreamTransport::spawn("/bin/sh", {"-c", "echo one; exit 0"});
    auto line = transport->receive();
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(*line, "one");
    EXPECT_FALSE(transport->receive().has_value());
}
