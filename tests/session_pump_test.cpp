#include "async_tls/net/memory_pipe.hpp"
#include "async_tls/stream/session_pump.hpp"
#include "async_tls/stream/stream_error.hpp"
#include "support/fake_session.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <string>

namespace{
std::string drain(memory_endpoint& ep){
    std::string out;
    char buf[256];
    while(true){
        auto n = ep.read_some(buf, sizeof(buf));
        if(!n || *n == 0) break;
        out.append(buf, *n);
    }
    return out;
}

void put(memory_endpoint& ep, std::string_view data){
    auto n = ep.write_some(data.data(), data.size());
    ASSERT_TRUE(n.has_value());
    ASSERT_EQ(*n, data.size());
}

fake_session established(){
    fake_session s(true);
    s.handshaking = false;
    s.outgoing.clear();
    return s;
}
}

TEST(session_pump, handshake_blocks_until_peer_replies){
    auto [local, peer] = make_memory_pipe();
    fake_session session(true);
    session_pump pump(*local, session);

    auto first = pump.complete_io();
    ASSERT_FALSE(first.has_value());
    EXPECT_TRUE(is_would_block(first.error()));
    EXPECT_EQ(drain(*peer), "H");

    put(*peer, "S");
    auto second = pump.complete_io();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->read, 1u);
    EXPECT_EQ(second->written, 0u);
    EXPECT_FALSE(session.is_handshaking());
}

TEST(session_pump, eof_while_handshaking){
    auto [local, peer] = make_memory_pipe();
    fake_session session(true);
    session_pump pump(*local, session);

    ASSERT_TRUE(peer->close().has_value());
    auto res = pump.complete_io();
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), error_code::from_stream(stream_error::handshake_eof));
    EXPECT_TRUE(pump.is_eof());
}

TEST(session_pump, eof_seeded_from_stream_skips_reading){
    auto [local, peer] = make_memory_pipe();
    fake_session session(true);
    session_pump pump(*local, session, true);

    auto res = pump.complete_io();
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), error_code::from_stream(stream_error::handshake_eof));
    EXPECT_EQ(session.read_tls_calls, 0u);
}

TEST(session_pump, protocol_error_is_invalid_data_and_sends_alert){
    auto [local, peer] = make_memory_pipe();
    fake_session session(true);
    session_pump pump(*local, session);

    ASSERT_FALSE(pump.complete_io().has_value());
    EXPECT_EQ(drain(*peer), "H");

    put(*peer, "X");
    auto res = pump.complete_io();
    ASSERT_FALSE(res.has_value());
    EXPECT_TRUE(is_invalid_data(res.error()));
    EXPECT_EQ(drain(*peer), std::string(1, fake_session::alert));
}

TEST(session_pump, transport_error_propagates_verbatim){
    auto [local, peer] = make_memory_pipe();
    fake_session session(true);
    local->inject_write_error(error_code::from_errno(EIO));
    session_pump pump(*local, session);

    auto res = pump.complete_io();
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), error_code::from_errno(EIO));
}

TEST(session_pump, only_accepted_bytes_are_consumed){
    pipe_options opt;
    opt.capacity = 3;
    auto [local, peer] = make_memory_pipe(opt);
    fake_session session = established();
    session_pump pump(*local, session);

    auto n = pump.write("abcdefgh", 8);
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(*n, 8u);
    EXPECT_EQ(session.outgoing.remaining(), 5u);

    EXPECT_EQ(drain(*peer), "abc");
    auto flushed = pump.flush();
    ASSERT_FALSE(flushed.has_value());
    EXPECT_TRUE(is_would_block(flushed.error()));
    EXPECT_EQ(drain(*peer), "def");

    ASSERT_TRUE(pump.flush().has_value());
    EXPECT_EQ(drain(*peer), "gh");
}

TEST(session_pump, write_blocked_before_any_progress_is_pending){
    auto [local, peer] = make_memory_pipe();
    fake_session session = established();
    session.max_plaintext_accept = 0;
    session.outgoing.append(std::string_view("queued"));
    local->inject_write_error(error_code::from_errno(EAGAIN));
    session_pump pump(*local, session);

    auto n = pump.write("x", 1);
    ASSERT_FALSE(n.has_value());
    EXPECT_TRUE(is_would_block(n.error()));
}

TEST(session_pump, write_without_progress_is_a_protocol_error){
    auto [local, peer] = make_memory_pipe();
    fake_session session = established();
    session.max_plaintext_accept = 0;
    session_pump pump(*local, session);

    auto n = pump.write("x", 1);
    ASSERT_FALSE(n.has_value());
    EXPECT_EQ(n.error(), error_code::from_errno(EPROTO));
}

TEST(session_pump, read_reports_pending_data_and_eof){
    auto [local, peer] = make_memory_pipe();
    fake_session session = established();
    session_pump pump(*local, session);
    char buf[16];

    auto empty = pump.read(buf, sizeof(buf));
    ASSERT_FALSE(empty.has_value());
    EXPECT_TRUE(is_would_block(empty.error()));

    put(*peer, "hello");
    auto got = pump.read(buf, sizeof(buf));
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(std::string(buf, *got), "hello");

    ASSERT_TRUE(peer->close().has_value());
    auto eof = pump.read(buf, sizeof(buf));
    ASSERT_TRUE(eof.has_value());
    EXPECT_EQ(*eof, 0u);
    EXPECT_TRUE(pump.is_eof());
}

TEST(session_pump, data_before_close_notify_is_returned_first){
    auto [local, peer] = make_memory_pipe();
    fake_session session = established();
    session_pump pump(*local, session);
    char buf[16];

    put(*peer, std::string("bye") + fake_session::close_notify);
    auto got = pump.read(buf, sizeof(buf));
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(std::string(buf, *got), "bye");

    auto closed = pump.read(buf, sizeof(buf));
    ASSERT_FALSE(closed.has_value());
    EXPECT_TRUE(is_connection_aborted(closed.error()));
}

TEST(session_pump, transport_error_after_copy_returns_the_copied_bytes){
    auto [local, peer] = make_memory_pipe();
    fake_session session = established();
    session_pump pump(*local, session);
    char buf[16];

    put(*peer, "abc");
    auto head = pump.read(buf, 2);
    ASSERT_TRUE(head.has_value());
    EXPECT_EQ(std::string(buf, *head), "ab");

    local->inject_read_error(error_code::from_errno(EIO));
    auto tail = pump.read(buf, sizeof(buf));
    ASSERT_TRUE(tail.has_value());
    EXPECT_EQ(std::string(buf, *tail), "c");

    auto failed = pump.read(buf, sizeof(buf));
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error(), error_code::from_errno(EIO));
}
