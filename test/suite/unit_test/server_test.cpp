/* ipcsrv: Connection server
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */


#include "ipcsrv/server/server.hpp"
#include "ipcsrv/server/error.hpp"
#include "ipcsrv/transport/local_stream_transport.hpp"
#include "ipcsrv/transport/tcp_transport.hpp"
#include "ipcsrv/test/test_logger.hpp"
#include "ipcsrv/test/test_client.hpp"
#include "ipcsrv/test/test_common_util.hpp"
#include <flow/error/error.hpp>
#include <flow/util/util.hpp>
#include <gtest/gtest.h>
#include <boost/asio.hpp>
#include <boost/thread/future.hpp>
#include <sstream>

namespace ipcsrv::test
{

namespace
{

using server::Server;
using server::Server_config;
using server::Connection;
using server::Connection_mode;
using server::Message;
namespace error = server::error;
using flow::util::Lock_guard;
using flow::util::Mutex_non_recursive;

/// Server that records what happens to it, for the test thread to examine.
class Recording_server :
  public Server
{
public:
  /// Record of one finished session.
  struct Finished
  {
    Connection::Ptr m_conn;
    Error_code m_result;
  };

  explicit Recording_server(flow::log::Logger* logger_ptr, transport::Transport_adapter* transport,
                            const Server_config& config) :
    Server(logger_ptr, transport, config)
  {
    // Nothing else.
  }

  ~Recording_server() override
  {
    close(); // Before our hooks become unusable.
  }

  /// Set before start(): authentication decision.
  bool m_accept = true;

  /// Set before start(): if not empty, each message is answered with this prefix plus the message.
  std::string m_reply_prefix;

  /// Set before start(): how many times each message is answered (if #m_reply_prefix is not empty).
  size_t m_n_replies = 1;

  /// Set before start(): if `true`, the message hook does not report completion but saves it for take_held_hook().
  bool m_hold_message_hook = false;

  /// Completion handlers of the replies sent so far, in order.
  std::vector<Error_code> reply_results() const
  {
    Lock_guard<decltype(m_mutex)> lock(m_mutex);
    return m_reply_results;
  }

  /// Takes the most recent message hook completion held due to #m_hold_message_hook.
  util::Task take_held_hook()
  {
    Lock_guard<decltype(m_mutex)> lock(m_mutex);
    auto held_func = std::move(m_held_hook_func);
    m_held_hook_func = util::Task();
    return held_func;
  }

  std::vector<std::string> messages() const
  {
    Lock_guard<decltype(m_mutex)> lock(m_mutex);
    return m_messages;
  }

  std::vector<Finished> finished() const
  {
    Lock_guard<decltype(m_mutex)> lock(m_mutex);
    return m_finished;
  }

  std::vector<Error_code> rejected() const
  {
    Lock_guard<decltype(m_mutex)> lock(m_mutex);
    return m_rejected;
  }

  std::vector<Connection::Ptr> senders() const
  {
    Lock_guard<decltype(m_mutex)> lock(m_mutex);
    return m_senders;
  }

  std::vector<std::optional<util::Process_credentials>> authenticated_creds() const
  {
    Lock_guard<decltype(m_mutex)> lock(m_mutex);
    return m_authenticated_creds;
  }

  bool await_finished(size_t n_finished)
  {
    return wait_until([&]() { return finished().size() >= n_finished; });
  }

protected:
  void async_authenticate(const Connection::Ptr& conn, On_authenticated_func&& on_done_func) override
  {
    {
      Lock_guard<decltype(m_mutex)> lock(m_mutex);
      const auto creds = conn->peer_process_credentials();
      m_authenticated_creds.emplace_back(creds ? std::optional<util::Process_credentials>(*creds) : std::nullopt);
    }
    on_done_func(m_accept);
  }

  void async_handle_message(Message&& msg, util::Task&& on_done_func) override
  {
    const auto payload = msg.payload_str();
    {
      Lock_guard<decltype(m_mutex)> lock(m_mutex);
      m_messages.push_back(payload);
      m_senders.push_back(msg.sender());
    }
    for (size_t idx = 0; (!m_reply_prefix.empty()) && (idx != m_n_replies); ++idx)
    {
      async_send_value(msg.sender(), m_reply_prefix + payload, [this](const Error_code& err_code)
      {
        Lock_guard<decltype(m_mutex)> lock(m_mutex);
        m_reply_results.push_back(err_code);
      });
    }

    if (m_hold_message_hook)
    {
      Lock_guard<decltype(m_mutex)> lock(m_mutex);
      m_held_hook_func = std::move(on_done_func);
      return;
    }
    // else
    on_done_func();
  }

  void on_session_finished(const Connection::Ptr& conn, const Error_code& result) override
  {
    Lock_guard<decltype(m_mutex)> lock(m_mutex);
    m_finished.push_back(Finished{ conn, result });
  }

  void on_connection_rejected(const Connection::Ptr&, const Error_code& reason) override
  {
    Lock_guard<decltype(m_mutex)> lock(m_mutex);
    m_rejected.push_back(reason);
  }

private:
  mutable Mutex_non_recursive m_mutex;
  std::vector<std::string> m_messages;
  std::vector<Connection::Ptr> m_senders;
  std::vector<Finished> m_finished;
  std::vector<Error_code> m_rejected;
  std::vector<std::optional<util::Process_credentials>> m_authenticated_creds;
  std::vector<Error_code> m_reply_results;
  util::Task m_held_hook_func;
}; // class Recording_server

/// Local-socket transport plus a Recording_server on it, with the given config.
struct Local_fixture
{
  explicit Local_fixture(const std::string& tag, const Server_config& config = Server_config()) :
    m_path(unique_socket_path(tag)),
    m_transport(&m_logger, m_path),
    m_server(&m_logger, &m_transport, config)
  {
    // Nothing else.
  }

  Test_logger m_logger;
  const fs::path m_path;
  transport::Local_stream_transport m_transport;
  Recording_server m_server;
};

std::string cmd(server::Command command)
{
  return server::command_header(command);
}

} // Anonymous namespace.

TEST(Server_test, Text_data_one_message)
{
  Local_fixture fix("text");
  fix.m_server.start();

  Test_client client(fix.m_path);
  EXPECT_FALSE(client.send("hello "));
  EXPECT_FALSE(client.send("world"));
  client.end_sending();
  EXPECT_EQ(client.receive_all(), ""); // Server closes; says nothing.

  ASSERT_TRUE(fix.m_server.await_finished(1));
  EXPECT_EQ(fix.m_server.messages(), std::vector<std::string>{ "hello world" });
  EXPECT_FALSE(fix.m_server.finished().front().m_result);
  EXPECT_EQ(fix.m_server.session_count(), 0u);
}

TEST(Server_test, Text_data_reply)
{
  Local_fixture fix("reply");
  fix.m_server.m_reply_prefix = "re:";
  fix.m_server.start();

  Test_client client(fix.m_path);
  EXPECT_FALSE(client.send("question"));
  client.end_sending();
  EXPECT_EQ(client.receive_all(), "re:question");

  ASSERT_TRUE(fix.m_server.await_finished(1));
  EXPECT_FALSE(fix.m_server.finished().front().m_result);
}

TEST(Server_test, Second_send_refused)
{
  Local_fixture fix("twosends");
  fix.m_server.m_reply_prefix = "re:";
  fix.m_server.m_n_replies = 2;
  fix.m_server.start();

  Test_client client(fix.m_path);
  EXPECT_FALSE(client.send("q"));
  client.end_sending();
  EXPECT_EQ(client.receive_all(), "re:q"); // The first reply ended the outbound direction.

  ASSERT_TRUE(fix.m_server.await_finished(1));
  const auto results = fix.m_server.reply_results();
  ASSERT_EQ(results.size(), 2u);
  EXPECT_FALSE(results[0]);
  EXPECT_EQ(results[1], error::Code::S_SENDS_FINISHED_CANNOT_SEND);
  EXPECT_FALSE(fix.m_server.finished().front().m_result);
}

TEST(Server_test, Text_data_empty_connection)
{
  Local_fixture fix("empty");
  fix.m_server.start();

  Test_client client(fix.m_path);
  client.end_sending();
  EXPECT_EQ(client.receive_all(), "");

  ASSERT_TRUE(fix.m_server.await_finished(1));
  EXPECT_TRUE(fix.m_server.messages().empty());
  EXPECT_FALSE(fix.m_server.finished().front().m_result);
}

TEST(Server_test, Stream_data_chunks)
{
  Server_config config;
  config.m_default_mode = Connection_mode::S_STREAM_DATA;
  config.m_chunk_size = 4;
  Local_fixture fix("stream", config);
  fix.m_server.start();

  const std::string payload = "abcdefghijklmnopqrstuvwxyz";
  Test_client client(fix.m_path);
  EXPECT_FALSE(client.send(payload));
  client.end_sending();
  client.receive_all();

  ASSERT_TRUE(fix.m_server.await_finished(1));
  const auto messages = fix.m_server.messages();
  EXPECT_GE(messages.size(), (payload.size() + 3) / 4);
  std::string reassembled;
  for (const auto& msg : messages)
  {
    EXPECT_FALSE(msg.empty());
    EXPECT_LE(msg.size(), 4u);
    reassembled += msg;
  }
  EXPECT_EQ(reassembled, payload); // Order preserved.
}

TEST(Server_test, Authentication_rejected)
{
  Local_fixture fix("auth");
  fix.m_server.m_accept = false;
  fix.m_server.start();

  Test_client client(fix.m_path);
  client.send("should never be delivered"); // May fail, if the server has already hung up.
  client.receive_all();

  ASSERT_TRUE(fix.m_server.await_finished(1));
  EXPECT_TRUE(fix.m_server.messages().empty());
  EXPECT_EQ(fix.m_server.finished().front().m_result, error::Code::S_AUTHENTICATION_REJECTED);
}

TEST(Server_test, Peer_credentials)
{
  Local_fixture fix("creds");
  fix.m_server.start();

  Test_client client(fix.m_path);
  client.end_sending();
  client.receive_all();

  ASSERT_TRUE(fix.m_server.await_finished(1));
  const auto creds = fix.m_server.authenticated_creds();
  ASSERT_EQ(creds.size(), 1u);
  ASSERT_TRUE(creds.front());
  EXPECT_EQ(*creds.front(), get_process_creds()); // The client is this process.

  const auto conn = fix.m_server.finished().front().m_conn;
  ASSERT_TRUE(conn->peer_process_credentials());
  EXPECT_FALSE(conn->peer_network_identity());
  EXPECT_LE(conn->created_at(), conn->updated_at());
}

TEST(Server_test, Set_stream_switches_mode)
{
  Server_config config;
  config.m_chunk_size = 16;
  Local_fixture fix("setstream", config);
  fix.m_server.start();

  const std::string payload(40, 'x');
  Test_client client(fix.m_path);
  EXPECT_FALSE(client.send(cmd(server::Command::S_SET_STREAM) + payload));
  client.end_sending();
  client.receive_all();

  ASSERT_TRUE(fix.m_server.await_finished(1));
  const auto messages = fix.m_server.messages();
  EXPECT_GE(messages.size(), 3u); // TEXT_DATA would have yielded exactly 1.
  std::string reassembled;
  for (const auto& msg : messages)
  {
    EXPECT_LE(msg.size(), 16u);
    reassembled += msg;
  }
  EXPECT_EQ(reassembled, payload); // Header consumed, not delivered.
  EXPECT_EQ(fix.m_server.finished().front().m_conn->mode(), Connection_mode::S_STREAM_DATA);
}

TEST(Server_test, Set_data_switches_mode)
{
  Server_config config;
  config.m_default_mode = Connection_mode::S_STREAM_DATA;
  config.m_chunk_size = 16;
  Local_fixture fix("setdata", config);
  fix.m_server.start();

  const std::string payload(40, 'y');
  Test_client client(fix.m_path);
  EXPECT_FALSE(client.send(cmd(server::Command::S_SET_DATA) + payload));
  client.end_sending();
  client.receive_all();

  ASSERT_TRUE(fix.m_server.await_finished(1));
  EXPECT_EQ(fix.m_server.messages(), std::vector<std::string>{ payload });
}

TEST(Server_test, Ping_pong)
{
  Local_fixture fix("ping");
  fix.m_server.start();

  Test_client client(fix.m_path);
  EXPECT_FALSE(client.send(cmd(server::Command::S_PING)));
  client.end_sending();
  EXPECT_EQ(client.receive_all(), cmd(server::Command::S_PONG));

  ASSERT_TRUE(fix.m_server.await_finished(1));
  EXPECT_TRUE(fix.m_server.messages().empty());
  EXPECT_FALSE(fix.m_server.finished().front().m_result);
}

TEST(Server_test, Pong_not_answered)
{
  Local_fixture fix("pong");
  fix.m_server.start();

  Test_client client(fix.m_path);
  EXPECT_FALSE(client.send(cmd(server::Command::S_PONG)));
  client.end_sending();
  EXPECT_EQ(client.receive_all(), "");

  ASSERT_TRUE(fix.m_server.await_finished(1));
  EXPECT_TRUE(fix.m_server.messages().empty());
}

TEST(Server_test, Read_limit)
{
  Server_config config;
  config.m_read_limit = 10;

  {
    Local_fixture fix("limitok", config);
    fix.m_server.start();
    Test_client client(fix.m_path);
    EXPECT_FALSE(client.send("0123456789"));
    client.end_sending();
    client.receive_all();
    ASSERT_TRUE(fix.m_server.await_finished(1));
    EXPECT_EQ(fix.m_server.messages(), std::vector<std::string>{ "0123456789" });
    EXPECT_FALSE(fix.m_server.finished().front().m_result);
  }

  {
    Local_fixture fix("limitbad", config);
    fix.m_server.start();
    Test_client client(fix.m_path);
    EXPECT_FALSE(client.send("0123456789A")); // And do not end sending: the server must act on its own.
    client.receive_all();
    ASSERT_TRUE(fix.m_server.await_finished(1));
    EXPECT_TRUE(fix.m_server.messages().empty());
    EXPECT_EQ(fix.m_server.finished().front().m_result, error::Code::S_MESSAGE_LIMIT_EXCEEDED);
  }
}

TEST(Server_test, Capacity)
{
  Server_config config;
  config.m_max_connections = 2;
  Local_fixture fix("capacity", config);
  fix.m_server.start();

  // Connections that stay open (never end sending) and so occupy their slots.
  std::vector<std::unique_ptr<Test_client>> clients;
  for (size_t idx = 0; idx != 3; ++idx)
  {
    clients.emplace_back(new Test_client(fix.m_path));
    clients.back()->send("partial");
  }

  ASSERT_TRUE(wait_until([&]() { return fix.m_server.rejected().size() == 1; }));
  EXPECT_EQ(fix.m_server.session_count(), 2u);
  EXPECT_EQ(fix.m_server.rejected().front(), error::Code::S_POOL_CAPACITY_EXCEEDED);

  // Finishing frees the slots.
  for (auto& client : clients)
  {
    client->end_sending();
  }
  ASSERT_TRUE(wait_until([&]() { return fix.m_server.session_count() == 0; }));

  Test_client late_client1(fix.m_path);
  Test_client late_client2(fix.m_path);
  late_client1.send("late");
  late_client2.send("late");
  ASSERT_TRUE(wait_until([&]() { return fix.m_server.session_count() == 2; }));
  EXPECT_EQ(fix.m_server.rejected().size(), 1u);
}

TEST(Server_test, Close_cancels_sessions)
{
  const size_t N_CLIENTS = 3;
  Local_fixture fix("cancel");
  fix.m_server.start();

  std::vector<std::unique_ptr<Test_client>> clients;
  for (size_t idx = 0; idx != N_CLIENTS; ++idx)
  {
    clients.emplace_back(new Test_client(fix.m_path));
    clients.back()->send("blocked mid-message");
  }
  ASSERT_TRUE(wait_until([&]() { return fix.m_server.session_count() == N_CLIENTS; }));

  fix.m_server.close();

  EXPECT_EQ(fix.m_server.session_count(), 0u);
  const auto finished = fix.m_server.finished();
  ASSERT_EQ(finished.size(), N_CLIENTS);
  for (const auto& fin : finished)
  {
    EXPECT_EQ(fin.m_result, error::Code::S_SESSION_CANCELED);
  }
  EXPECT_TRUE(fix.m_server.messages().empty());
  EXPECT_FALSE(fs::exists(fix.m_path)); // Listener torn down.

  for (auto& client : clients)
  {
    client->receive_all(); // Hung up on.
  }

  fix.m_server.close(); // Idempotent.
}

TEST(Server_test, Close_cancels_held_message_hook)
{
  Server_config config;
  config.m_default_mode = Connection_mode::S_STREAM_DATA;
  Local_fixture fix("held", config);
  fix.m_server.m_hold_message_hook = true;
  fix.m_server.start();

  Test_client client(fix.m_path);
  EXPECT_FALSE(client.send("first"));
  ASSERT_TRUE(wait_until([&]() { return !fix.m_server.messages().empty(); }));
  EXPECT_FALSE(client.send("second")); // Not read: the session awaits the hook.

  fix.m_server.close();

  const auto finished = fix.m_server.finished();
  ASSERT_EQ(finished.size(), 1u);
  EXPECT_EQ(finished.front().m_result, error::Code::S_SESSION_CANCELED);
  EXPECT_EQ(fix.m_server.session_count(), 0u);

  // Reporting completion late is harmless and leads to nothing further.
  auto held_func = fix.m_server.take_held_hook();
  ASSERT_TRUE(held_func);
  held_func();

  EXPECT_EQ(fix.m_server.messages().size(), 1u);
  EXPECT_EQ(fix.m_server.finished().size(), 1u);
  client.receive_all(); // Hung up on.
}

TEST(Server_test, Send_after_close)
{
  Local_fixture fix("afterclose");
  fix.m_server.start();

  Test_client client(fix.m_path);
  client.end_sending();
  client.receive_all();
  ASSERT_TRUE(fix.m_server.await_finished(1));
  const auto conn = fix.m_server.finished().front().m_conn;

  fix.m_server.close();

  // Completion is reported before async_send() returns, once per target.
  std::vector<Error_code> results;
  fix.m_server.async_send(conn, util::Blob_const("late", 4),
                          [&](const Error_code& err_code) { results.push_back(err_code); });
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results.front(), error::Code::S_STALE_CONNECTION);

  results.clear();
  fix.m_server.async_send_value(std::vector<Connection::Ptr>{ conn, Connection::Ptr(), conn }, "late",
                                [&](const Error_code& err_code) { results.push_back(err_code); });
  ASSERT_EQ(results.size(), 3u);
  for (const auto& result : results)
  {
    EXPECT_EQ(result, error::Code::S_STALE_CONNECTION);
  }

  fix.m_server.async_send(conn, util::Blob_const("late", 4)); // No handler: fine too.
}

TEST(Server_test, Send_to_stale_connection)
{
  Local_fixture fix("stale");
  fix.m_server.start();

  Test_client client(fix.m_path);
  client.end_sending();
  client.receive_all();
  ASSERT_TRUE(fix.m_server.await_finished(1));

  using boost::promise;

  const auto conn = fix.m_server.finished().front().m_conn;
  promise<Error_code> result_promise;
  fix.m_server.async_send(conn, util::Blob_const("late", 4),
                          [&](const Error_code& err_code) { result_promise.set_value(err_code); });
  EXPECT_EQ(result_promise.get_future().get(), error::Code::S_STALE_CONNECTION);

  promise<Error_code> null_result_promise;
  fix.m_server.async_send(Connection::Ptr(), util::Blob_const("late", 4),
                          [&](const Error_code& err_code) { null_result_promise.set_value(err_code); });
  EXPECT_EQ(null_result_promise.get_future().get(), error::Code::S_STALE_CONNECTION);
}

TEST(Server_test, Persistent_mode)
{
  Server_config config;
  config.m_default_mode = Connection_mode::S_PERSISTENT;
  Local_fixture fix("persistent", config);
  fix.m_server.m_reply_prefix = "re:";
  fix.m_server.start();

  Test_client client(fix.m_path);

  // Replies do not end the outbound direction; commands are recognized after payload too.
  EXPECT_FALSE(client.send("one"));
  EXPECT_EQ(client.receive_exactly(6), "re:one");
  EXPECT_FALSE(client.send(cmd(server::Command::S_PING)));
  EXPECT_EQ(client.receive_exactly(server::S_COMMAND_HEADER_SIZE), cmd(server::Command::S_PONG));
  EXPECT_FALSE(client.send("two"));
  EXPECT_EQ(client.receive_exactly(6), "re:two");

  client.end_sending();
  EXPECT_EQ(client.receive_all(), "");

  ASSERT_TRUE(fix.m_server.await_finished(1));
  EXPECT_EQ(fix.m_server.messages(), (std::vector<std::string>{ "one", "two" }));
  EXPECT_FALSE(fix.m_server.finished().front().m_result);
}

TEST(Server_test, Broadcast)
{
  Server_config config;
  config.m_default_mode = Connection_mode::S_PERSISTENT;
  Local_fixture fix("broadcast", config);
  fix.m_server.start();

  Test_client client1(fix.m_path);
  Test_client client2(fix.m_path);
  // Each says hello, so that we have its Connection.
  EXPECT_FALSE(client1.send("a"));
  EXPECT_FALSE(client2.send("b"));
  ASSERT_TRUE(wait_until([&]() { return fix.m_server.senders().size() == 2; }));

  Mutex_non_recursive mutex;
  std::vector<Error_code> results;
  fix.m_server.async_send_value(fix.m_server.senders(), 42, [&](const Error_code& err_code)
  {
    Lock_guard<decltype(mutex)> lock(mutex);
    results.push_back(err_code);
  });

  EXPECT_EQ(client1.receive_exactly(2), "42");
  EXPECT_EQ(client2.receive_exactly(2), "42");
  ASSERT_TRUE(wait_until([&]() { Lock_guard<decltype(mutex)> lock(mutex); return results.size() == 2; }));
  for (const auto& result : results)
  {
    EXPECT_FALSE(result);
  }
  EXPECT_EQ(fix.m_server.session_count(), 2u);
}

TEST(Server_test, Start_errors)
{
  {
    Server_config config;
    config.m_chunk_size = 0;
    Local_fixture fix("badcfg", config);
    Error_code err_code;
    fix.m_server.start(&err_code);
    EXPECT_EQ(err_code, error::Code::S_INVALID_ARGUMENT);
    EXPECT_FALSE(fs::exists(fix.m_path));
  }

  {
    Local_fixture fix("twice");
    fix.m_server.start();
    Error_code err_code;
    fix.m_server.start(&err_code);
    EXPECT_EQ(err_code, error::Code::S_SERVER_ALREADY_STARTED);

    // Exception form.
    EXPECT_THROW(fix.m_server.start(), flow::error::Runtime_error);
  }

  {
    Test_logger logger;
    const auto path = unique_socket_path("dir");
    fs::create_directory(path);
    transport::Local_stream_transport transport(&logger, path);
    Recording_server server(&logger, &transport, Server_config());
    Error_code err_code;
    server.start(&err_code);
    EXPECT_EQ(err_code, boost::system::errc::make_error_code(boost::system::errc::is_a_directory));
    server.close();
    fs::remove(path);
  }
}

TEST(Server_test, Tcp_text_data)
{
  using boost::asio::ip::tcp;
  using boost::asio::ip::address_v4;

  Test_logger logger;
  transport::Tcp_transport transport(&logger, tcp::endpoint(address_v4::loopback(), 0));
  Recording_server server(&logger, &transport, Server_config());
  server.m_reply_prefix = "tcp:";
  server.start();

  Test_client client(transport.local_endpoint());
  EXPECT_FALSE(client.send("over the network"));
  client.end_sending();
  EXPECT_EQ(client.receive_all(), "tcp:over the network");

  ASSERT_TRUE(server.await_finished(1));
  const auto conn = server.finished().front().m_conn;
  const auto net_identity = conn->peer_network_identity();
  ASSERT_TRUE(net_identity);
  EXPECT_EQ(net_identity->m_local, transport.local_endpoint());
  EXPECT_FALSE(conn->peer_process_credentials());
}

TEST(Server_test, Logs_lifecycle)
{
  std::ostringstream log_os;
  {
    Test_logger logger(flow::log::Sev::S_INFO, log_os);
    const auto path = unique_socket_path("logs");
    transport::Local_stream_transport transport(&logger, path);
    Recording_server server(&logger, &transport, Server_config());
    server.start();
    server.close();
  }
  const auto log = log_os.str();
  EXPECT_NE(log.find("Started; accepting connections"), std::string::npos);
  EXPECT_NE(log.find("Closed."), std::string::npos);
}

TEST(Server_test, Logs_peer_command_line)
{
  std::ostringstream log_os;
  {
    Test_logger logger(flow::log::Sev::S_TRACE, log_os);
    const auto path = unique_socket_path("cmdline");
    transport::Local_stream_transport transport(&logger, path);
    Recording_server server(&logger, &transport, Server_config());
    server.start();

    Test_client client(path);
    client.end_sending();
    client.receive_all();
    ASSERT_TRUE(server.await_finished(1));
    server.close();
  }
  const auto log = log_os.str();
  const auto pos = log.find("]; invoked as [");
  ASSERT_NE(pos, std::string::npos);
  EXPECT_NE(log.compare(pos, 17, "]; invoked as [?:"), 0); // The peer (this process) was still there to ask.
}

} // namespace ipcsrv::test
