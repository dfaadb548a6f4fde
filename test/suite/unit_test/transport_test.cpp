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


#include "ipcsrv/transport/local_stream_transport.hpp"
#include "ipcsrv/transport/tcp_transport.hpp"
#include "ipcsrv/transport/error.hpp"
#include "ipcsrv/test/test_logger.hpp"
#include "ipcsrv/test/test_client.hpp"
#include "ipcsrv/test/test_common_util.hpp"
#include <flow/async/single_thread_task_loop.hpp>
#include <gtest/gtest.h>
#include <boost/filesystem/fstream.hpp>
#include <sys/stat.h>
#include <future>

namespace ipcsrv::test
{

namespace
{

using flow::async::Synchronicity;

/// Runs a transport in its own thread, as server::Server would; executes listen() and close() in that thread.
class Transport_runner
{
public:
  explicit Transport_runner(flow::log::Logger* logger_ptr, transport::Transport_adapter* transport) :
    m_transport(transport),
    m_loop(logger_ptr, "transp_test")
  {
    m_loop.start();
  }

  ~Transport_runner()
  {
    close();
    m_loop.stop();
  }

  Error_code listen()
  {
    Error_code err_code;
    m_loop.post([&]() { m_transport->listen(m_loop.task_engine().get(), &err_code); },
                Synchronicity::S_ASYNC_AND_AWAIT_CONCURRENT_COMPLETION);
    return err_code;
  }

  /// Starts the accept loop; the first peer's identity is available from the returned future.
  std::future<transport::Peer_identity> accept_one()
  {
    auto identity_future = m_identity_promise.get_future();
    m_loop.post([&]()
    {
      m_transport->start_accept_loop([this](const Error_code& err_code, transport::Peer_socket&& peer_socket,
                                            transport::Peer_identity&& identity)
      {
        EXPECT_FALSE(err_code);
        if ((!err_code) && (!m_accepted))
        {
          m_accepted = true;
          m_peer_socket.emplace(std::move(peer_socket));
          m_identity_promise.set_value(std::move(identity));
        }
      });
    }, Synchronicity::S_ASYNC_AND_AWAIT_CONCURRENT_COMPLETION);
    return identity_future;
  }

  void close()
  {
    m_loop.post([&]()
    {
      m_transport->close();
      m_peer_socket.reset();
    }, Synchronicity::S_ASYNC_AND_AWAIT_CONCURRENT_COMPLETION);
  }

private:
  transport::Transport_adapter* const m_transport;
  flow::async::Single_thread_task_loop m_loop;
  std::promise<transport::Peer_identity> m_identity_promise;
  bool m_accepted = false;
  std::optional<transport::Peer_socket> m_peer_socket;
}; // class Transport_runner

} // Anonymous namespace.

TEST(Transport_test, Local_listen_and_close)
{
  Test_logger logger;
  const auto path = unique_socket_path("listen");
  transport::Local_stream_transport transport(&logger, path);
  EXPECT_EQ(transport.path(), path);

  {
    Transport_runner runner(&logger, &transport);
    ASSERT_FALSE(runner.listen());

    // Node exists as a socket, accessible only to us.
    struct ::stat st;
    ASSERT_EQ(::stat(path.c_str(), &st), 0);
    EXPECT_TRUE(S_ISSOCK(st.st_mode));
    EXPECT_EQ(st.st_mode & 0777, 0600u);

    EXPECT_EQ(runner.listen(), transport::error::Code::S_LISTENER_ALREADY_STARTED);

    auto identity_future = runner.accept_one();
    Test_client client(path);
    ASSERT_EQ(identity_future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    const auto identity = identity_future.get();
    const auto creds = std::get_if<util::Process_credentials>(&identity);
    ASSERT_TRUE(creds);
    EXPECT_EQ(*creds, get_process_creds());

    runner.close();
    EXPECT_FALSE(fs::exists(path)); // Node removed on close.
  }
}

TEST(Transport_test, Local_permissions)
{
  Test_logger logger;
  const auto path = unique_socket_path("perms");
  transport::Local_stream_transport transport(&logger, path, util::Permissions_level::S_UNRESTRICTED);
  Transport_runner runner(&logger, &transport);
  ASSERT_FALSE(runner.listen());

  struct ::stat st;
  ASSERT_EQ(::stat(path.c_str(), &st), 0);
  EXPECT_EQ(st.st_mode & 0777, 0666u);
}

TEST(Transport_test, Local_replaces_stale_node)
{
  Test_logger logger;
  const auto path = unique_socket_path("stale");
  {
    fs::ofstream stale(path);
    stale << "left behind";
  }
  ASSERT_TRUE(fs::exists(path));

  transport::Local_stream_transport transport(&logger, path);
  Transport_runner runner(&logger, &transport);
  ASSERT_FALSE(runner.listen());

  struct ::stat st;
  ASSERT_EQ(::stat(path.c_str(), &st), 0);
  EXPECT_TRUE(S_ISSOCK(st.st_mode));
}

TEST(Transport_test, Local_bad_paths)
{
  Test_logger logger;

  {
    transport::Local_stream_transport transport(&logger, fs::path());
    Transport_runner runner(&logger, &transport);
    EXPECT_EQ(runner.listen(), transport::error::Code::S_INVALID_ARGUMENT);
  }

  {
    const auto path = unique_socket_path("dir");
    fs::create_directory(path);
    transport::Local_stream_transport transport(&logger, path);
    Transport_runner runner(&logger, &transport);
    EXPECT_EQ(runner.listen(), boost::system::errc::make_error_code(boost::system::errc::is_a_directory));
    EXPECT_TRUE(fs::is_directory(path)); // Untouched.
    fs::remove(path);
  }

  {
    // Relative path lands in the run directory.
    transport::Local_stream_transport transport(&logger, "ipcsrv_relative.sock");
    EXPECT_EQ(transport.path(), fs::path("/var/run/ipcsrv_relative.sock"));
  }
}

TEST(Transport_test, Tcp_listen_and_identity)
{
  using boost::asio::ip::tcp;
  using boost::asio::ip::address_v4;

  Test_logger logger;
  transport::Tcp_transport transport(&logger, tcp::endpoint(address_v4::loopback(), 0));
  Transport_runner runner(&logger, &transport);
  ASSERT_FALSE(runner.listen());

  const auto local_endpoint = transport.local_endpoint();
  EXPECT_NE(local_endpoint.port(), 0);
  EXPECT_EQ(local_endpoint.address(), address_v4::loopback());

  auto identity_future = runner.accept_one();
  Test_client client(local_endpoint);
  ASSERT_EQ(identity_future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  const auto identity = identity_future.get();
  const auto net_identity = std::get_if<transport::Network_peer_identity>(&identity);
  ASSERT_TRUE(net_identity);
  EXPECT_EQ(net_identity->m_local, local_endpoint);
  EXPECT_TRUE(net_identity->m_remote.address().is_loopback());
}

} // namespace ipcsrv::test
