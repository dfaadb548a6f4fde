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


#include "ipcsrv/test/test_client.hpp"
#include <gtest/gtest.h>

namespace ipcsrv::test
{

Test_client::Test_client(const fs::path& path) :
  m_socket(m_io)
{
  Error_code sys_err_code;
  m_socket.connect(boost::asio::generic::stream_protocol::endpoint
                     (boost::asio::local::stream_protocol::endpoint(path.string())),
                   sys_err_code);
  EXPECT_FALSE(sys_err_code) << "Connect to [" << path << "] failed: [" << sys_err_code.message() << "].";
}

Test_client::Test_client(const boost::asio::ip::tcp::endpoint& endpoint) :
  m_socket(m_io)
{
  Error_code sys_err_code;
  m_socket.connect(boost::asio::generic::stream_protocol::endpoint(endpoint), sys_err_code);
  EXPECT_FALSE(sys_err_code) << "Connect to [" << endpoint << "] failed: [" << sys_err_code.message() << "].";
}

Error_code Test_client::send(const std::string& bytes)
{
  Error_code sys_err_code;
  boost::asio::write(m_socket, boost::asio::buffer(bytes), sys_err_code);
  return sys_err_code;
}

Error_code Test_client::end_sending()
{
  Error_code sys_err_code;
  m_socket.shutdown(boost::asio::socket_base::shutdown_send, sys_err_code);
  return sys_err_code;
}

std::string Test_client::receive_exactly(size_t n)
{
  std::string bytes(n, '\0');
  Error_code sys_err_code;
  const auto n_rcvd = boost::asio::read(m_socket, boost::asio::buffer(bytes), sys_err_code);
  bytes.resize(n_rcvd);
  return bytes;
}

std::string Test_client::receive_all()
{
  std::string bytes;
  Error_code sys_err_code;
  boost::asio::read(m_socket, boost::asio::dynamic_buffer(bytes), sys_err_code);
  EXPECT_TRUE((sys_err_code == boost::asio::error::eof) || (sys_err_code == boost::asio::error::connection_reset))
    << "Unexpected read error [" << sys_err_code << "] [" << sys_err_code.message() << "].";
  return bytes;
}

void Test_client::close()
{
  Error_code sys_err_code;
  m_socket.close(sys_err_code);
}

} // namespace ipcsrv::test
