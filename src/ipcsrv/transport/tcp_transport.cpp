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

/// @file
#include "ipcsrv/transport/tcp_transport.hpp"
#include <flow/common.hpp>

namespace ipcsrv::transport
{

// Implementations.

Tcp_transport::Tcp_transport(flow::log::Logger* logger_ptr, const Endpoint& endpoint) :
  Socket_transport_base(logger_ptr, flow::util::ostream_op_string("tcp:", endpoint)),
  m_endpoint(endpoint),
  m_bound_endpoint(endpoint)
{
  // That's it.
}

Tcp_transport::~Tcp_transport()
{
  close();
}

Tcp_transport::Endpoint Tcp_transport::local_endpoint() const
{
  return m_bound_endpoint;
}

Tcp_transport::Endpoint Tcp_transport::prepare_listen(Error_code* err_code)
{
  err_code->clear();
  return m_endpoint;
}

void Tcp_transport::on_listening(const Acceptor& acceptor, Error_code* err_code)
{
  // The requested endpoint may have had port 0; ask the kernel what it chose.
  const auto bound_endpoint = acceptor.local_endpoint(*err_code);
  if (*err_code)
  {
    const auto& sys_err_code = *err_code;
    FLOW_LOG_WARNING("Transport [" << *this << "]: Could not obtain bound endpoint.  Details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    return;
  }
  // else
  m_bound_endpoint = bound_endpoint;
}

Peer_identity Tcp_transport::peer_identity(const Protocol_socket& peer_socket, Error_code* err_code)
{
  Network_peer_identity identity;
  identity.m_remote = peer_socket.remote_endpoint(*err_code);
  if (!*err_code)
  {
    identity.m_local = peer_socket.local_endpoint(*err_code);
  }
  return identity;
}

void Tcp_transport::on_closed()
{
  // Nothing to undo.
}

} // namespace ipcsrv::transport
