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
#pragma once

#include "ipcsrv/transport/detail/socket_transport_base.hpp"
#include <boost/asio/ip/tcp.hpp>

namespace ipcsrv::transport
{

// Types.

/**
 * Transport_adapter that listens on a TCP endpoint; the peer identity of each connection is
 * Network_peer_identity.  The endpoint's port may be 0, in which case the OS chooses one; local_endpoint() then
 * reports it (once listen() has succeeded).
 *
 * There's no authentication at this layer; a network peer's identity is only its address.  Use with a
 * server::Server::async_authenticate() override, or on a trusted network.
 */
class Tcp_transport :
  public Socket_transport_base<boost::asio::ip::tcp>
{
public:
  // Constructors/destructor.

  /**
   * Constructs in not-listening state.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param endpoint
   *        Endpoint to bind.
   */
  explicit Tcp_transport(flow::log::Logger* logger_ptr, const Endpoint& endpoint);

  /// Closes (see close()) if needed.
  ~Tcp_transport() override;

  // Methods.

  /**
   * The endpoint actually bound by the last successful listen(); the ctor arg until then.  May be invoked from
   * any thread once listen() has returned (e.g., after server::Server::start()).
   *
   * @return See above.
   */
  Endpoint local_endpoint() const;

protected:
  // Methods.

  /**
   * Implements Socket_transport_base API.
   * @param err_code
   *        See Socket_transport_base.
   * @return The ctor endpoint.
   */
  Endpoint prepare_listen(Error_code* err_code) override;

  /**
   * Implements Socket_transport_base API: memorizes the bound endpoint.
   * @param acceptor
   *        See Socket_transport_base.
   * @param err_code
   *        See Socket_transport_base.
   */
  void on_listening(const Acceptor& acceptor, Error_code* err_code) override;

  /**
   * Implements Socket_transport_base API: obtains the endpoint pair.
   * @param peer_socket
   *        See Socket_transport_base.
   * @param err_code
   *        See Socket_transport_base.
   * @return Network_peer_identity.
   */
  Peer_identity peer_identity(const Protocol_socket& peer_socket, Error_code* err_code) override;

  /// Implements Socket_transport_base API: no-op.
  void on_closed() override;

private:
  // Data.

  /// See ctor.
  const Endpoint m_endpoint;

  /// See local_endpoint().  Written in thread W by listen(), which server::Server::start() awaits.
  Endpoint m_bound_endpoint;
}; // class Tcp_transport

} // namespace ipcsrv::transport
