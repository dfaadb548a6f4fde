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

#include "ipcsrv/transport/transport_fwd.hpp"
#include "ipcsrv/util/process_credentials.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/noncopyable.hpp>

namespace ipcsrv::transport
{

// Types.

/// Identity of a network (TCP) peer: the connection's endpoint pair, as of acceptance.
struct Network_peer_identity
{
  // Data.

  /// The peer's (client's) address and port.
  boost::asio::ip::tcp::endpoint m_remote;

  /// Our (server's) address and port on which the connection was accepted.
  boost::asio::ip::tcp::endpoint m_local;
}; // struct Network_peer_identity

/**
 * Interface of a listening endpoint as seen by server::Server: something that can start listening, then
 * asynchronously produce connected peer sockets (each with the peer's identity), then close.  Implementations:
 * Local_stream_transport, Tcp_transport.  The server holds a pointer to this interface only.
 *
 * ### Thread safety, lifetime ###
 * All methods are to be invoked from the thread of the `Task_engine` given to listen() (thread W of the
 * server); all On_peer_func invocations occur in that thread too.  The Transport_adapter must outlive any
 * server::Server using it; and close() must run (server::Server::close() does this) before that `Task_engine`
 * is destroyed, as the listener's boost.asio objects are associated with it.
 *
 * ### Error model ###
 * listen() fails synchronously (e.g., bind failure: address in use, permission denied, bad path).  Once the
 * accept loop is going, per-connection hiccups (peer aborted mid-handshake, identity lookup failure) are logged
 * and skipped, as are network errors reported for the pending connection; resource exhaustion (too many open
 * files and the like) is retried after a short delay.  Only an error meaning the listening socket itself is
 * unusable is fatal to the listener: it is closed and On_peer_func is invoked once with the error.
 */
class Transport_adapter :
  private boost::noncopyable
{
public:
  // Types.

  /**
   * Short-hand for the accept-loop callback.  On success `err_code` is falsy, and `peer_socket` is an open,
   * connected socket (associated with the listen() `Task_engine`) that the callee now owns, while
   * `peer_identity` is that peer's identity.  On fatal listener error `err_code` is truthy; the other args are
   * then meaningless; and there will be no further calls.
   */
  using On_peer_func = Function<void (const Error_code& err_code,
                                      Peer_socket&& peer_socket, Peer_identity&& peer_identity)>;

  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Transport_adapter();

  // Methods.

  /**
   * Opens the listener, synchronously.  Upon successful return clients can connect (their connections queue up
   * in the kernel backlog until start_accept_loop()).
   *
   * @param task_engine
   *        The boost.asio event loop with which to associate the listener and subsequent peer sockets; this method
   *        must be called from its thread.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_LISTENER_ALREADY_STARTED (already listening), error::Code::S_INVALID_ARGUMENT
   *        (bad adapter configuration), system codes from open/bind/listen and associated file-system ops.
   */
  virtual void listen(Task_engine* task_engine, Error_code* err_code = 0) = 0;

  /**
   * Begins asynchronously accepting connections, invoking `on_peer_func` (from thread W) for each one.  Must
   * follow a successful listen().  Returns immediately.
   *
   * @param on_peer_func
   *        See On_peer_func.
   */
  virtual void start_accept_loop(On_peer_func&& on_peer_func) = 0;

  /**
   * Stops accepting, closes the listener and undoes any side effects of listen() (such as a file-system node).
   * Idempotent; no-op if not listening.  `on_peer_func` from start_accept_loop() will not be invoked after this
   * returns.
   */
  virtual void close() = 0;

  /**
   * Returns nickname, a brief string suitable for logging.  This is included in the output by the `ostream<<`
   * operator as well.
   *
   * @return See above.
   */
  const std::string& nickname() const;

protected:
  // Constructors.

  /**
   * Constructs base with the given nickname.
   *
   * @param nickname_str
   *        See nickname().
   */
  explicit Transport_adapter(std::string&& nickname_str);

private:
  // Data.

  /// See nickname().
  const std::string m_nickname;
}; // class Transport_adapter

} // namespace ipcsrv::transport
