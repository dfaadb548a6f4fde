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

#include "ipcsrv/server/server_fwd.hpp"
#include "ipcsrv/transport/transport_adapter.hpp"
#include <flow/log/log.hpp>
#include <flow/util/blob.hpp>
#include <boost/enable_shared_from_this.hpp>
#include <boost/noncopyable.hpp>
#include <queue>

namespace ipcsrv::server
{

// Types.

/**
 * One accepted client connection: its transport identity (fixed at acceptance), its connected socket, and its
 * mutable session state.  The Server creates one per accepted connection and hands it to the user through the
 * hooks (Server::async_authenticate() and so on) as a Connection::Ptr; a Message refers to its originating
 * Connection only weakly (Message::sender()).
 *
 * The public API is informational only.  To send to the client use Server::async_send().
 *
 * ### Thread safety ###
 * identity accessors (peer_identity() and friends, id()) are immutable and may be called from any thread.
 * The session-state accessors (mode(), created_at(), updated_at()) must be called from within hooks (thread W).
 *
 * ### Lifetime ###
 * The Connection lives as long as its session and as long as the user holds a Ptr.  Do not hold a Ptr past the
 * lifetime of the Server: the socket is associated with the Server's event loop.
 *
 * @internal
 * ### Outbound queue ###
 * Sends are serialized: at most one `async_write()` is outstanding; further requests wait in #m_snd_queue.
 * A request may also end the outbound direction (shutdown-send) once its bytes are written, after which
 * further sends are refused.  Once the owning Session starts closing, sends are refused outright
 * (error::Code::S_STALE_CONNECTION); Session then waits for the queue to empty (on_snd_idle()) before ending the
 * outbound direction and closing.  All of this runs in thread W.
 */
class Connection :
  public flow::log::Log_context,
  public boost::enable_shared_from_this<Connection>,
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for `shared_ptr` to Connection.
  using Ptr = boost::shared_ptr<Connection>;

  /// Short-hand for `weak_ptr` to Connection.
  using Observer = boost::weak_ptr<Connection>;

  /// Short-hand for send-completion handler.
  using Task_err = Function<void (const Error_code& err_code)>;

  // Constructors/destructor.

  /// Logs.
  ~Connection();

  // Methods.

  /**
   * Server-unique ID of this connection, for logging and bookkeeping.
   * @return See above.
   */
  uint64_t id() const;

  /**
   * The peer's identity as determined by the transport adapter at acceptance.
   * @return See above.
   */
  const transport::Peer_identity& peer_identity() const;

  /**
   * The kernel-reported credentials of the peer process, if it's a local-socket connection; else null.
   * @return See above.
   */
  const util::Process_credentials* peer_process_credentials() const;

  /**
   * The endpoint pair, if it's a network connection; else null.
   * @return See above.
   */
  const transport::Network_peer_identity* peer_network_identity() const;

  /**
   * The current framing mode.  Thread W only.
   * @return See above.
   */
  Connection_mode mode() const;

  /**
   * When the connection was accepted.
   * @return See above.
   */
  util::Fine_time_pt created_at() const;

  /**
   * When state last changed: mode change, Message delivery, or send.  Thread W only.
   * @return See above.
   */
  util::Fine_time_pt updated_at() const;

private:
  // Types.

  /// A queued send.
  struct Snd_request
  {
    /// Bytes to write; shared in case of a multi-target send.
    boost::shared_ptr<const flow::util::Blob> m_payload;

    /// Whether to end the outbound direction once #m_payload is written.
    bool m_end_sending;

    /// Completion handler (may be empty).
    Task_err m_on_done_func;
  };

  // Friends.

  /// Session drives the lifecycle.
  friend class Session;
  /// Server creates us and sends via us.
  friend class Server;

  // Constructors.

  /**
   * Constructs.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param id
   *        See id().
   * @param peer_socket
   *        Connected socket, now owned.
   * @param peer_identity
   *        See peer_identity().
   * @param mode
   *        Initial mode().
   */
  explicit Connection(flow::log::Logger* logger_ptr, uint64_t id, transport::Peer_socket&& peer_socket,
                      transport::Peer_identity&& peer_identity, Connection_mode mode);

  // Methods.

  /**
   * Enqueues a send.  Thread W.  `on_done_func` (if not empty) is eventually invoked from thread W with the
   * result (synchronously, if the send is refused outright).
   *
   * @param payload
   *        Bytes to write.
   * @param end_sending
   *        Whether to end the outbound direction after them.
   * @param on_done_func
   *        Completion handler.
   */
  void async_send(const boost::shared_ptr<const flow::util::Blob>& payload, bool end_sending,
                  Task_err&& on_done_func);

  /// Starts `async_write()` of the head of #m_snd_queue.
  void async_write_next();

  /**
   * `async_write()` completion handler.
   * @param sys_err_code
   *        Result.
   */
  void on_written(const Error_code& sys_err_code);

  /**
   * Registers `on_idle_func` to be posted (thread W) once #m_snd_queue is empty and no write is outstanding
   * (or right away if that's already so).  At most one such registration.
   *
   * @param on_idle_func
   *        Handler.
   */
  void on_snd_idle(util::Task&& on_idle_func);

  /// Refuses all subsequent sends with error::Code::S_STALE_CONNECTION.
  void mark_closing();

  /// Ends the outbound direction (shutdown-send) if not yet done.
  void end_sending();

  /// Closes the socket (any outstanding op completes with `operation_aborted`).  Idempotent.
  void close_socket();

  /**
   * Sets mode() and touches updated_at().
   * @param mode
   *        New mode.
   */
  void set_mode(Connection_mode mode);

  /// Sets updated_at() to now.
  void touch();

  // Data.

  /// See id().
  const uint64_t m_id;

  /// See peer_identity().
  const transport::Peer_identity m_peer_identity;

  /// The socket.
  transport::Peer_socket m_socket;

  /// See mode().
  Connection_mode m_mode;

  /// See created_at().
  const util::Fine_time_pt m_created_at;

  /// See updated_at().
  util::Fine_time_pt m_updated_at;

  /// See mark_closing().
  bool m_closing;

  /// Whether a send requesting end of outbound direction has been accepted (or end_sending() was called).
  bool m_snd_finished;

  /// Whether the outbound direction has actually been shut down.
  bool m_snd_shut_down;

  /// Outstanding (head; being written) and queued sends.
  std::queue<Snd_request> m_snd_queue;

  /// Truthy once a write has failed; subsequent queued sends fail with it.
  Error_code m_snd_pending_err_code;

  /// See on_snd_idle().
  util::Task m_on_snd_idle_func;
}; // class Connection

} // namespace ipcsrv::server
