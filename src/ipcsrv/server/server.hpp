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

#include "ipcsrv/server/server_config.hpp"
#include "ipcsrv/server/connection.hpp"
#include "ipcsrv/server/message.hpp"
#include "ipcsrv/server/connection_pool.hpp"
#include "ipcsrv/server/detail/session.hpp"
#include "ipcsrv/transport/transport_adapter.hpp"
#include <flow/async/single_thread_task_loop.hpp>
#include <flow/log/log.hpp>
#include <flow/util/util.hpp>
#include <boost/noncopyable.hpp>
#include <atomic>
#include <optional>
#include <vector>

namespace ipcsrv::server
{

// Types.

/**
 * The connection server: accepts connections from a transport::Transport_adapter, runs one Session per admitted
 * connection (authentication, command sub-protocol, framing into Message objects, teardown), and lets the
 * application reply to or push data at any live Connection.  The application plugs in by subclassing and
 * overriding the hooks: async_authenticate(), async_handle_message(), on_session_finished(),
 * on_connection_rejected().  With no overrides the server accepts everyone and logs what it receives.
 *
 * ### Threads ###
 * Server owns one thread, W (a `flow::async::Single_thread_task_loop`), started by the constructor.  Everything
 * happens there: the accept loop, every Session, the Connection_pool, and every hook invocation.  Sessions
 * interleave only at asynchronous points (reads, writes, hook completions, the close-linger timer), so no hook need
 * worry about concurrency with another hook.  A hook's completion handler may be invoked from any thread at any
 * time (even synchronously from within the hook); the session continues in thread W.
 *
 * Public methods may be called from any thread, concurrently, with the exception of close() and the destructor:
 * those must not be called from thread W (i.e., from within a hook), as they wait for W's work to drain.
 *
 * ### Lifecycle ###
 * Construct (listening has not started); start() (listening has started, or an error has been emitted);
 * close() (listener closed, sessions canceled and gone, thread W joined).  close() is idempotent, and the destructor
 * calls it.  However, a subclass overriding any hook must itself call close() in its destructor: otherwise thread W
 * might invoke a hook while the subclass is already being destroyed.
 *
 * ### Framing ###
 * See Connection_mode.  In short: in Connection_mode::S_TEXT_DATA (default, see Server_config::m_default_mode) one
 * connection carries one Message, delivered once the client ends its outbound direction; in
 * Connection_mode::S_STREAM_DATA each read is a Message; Connection_mode::S_PERSISTENT is like the latter
 * but for long-lived control connections.  The client can switch modes and ping using the Command sub-protocol.
 *
 * Messages from one connection are delivered strictly in arrival order: the next read is not issued until
 * async_handle_message() has invoked its completion handler.
 *
 * ### Sending ###
 * async_send() and friends copy the payload before returning; the bytes are written in thread W after any
 * previously queued sends to the same Connection.  Unless the Connection is in Connection_mode::S_PERSISTENT,
 * a send also ends the server's outbound direction on that connection: one reply per connection, mirroring
 * the one-message-per-connection request.
 */
class Server :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for Connection::Task_err.
  using Task_err = Connection::Task_err;

  /// Completion handler type for async_authenticate(): pass `true` to accept the connection.
  using On_authenticated_func = Session::On_authenticated_func;

  // Constructors/destructor.

  /**
   * Constructs a server that will accept via the given transport; and starts thread W.  Does not start listening:
   * see start().
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param transport
   *        The transport adapter.  Must exist until close() returns.  Must not have been listen()ed.
   * @param config
   *        Configuration; copied.  Validated by start().
   */
  explicit Server(flow::log::Logger* logger_ptr, transport::Transport_adapter* transport,
                  const Server_config& config);

  /// Invokes close(); see that method.  Must not be called from thread W.
  virtual ~Server();

  // Methods.

  /**
   * Starts listening for and accepting connections.  On success the listener is ready before this returns (so
   * a client may connect immediately).  Must not be called from thread W.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_SERVER_ALREADY_STARTED (start() was already called successfully, or close() was called),
   *        error::Code::S_INVALID_ARGUMENT (bad Server_config, e.g., zero Server_config::m_chunk_size),
   *        whatever transport::Transport_adapter::listen() emits (e.g., `errc::address_in_use`,
   *        `errc::permission_denied`, transport::error::Code::S_INVALID_ARGUMENT).
   */
  void start(Error_code* err_code = 0);

  /**
   * Stops the server: closes the listener (with any transport-specific cleanup, such as removal of the socket node),
   * cancels all sessions, waits until they have all finished (each reporting
   * error::Code::S_SESSION_CANCELED to on_session_finished()), then stops thread W.  Idempotent.
   * Must not be called from thread W.
   *
   * After this returns no hook shall be invoked.
   */
  void close();

  /**
   * Queues a send of a copy of the given bytes to the given connection.
   *
   * @param conn
   *        Target.  May be null (e.g., from Message::sender() after the sender went away), which yields
   *        error::Code::S_STALE_CONNECTION.
   * @param payload
   *        Bytes; copied before this returns.
   * @param on_done_func
   *        If not empty, invoked from thread W once the bytes have been written (falsy code) or the send has failed:
   *        error::Code::S_STALE_CONNECTION (connection closing or closed; or close() was already called, in which
   *        case it is invoked synchronously from the calling thread before this returns),
   *        error::Code::S_SENDS_FINISHED_CANNOT_SEND (a previous send ended the outbound direction), a system code
   *        from the write.
   */
  void async_send(const Connection::Ptr& conn, const util::Blob_const& payload,
                  Task_err&& on_done_func = Task_err());

  /**
   * Identical to the other async_send() but sends the same bytes to each of the given connections.
   * `on_done_func` (if not empty) is invoked once per element of `conns`.
   *
   * @param conns
   *        Targets.
   * @param payload
   *        See other overload.
   * @param on_done_func
   *        See above.
   */
  void async_send(const std::vector<Connection::Ptr>& conns, const util::Blob_const& payload,
                  Task_err&& on_done_func = Task_err());

  /**
   * async_send() of the text representation of the given value, as by `ostream << value`.
   *
   * @tparam Value
   *         Type with an `ostream<<`.
   * @tparam Target
   *         `Connection::Ptr` or `vector<Connection::Ptr>`.
   * @param target
   *        See async_send().
   * @param value
   *        Value to serialize.
   * @param on_done_func
   *        See async_send().
   */
  template<typename Target, typename Value>
  void async_send_value(const Target& target, const Value& value, Task_err&& on_done_func = Task_err());

  /**
   * Number of sessions currently running (admitted and not yet finished).  May be called from any thread.
   * @return See above.
   */
  size_t session_count() const;

  /**
   * Configuration given to the constructor.
   * @return See above.
   */
  const Server_config& config() const;

protected:
  // Methods.

  /**
   * Hook invoked (thread W) for each admitted connection before anything is read from it.
   * Invoke `on_done_func(true)` to proceed or `on_done_func(false)` to refuse the connection;
   * from any thread, any time.  Nothing is read from the connection until then.  Default: accepts.
   *
   * Use, e.g., Connection::peer_process_credentials() for a decision.
   *
   * @param conn
   *        The connection.
   * @param on_done_func
   *        Completion handler; invoke exactly once.
   */
  virtual void async_authenticate(const Connection::Ptr& conn, On_authenticated_func&& on_done_func);

  /**
   * Hook invoked (thread W) for each Message.  Invoke `on_done_func()` (from any thread, any time) when ready for
   * the next Message from the same connection.  Default: logs the message and invokes `on_done_func()`.
   *
   * @param msg
   *        The message.  Use Message::sender() to reply.
   * @param on_done_func
   *        Completion handler; invoke exactly once.
   */
  virtual void async_handle_message(Message&& msg, util::Task&& on_done_func);

  /**
   * Hook invoked (thread W) when a session has finished, its socket is closed, and the session is no longer counted
   * by session_count().  Default: logs.
   *
   * @param conn
   *        The connection.
   * @param result
   *        Falsy if the client ended the connection normally and everything was flushed;
   *        otherwise error::Code::S_AUTHENTICATION_REJECTED, error::Code::S_MESSAGE_LIMIT_EXCEEDED,
   *        error::Code::S_SESSION_CANCELED, or a system code from the transport.
   */
  virtual void on_session_finished(const Connection::Ptr& conn, const Error_code& result);

  /**
   * Hook invoked (thread W) when a connection was accepted but immediately closed, because the server was at
   * capacity (Server_config::m_max_connections) or closing.  Default: does nothing.
   *
   * @param conn
   *        The (already closed) connection.
   * @param reason
   *        error::Code::S_POOL_CAPACITY_EXCEEDED or error::Code::S_SESSION_CANCELED (server closing).
   */
  virtual void on_connection_rejected(const Connection::Ptr& conn, const Error_code& reason);

private:
  // Friends.

  /// Prints the transport's nickname.
  friend std::ostream& operator<<(std::ostream& os, const Server& val);

  // Types.

  /// Short-hand for the pool we use.
  using Pool = Connection_pool<Session>;

  // Methods.

  /**
   * Handler from the transport's accept loop.  Thread W.
   *
   * @param err_code
   *        Fatal listener error, or success.
   * @param peer_socket
   *        The connected peer socket, if success.
   * @param peer_identity
   *        Its identity, if success.
   */
  void on_peer(const Error_code& err_code, transport::Peer_socket&& peer_socket,
               transport::Peer_identity&& peer_identity);

  /**
   * Session's finish handler.  Thread W.
   *
   * @param handle
   *        The session's handle.
   * @param conn
   *        Its connection.
   * @param result
   *        Its result.
   */
  void on_session_finished_internal(Session_handle handle, const Connection::Ptr& conn, const Error_code& result);

  /**
   * Enqueues the send on `conn` in thread W.
   *
   * @param conn
   *        See async_send().
   * @param payload
   *        The copied bytes.
   * @param on_done_func
   *        See async_send().
   */
  void send_in_w(const Connection::Ptr& conn, const boost::shared_ptr<const flow::util::Blob>& payload,
                 Task_err&& on_done_func);

  /**
   * Copies the bytes into a new blob.
   *
   * @param payload
   *        Bytes.
   * @return See above.
   */
  boost::shared_ptr<const flow::util::Blob> copy_payload(const util::Blob_const& payload) const;

  // Data.

  /// See constructor.
  const Server_config m_config;

  /// See constructor.
  transport::Transport_adapter* const m_transport;

  /// Thread W.
  flow::async::Single_thread_task_loop m_worker;

  /// The sessions.  Thread W only.
  Pool m_pool;

  /// Mirror of `m_pool.size()` for session_count(); written in thread W only.
  std::atomic<size_t> m_session_count;

  /// Whether start() has succeeded.  Thread W only.
  bool m_started;

  /// Whether close() has begun; thread W only.  No sessions are admitted once this is set.
  bool m_closing;

  /// Whether close() has been called; any thread.  Makes close() idempotent.
  std::atomic<bool> m_close_called;

  /// If not empty, invoked (and emptied) once the pool becomes empty; set by close().  Thread W only.
  util::Task m_on_drained_func;

  /// The next Connection::id() minus 1.  Thread W only.
  uint64_t m_next_conn_id;

  /// The next Session_handle minus 1.  Thread W only.
  Session_handle m_next_handle;
}; // class Server

// Template implementations.

template<typename Target, typename Value>
void Server::async_send_value(const Target& target, const Value& value, Task_err&& on_done_func)
{
  const auto str = flow::util::ostream_op_string(value);
  async_send(target, util::Blob_const(str.data(), str.size()), std::move(on_done_func));
}

} // namespace ipcsrv::server
