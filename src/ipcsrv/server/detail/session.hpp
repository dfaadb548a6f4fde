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

#include "ipcsrv/server/connection.hpp"
#include "ipcsrv/server/message.hpp"
#include "ipcsrv/server/server_config.hpp"
#include "ipcsrv/server/command.hpp"
#include <flow/log/log.hpp>
#include <flow/util/blob.hpp>
#include <flow/util/util.hpp>
#include <boost/enable_shared_from_this.hpp>
#include <boost/noncopyable.hpp>
#include <vector>

namespace ipcsrv::server
{

// Types.

/**
 * Internal-use class that runs the lifecycle of one Connection: authentication, command sub-protocol, framing,
 * teardown.  Created by Server for each admitted connection and tracked in its Connection_pool; all its work
 * happens in thread W.  The Server's hooks are given to it as functions, so that it stays independent of
 * Server proper.
 *
 * ### State machine ###
 *   - State::S_AUTHENTICATING: awaiting the authentication hook.  Rejected => closing with
 *     error::Code::S_AUTHENTICATION_REJECTED.
 *   - State::S_FRAMING: read loop.  Each read (up to Server_config::chunk_size() bytes) is first examined for
 *     leading command headers (see Command), while command sniffing is on: until the first payload byte, or always
 *     in Connection_mode::S_PERSISTENT.  The remaining bytes are payload, framed per the *current* mode:
 *     accumulated until end-of-stream (`S_TEXT_DATA`, subject to Server_config::m_read_limit), or delivered as
 *     one Message per read (otherwise).  The next read is not started until the message hook's completion
 *     handler runs, so Message delivery is strictly ordered.
 *   - State::S_CLOSING: Connection refuses further sends; queued sends are flushed; the outbound direction is
 *     ended; a pause of Server_config::m_close_linger; socket closed.
 *   - State::S_CLOSED: terminal; the finish handler has been invoked (exactly once) with the result.
 *
 * ### Cancellation ###
 * cancel() sets a flag and closes the socket and timer, so that any outstanding async op completes promptly;
 * each continuation checks the flag first and finishes with error::Code::S_SESSION_CANCELED, invoking no
 * further hooks.  If a hook's completion is pending, there is nothing to abort; so cancel() finishes
 * synchronously, and the late completion is then ignored.
 */
class Session :
  public flow::log::Log_context,
  public boost::enable_shared_from_this<Session>,
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for `shared_ptr` to Session.
  using Ptr = boost::shared_ptr<Session>;

  /// States; see class doc header.
  enum class State
  {
    /// See class doc header.
    S_AUTHENTICATING,
    /// See class doc header.
    S_FRAMING,
    /// See class doc header.
    S_CLOSING,
    /// See class doc header.
    S_CLOSED
  };

  /// Completion handler given to the authentication hook.
  using On_authenticated_func = Function<void (bool ok)>;

  /// The authentication hook.
  using Authenticate_func = Function<void (const Connection::Ptr& conn, On_authenticated_func&& on_done_func)>;

  /// The message hook.
  using Handle_message_func = Function<void (Message&& msg, util::Task&& on_done_func)>;

  /// Invoked once upon reaching State::S_CLOSED, with the result: falsy on graceful end.
  using On_finished_func = Function<void (const Error_code& result)>;

  // Constructors/destructor.

  /**
   * Constructs, in State::S_AUTHENTICATING, without doing anything.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param handle
   *        See handle().
   * @param config
   *        Server's config.  Must be valid (e.g., chunk size not 0).
   * @param conn
   *        The connection.
   * @param authenticate_func
   *        Authentication hook.
   * @param handle_message_func
   *        Message hook.
   * @param on_finished_func
   *        Finish handler.
   */
  explicit Session(flow::log::Logger* logger_ptr, Session_handle handle, const Server_config& config,
                   const Connection::Ptr& conn, Authenticate_func&& authenticate_func,
                   Handle_message_func&& handle_message_func, On_finished_func&& on_finished_func);

  /// Logs.
  ~Session();

  // Methods.

  /// Starts: invokes the authentication hook.  Call once.
  void start();

  /// Requests cancellation; see class doc header.  Idempotent.
  void cancel();

  /**
   * Handle given to ctor.
   * @return See above.
   */
  Session_handle handle() const;

  /**
   * Current state.
   * @return See above.
   */
  State state() const;

  /**
   * The connection.
   * @return See above.
   */
  const Connection::Ptr& connection() const;

private:
  // Methods.

  /**
   * Continuation of the authentication hook.
   * @param ok
   *        Hook's verdict.
   */
  void on_authenticated(bool ok);

  /// Starts the next read.
  void async_read_next();

  /**
   * Read completion handler.
   * @param sys_err_code
   *        Result.
   * @param n_rcvd
   *        Bytes read.
   */
  void on_read(const Error_code& sys_err_code, size_t n_rcvd);

  /**
   * Consumes leading command headers from `bytes` while command sniffing is on; handles each.
   *
   * @param bytes
   *        Received bytes.
   * @return Number of bytes consumed.
   */
  size_t consume_commands(const util::Blob_const& bytes);

  /**
   * Handles one received command.
   * @param cmd
   *        The command.
   */
  void handle_command(Command cmd);

  /// Handles end-of-stream from the client.
  void on_end_of_stream();

  /**
   * Gives a Message to the message hook; once it completes, runs `then_func` (in thread W, unless the session has
   * ended in the meantime).
   *
   * @param payload
   *        Message bytes.
   * @param then_func
   *        Continuation.
   */
  void deliver(flow::util::Blob&& payload, util::Task&& then_func);

  /**
   * Enters State::S_CLOSING; the eventual result shall be `result` (unless canceled).
   * @param result
   *        See On_finished_func.
   */
  void begin_closing(const Error_code& result);

  /// Continuation of begin_closing() once sends are flushed.
  void on_snd_flushed();

  /**
   * Whether the continuation about to run should not: the session has already finished (returns `true`); or it
   * has been canceled (finishes it and returns `true`).
   *
   * @return See above.
   */
  bool finished_or_canceled();

  /**
   * Enters State::S_CLOSED: releases the socket and invokes the finish handler.  No-op if already there.
   * @param result
   *        See On_finished_func.
   */
  void finish(const Error_code& result);

  /**
   * Returns a function that, invoked from any thread, posts `func` onto thread W (keeping `*this` alive until
   * then).  Used for hook completion handlers.
   *
   * @param func
   *        Function to invoke in thread W.
   * @return See above.
   */
  util::Task post_to_w(util::Task&& func);

  // Data.

  /// See handle().
  const Session_handle m_handle;

  /// See ctor.
  const Server_config m_config;

  /// See connection().
  const Connection::Ptr m_conn;

  /// See ctor.
  Authenticate_func m_authenticate_func;

  /// See ctor.
  Handle_message_func m_handle_message_func;

  /// See ctor.  Emptied when invoked.
  On_finished_func m_on_finished_func;

  /// See state().
  State m_state;

  /// See cancel().
  bool m_canceled;

  /// Whether a hook's completion is awaited (no async op of ours is outstanding then).
  bool m_awaiting_hook;

  /// Whether command headers are still recognized at the start of a read (besides always in `S_PERSISTENT`).
  bool m_sniffing_commands;

  /// Read target; Server_config::chunk_size() bytes.
  flow::util::Blob m_rcv_buf;

  /// `S_TEXT_DATA` accumulated payload.
  std::vector<uint8_t> m_text_buf;

  /// Result to report once State::S_CLOSING completes (if not canceled).
  Error_code m_closing_result;

  /// Timer for Server_config::m_close_linger.
  flow::util::Timer m_linger_timer;
}; // class Session

} // namespace ipcsrv::server
