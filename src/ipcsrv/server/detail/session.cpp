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
#include "ipcsrv/server/detail/session.hpp"
#include "ipcsrv/server/error.hpp"
#include <flow/error/error.hpp>
#include <flow/common.hpp>
#include <boost/make_shared.hpp>

namespace ipcsrv::server
{

// Implementations.

Session::Session(flow::log::Logger* logger_ptr, Session_handle handle, const Server_config& config,
                 const Connection::Ptr& conn, Authenticate_func&& authenticate_func,
                 Handle_message_func&& handle_message_func, On_finished_func&& on_finished_func) :
  flow::log::Log_context(logger_ptr, Log_component::S_SERVER),
  m_handle(handle),
  m_config(config),
  m_conn(conn),
  m_authenticate_func(std::move(authenticate_func)),
  m_handle_message_func(std::move(handle_message_func)),
  m_on_finished_func(std::move(on_finished_func)),
  m_state(State::S_AUTHENTICATING),
  m_canceled(false),
  m_awaiting_hook(false),
  m_sniffing_commands(true),
  m_rcv_buf(get_logger(), m_config.chunk_size()),
  m_linger_timer(m_conn->m_socket.get_executor())
{
  assert(m_config.chunk_size() != 0);
  FLOW_LOG_TRACE("Session [" << *this << "]: Created.");
}

Session::~Session()
{
  FLOW_LOG_TRACE("Session [" << *this << "]: Destroying.");
}

Session_handle Session::handle() const
{
  return m_handle;
}

Session::State Session::state() const
{
  return m_state;
}

const Connection::Ptr& Session::connection() const
{
  return m_conn;
}

util::Task Session::post_to_w(util::Task&& func)
{
  return [self = shared_from_this(), func = std::move(func)]()
  {
    // We are in thread U or W.
    boost::asio::post(self->m_conn->m_socket.get_executor(), func);
  };
}

void Session::start()
{
  assert(m_state == State::S_AUTHENTICATING);

  FLOW_LOG_INFO("Session [" << *this << "]: Starting; awaiting authentication hook.");

  m_awaiting_hook = true;
  /* The hook's handler may be invoked from any thread, even synchronously; in any case continue via a post() so that
   * the hook has fully returned (and we're in thread W) by then. */
  auto self = shared_from_this();
  m_authenticate_func(m_conn, [this, self](bool ok)
  {
    post_to_w([this, ok]() { on_authenticated(ok); })();
  });
}

void Session::on_authenticated(bool ok)
{
  // We are in thread W.
  m_awaiting_hook = false;
  if (finished_or_canceled())
  {
    return;
  }
  // else

  if (!ok)
  {
    FLOW_LOG_INFO("Session [" << *this << "]: Authentication hook rejected the connection.");
    begin_closing(error::Code::S_AUTHENTICATION_REJECTED);
    return;
  }
  // else

  FLOW_LOG_INFO("Session [" << *this << "]: Authenticated; framing in mode [" << m_conn->mode() << "].");
  m_state = State::S_FRAMING;
  async_read_next();
}

void Session::async_read_next()
{
  assert(m_state == State::S_FRAMING);

  m_conn->m_socket.async_read_some(m_rcv_buf.mutable_buffer(),
                                   [this, self = shared_from_this()](const Error_code& sys_err_code, size_t n_rcvd)
  {
    // We are in thread W.
    on_read(sys_err_code, n_rcvd);
  });
}

void Session::on_read(const Error_code& sys_err_code, size_t n_rcvd)
{
  using util::Blob_const;
  using flow::util::Blob;

  // We are in thread W.
  if (finished_or_canceled())
  {
    return;
  }
  // else

  if (sys_err_code == boost::asio::error::eof)
  {
    FLOW_LOG_TRACE("Session [" << *this << "]: Client ended its outbound direction.");
    on_end_of_stream();
    return;
  }
  // else
  if (sys_err_code)
  {
    FLOW_LOG_WARNING("Session [" << *this << "]: Read failed; closing.  Details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    begin_closing(sys_err_code);
    return;
  }
  // else

  const Blob_const rcvd(m_rcv_buf.const_data(), n_rcvd);
  FLOW_LOG_TRACE("Session [" << *this << "]: Received [" << n_rcvd << "] bytes.");
  FLOW_LOG_DATA("Session [" << *this << "]: Received bytes: "
                "[\n" << flow::util::buffers_dump_string(rcvd, "  ") << "].");

  const size_t n_cmd = consume_commands(rcvd);
  const Blob_const payload(util::blob_data(rcvd) + n_cmd, n_rcvd - n_cmd);
  if (payload.size() == 0)
  {
    async_read_next();
    return;
  }
  // else

  m_sniffing_commands = false; // Payload has begun.  (Does not matter for S_PERSISTENT.)
  m_conn->touch();

  switch (m_conn->mode())
  {
  case Connection_mode::S_TEXT_DATA:
  {
    const size_t new_size = m_text_buf.size() + payload.size();
    if (m_config.m_read_limit && (new_size > *m_config.m_read_limit))
    {
      FLOW_LOG_WARNING("Session [" << *this << "]: Message would reach [" << new_size << "] bytes, exceeding "
                       "limit [" << *m_config.m_read_limit << "]; closing without delivering it.");
      m_text_buf.clear();
      begin_closing(error::Code::S_MESSAGE_LIMIT_EXCEEDED);
      return;
    }
    // else
    const auto data = util::blob_data(payload);
    m_text_buf.insert(m_text_buf.end(), data, data + payload.size());
    async_read_next();
    return;
  }

  case Connection_mode::S_STREAM_DATA:
  case Connection_mode::S_PERSISTENT:
  {
    Blob chunk(get_logger());
    chunk.assign_copy(payload);
    deliver(std::move(chunk), [this]() { async_read_next(); });
    return;
  }

  case Connection_mode::S_END_SENTINEL:
    break;
  }
  assert(false && "Invalid mode.");
} // Session::on_read()

size_t Session::consume_commands(const util::Blob_const& bytes)
{
  using util::Blob_const;

  size_t n_consumed = 0;
  while (m_sniffing_commands || (m_conn->mode() == Connection_mode::S_PERSISTENT))
  {
    const auto cmd = parse_command_header(Blob_const(util::blob_data(bytes) + n_consumed,
                                                     bytes.size() - n_consumed));
    if (!cmd)
    {
      break;
    }
    // else
    n_consumed += S_COMMAND_HEADER_SIZE;
    handle_command(*cmd);
  }
  return n_consumed;
}

void Session::handle_command(Command cmd)
{
  FLOW_LOG_INFO("Session [" << *this << "]: Received command [" << cmd << "].");

  switch (cmd)
  {
  case Command::S_PING:
  {
    const auto header = command_header(Command::S_PONG);
    auto pong = boost::make_shared<flow::util::Blob>(get_logger());
    pong->assign_copy(util::Blob_const(header.data(), header.size()));
    // A command reply never ends the outbound direction: the session continues.
    m_conn->async_send(pong, false, [this, self = shared_from_this()](const Error_code& err_code)
    {
      if (err_code)
      {
        FLOW_LOG_INFO("Session [" << *this << "]: PONG reply not sent: "
                      "[" << err_code << "] [" << err_code.message() << "].");
      }
    });
    m_conn->touch();
    return;
  }
  case Command::S_PONG:
    m_conn->touch();
    return;
  case Command::S_SET_STREAM:
    m_conn->set_mode(Connection_mode::S_STREAM_DATA);
    return;
  case Command::S_SET_DATA:
    m_conn->set_mode(Connection_mode::S_TEXT_DATA);
    return;
  case Command::S_END_SENTINEL:
    break;
  }
  assert(false && "parse_command_header() would not have emitted this.");
} // Session::handle_command()

void Session::on_end_of_stream()
{
  using flow::util::Blob;

  if ((m_conn->mode() == Connection_mode::S_TEXT_DATA) && (!m_text_buf.empty()))
  {
    Blob msg(get_logger());
    msg.assign_copy(util::Blob_const(m_text_buf.data(), m_text_buf.size()));
    m_text_buf.clear();
    deliver(std::move(msg), [this]() { begin_closing(Error_code()); });
    return;
  }
  // else
  begin_closing(Error_code());
}

void Session::deliver(flow::util::Blob&& payload, util::Task&& then_func)
{
  FLOW_LOG_TRACE("Session [" << *this << "]: Delivering message of [" << payload.size() << "] bytes "
                 "(mode [" << m_conn->mode() << "]).");

  m_awaiting_hook = true;
  m_handle_message_func(Message(std::move(payload), m_conn),
                        post_to_w([this, then_func = std::move(then_func)]()
  {
    // We are in thread W.
    m_awaiting_hook = false;
    if (finished_or_canceled())
    {
      return;
    }
    // else
    m_conn->touch();
    then_func();
  }));
}

void Session::begin_closing(const Error_code& result)
{
  assert((m_state == State::S_AUTHENTICATING) || (m_state == State::S_FRAMING));

  FLOW_LOG_INFO("Session [" << *this << "]: Closing; flushing [" << m_conn->m_snd_queue.size() << "] "
                "queued sends first.  Result shall be [" << result << "] [" << result.message() << "].");
  m_state = State::S_CLOSING;
  m_closing_result = result;
  m_conn->mark_closing();
  m_conn->on_snd_idle([this, self = shared_from_this()]()
  {
    // We are in thread W.
    on_snd_flushed();
  });
}

void Session::on_snd_flushed()
{
  if (finished_or_canceled())
  {
    return;
  }
  // else

  m_conn->end_sending();

  FLOW_LOG_TRACE("Session [" << *this << "]: Sends flushed; lingering before closing socket.");
  m_linger_timer.expires_after(m_config.m_close_linger);
  m_linger_timer.async_wait([this, self = shared_from_this()](const Error_code&)
  {
    // We are in thread W.  (operation_aborted => canceled; which the following detects.)
    if (finished_or_canceled())
    {
      return;
    }
    // else
    finish(m_closing_result);
  });
}

bool Session::finished_or_canceled()
{
  if (m_state == State::S_CLOSED)
  {
    return true;
  }
  // else
  if (m_canceled)
  {
    finish(error::Code::S_SESSION_CANCELED);
    return true;
  }
  // else
  return false;
}

void Session::cancel()
{
  if ((m_state == State::S_CLOSED) || m_canceled)
  {
    return;
  }
  // else

  FLOW_LOG_INFO("Session [" << *this << "]: Canceling.");
  m_canceled = true;

  if (m_awaiting_hook)
  {
    // No op of ours to abort; finish now.  The hook's eventual completion will be ignored.
    finish(error::Code::S_SESSION_CANCELED);
    return;
  }
  // else

  // Make the outstanding op (read, write flush, or linger) complete promptly; its continuation will finish().
  m_conn->close_socket();
  Error_code dummy;
  m_linger_timer.cancel(dummy);
}

void Session::finish(const Error_code& result)
{
  if (m_state == State::S_CLOSED)
  {
    return;
  }
  // else
  auto self = shared_from_this(); // The finish handler may drop the last other reference to us.

  m_state = State::S_CLOSED;
  m_conn->mark_closing();
  m_conn->close_socket();
  Error_code dummy;
  m_linger_timer.cancel(dummy);

  FLOW_LOG_INFO("Session [" << *this << "]: Finished with result [" << result << "] [" << result.message() << "].");

  auto on_finished_func = std::move(m_on_finished_func);
  m_on_finished_func = On_finished_func();
  // Drop the hooks, as they may hold references to things we do not want to keep alive any longer.
  m_authenticate_func = Authenticate_func();
  m_handle_message_func = Handle_message_func();

  on_finished_func(result);
}

std::ostream& operator<<(std::ostream& os, const Session& val)
{
  return os << "session" << val.handle() << '[' << *val.connection() << ']';
}

} // namespace ipcsrv::server
