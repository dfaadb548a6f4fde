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
#include "ipcsrv/server/connection.hpp"
#include "ipcsrv/server/error.hpp"
#include <flow/error/error.hpp>
#include <flow/common.hpp>

namespace ipcsrv::server
{

// Implementations.

Connection::Connection(flow::log::Logger* logger_ptr, uint64_t id, transport::Peer_socket&& peer_socket,
                       transport::Peer_identity&& peer_identity, Connection_mode mode) :
  flow::log::Log_context(logger_ptr, Log_component::S_SERVER),
  m_id(id),
  m_peer_identity(std::move(peer_identity)),
  m_socket(std::move(peer_socket)),
  m_mode(mode),
  m_created_at(flow::Fine_clock::now()),
  m_updated_at(m_created_at),
  m_closing(false),
  m_snd_finished(false),
  m_snd_shut_down(false)
{
  FLOW_LOG_TRACE("Connection [" << *this << "]: Created; mode [" << m_mode << "].");
}

Connection::~Connection()
{
  FLOW_LOG_TRACE("Connection [" << *this << "]: Destroying.");
}

uint64_t Connection::id() const
{
  return m_id;
}

const transport::Peer_identity& Connection::peer_identity() const
{
  return m_peer_identity;
}

const util::Process_credentials* Connection::peer_process_credentials() const
{
  return std::get_if<util::Process_credentials>(&m_peer_identity);
}

const transport::Network_peer_identity* Connection::peer_network_identity() const
{
  return std::get_if<transport::Network_peer_identity>(&m_peer_identity);
}

Connection_mode Connection::mode() const
{
  return m_mode;
}

util::Fine_time_pt Connection::created_at() const
{
  return m_created_at;
}

util::Fine_time_pt Connection::updated_at() const
{
  return m_updated_at;
}

void Connection::set_mode(Connection_mode mode)
{
  if (mode != m_mode)
  {
    FLOW_LOG_INFO("Connection [" << *this << "]: Mode change [" << m_mode << "] => [" << mode << "].");
    m_mode = mode;
  }
  touch();
}

void Connection::touch()
{
  m_updated_at = flow::Fine_clock::now();
}

void Connection::async_send(const boost::shared_ptr<const flow::util::Blob>& payload, bool end_sending,
                            Task_err&& on_done_func)
{
  // We are in thread W.

  Error_code err_code;
  if (m_closing)
  {
    err_code = error::Code::S_STALE_CONNECTION;
  }
  else if (m_snd_finished)
  {
    err_code = error::Code::S_SENDS_FINISHED_CANNOT_SEND;
  }
  else if (m_snd_pending_err_code)
  {
    err_code = m_snd_pending_err_code;
  }

  if (err_code)
  {
    FLOW_LOG_INFO("Connection [" << *this << "]: Send of [" << payload->size() << "] bytes refused: "
                  "[" << err_code << "] [" << err_code.message() << "].");
    if (on_done_func)
    {
      on_done_func(err_code);
    }
    return;
  }
  // else

  FLOW_LOG_TRACE("Connection [" << *this << "]: Send of [" << payload->size() << "] bytes "
                 "(end-sending? = [" << end_sending << "]) enqueued; queue had [" << m_snd_queue.size() << "] "
                 "requests.");
  if (end_sending)
  {
    m_snd_finished = true; // Refuse subsequent ones even before this one completes.
  }

  const bool idle = m_snd_queue.empty();
  m_snd_queue.push(Snd_request{ payload, end_sending, std::move(on_done_func) });
  if (idle)
  {
    async_write_next();
  }
  // else { on_written() will get to it. }
} // Connection::async_send()

void Connection::async_write_next()
{
  using boost::asio::async_write;

  assert(!m_snd_queue.empty());
  const auto& payload = *m_snd_queue.front().m_payload;

  FLOW_LOG_TRACE("Connection [" << *this << "]: Writing [" << payload.size() << "] bytes.");
  FLOW_LOG_DATA("Connection [" << *this << "]: Bytes to write: "
                "[\n" << flow::util::buffers_dump_string(payload.const_buffer(), "  ") << "].");

  async_write(m_socket, payload.const_buffer(),
              [this, self = shared_from_this()](const Error_code& sys_err_code, size_t)
  {
    // We are in thread W.
    on_written(sys_err_code);
  });
}

void Connection::on_written(const Error_code& sys_err_code)
{
  using std::queue;

  // We are in thread W.
  assert(!m_snd_queue.empty());

  auto head = std::move(m_snd_queue.front());
  m_snd_queue.pop();

  /* Update all state -- and start the next write if any -- before invoking any user handler, as the latter
   * may send again (reentrantly). */
  queue<Snd_request> failed_q;
  if (sys_err_code)
  {
    FLOW_LOG_WARNING("Connection [" << *this << "]: Write failed; all subsequent sends will fail.  "
                     "Details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    m_snd_pending_err_code = sys_err_code;
    failed_q.swap(m_snd_queue);
  }
  else
  {
    touch();
    if (head.m_end_sending)
    {
      end_sending();
    }
  }

  if (!m_snd_queue.empty())
  {
    async_write_next();
  }
  else if (m_on_snd_idle_func)
  {
    auto on_idle_func = std::move(m_on_snd_idle_func);
    m_on_snd_idle_func = util::Task();
    boost::asio::post(m_socket.get_executor(), std::move(on_idle_func));
  }

  if (head.m_on_done_func)
  {
    head.m_on_done_func(sys_err_code);
  }
  while (!failed_q.empty())
  {
    if (failed_q.front().m_on_done_func)
    {
      failed_q.front().m_on_done_func(sys_err_code);
    }
    failed_q.pop();
  }
} // Connection::on_written()

void Connection::on_snd_idle(util::Task&& on_idle_func)
{
  assert((!m_on_snd_idle_func) && "At most one registration.");

  if (m_snd_queue.empty())
  {
    boost::asio::post(m_socket.get_executor(), std::move(on_idle_func));
    return;
  }
  // else
  FLOW_LOG_TRACE("Connection [" << *this << "]: Awaiting [" << m_snd_queue.size() << "] sends to finish.");
  m_on_snd_idle_func = std::move(on_idle_func);
}

void Connection::mark_closing()
{
  m_closing = true;
}

void Connection::end_sending()
{
  m_snd_finished = true;
  if (m_snd_shut_down)
  {
    return;
  }
  // else
  m_snd_shut_down = true;

  Error_code sys_err_code;
  m_socket.shutdown(transport::Peer_socket::shutdown_send, sys_err_code);
  if (sys_err_code)
  {
    // Probably the peer is gone already; reads will find out.  Not fatal.
    FLOW_LOG_INFO("Connection [" << *this << "]: Could not end outbound direction; ignoring.  Details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    return;
  }
  // else
  FLOW_LOG_TRACE("Connection [" << *this << "]: Ended outbound direction.");
}

void Connection::close_socket()
{
  if (!m_socket.is_open())
  {
    return;
  }
  // else
  FLOW_LOG_TRACE("Connection [" << *this << "]: Closing socket.");
  Error_code dummy;
  m_socket.close(dummy);
}

std::ostream& operator<<(std::ostream& os, const Connection& val)
{
  return os << "conn" << val.id() << '[' << val.peer_identity() << "]@" << static_cast<const void*>(&val);
}

} // namespace ipcsrv::server
