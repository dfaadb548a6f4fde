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
#include "ipcsrv/server/server.hpp"
#include "ipcsrv/server/error.hpp"
#include <flow/async/util.hpp>
#include <flow/error/error.hpp>
#include <flow/common.hpp>
#include <boost/make_shared.hpp>
#include <boost/thread/future.hpp>

namespace ipcsrv::server
{

// Implementations.

Server::Server(flow::log::Logger* logger_ptr, transport::Transport_adapter* transport,
               const Server_config& config) :
  flow::log::Log_context(logger_ptr, Log_component::S_SERVER),
  m_config(config),
  m_transport(transport),
  m_worker(get_logger(), // Start the 1 thread below.
           /* (Linux) OS thread name will truncate the nickname to 15-4=11 chars here; the start of it should be
            * informative enough. */
           flow::util::ostream_op_string("Srv-", m_transport->nickname())),
  m_pool(m_config.m_max_connections),
  m_session_count(0),
  m_started(false),
  m_closing(false),
  m_close_called(false),
  m_next_conn_id(0),
  m_next_handle(0)
{
  using flow::async::reset_thread_pinning;

  assert(m_transport);

  FLOW_LOG_INFO("Server [" << *this << "]: Created with config [" << m_config << "]; starting worker thread.  "
                "Listening will begin on start().");

  m_worker.start([this]()
  {
    reset_thread_pinning(get_logger()); // Don't inherit any strange core-affinity!  Worker must float free.
  });
}

Server::~Server()
{
  // We are in thread U.  By contract in doc header, they must not call us from a hook (thread W).
  close();
  FLOW_LOG_TRACE("Server [" << *this << "]: Destroying.");
}

void Server::start(Error_code* err_code)
{
  using flow::async::Synchronicity;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { start(actual_err_code); },
         err_code, "Server::start()"))
  {
    return;
  }
  // else

  if (m_close_called)
  {
    FLOW_LOG_WARNING("Server [" << *this << "]: start() called after close().  Ignoring.");
    *err_code = error::Code::S_SERVER_ALREADY_STARTED;
    return;
  }
  // else

  Error_code result;
  m_worker.post([&]()
  {
    // We are in thread W.
    if (m_started || m_closing)
    {
      FLOW_LOG_WARNING("Server [" << *this << "]: start() called, but it was already called successfully.  "
                       "Ignoring.");
      result = error::Code::S_SERVER_ALREADY_STARTED;
      return;
    }
    // else

    if (m_config.chunk_size() == 0)
    {
      FLOW_LOG_WARNING("Server [" << *this << "]: start() called, but config [" << m_config << "] specifies "
                       "zero chunk size.  Refusing.");
      result = error::Code::S_INVALID_ARGUMENT;
      return;
    }
    // else

    m_transport->listen(m_worker.task_engine().get(), &result);
    if (result)
    {
      FLOW_LOG_WARNING("Server [" << *this << "]: Listener setup failed with [" << result << "] "
                       "[" << result.message() << "].  Server remains unstarted; start() may be retried.");
      return;
    }
    // else

    m_started = true;
    m_transport->start_accept_loop([this](const Error_code& async_err_code, transport::Peer_socket&& peer_socket,
                                          transport::Peer_identity&& peer_identity)
    {
      // We are in thread W.
      on_peer(async_err_code, std::move(peer_socket), std::move(peer_identity));
    });

    FLOW_LOG_INFO("Server [" << *this << "]: Started; accepting connections.");
  }, Synchronicity::S_ASYNC_AND_AWAIT_CONCURRENT_COMPLETION); // m_worker.post()

  *err_code = result;
} // Server::start()

void Server::close()
{
  if (m_close_called.exchange(true))
  {
    return; // Already closed (or being closed).
  }
  // else

  FLOW_LOG_INFO("Server [" << *this << "]: Closing: listener shall close; all sessions shall be canceled; then "
                "worker thread shall stop.");

  using boost::promise;

  promise<void> drained_promise;
  auto drained = drained_promise.get_future();

  m_worker.post([&]()
  {
    // We are in thread W.
    m_closing = true;
    if (m_started)
    {
      m_transport->close();
    }

    FLOW_LOG_INFO("Server [" << *this << "]: Canceling [" << m_pool.size() << "] sessions.");
    m_pool.cancel_all();

    if (m_pool.size() == 0)
    {
      drained_promise.set_value();
      return;
    }
    // else
    FLOW_LOG_INFO("Server [" << *this << "]: Awaiting [" << m_pool.size() << "] sessions' finishing.");
    m_on_drained_func = [&]() { drained_promise.set_value(); };
  });

  drained.wait();

  m_worker.stop();
  // Thread W is (synchronously!) no more.

  FLOW_LOG_INFO("Server [" << *this << "]: Closed.");
} // Server::close()

void Server::on_peer(const Error_code& err_code, transport::Peer_socket&& peer_socket,
                     transport::Peer_identity&& peer_identity)
{
  // We are in thread W.
  if (err_code)
  {
    FLOW_LOG_WARNING("Server [" << *this << "]: Listener failed fatally; it is closed, and no more connections "
                     "shall be accepted.  Existing sessions are unaffected.  Details follow.");
    const auto& sys_err_code = err_code;
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    return;
  }
  // else

  const Connection::Ptr conn(new Connection(get_logger(), ++m_next_conn_id, std::move(peer_socket),
                                            std::move(peer_identity), m_config.m_default_mode));

  if (m_closing || (!m_pool.admit()))
  {
    FLOW_LOG_INFO("Server [" << *this << "]: Accepted connection [" << *conn << "] but shall close it at once, "
                  "running no session: "
                  << (m_closing ? "server is closing."
                                : flow::util::ostream_op_string("at capacity [", *m_pool.max_size(), "].")));
    conn->mark_closing();
    conn->close_socket();
    on_connection_rejected(conn, m_closing ? error::Code::S_SESSION_CANCELED
                                           : error::Code::S_POOL_CAPACITY_EXCEEDED);
    return;
  }
  // else

  const auto handle = ++m_next_handle;
  const auto session
    = boost::make_shared<Session>(get_logger(), handle, m_config, conn,
                                  [this](const Connection::Ptr& auth_conn, On_authenticated_func&& on_done_func)
  {
    async_authenticate(auth_conn, std::move(on_done_func));
  },
                                  [this](Message&& msg, util::Task&& on_done_func)
  {
    async_handle_message(std::move(msg), std::move(on_done_func));
  },
                                  [this, handle, conn](const Error_code& result)
  {
    on_session_finished_internal(handle, conn, result);
  });

  m_pool.register_session(handle, session);
  ++m_session_count;

  FLOW_LOG_INFO("Server [" << *this << "]: Admitted connection [" << *conn << "] as session [" << *session << "]; "
                "sessions now [" << m_pool.size() << "].");

  session->start();
} // Server::on_peer()

void Server::on_session_finished_internal(Session_handle handle, const Connection::Ptr& conn,
                                          const Error_code& result)
{
  // We are in thread W.
  [[maybe_unused]] const bool erased = m_pool.deregister_session(handle);
  assert(erased && "Session finished twice?");
  --m_session_count;

  on_session_finished(conn, result);

  if (m_on_drained_func && (m_pool.size() == 0))
  {
    FLOW_LOG_INFO("Server [" << *this << "]: Last session finished while closing.");
    auto on_drained_func = std::move(m_on_drained_func);
    m_on_drained_func = util::Task();
    on_drained_func();
  }
}

void Server::async_send(const Connection::Ptr& conn, const util::Blob_const& payload, Task_err&& on_done_func)
{
  using flow::async::Synchronicity;

  // We are in thread U or W.
  if (m_close_called)
  {
    // Thread W is stopped (or about to be); nothing posted now would run.
    FLOW_LOG_WARNING("Server [" << *this << "]: Send of [" << payload.size() << "] bytes requested after close().  "
                     "Refusing.");
    if (on_done_func)
    {
      on_done_func(error::Code::S_STALE_CONNECTION);
    }
    return;
  }
  // else

  const auto payload_copy = copy_payload(payload);
  m_worker.post([this, conn, payload_copy, on_done_func = std::move(on_done_func)]() mutable
  {
    send_in_w(conn, payload_copy, std::move(on_done_func));
  }, Synchronicity::S_OPPORTUNISTIC_SYNC_ELSE_ASYNC);
}

void Server::async_send(const std::vector<Connection::Ptr>& conns, const util::Blob_const& payload,
                        Task_err&& on_done_func)
{
  using flow::async::Synchronicity;

  if (m_close_called)
  {
    FLOW_LOG_WARNING("Server [" << *this << "]: Send of [" << payload.size() << "] bytes to [" << conns.size() << "] "
                     "connections requested after close().  Refusing each.");
    if (on_done_func)
    {
      for (size_t idx = 0; idx != conns.size(); ++idx)
      {
        on_done_func(error::Code::S_STALE_CONNECTION);
      }
    }
    return;
  }
  // else

  // Copy once; every connection writes the same (immutable) blob.
  const auto payload_copy = copy_payload(payload);
  m_worker.post([this, conns, payload_copy, on_done_func = std::move(on_done_func)]()
  {
    for (const auto& conn : conns)
    {
      send_in_w(conn, payload_copy, Task_err(on_done_func));
    }
  }, Synchronicity::S_OPPORTUNISTIC_SYNC_ELSE_ASYNC);
}

void Server::send_in_w(const Connection::Ptr& conn, const boost::shared_ptr<const flow::util::Blob>& payload,
                       Task_err&& on_done_func)
{
  // We are in thread W.
  if (!conn)
  {
    FLOW_LOG_WARNING("Server [" << *this << "]: Send of [" << payload->size() << "] bytes to a connection that "
                     "no longer exists.  Refusing.");
    if (on_done_func)
    {
      on_done_func(error::Code::S_STALE_CONNECTION);
    }
    return;
  }
  // else

  FLOW_LOG_TRACE("Server [" << *this << "]: Queuing send of [" << payload->size() << "] bytes to "
                 "[" << *conn << "].");
  conn->async_send(payload, conn->mode() != Connection_mode::S_PERSISTENT, std::move(on_done_func));
}

boost::shared_ptr<const flow::util::Blob> Server::copy_payload(const util::Blob_const& payload) const
{
  const auto copy = boost::make_shared<flow::util::Blob>(get_logger());
  copy->assign_copy(payload);
  return copy;
}

size_t Server::session_count() const
{
  return m_session_count;
}

const Server_config& Server::config() const
{
  return m_config;
}

void Server::async_authenticate(const Connection::Ptr& conn, On_authenticated_func&& on_done_func)
{
  FLOW_LOG_TRACE("Server [" << *this << "]: Default authentication: accepting [" << *conn << "].");
  on_done_func(true);
}

void Server::async_handle_message(Message&& msg, util::Task&& on_done_func)
{
  const auto sender = msg.sender();
  FLOW_LOG_INFO("Server [" << *this << "]: Default message handler: received message of [" << msg.payload().size()
                << "] bytes from [" << (sender ? flow::util::ostream_op_string(*sender) : "(gone)") << "].");
  FLOW_LOG_DATA("Server [" << *this << "]: Message contents: "
                "[\n" << flow::util::buffers_dump_string(msg.payload_buffer(), "  ") << "].");
  on_done_func();
}

void Server::on_session_finished(const Connection::Ptr& conn, const Error_code& result)
{
  if (result)
  {
    FLOW_LOG_INFO("Server [" << *this << "]: Session on [" << *conn << "] finished with error [" << result << "] "
                  "[" << result.message() << "].");
    return;
  }
  // else
  FLOW_LOG_INFO("Server [" << *this << "]: Session on [" << *conn << "] finished normally.");
}

void Server::on_connection_rejected(const Connection::Ptr&, const Error_code&)
{
  // Do nothing by default.
}

std::ostream& operator<<(std::ostream& os, const Server& val)
{
  return os << "srv[" << val.m_transport->nickname() << "]@" << static_cast<const void*>(&val);
}

} // namespace ipcsrv::server
