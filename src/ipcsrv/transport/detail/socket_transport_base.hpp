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

#include "ipcsrv/transport/transport_adapter.hpp"
#include "ipcsrv/transport/error.hpp"
#include <flow/log/log.hpp>
#include <flow/error/error.hpp>
#include <flow/util/util.hpp>
#include <boost/move/unique_ptr.hpp>
#include <boost/chrono/round.hpp>
#include <optional>

namespace ipcsrv::transport
{

// Types.

/**
 * Internal-use implementation of Transport_adapter common to the boost.asio socket-based adapters (local stream,
 * TCP): acceptor setup and the async-accept chain.  A sub-class supplies the protocol-specific steps by
 * implementing a handful of `protected` `virtual`s.
 *
 * ### Accept chain ###
 * One `async_accept()` is outstanding at a time; its handler hands the new peer off (as a generic Peer_socket
 * wrapping the released native handle, after the sub-class extracts the identity) and starts the next one.
 * Errors are handled per Transport_adapter doc header: `connection_aborted` is skipped; resource exhaustion
 * (`EMFILE`, `ENFILE`, `ENOBUFS`, `ENOMEM`) waits S_RESOURCE_EXHAUSTION_RETRY_PERIOD and retries; an error
 * meaning the listening socket itself is unusable (`EBADF`, `EINVAL`, `ENOTSOCK`) closes the listener and is
 * reported to On_peer_func once; anything else (network errors of the pending connection, `EPERM`, ...) is logged
 * and the next accept is started at once.
 *
 * @tparam Protocol
 *         boost.asio stream protocol, e.g., `boost::asio::local::stream_protocol`, `boost::asio::ip::tcp`.
 */
template<typename Protocol>
class Socket_transport_base :
  public Transport_adapter,
  public flow::log::Log_context
{
public:
  // Types.

  /// Short-hand for boost.asio acceptor type of #Protocol.
  using Acceptor = typename Protocol::acceptor;

  /// Short-hand for boost.asio endpoint type of #Protocol.
  using Endpoint = typename Protocol::endpoint;

  /// Short-hand for boost.asio (non-generic) peer socket type of #Protocol.
  using Protocol_socket = typename Protocol::socket;

  // Constants.

  /// How long to wait before accepting again after a resource-exhaustion accept error.
  static const util::Fine_duration S_RESOURCE_EXHAUSTION_RETRY_PERIOD;

  // Methods.

  /**
   * Implements Transport_adapter API.
   * @param task_engine
   *        See Transport_adapter.
   * @param err_code
   *        See Transport_adapter.
   */
  void listen(Task_engine* task_engine, Error_code* err_code = 0) override;

  /**
   * Implements Transport_adapter API.
   * @param on_peer_func
   *        See Transport_adapter.
   */
  void start_accept_loop(On_peer_func&& on_peer_func) override;

  /// Implements Transport_adapter API.
  void close() override;

protected:
  // Constructors/destructor.

  /**
   * Constructs in not-listening state.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param nickname_str
   *        See Transport_adapter::nickname().
   */
  explicit Socket_transport_base(flow::log::Logger* logger_ptr, std::string&& nickname_str);

  /// Destroys; a sub-class destructor must have already invoked close().
  ~Socket_transport_base() override;

  // Methods.

  /**
   * Invoked by listen() before anything else is done: performs any preparation and returns the endpoint to
   * bind.
   *
   * @param err_code
   *        Not null.  Set to truthy to fail listen() with that code.
   * @return The endpoint; ignored on error.
   */
  virtual Endpoint prepare_listen(Error_code* err_code) = 0;

  /**
   * Invoked by listen() after the acceptor has successfully bound and is listening.
   *
   * @param acceptor
   *        The listening acceptor.
   * @param err_code
   *        Not null.  Set to truthy to fail listen() with that code (the listener is then closed, including
   *        on_closed()).
   */
  virtual void on_listening(const Acceptor& acceptor, Error_code* err_code) = 0;

  /**
   * Invoked upon each successful accept, to determine the identity of the peer.
   *
   * @param peer_socket
   *        The connected socket.
   * @param err_code
   *        Not null.  Set to truthy to drop this peer (logged, not fatal).
   * @return The identity; ignored on error.
   */
  virtual Peer_identity peer_identity(const Protocol_socket& peer_socket, Error_code* err_code) = 0;

  /// Invoked by close() after the listener is closed, if listen() had gotten at least as far as on_listening().
  virtual void on_closed() = 0;

private:
  // Methods.

  /// Starts the next `async_accept()`.
  void async_accept_next();

  /**
   * Handler of each `async_accept()`.
   *
   * @param sys_err_code
   *        Result.
   * @param peer_socket
   *        The new peer socket if `!sys_err_code`.
   */
  void on_peer_socket_or_error(const Error_code& sys_err_code, Protocol_socket&& peer_socket);

  // Data.

  /// Event loop given to listen(); null until then.
  Task_engine* m_task_engine;

  /// The listener; null if not listening.
  boost::movelib::unique_ptr<Acceptor> m_acceptor;

  /// Protocol with which accepted sockets are wrapped into Peer_socket; set by listen().
  std::optional<boost::asio::generic::stream_protocol> m_generic_protocol;

  /// Timer for resource-exhaustion retry; exists while #m_acceptor does.
  boost::movelib::unique_ptr<flow::util::Timer> m_retry_timer;

  /// From start_accept_loop(); empty until then and after close().
  On_peer_func m_on_peer_func;
}; // class Socket_transport_base

// Template initializers.

template<typename Protocol>
const util::Fine_duration Socket_transport_base<Protocol>::S_RESOURCE_EXHAUSTION_RETRY_PERIOD
  = boost::chrono::milliseconds(100);

// Template implementations.

template<typename Protocol>
Socket_transport_base<Protocol>::Socket_transport_base(flow::log::Logger* logger_ptr, std::string&& nickname_str) :
  Transport_adapter(std::move(nickname_str)),
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_task_engine(0)
{
  // That's it.
}

template<typename Protocol>
Socket_transport_base<Protocol>::~Socket_transport_base()
{
  assert((!m_acceptor) && "Sub-class destructor must close() first.");
}

template<typename Protocol>
void Socket_transport_base<Protocol>::listen(Task_engine* task_engine, Error_code* err_code)
{
  using boost::system::system_error;
  using boost::movelib::make_unique;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { listen(task_engine, actual_err_code); },
         err_code, "Socket_transport_base::listen()"))
  {
    return;
  }
  // else
  assert(task_engine);

  if (m_acceptor)
  {
    FLOW_LOG_WARNING("Transport [" << *this << "]: listen() called but already listening.  Ignoring.");
    *err_code = error::Code::S_LISTENER_ALREADY_STARTED;
    return;
  }
  // else

  const auto local_endpoint = prepare_listen(err_code);
  if (*err_code) // It logged.
  {
    return;
  }
  // else

  try
  {
    // Throws on error.  (No error-code-returning API; normal in boost.asio ctors.)  Opens, binds, listens.
    m_acceptor.reset(new Acceptor(*task_engine, local_endpoint));
  }
  catch (const system_error& exc)
  {
    assert(!m_acceptor);
    FLOW_LOG_WARNING("Transport [" << *this << "]: Unable to open/bind/listen at [" << local_endpoint << "]; "
                     "details logged below.");
    const auto& sys_err_code = *err_code = exc.code();
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    return;
  }
  // Got here: listening.

  m_task_engine = task_engine;
  m_generic_protocol.emplace(local_endpoint.protocol());
  m_retry_timer = make_unique<flow::util::Timer>(*m_task_engine);

  on_listening(*m_acceptor, err_code);
  if (*err_code) // It logged.
  {
    FLOW_LOG_WARNING("Transport [" << *this << "]: Post-listen setup failed; closing.");
    close();
    return;
  }
  // else

  FLOW_LOG_INFO("Transport [" << *this << "]: Listening at [" << local_endpoint << "].");
} // Socket_transport_base::listen()

template<typename Protocol>
void Socket_transport_base<Protocol>::start_accept_loop(On_peer_func&& on_peer_func)
{
  assert(m_acceptor && "Must successfully listen() first.");
  assert((!m_on_peer_func) && "start_accept_loop() may be called once per listen().");

  m_on_peer_func = std::move(on_peer_func);
  FLOW_LOG_INFO("Transport [" << *this << "]: Starting accept loop.");
  async_accept_next();
}

template<typename Protocol>
void Socket_transport_base<Protocol>::async_accept_next()
{
  FLOW_LOG_TRACE("Transport [" << *this << "]: Starting the next background accept.");
  m_acceptor->async_accept([this](const Error_code& async_err_code, Protocol_socket peer_socket)
  {
    // We are in thread W.
    on_peer_socket_or_error(async_err_code, std::move(peer_socket));
  });
}

template<typename Protocol>
void Socket_transport_base<Protocol>::on_peer_socket_or_error(const Error_code& sys_err_code,
                                                              Protocol_socket&& peer_socket)
{
  namespace errc = boost::system::errc;
  using boost::asio::error::operation_aborted;

  // We are in thread W.
  if ((sys_err_code == operation_aborted) || (!m_acceptor))
  {
    return; // close() was called.  (If a peer did get accepted just before that, its socket closes on scope exit.)
  }
  // else

  if (sys_err_code)
  {
    if (sys_err_code == boost::asio::error::connection_aborted)
    {
      FLOW_LOG_WARNING("Transport [" << *this << "]: Incoming connection aborted halfway during connection; "
                       "ignoring.  Still listening.");
      async_accept_next();
      return;
    }
    // else

    if ((sys_err_code == boost::asio::error::no_descriptors)
        || (sys_err_code == errc::too_many_files_open_in_system)
        || (sys_err_code == boost::asio::error::no_buffer_space)
        || (sys_err_code == boost::asio::error::no_memory))
    {
      FLOW_LOG_WARNING("Transport [" << *this << "]: Accept failed due to resource exhaustion; shall retry in "
                       "[" << boost::chrono::round<boost::chrono::milliseconds>
                                (S_RESOURCE_EXHAUSTION_RETRY_PERIOD) << "].  Details follow.");
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();

      m_retry_timer->expires_after(S_RESOURCE_EXHAUSTION_RETRY_PERIOD);
      m_retry_timer->async_wait([this](const Error_code& async_err_code)
      {
        // We are in thread W.
        if ((async_err_code == operation_aborted) || (!m_acceptor))
        {
          return;
        }
        // else
        async_accept_next();
      });
      return;
    }
    // else

    if ((sys_err_code == boost::asio::error::bad_descriptor)
        || (sys_err_code == boost::asio::error::invalid_argument)
        || (sys_err_code == errc::not_a_socket))
    {
      // The listening socket itself is unusable.
      FLOW_LOG_WARNING("Transport [" << *this << "]: The background accept failed fatally.  "
                       "Closing listener; no longer listening.  Details follow.");
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();

      auto on_peer_func = std::move(m_on_peer_func);
      close();
      on_peer_func(sys_err_code, Peer_socket(*m_task_engine), Peer_identity());
      return;
    }
    // else

    /* Per accept(2) the pending connection's own network errors (EPROTO, ENETDOWN, EHOSTUNREACH, EPERM, ...)
     * are reported here too; the listener is fine, so treat them like the aborted-connection case. */
    FLOW_LOG_WARNING("Transport [" << *this << "]: Accept of one incoming connection failed; ignoring.  "
                     "Still listening.  Details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    async_accept_next();
    return;
  } // if (sys_err_code)
  // else if (!sys_err_code)

  Error_code identity_err_code;
  auto identity = peer_identity(peer_socket, &identity_err_code);
  if (identity_err_code)
  {
    FLOW_LOG_WARNING("Transport [" << *this << "]: Accepted a peer but could not determine its identity; "
                     "dropping it.  Still listening.  Error: "
                     "[" << identity_err_code << "] [" << identity_err_code.message() << "].");
    async_accept_next();
    return; // peer_socket closes on scope exit.
  }
  // else

  /* The server core deals in protocol-agnostic sockets; so eject the native handle and have a generic socket
   * take it over.  It's the same event loop, and no async op has been started on it, so this is safe.
   * .release() won't fail in Linux (it's unsupported only in old Windows); but use the non-throwing form anyway. */
#ifndef FLOW_OS_LINUX
  static_assert(false, "Should not have gotten to this line; should have required Linux; "
                         "the next thing assumes not-Win-<8.1.");
#endif
  Error_code release_err_code;
  const auto native_peer_socket = peer_socket.release(release_err_code);
  if (release_err_code)
  {
    FLOW_LOG_WARNING("Transport [" << *this << "]: Could not eject native handle of new peer socket; "
                     "dropping it.  Error: [" << release_err_code << "] [" << release_err_code.message() << "].");
    async_accept_next();
    return;
  }
  // else

  FLOW_LOG_TRACE("Transport [" << *this << "]: Accepted peer [" << identity << "] "
                 "(native handle [" << native_peer_socket << "]); handing it off.");

  /* Start the next accept first: the callee may close() us synchronously, and close() promises no more
   * callbacks; so this is simplest. */
  async_accept_next();
  m_on_peer_func(Error_code(), Peer_socket(*m_task_engine, *m_generic_protocol, native_peer_socket),
                 std::move(identity));
} // Socket_transport_base::on_peer_socket_or_error()

template<typename Protocol>
void Socket_transport_base<Protocol>::close()
{
  if (!m_acceptor)
  {
    return;
  }
  // else

  FLOW_LOG_INFO("Transport [" << *this << "]: Closing listener.");

  /* The destructors cancel any outstanding async_accept()/async_wait(); their handlers will see operation_aborted
   * and do nothing (as will any already-queued successful one, as m_acceptor is null). */
  Error_code dummy;
  m_acceptor->close(dummy);
  m_acceptor.reset();
  m_retry_timer.reset();
  m_on_peer_func = On_peer_func();

  on_closed();
} // Socket_transport_base::close()

} // namespace ipcsrv::transport
