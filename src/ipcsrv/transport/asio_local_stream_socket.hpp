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

#include "ipcsrv/transport/asio_local_stream_socket_fwd.hpp"
#include "ipcsrv/util/process_credentials.hpp"
#include <flow/util/util.hpp>
#include <stdexcept>

namespace ipcsrv::transport::asio_local_stream_socket
{

// Types.

/**
 * Gettable (read-only) socket option for use with boost.asio API `Peer_socket::get_option()` that gets the
 * credentials (PID, UID, GID) of the process on the other side of a connected local stream socket.
 * For example:
 *
 *   ~~~
 *   Opt_peer_process_credentials creds;
 *   peer_socket.get_option(creds, err_code); // Or: get_option(creds); to throw instead.
 *   // creds.process_id() and so on are now available.
 *   ~~~
 *
 * The kernel (Linux `SO_PEERCRED`) records these at `connect()` time; see util::Process_credentials for caveats.
 * The methods other than the constructors implement boost.asio's `GettableSocketOption` concept and are not
 * for direct use.
 */
class Opt_peer_process_credentials :
  public util::Process_credentials
{
public:
  // Constructors/destructor.

  /// Default ctor: each value is initialized to zero.
  Opt_peer_process_credentials();

  // Methods.

  /**
   * For boost.asio use, to enable `Peer_socket::get_option(Opt_peer_process_credentials&)` to work.
   * @tparam Protocol
   *         See concept API.
   * @param proto
   *        See concept API.
   * @return `SOL_SOCKET`.
   */
  template<typename Protocol>
  int level(const Protocol& proto) const;

  /**
   * For boost.asio use, to enable `Peer_socket::get_option(Opt_peer_process_credentials&)` to work.
   * @tparam Protocol
   *         See concept API.
   * @param proto
   *        See concept API.
   * @return `SO_PEERCRED`.
   */
  template<typename Protocol>
  int name(const Protocol& proto) const;

  /**
   * For boost.asio use, to enable `Peer_socket::get_option(Opt_peer_process_credentials&)` to work.
   * @tparam Protocol
   *         See concept API.
   * @param proto
   *        See concept API.
   * @return Pointer to the `ucred` the kernel shall fill.
   */
  template<typename Protocol>
  void* data(const Protocol& proto);

  /**
   * For boost.asio use, to enable `Peer_socket::get_option(Opt_peer_process_credentials&)` to work.
   * @tparam Protocol
   *         See concept API.
   * @param proto
   *        See concept API.
   * @return `sizeof(ucred)`.
   */
  template<typename Protocol>
  size_t size(const Protocol& proto) const;

  /**
   * For boost.asio use, to enable `Peer_socket::get_option(Opt_peer_process_credentials&)` to work.
   * The option is fixed-size; so this is a no-op unless the kernel reports a size other than size(), in which case
   * it throws `std::length_error` (boost.asio turns that into an exception out of `get_option()`).
   *
   * @tparam Protocol
   *         See concept API.
   * @param proto
   *        See concept API.
   * @param new_size_but_really_must_equal_current
   *        See concept API.
   */
  template<typename Protocol>
  void resize(const Protocol& proto, size_t new_size_but_really_must_equal_current) const;
}; // class Opt_peer_process_credentials

// Template implementations.

template<typename Protocol>
int Opt_peer_process_credentials::level(const Protocol&) const
{
  return SOL_SOCKET;
}

template<typename Protocol>
int Opt_peer_process_credentials::name(const Protocol&) const
{
  return SO_PEERCRED;
}

template<typename Protocol>
void* Opt_peer_process_credentials::data(const Protocol&)
{
  return static_cast<void*>(&m_val);
}

template<typename Protocol>
size_t Opt_peer_process_credentials::size(const Protocol&) const
{
  return sizeof(m_val);
}

template<typename Protocol>
void Opt_peer_process_credentials::resize(const Protocol& proto, size_t new_size_but_really_must_equal_current) const
{
  using flow::util::ostream_op_string;
  using std::length_error;

  if (new_size_but_really_must_equal_current != size(proto))
  {
    throw length_error(ostream_op_string
                         ("Opt_peer_process_credentials does not support resizing; kernel reported size [",
                          new_size_but_really_must_equal_current, "]; expected [", size(proto), "]."));
  }
}

} // namespace ipcsrv::transport::asio_local_stream_socket
