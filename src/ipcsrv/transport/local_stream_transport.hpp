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
#include "ipcsrv/transport/asio_local_stream_socket_fwd.hpp"

namespace ipcsrv::transport
{

// Types.

/**
 * Transport_adapter that listens on a local stream (Unix domain) socket whose node lives at a given file-system
 * path; the peer identity of each connection is the kernel-reported process credentials (`SO_PEERCRED`) of the
 * connecting process.
 *
 * ### File-system node ###
 * listen() resolves the path (a relative path is taken relative to util::IPCSRV_KERNEL_PERSISTENT_RUN_DIR),
 * then:
 *   - fails with error::Code::S_INVALID_ARGUMENT if the path is empty;
 *   - fails with `errc::is_a_directory` if a directory exists there;
 *   - otherwise removes whatever else is there, most likely a socket node left behind by a previous instance
 *     that did not exit cleanly;
 *   - binds and listens, creating the node;
 *   - sets the node's permissions per the Permissions_level given to the ctor (who can write the node
 *     can connect).
 *
 * close() removes the node.
 */
class Local_stream_transport :
  public Socket_transport_base<asio_local_stream_socket::Protocol>
{
public:
  // Constructors/destructor.

  /**
   * Constructs in not-listening state.  No file-system or socket operations are performed.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param path
   *        Socket node path.  See class doc header.
   * @param permissions_lvl
   *        Access to the socket node.  The default allows only processes running as our effective user.
   */
  explicit Local_stream_transport(flow::log::Logger* logger_ptr, const fs::path& path,
                                  util::Permissions_level permissions_lvl = util::Permissions_level::S_USER_ACCESS);

  /// Closes (see close()) if needed.
  ~Local_stream_transport() override;

  // Methods.

  /**
   * The resolved (absolute) socket node path.
   * @return See above.
   */
  const fs::path& path() const;

protected:
  // Methods.

  /**
   * Implements Socket_transport_base API: validates path, removes stale node.
   * @param err_code
   *        See Socket_transport_base.
   * @return See Socket_transport_base.
   */
  Endpoint prepare_listen(Error_code* err_code) override;

  /**
   * Implements Socket_transport_base API: sets node permissions.
   * @param acceptor
   *        See Socket_transport_base.
   * @param err_code
   *        See Socket_transport_base.
   */
  void on_listening(const Acceptor& acceptor, Error_code* err_code) override;

  /**
   * Implements Socket_transport_base API: obtains `SO_PEERCRED`.
   * @param peer_socket
   *        See Socket_transport_base.
   * @param err_code
   *        See Socket_transport_base.
   * @return util::Process_credentials.
   */
  Peer_identity peer_identity(const Protocol_socket& peer_socket, Error_code* err_code) override;

  /// Implements Socket_transport_base API: removes the node.
  void on_closed() override;

private:
  // Data.

  /// See path().
  const fs::path m_path;

  /// See ctor.
  const util::Permissions_level m_permissions_lvl;
}; // class Local_stream_transport

} // namespace ipcsrv::transport
