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

#include "ipcsrv/util/util_fwd.hpp"
#include <boost/asio.hpp>

/**
 * Additional (versus boost.asio) APIs for advanced work with local stream (Unix domain) sockets, as used by
 * transport::Local_stream_transport: the boost.asio type aliases, the peer-credentials socket option, and endpoint
 * construction from a file-system path.
 *
 * Local stream sockets are addressed here by a node in the file system (not the Linux abstract namespace): that
 * is how clients such as command-line tools find a daemon, and the node's permissions then gate who may connect.
 */
namespace ipcsrv::transport::asio_local_stream_socket
{

// Types.

/// Short-hand for boost.asio Unix domain socket namespace.
namespace local_ns = boost::asio::local;

/// Short-hand for boost.asio Unix domain stream-socket protocol.
using Protocol = local_ns::stream_protocol;

/// Short-hand for boost.asio Unix domain stream-socket acceptor (listening guy) socket.
using Acceptor = Protocol::acceptor;

/// Short-hand for boost.asio Unix domain peer stream-socket (usually-connected-or-empty guy).
using Peer_socket = Protocol::socket;

/// Short-hand for boost.asio Unix domain peer stream-socket endpoint.
using Endpoint = Protocol::endpoint;

class Opt_peer_process_credentials;

// Free functions.

/**
 * Returns an `Endpoint` corresponding to the given file-system path.  Fails if the path is too long to fit a
 * `sockaddr_un` (on Linux `sun_path` holds 107 characters plus NUL).
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param path
 *        Path of the socket node.  It need not exist (bind creates it).
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        whatever boost.asio reports (as of Boost 1.74: `name_too_long`).
 * @return `Endpoint` on success; default-constructed one on error.
 */
Endpoint endpoint_at_path(flow::log::Logger* logger_ptr, const fs::path& path, Error_code* err_code = 0);

} // namespace ipcsrv::transport::asio_local_stream_socket
