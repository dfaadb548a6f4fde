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
#include <variant>
#include <ostream>

/**
 * ipcsrv module providing the listening side of the server: a transport adapter opens a listener, accepts
 * incoming connections, and hands each to the server core as a connected stream socket plus the peer's
 * identity.  The server core (ipcsrv::server) knows only the abstract Transport_adapter; the concrete adapters
 * are Local_stream_transport (local stream socket at a file-system path) and Tcp_transport.
 */
namespace ipcsrv::transport
{

// Types.

// Find doc headers near the bodies of these compound types.

class Transport_adapter;
class Local_stream_transport;
class Tcp_transport;
struct Network_peer_identity;

/// Short-hand for boost.asio event loop.
using Task_engine = flow::util::Task_engine;

/**
 * The connected peer stream socket as handed by any Transport_adapter to the server core: a protocol-agnostic
 * boost.asio stream socket.  Its underlying protocol is that of the adapter (local or TCP); the server core never
 * needs to know which.
 */
using Peer_socket = boost::asio::generic::stream_protocol::socket;

/**
 * The identity of a connected peer, determined once at acceptance: the kernel-reported process credentials of a
 * local-socket peer; or the endpoint pair of a network peer.
 */
using Peer_identity = std::variant<util::Process_credentials, Network_peer_identity>;

// Free functions.

/**
 * Prints string representation of the given Transport_adapter to the given `ostream`.
 *
 * @relatesalso Transport_adapter
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Transport_adapter& val);

/**
 * Prints string representation of the given Network_peer_identity to the given `ostream`.
 *
 * @relatesalso Network_peer_identity
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Network_peer_identity& val);

/**
 * Prints string representation of the given Peer_identity (whichever alternative it holds) to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Peer_identity& val);

} // namespace ipcsrv::transport
