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

#include "ipcsrv/transport/transport_fwd.hpp"
#include <boost/shared_ptr.hpp>
#include <boost/weak_ptr.hpp>
#include <ostream>
#include <istream>

/**
 * ipcsrv module containing the connection lifecycle and session-framing engine.  The main class is Server:
 * construct it over a transport::Transport_adapter, start() it, and override its hooks
 * (Server::async_authenticate(), Server::async_handle_message(), and so on) to implement a service.
 * Each accepted client is represented by a Connection; each unit of received payload by a Message.
 *
 * ### Sessions, framing ###
 * Each admitted connection becomes a *session*: authentication hook; then a read loop whose framing depends on
 * the Connection_mode (see that doc header), steered optionally by the in-band Command sub-protocol; then
 * teardown.  Sessions run concurrently but all in the single thread of the Server (thread W).
 */
namespace ipcsrv::server
{

// Types.

// Find doc headers near the bodies of these compound types.

class Server;
struct Server_config;
class Connection;
class Message;
template<typename Session_obj>
class Connection_pool;
class Session;

/**
 * Opaque handle identifying a session within a Server (and its Connection_pool).  Unique within one Server for
 * its lifetime.
 */
using Session_handle = uint64_t;

/**
 * Framing discipline of a session: how received bytes are grouped into Message objects (and whether sending
 * ends the outbound direction).  A session starts in Server_config::m_default_mode; the Command sub-protocol
 * (SET_STREAM, SET_DATA) can switch it while the session runs.
 */
enum class Connection_mode
{
  /**
   * Discrete framing: all bytes until the client ends its outbound direction (end-of-stream) form exactly one
   * Message (none if there were no bytes), subject to Server_config::m_read_limit.  A send by the server
   * ends the server's outbound direction (the reply is the final word).
   */
  S_TEXT_DATA,

  /**
   * Chunked framing: each read (up to Server_config::m_chunk_size bytes) is one Message, in arrival order,
   * until end-of-stream.  No cross-chunk assembly.  Sends end the outbound direction as in `S_TEXT_DATA`.
   */
  S_STREAM_DATA,

  /**
   * Long-lived control channel: chunked framing as in `S_STREAM_DATA`, but command headers are recognized at the
   * start of every read (not only before the first payload byte), and sends do *not* end the outbound
   * direction, so that many request/reply exchanges can occur.
   */
  S_PERSISTENT,

  /// Sentinel: not a valid value.
  S_END_SENTINEL
}; // enum class Connection_mode

// Free functions.

/**
 * Prints string representation of the given Connection_mode to the given `ostream`, e.g., `TEXT_DATA`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Connection_mode val);

/**
 * Deserializes a Connection_mode from a standard input stream: case-insensitive symbol as written by `<<`,
 * or its `int` value; no match yields Connection_mode::S_END_SENTINEL.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Connection_mode& val);

/**
 * Prints string representation of the given Server_config to the given `ostream`.
 *
 * @relatesalso Server_config
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Server_config& val);

/**
 * Prints string representation of the given Connection to the given `ostream`.
 *
 * @relatesalso Connection
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Connection& val);

/**
 * Prints string representation of the given Server to the given `ostream`.
 *
 * @relatesalso Server
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Server& val);

/**
 * Prints string representation of the given Session to the given `ostream`.
 *
 * @relatesalso Session
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Session& val);

} // namespace ipcsrv::server
