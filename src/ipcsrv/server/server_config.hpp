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

#include "ipcsrv/server/server_fwd.hpp"
#include <optional>

namespace ipcsrv::server
{

// Types.

/**
 * Server configuration, passed by value to the Server constructor.  A default-constructed one is valid:
 * unbounded reads in `S_TEXT_DATA` mode, S_DEFAULT_CHUNK_SIZE-sized reads, unbounded concurrency,
 * Connection_mode::S_TEXT_DATA, S_DEFAULT_CLOSE_LINGER.
 *
 * Transport parameters (socket path, TCP endpoint, socket-node permissions) are not here: they are the business of
 * the transport::Transport_adapter given to the Server.
 */
struct Server_config
{
  // Constants.

  /// Read buffer size used if #m_chunk_size is not set.
  static constexpr size_t S_DEFAULT_CHUNK_SIZE = 64 * 1024;

  /// Default for #m_close_linger.
  static const util::Fine_duration S_DEFAULT_CLOSE_LINGER;

  // Data.

  /**
   * Maximum total number of payload bytes a session may accumulate in Connection_mode::S_TEXT_DATA before the client
   * ends its message; one more byte fails the session with error::Code::S_MESSAGE_LIMIT_EXCEEDED.  Unset means
   * unbounded.  Not applicable to chunked modes (there #m_chunk_size bounds each Message).
   */
  std::optional<size_t> m_read_limit;

  /**
   * Maximum number of bytes requested per read; hence the maximum size of each chunked-mode Message.
   * Unset means S_DEFAULT_CHUNK_SIZE.  Zero is invalid (Server::start() fails with error::Code::S_INVALID_ARGUMENT).
   */
  std::optional<size_t> m_chunk_size;

  /**
   * Maximum number of concurrently running sessions; a connection accepted while at capacity is closed immediately
   * without a session.  Unset means unbounded.
   */
  std::optional<size_t> m_max_connections;

  /// The Connection_mode with which each session begins.
  Connection_mode m_default_mode = Connection_mode::S_TEXT_DATA;

  /**
   * How long a closing session waits, after flushing its sends and ending its outbound direction, before closing the
   * socket; gives the peer a chance to read the final bytes before any reset.  Zero is allowed.
   */
  util::Fine_duration m_close_linger = S_DEFAULT_CLOSE_LINGER;

  // Methods.

  /**
   * Returns #m_chunk_size or its default.
   * @return See above.
   */
  size_t chunk_size() const;
}; // struct Server_config

} // namespace ipcsrv::server
