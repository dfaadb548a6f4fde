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
 * A command of the in-band control sub-protocol.  A client may send one or more command headers at the start of a
 * read (in Connection_mode::S_PERSISTENT: at the start of any read; otherwise only before its first payload byte);
 * the server consumes them instead of treating them as payload.
 *
 * ### Wire format ###
 * Exactly S_COMMAND_HEADER_SIZE bytes: the ESC byte (`0x1B`), ASCII `CMD`, then the command's value as 4 ASCII
 * decimal digits (PING = `0001`, and so on).  Anything else (including a header with an unknown number) is
 * payload.  The leading ESC makes a collision with text payloads unlikely; a binary payload can collide
 * (the parse is advisory: never a protocol error).
 */
enum class Command
{
  /// Liveness probe; the server replies with a PONG header immediately, and the session continues.
  S_PING = 1,

  /// Reply to a PING; acknowledged (logged) only.
  S_PONG,

  /// Switch the session to Connection_mode::S_STREAM_DATA.
  S_SET_STREAM,

  /// Switch the session to Connection_mode::S_TEXT_DATA.
  S_SET_DATA,

  /// Sentinel: not a valid value.
  S_END_SENTINEL
}; // enum class Command

// Constants.

/// Size of a command header on the wire.
constexpr size_t S_COMMAND_HEADER_SIZE = 8;

/// First byte of a command header (ASCII ESC).
constexpr uint8_t S_COMMAND_HEADER_LEAD_BYTE = 0x1B;

// Free functions.

/**
 * Parses a command header at the start of the given bytes.
 *
 * @param bytes
 *        Bytes; only the first S_COMMAND_HEADER_SIZE are examined.
 * @return The Command, if `bytes` begins with a valid header; else none (not a command: payload).
 */
std::optional<Command> parse_command_header(const util::Blob_const& bytes);

/**
 * Returns the wire encoding of the given command; e.g., for use by a client, or to send a PONG.
 *
 * @param cmd
 *        A Command other than `S_END_SENTINEL`.
 * @return Exactly S_COMMAND_HEADER_SIZE bytes.
 */
std::string command_header(Command cmd);

/**
 * Prints string representation of the given Command to the given `ostream`, e.g., `PING`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Command val);

} // namespace ipcsrv::server
