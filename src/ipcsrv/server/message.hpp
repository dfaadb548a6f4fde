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

#include "ipcsrv/server/connection.hpp"
#include <flow/util/blob.hpp>

namespace ipcsrv::server
{

// Types.

/**
 * A unit of payload received from a client, as given to Server::async_handle_message(): a complete logical message
 * in Connection_mode::S_TEXT_DATA, one chunk in the chunked modes.  It never contains command headers.
 *
 * Move-only; immutable.  The sender reference is weak: a Message does not keep its Connection alive (though
 * during the Server::async_handle_message() call the Connection is guaranteed to exist).
 */
class Message
{
public:
  // Constructors/destructor.

  /**
   * Constructs.
   *
   * @param payload
   *        The bytes; moved-from.
   * @param sender
   *        The Connection on which they arrived.
   */
  explicit Message(flow::util::Blob&& payload, const Connection::Ptr& sender);

  /**
   * Move-constructs.
   * @param src
   *        Moved-from object; becomes empty.
   */
  Message(Message&& src);

  /// Disallow copying.
  Message(const Message&) = delete;

  // Methods.

  /**
   * Move-assigns.
   * @param src
   *        Moved-from object; becomes empty.
   * @return `*this`.
   */
  Message& operator=(Message&& src);

  /// Disallow copying.
  Message& operator=(const Message&) = delete;

  /**
   * The bytes.
   * @return See above.
   */
  const flow::util::Blob& payload() const;

  /**
   * The bytes as a buffer (e.g., for Server::async_send() as an echo).
   * @return See above.
   */
  util::Blob_const payload_buffer() const;

  /**
   * Convenience: payload() as a string.
   * @return See above.
   */
  std::string payload_str() const;

  /**
   * The originating Connection, or null if it no longer exists.
   * @return See above.
   */
  Connection::Ptr sender() const;

private:
  // Data.

  /// See payload().
  flow::util::Blob m_payload;

  /// See sender().
  Connection::Observer m_sender;
}; // class Message

} // namespace ipcsrv::server
