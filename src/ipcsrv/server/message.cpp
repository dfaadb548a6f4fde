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
#include "ipcsrv/server/message.hpp"

namespace ipcsrv::server
{

// Implementations.

Message::Message(flow::util::Blob&& payload, const Connection::Ptr& sender) :
  m_payload(std::move(payload)),
  m_sender(sender)
{
  // That's it.
}

Message::Message(Message&&) = default;

Message& Message::operator=(Message&&) = default;

const flow::util::Blob& Message::payload() const
{
  return m_payload;
}

util::Blob_const Message::payload_buffer() const
{
  return m_payload.const_buffer();
}

std::string Message::payload_str() const
{
  return std::string(reinterpret_cast<const char*>(m_payload.const_data()), m_payload.size());
}

Connection::Ptr Message::sender() const
{
  return m_sender.lock();
}

} // namespace ipcsrv::server
