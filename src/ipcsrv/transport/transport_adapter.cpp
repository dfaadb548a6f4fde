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
#include "ipcsrv/transport/transport_adapter.hpp"

namespace ipcsrv::transport
{

// Implementations.

Transport_adapter::Transport_adapter(std::string&& nickname_str) :
  m_nickname(std::move(nickname_str))
{
  // That's it.
}

Transport_adapter::~Transport_adapter() = default;

const std::string& Transport_adapter::nickname() const
{
  return m_nickname;
}

std::ostream& operator<<(std::ostream& os, const Transport_adapter& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

std::ostream& operator<<(std::ostream& os, const Network_peer_identity& val)
{
  return os << "peer_endpoints[remote=" << val.m_remote << " local=" << val.m_local << ']';
}

std::ostream& operator<<(std::ostream& os, const Peer_identity& val)
{
  std::visit([&](const auto& identity) { os << identity; }, val);
  return os;
}

} // namespace ipcsrv::transport
