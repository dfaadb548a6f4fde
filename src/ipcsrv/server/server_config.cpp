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
#include "ipcsrv/server/server_config.hpp"
#include <flow/util/util.hpp>
#include <boost/chrono/round.hpp>

namespace ipcsrv::server
{

// Static initializers.

const util::Fine_duration Server_config::S_DEFAULT_CLOSE_LINGER = boost::chrono::milliseconds(100);

// Implementations.

size_t Server_config::chunk_size() const
{
  return m_chunk_size ? *m_chunk_size : S_DEFAULT_CHUNK_SIZE;
}

std::ostream& operator<<(std::ostream& os, const Server_config& val)
{
  os << "read_limit[";
  if (val.m_read_limit)
  {
    os << *val.m_read_limit;
  }
  else
  {
    os << "unbounded";
  }
  os << "] chunk_size[" << val.chunk_size() << "] max_connections[";
  if (val.m_max_connections)
  {
    os << *val.m_max_connections;
  }
  else
  {
    os << "unbounded";
  }
  return os << "] default_mode[" << val.m_default_mode << "] close_linger["
            << boost::chrono::round<boost::chrono::milliseconds>(val.m_close_linger) << ']';
}

std::ostream& operator<<(std::ostream& os, Connection_mode val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  switch (val)
  {
  case Connection_mode::S_TEXT_DATA:
    return os << "TEXT_DATA";
  case Connection_mode::S_STREAM_DATA:
    return os << "STREAM_DATA";
  case Connection_mode::S_PERSISTENT:
    return os << "PERSISTENT";
  case Connection_mode::S_END_SENTINEL:
    return os << "END_SENTINEL";
  }
  assert(false);
  return os;
}

std::istream& operator>>(std::istream& is, Connection_mode& val)
{
  // Range [TEXT_DATA, END_SENTINEL); no match => END_SENTINEL; allow for number; case-insensitive.
  val = flow::util::istream_to_enum(&is, Connection_mode::S_END_SENTINEL, Connection_mode::S_END_SENTINEL,
                                    true, false, Connection_mode::S_TEXT_DATA);
  return is;
}

} // namespace ipcsrv::server
