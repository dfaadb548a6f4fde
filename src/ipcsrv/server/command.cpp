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
#include "ipcsrv/server/command.hpp"
#include <flow/util/util.hpp>
#include <iomanip>
#include <cstring>

namespace ipcsrv::server
{

// Implementations.

std::optional<Command> parse_command_header(const util::Blob_const& bytes)
{
  using util::blob_data;

  if (bytes.size() < S_COMMAND_HEADER_SIZE)
  {
    return std::nullopt;
  }
  // else
  const auto data = blob_data(bytes);

  if ((data[0] != S_COMMAND_HEADER_LEAD_BYTE) || (std::memcmp(data + 1, "CMD", 3) != 0))
  {
    return std::nullopt;
  }
  // else

  int value = 0;
  for (size_t idx = 4; idx != S_COMMAND_HEADER_SIZE; ++idx)
  {
    const auto ch = data[idx];
    if ((ch < '0') || (ch > '9'))
    {
      return std::nullopt;
    }
    value = (value * 10) + (ch - '0');
  }

  if ((value < int(Command::S_PING)) || (value >= int(Command::S_END_SENTINEL)))
  {
    return std::nullopt;
  }
  return Command(value);
} // parse_command_header()

std::string command_header(Command cmd)
{
  using flow::util::ostream_op_string;

  assert((cmd != Command::S_END_SENTINEL) && "Sentinel is not a command.");

  auto header = ostream_op_string(char(S_COMMAND_HEADER_LEAD_BYTE), "CMD",
                                  std::setfill('0'), std::setw(4), int(cmd));
  assert(header.size() == S_COMMAND_HEADER_SIZE);
  return header;
}

std::ostream& operator<<(std::ostream& os, Command val)
{
  switch (val)
  {
  case Command::S_PING:
    return os << "PING";
  case Command::S_PONG:
    return os << "PONG";
  case Command::S_SET_STREAM:
    return os << "SET_STREAM";
  case Command::S_SET_DATA:
    return os << "SET_DATA";
  case Command::S_END_SENTINEL:
    return os << "END_SENTINEL";
  }
  assert(false);
  return os;
}

} // namespace ipcsrv::server
