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
#include "ipcsrv/util/process_credentials.hpp"
#include <flow/error/error.hpp>
#include <flow/common.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/lexical_cast.hpp>
#include <unistd.h>

namespace ipcsrv::util
{

// Process_credentials implementations.

Process_credentials::Process_credentials() :
  Process_credentials(0, 0, 0)
{
  // That's it.
}

Process_credentials::Process_credentials(process_id_t process_id_init, user_id_t user_id_init,
                                         group_id_t group_id_init)
{
  // Field order within `ucred` is not something to rely on; assign by name.
  m_val.pid = process_id_init;
  m_val.uid = user_id_init;
  m_val.gid = group_id_init;
}

process_id_t Process_credentials::process_id() const
{
  return m_val.pid;
}

user_id_t Process_credentials::user_id() const
{
  return m_val.uid;
}

group_id_t Process_credentials::group_id() const
{
  return m_val.gid;
}

std::string Process_credentials::process_invoked_as(Error_code* err_code) const
{
  using boost::lexical_cast;
  using boost::system::system_category;
  using boost::system::errc::make_error_code;
  using boost::system::errc::io_error;
  using std::string;
  // using ::errno; // It's a macro apparently.

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(string, process_invoked_as, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

#ifndef FLOW_OS_LINUX
  static_assert(false, "process_invoked_as() depends on Linux /proc semantics.");
#endif

  const auto cmd_line_path = fs::path("/proc") / lexical_cast<string>(process_id()) / "cmdline";

  // The "file" is argv[0], argv[1], ..., each NUL-terminated; binary mode, read through the first NUL.
  fs::ifstream cmd_line_file(cmd_line_path, std::ios_base::binary);
  if (!cmd_line_file.good())
  {
    const int open_errno = errno;
    *err_code = (open_errno == 0) ? make_error_code(io_error) : Error_code(open_errno, system_category());
    return string();
  }
  // else

  string result;
  std::getline(cmd_line_file, result, '\0');
  if (cmd_line_file.bad())
  {
    // errno is not reliably set by iostreams; report something generic.
    *err_code = make_error_code(io_error);
    return string();
  }
  // else: .eof() (no NUL at all, or empty) is fine; result is whatever was there.

  err_code->clear();
  return result;
} // Process_credentials::process_invoked_as()

process_id_t Process_credentials::own_process_id() // Static.
{
  return ::getpid();
}

user_id_t Process_credentials::own_user_id() // Static.
{
  return ::geteuid();
}

group_id_t Process_credentials::own_group_id() // Static.
{
  return ::getegid();
}

Process_credentials Process_credentials::own_process_credentials() // Static.
{
  return Process_credentials(own_process_id(), own_user_id(), own_group_id());
}

bool operator==(const Process_credentials& val1, const Process_credentials& val2)
{
  return (val1.process_id() == val2.process_id())
         && (val1.user_id() == val2.user_id()) && (val1.group_id() == val2.group_id());
}

bool operator!=(const Process_credentials& val1, const Process_credentials& val2)
{
  return !(val1 == val2);
}

std::ostream& operator<<(std::ostream& os, const Process_credentials& val)
{
  return os << "peer_creds[pid=" << val.process_id() << " uid=" << val.user_id()
            << " gid=" << val.group_id() << ']';
}

} // namespace ipcsrv::util
