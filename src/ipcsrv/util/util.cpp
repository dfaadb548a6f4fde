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
#include "ipcsrv/util/detail/util_fwd.hpp"
#include <flow/error/error.hpp>
#include <flow/common.hpp>
#include <sys/stat.h>

namespace ipcsrv::util
{

// Implementations.

Permissions shared_resource_permissions(Permissions_level permissions_lvl)
{
  const auto raw_lvl = size_t(permissions_lvl);
  assert((raw_lvl < size_t(Permissions_level::S_END_SENTINEL))
         && "Seems the sentinel enum value was specified, or there is an internal maintenance bug.");

  return SHARED_RESOURCE_PERMISSIONS_LVL_MAP[raw_lvl];
}

void set_resource_permissions(flow::log::Logger* logger_ptr, const fs::path& path,
                              const Permissions& perms, Error_code* err_code)
{
  using boost::system::system_category;
  using ::chmod;
  // using ::errno; // It's a macro apparently.

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code)
           { set_resource_permissions(logger_ptr, path, perms, actual_err_code); },
         err_code, "util::set_resource_permissions()"))
  {
    return;
  }
  // else

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_UTIL);

  /* The main customer is a local-socket node, and ::open() of a socket node fails (ENXIO); so we cannot go
   * through a descriptor and ::fchmod().  There's no Boost.filesystem way to set the mode other than
   * fs::permissions(), which would not report errors any better; so use the POSIX-y path-based call. */
  const auto rc = chmod(path.c_str(), perms.get_permissions());
  if (rc == -1)
  {
    *err_code = Error_code(errno, system_category());
    FLOW_LOG_WARNING("Tried to set permissions of resource at [" << path << "] to "
                     "[" << std::oct << perms.get_permissions() << std::dec << "] but encountered "
                     "error [" << *err_code << "] [" << err_code->message() << "].");
  }
  else
  {
    err_code->clear();
  }

  // As promised don't log anything else (not even TRACE) and leave that to the caller if desired.
} // set_resource_permissions()

const uint8_t* blob_data(const Blob_const& blob)
{
  return static_cast<const uint8_t*>(blob.data());
}

} // namespace ipcsrv::util
