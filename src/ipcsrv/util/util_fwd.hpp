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

#include "ipcsrv/common.hpp"
#include <flow/log/log.hpp>
#include <flow/async/util.hpp>
#include <boost/asio.hpp>
#include <boost/interprocess/permissions.hpp>

/**
 * Flow-like utilities used throughout ipcsrv, plus the process-identity and permission types the transports need.
 */
namespace ipcsrv::util
{

// Types.

// Find doc headers near the bodies of these compound types.

class Process_credentials;

#ifdef FLOW_OS_WIN
static_assert(false, "Design of Permissions_level assumes a POSIX-y security model with users and groups; "
                       "we have not yet considered whether it can apply to Windows in its current form.");
#endif

/**
 * Simple specifier of desired access permissions, usually but not necessarily translated into
 * a `Permissions` value (though even then different value in different contexts).  May be used to map, say,
 * from a Permissions_level to a #Permissions value in an
 * `array<Permissions, size_t(Permissions_level::S_END_SENTINEL)>`.
 *
 * The ipcsrv use case is the access mode of the file-system node of a local-socket listener: whoever can write
 * the node can connect.
 */
enum class Permissions_level : size_t
{
  /// Forbids all access, even by the creator's user.  Most likely this would be useful for testing or debugging.
  S_NO_ACCESS,

  /// Allows access by resource-owning user (in POSIX/Unix identified by UID) and no one else.
  S_USER_ACCESS,

  /**
   * Allows access by resource-owning user's containing group(s) (in POSIX/Unix identified by GID) and no one else.
   * This implies, as well, at least as much access as `S_USER_ACCESS`.
   */
  S_GROUP_ACCESS,

  /// Allows access by all.  Implies, as well, at least as much access as `S_GROUP_ACCESS` and thus `S_USER_ACCESS`.
  S_UNRESTRICTED,

  /// Sentinel: not a valid value.  May be used to, e.g., size an `array<>` mapping from Permissions_level.
  S_END_SENTINEL
}; // enum class Permissions_level

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;
/// Short-hand for Flow's `Fine_duration`.
using Fine_duration = flow::Fine_duration;
/// Short-hand for Flow's `Fine_time_pt`.
using Fine_time_pt = flow::Fine_time_pt;

/// Short-hand for polymorphic function (a-la `std::function<>`) that takes no arguments and returns nothing.
using Task = flow::async::Task;

/**
 * Short-hand for an immutable blob somewhere in memory, stored as exactly a `void const *` and a `size_t`.
 *
 * ### How to use ###
 * We provide this alias as a stylistic short-hand, as it better suits the ipcsrv API.  Mostly the user would
 * construct it as `Blob_const(ptr, size)` (e.g., over a `std::string`'s contents) and pass it to the
 * server::Server send APIs, which copy the bytes before returning.
 */
using Blob_const = boost::asio::const_buffer;

/// Syntactic-sugary type for POSIX process ID (integer).
using process_id_t = ::pid_t;

/// Syntactic-sugary type for POSIX user ID (integer).
using user_id_t = ::uid_t;

/// Syntactic-sugary type for POSIX group ID (integer).
using group_id_t = ::gid_t;

/// Short-hand for Unix (POSIX) permissions class.
using Permissions = bipc::permissions;

// Free functions.

/**
 * Maps general Permissions_level specifier to low-level #Permissions value, when the underlying resource
 * is in the file-system and is either accessible (read-write in the case of files) or inaccessible.
 * For example a local-socket listener node created by the server, which clients must be able to open for
 * writing in order to connect.
 *
 * @param permissions_lvl
 *        The value to translate.
 * @return The result.
 */
Permissions shared_resource_permissions(Permissions_level permissions_lvl);

/**
 * Utility that sets the permissions of the given resource (at the supplied file system path) to specified
 * POSIX value.  If the resource cannot be accessed (not found, permissions...) that system Error_code shall be
 * emitted.
 *
 * @param logger_ptr
 *        Logger to use for logging (WARNING, on error only, including `EPERM`).
 * @param path
 *        Path to resource.  Symlinks are followed, and the target is the resource in question (not the symlink).
 * @param perms
 *        See other overloads.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        various system codes.
 */
void set_resource_permissions(flow::log::Logger* logger_ptr, const fs::path& path,
                              const Permissions& perms, Error_code* err_code = 0);

/**
 * Syntactic-sugary helper that returns pointer to first byte in an immutable buffer, as `const uint8_t*`.
 *
 * @param blob
 *        The buffer.
 * @return See above.
 */
const uint8_t* blob_data(const Blob_const& blob);

} // namespace ipcsrv::util
