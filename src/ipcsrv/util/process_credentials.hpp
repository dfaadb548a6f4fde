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

#ifndef _GNU_SOURCE
#  define _GNU_SOURCE // Needed at least to get access to `struct ::ucred` (Linux).
#endif

#include "ipcsrv/util/util_fwd.hpp"
#include "ipcsrv/util/process_credentials_fwd.hpp"
#include <sys/socket.h>

namespace ipcsrv::util
{

// Types.

/**
 * The identity of a process as the kernel reports it for a local-socket peer: process ID, effective user ID,
 * effective group ID.  A server::Connection accepted via transport::Local_stream_transport carries one of these
 * (see server::Connection::peer_process_credentials()); the authentication hook would typically check it against
 * some policy.
 *
 * The values are a snapshot taken at connect time (that is what `SO_PEERCRED` reports); the peer may since have
 * changed its effective UID/GID or even exited.
 *
 * @see transport::Opt_peer_process_credentials, the sub-class used to obtain the values from a connected socket.
 */
class Process_credentials
{
public:
  // Constructors/destructor.

  /// Default ctor: each value is initialized to zero.
  Process_credentials();

  /**
   * Ctor that sets the values explicitly.
   * @param process_id_init
   *        See process_id().
   * @param user_id_init
   *        See user_id().
   * @param group_id_init
   *        See group_id().
   */
  explicit Process_credentials(process_id_t process_id_init, user_id_t user_id_init, group_id_t group_id_init);

  // Methods.

  /**
   * The process ID (PID).
   * @return See above.
   */
  process_id_t process_id() const;

  /**
   * The (effective) user ID (UID).
   * @return See above.
   */
  user_id_t user_id() const;

  /**
   * The (effective) group ID (GID).
   * @return See above.
   */
  group_id_t group_id() const;

  /**
   * Obtains, from the OS, the first command-line argument (`argv[0]`) of process process_id(), as it appears
   * now.  The process must still be running; otherwise a no-such-file system error is emitted.
   *
   * The value is whatever the process was invoked as: it may be relative, un-normalized, a symlink, or (if the
   * process rewrote its own `argv` area) anything at all, including an empty string.  It is fine for logging
   * and for a best-effort check that a peer is an instance of an expected executable; it is not proof of
   * identity.
   *
   * Linux only: reads `/proc/<pid>/cmdline` up to the first NUL.  (`/proc/<pid>/exe` would give the real
   * executable path but needs privileges we do not want to require.)
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        some system error code, most likely no-such-file (process not running).
   * @return See above.  Empty string if an error is emitted without an exception.
   */
  std::string process_invoked_as(Error_code* err_code = 0) const;

  /**
   * Obtains the calling process's process_id().
   * @return See above.
   */
  static process_id_t own_process_id();

  /**
   * Obtains the calling process's effective user_id().
   * @return See above.
   */
  static user_id_t own_user_id();

  /**
   * Obtains the calling process's effective group_id().
   * @return See above.
   */
  static group_id_t own_group_id();

  /**
   * Returns `Process_credentials(own_process_id(), own_user_id(), own_group_id())`.  In particular a client
   * connecting from this same process would be seen by the server with these credentials.
   *
   * @return See above.
   */
  static Process_credentials own_process_credentials();

protected:
  // Data.

  /**
   * The raw values, in the very structure `getsockopt(SO_PEERCRED)` fills; this lets
   * transport::Opt_peer_process_credentials hand the kernel a pointer straight into `*this`.
   */
  ::ucred m_val;
}; // class Process_credentials

// Free functions: in *_fwd.hpp.

} // namespace ipcsrv::util
