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

#include <ostream>

namespace ipcsrv::util
{

// Types.

// Find doc headers near the bodies of these compound types.

class Process_credentials;

// Free functions.

/**
 * Checks for by-value equality between two Process_credentials objects.
 * Process_credentials::process_invoked_as() does not participate.
 *
 * @relatesalso Process_credentials
 * @param val1
 *        Value to compare.
 * @param val2
 *        Value to compare.
 * @return Whether PID, UID and GID all compare equal.
 */
bool operator==(const Process_credentials& val1, const Process_credentials& val2);

/**
 * Negation of the similar `==`.
 *
 * @relatesalso Process_credentials
 * @param val1
 *        Value to compare.
 * @param val2
 *        Value to compare.
 * @return See above.
 */
bool operator!=(const Process_credentials& val1, const Process_credentials& val2);

/**
 * Prints string representation of the given util::Process_credentials to the given `ostream`.  The result
 * is suitable for the server's log lines concerning a local-socket peer.
 *
 * @relatesalso Process_credentials
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Process_credentials& val);

} // namespace ipcsrv::util
