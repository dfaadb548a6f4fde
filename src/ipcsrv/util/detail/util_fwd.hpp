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

#include "ipcsrv/util/util_fwd.hpp"
#include <flow/common.hpp>
#include <boost/array.hpp>

namespace ipcsrv::util
{

// Constants.

/**
 * Maps general Permissions_level specifier to low-level #Permissions value, when the underlying resource
 * is in the file-system (e.g., a socket node) and is either accessible (read-write) or inaccessible.
 *
 * We don't use `bipc::permissions::set_unrestricted()` for the unrestricted level: that sets the executable bits,
 * which is pointless for a socket node; `0666` is used instead.
 */
extern const boost::array<Permissions, size_t(Permissions_level::S_END_SENTINEL)>
  SHARED_RESOURCE_PERMISSIONS_LVL_MAP;

#ifndef FLOW_OS_LINUX
#  error "IPCSRV_KERNEL_PERSISTENT_RUN_DIR (/var/run) semantics require Unix; tested in Linux specifically only."
#endif
/**
 * Absolute path to the directory (without trailing separator) in the file system where daemons conventionally
 * place their local-socket nodes and other kernel-persistent run-time items.  transport::Local_stream_transport
 * resolves a relative socket path against it.
 */
extern const fs::path IPCSRV_KERNEL_PERSISTENT_RUN_DIR;

} // namespace ipcsrv::util
