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
#include "ipcsrv/transport/asio_local_stream_socket.hpp"
#include <flow/error/error.hpp>
#include <flow/common.hpp>

namespace ipcsrv::transport::asio_local_stream_socket
{

// Free function implementations.

Endpoint endpoint_at_path(flow::log::Logger* logger_ptr, const fs::path& path, Error_code* err_code)
{
  namespace bind_ns = flow::util::bind_ns;
  using boost::system::system_error;

  FLOW_ERROR_EXEC_FUNC_AND_THROW_ON_ERROR(Endpoint, endpoint_at_path,
                                          logger_ptr, bind_ns::cref(path), _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_TRANSPORT);

  Endpoint endpoint;
  auto& sys_err_code = *err_code;
  try
  {
    // Throws on error (in practice only on too-long path as of Boost 1.74).  There's no error-code overload.
    endpoint.path(path.string());
    sys_err_code.clear(); // If it didn't throw.
  }
  catch (const system_error& exc)
  {
    FLOW_LOG_WARNING("Unable to set up native local stream endpoint structure for path [" << path << "]; "
                     "most likely due to path length; details logged below.");
    sys_err_code = exc.code();
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
  }

  return endpoint; // sys_err_code is set; `endpoint` might be empty.
} // endpoint_at_path()

// Opt_peer_process_credentials implementations.

Opt_peer_process_credentials::Opt_peer_process_credentials() = default;

} // namespace ipcsrv::transport::asio_local_stream_socket
