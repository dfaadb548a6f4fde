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
#include "ipcsrv/transport/local_stream_transport.hpp"
#include "ipcsrv/transport/asio_local_stream_socket.hpp"
#include "ipcsrv/util/detail/util_fwd.hpp"
#include <flow/common.hpp>

namespace ipcsrv::transport
{

// Implementations.

Local_stream_transport::Local_stream_transport(flow::log::Logger* logger_ptr, const fs::path& path,
                                               util::Permissions_level permissions_lvl) :
  Socket_transport_base(logger_ptr, flow::util::ostream_op_string("local:", path.string())),
  m_path((path.empty() || path.is_absolute()) ? path : (util::IPCSRV_KERNEL_PERSISTENT_RUN_DIR / path)),
  m_permissions_lvl(permissions_lvl)
{
  FLOW_LOG_TRACE("Transport [" << *this << "]: Created; node path [" << m_path << "]; "
                 "permissions level [" << int(m_permissions_lvl) << "].");
}

Local_stream_transport::~Local_stream_transport()
{
  close();
}

const fs::path& Local_stream_transport::path() const
{
  return m_path;
}

Local_stream_transport::Endpoint Local_stream_transport::prepare_listen(Error_code* err_code)
{
  using asio_local_stream_socket::endpoint_at_path;
  using boost::system::errc::make_error_code;
  using boost::system::errc::is_a_directory;

  assert(err_code);

  if (m_path.empty())
  {
    FLOW_LOG_WARNING("Transport [" << *this << "]: Cannot listen: no socket node path given.");
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return Endpoint();
  }
  // else

  Error_code sys_err_code;
  const auto status = fs::symlink_status(m_path, sys_err_code);
  if (fs::is_directory(status))
  {
    sys_err_code = make_error_code(is_a_directory);
    FLOW_LOG_WARNING("Transport [" << *this << "]: Cannot listen: [" << m_path << "] is a directory.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    *err_code = sys_err_code;
    return Endpoint();
  }
  // else
  if (fs::exists(status))
  {
    FLOW_LOG_INFO("Transport [" << *this << "]: Node [" << m_path << "] already exists (left behind by a "
                  "previous instance?); removing it before binding.");
    fs::remove(m_path, sys_err_code);
    if (sys_err_code)
    {
      FLOW_LOG_WARNING("Transport [" << *this << "]: Cannot listen: could not remove existing node.");
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      *err_code = sys_err_code;
      return Endpoint();
    }
  }
  // else: Nothing there (a status error, if any, just means that as well).

  return endpoint_at_path(get_logger(), m_path, err_code); // It logs on error.
} // Local_stream_transport::prepare_listen()

void Local_stream_transport::on_listening(const Acceptor&, Error_code* err_code)
{
  util::set_resource_permissions(get_logger(), m_path, util::shared_resource_permissions(m_permissions_lvl),
                                 err_code);
  // It logged on error.
}

Peer_identity Local_stream_transport::peer_identity(const Protocol_socket& peer_socket, Error_code* err_code)
{
  using asio_local_stream_socket::Opt_peer_process_credentials;

  assert(err_code);

  Opt_peer_process_credentials creds;
  peer_socket.get_option(creds, *err_code);
  if ((!*err_code) && get_logger() && get_logger()->should_log(flow::log::Sev::S_TRACE, get_log_component()))
  {
    // Best-effort: the peer may already be gone, in which case we just say so.
    Error_code cmd_err_code;
    const auto cmd_line = creds.process_invoked_as(&cmd_err_code);
    FLOW_LOG_TRACE_WITHOUT_CHECKING("Transport [" << *this << "]: Accepted peer [" << creds << "]; invoked as "
                                    "[" << (cmd_err_code ? flow::util::ostream_op_string("?: ", cmd_err_code.message())
                                                         : cmd_line) << "].");
  }
  return util::Process_credentials(creds);
}

void Local_stream_transport::on_closed()
{
  Error_code sys_err_code;
  fs::remove(m_path, sys_err_code);
  if (sys_err_code)
  {
    FLOW_LOG_WARNING("Transport [" << *this << "]: Could not remove socket node [" << m_path << "] after "
                     "closing listener.  Details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    return;
  }
  // else
  FLOW_LOG_INFO("Transport [" << *this << "]: Removed socket node [" << m_path << "].");
}

} // namespace ipcsrv::transport
