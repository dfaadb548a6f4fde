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


#include "ipcsrv/test/test_common_util.hpp"
#include <flow/util/util.hpp>
#include <atomic>
#include <chrono>
#include <thread>

namespace ipcsrv::test
{

const ipcsrv::util::Process_credentials& get_process_creds()
{
  static const auto S_PROCESS_CREDS = ipcsrv::util::Process_credentials::own_process_credentials();
  return S_PROCESS_CREDS;
}

fs::path unique_socket_path(const std::string& tag)
{
  static std::atomic<unsigned int> s_next_idx(0);

  const auto path = fs::temp_directory_path()
                      / flow::util::ostream_op_string("ipcsrv_", tag, '_', get_process_creds().process_id(),
                                                      '_', ++s_next_idx, ".sock");
  fs::remove(path);
  return path;
}

bool wait_until(const std::function<bool ()>& pred, flow::Fine_duration timeout)
{
  const auto deadline = flow::Fine_clock::now() + timeout;
  while (!pred())
  {
    if (flow::Fine_clock::now() >= deadline)
    {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return true;
}

} // namespace ipcsrv::test
