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


#pragma once

#include <ipcsrv/util/process_credentials.hpp>
#include <ipcsrv/common.hpp>
#include <flow/common.hpp>
#include <boost/chrono.hpp>
#include <functional>
#include <string>
#include <type_traits>

namespace ipcsrv::test
{

/**
 * Returns the effective process credentials of the running process initialized at first execution and remaining
 * unchanged for the remainder of the application.
 *
 * @return See above.
 */
const ipcsrv::util::Process_credentials& get_process_creds();

/**
 * Returns a path, in the temporary directory, at which nothing exists and at which no other call (in this or
 * another concurrently running test process) will return.  Short enough for a local-socket address.
 *
 * @param tag Short string to include in the name, for debugging.
 *
 * @return See above.
 */
fs::path unique_socket_path(const std::string& tag);

/**
 * Polls `pred` until it returns `true` or the timeout passes.
 *
 * @param pred Condition to await.
 * @param timeout Give up after this long.
 *
 * @return Whether `pred` returned `true`.
 */
bool wait_until(const std::function<bool ()>& pred,
                flow::Fine_duration timeout = boost::chrono::seconds(5));

/**
 * Casts an enumeration to its primitive type.
 *
 * @tparam Enum The enumeration type.
 * @param e The enumeration value.
 *
 * @return The primitive type form of the enumeration value.
 */
template <class Enum>
constexpr std::underlying_type_t<Enum> to_underlying(Enum e) noexcept
{
  return static_cast<std::underlying_type_t<Enum>>(e);
}

} // namespace ipcsrv::test
