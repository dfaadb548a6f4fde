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

/**
 * Namespace containing the ipcsrv::transport module's extension of boost.system error conventions, so that that
 * API can return codes/messages from within its own new set of error codes/messages.  Most errors a transport
 * adapter reports (bind failure, address in use, permission denied, and so on) are system errors and do not
 * draw from this set but from `boost::asio::error` or `boost::system::errc`; such mixing is normal in
 * boost.system.
 *
 * @see ipcsrv::server::error, which covers errors of the session/framing engine.
 *
 * See flow's `flow::net_flow::error` doc header which was used as the model for this and similar.
 */
namespace ipcsrv::transport::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by ipcsrv::transport functions/methods *outside of*
 * system-triggered errors such as `boost::asio::error::address_in_use`.
 * These values are convertible to #Error_code (a/k/a `boost::system::error_code`) and thus
 * extend the set of errors that #Error_code can represent.
 *
 * @internal
 *
 * When you add a value to this `enum`, also add its description to error.cpp's Category::message() (identical
 * to the /// comment below) and its symbol, minus the `S_`, to Category::code_symbol().  Add new values at the end,
 * ahead of Code::S_END_SENTINEL; never delete a value.
 */
enum class Code
{
  /// User called an API with 1 or more arguments against the API contract.
  S_INVALID_ARGUMENT = S_CODE_LOWEST_INT_VALUE,

  /// Transport adapter is already listening (or accepting); the operation may be performed at most once.
  S_LISTENER_ALREADY_STARTED,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight #Error_code (a/k/a boost.system `error_code`)
 * representing that error.  This is needed to make the
 * `boost::system::error_code::error_code<Code>()` template implementation work; it glues the (completely general)
 * #Error_code to the ipcsrv::transport-specific code set, so that one can implicitly convert from the latter to the
 * former.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding #Error_code.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a transport::error::Code from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character.  If nothing is recognized, Code::S_END_SENTINEL is the result.
 * Recognized: the `int` value of a Code; or, case-insensitively, the non-`S_` part of its name, e.g.,
 * "INVALID_ARGUMENT".
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a transport::error::Code to a standard output stream, e.g., Code::S_INVALID_ARGUMENT =>
 * `"INVALID_ARGUMENT"`.  The output is compatible with the reverse `istream>>` operator.  To log an #Error_code
 * continue to print it (category plus number) together with its `.message()`; this symbolic form exists mainly
 * so tests and config can name an expected outcome.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace ipcsrv::transport::error

namespace boost::system
{

// Types.

/**
 * Specialization that authorizes boost.system to make `enum` `Code` convertible to `Error_code`.  This is the
 * official way to accomplish that, as documented in boost.system docs.
 */
template<>
struct is_error_code_enum<::ipcsrv::transport::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
