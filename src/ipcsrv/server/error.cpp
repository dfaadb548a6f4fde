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
#include "ipcsrv/server/error.hpp"
#include "ipcsrv/util/util_fwd.hpp"

namespace ipcsrv::server::error
{

// Types.

/**
 * The boost.system category for errors returned by the ipcsrv::server module.  Think of it as the polymorphic
 * counterpart of error::Code; it kicks in when, for `Error_code ec`, something like `ec.message()` is invoked.
 *
 * Its declaration is not available outside this translation unit; its logic is accessed through standard
 * boost.system machinery.
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Implements super-class API: returns a `static` string representing this `error_category`.
   * @return See above.
   */
  const char* name() const noexcept override;

  /**
   * Implements super-class API: given the integer value of an error in this category, returns a description of
   * that error (similarly in spirit to `std::strerror()`).
   *
   * @param val
   *        A #Code `enum` value cast to `int`.
   * @return String describing the error.
   */
  std::string message(int val) const override;

  /**
   * The guts of the `ostream << Code` operation: outputs, e.g., Code::S_MESSAGE_LIMIT_EXCEEDED => `"MESSAGE_LIMIT_EXCEEDED"`.
   * @param code
   *        A Code.
   * @return What would/should be printed to an `ostream` given `code`.
   */
  static util::String_view code_symbol(Code code);

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "ipcsrv/server";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!
  switch (static_cast<Code>(val))
  {
  case Code::S_AUTHENTICATION_REJECTED:
    return "Session ended: the authentication hook rejected the connection.";
  case Code::S_MESSAGE_LIMIT_EXCEEDED:
    return "Session ended: the client sent more than the configured read limit before ending its message.";
  case Code::S_STALE_CONNECTION:
    return "Will not send: the target connection is closing or closed (or no longer exists).";
  case Code::S_SENDS_FINISHED_CANNOT_SEND:
    return "Will not send: the outbound direction of the connection has already been ended by an earlier send.";
  case Code::S_POOL_CAPACITY_EXCEEDED:
    return "Connection rejected: the server is at its configured maximum number of concurrent sessions.";
  case Code::S_SESSION_CANCELED:
    return "Session ended: it was canceled, because the server is shutting down.";
  case Code::S_INVALID_ARGUMENT:
    return "User called an API with 1 or more arguments against the API contract.";
  case Code::S_SERVER_ALREADY_STARTED:
    return "Server was already started; start() may be called at most once.";

  case Code::S_END_SENTINEL:
    assert(false && "SENTINEL: Not an error.  "
                    "This Code must never be issued by an error/success-emitting API; I/O use only.");
  }
  assert(false);
  return "";
} // Category::message()

util::String_view Category::code_symbol(Code code) // Static.
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (code)
  {
  case Code::S_AUTHENTICATION_REJECTED:
    return "AUTHENTICATION_REJECTED";
  case Code::S_MESSAGE_LIMIT_EXCEEDED:
    return "MESSAGE_LIMIT_EXCEEDED";
  case Code::S_STALE_CONNECTION:
    return "STALE_CONNECTION";
  case Code::S_SENDS_FINISHED_CANNOT_SEND:
    return "SENDS_FINISHED_CANNOT_SEND";
  case Code::S_POOL_CAPACITY_EXCEEDED:
    return "POOL_CAPACITY_EXCEEDED";
  case Code::S_SESSION_CANCELED:
    return "SESSION_CANCELED";
  case Code::S_INVALID_ARGUMENT:
    return "INVALID_ARGUMENT";
  case Code::S_SERVER_ALREADY_STARTED:
    return "SERVER_ALREADY_STARTED";

  case Code::S_END_SENTINEL:
    return "END_SENTINEL";
  }
  assert(false);
  return "";
}

std::ostream& operator<<(std::ostream& os, Code val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  return os << Category::code_symbol(val);
}

std::istream& operator>>(std::istream& is, Code& val)
{
  /* Range [<1st Code>, END_SENTINEL); no match => END_SENTINEL;
   * allow for number instead of ostream<< string; case-insensitive. */
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

} // namespace ipcsrv::server::error
