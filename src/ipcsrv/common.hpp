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

/* flow/common.hpp needs to #undef a couple things (FLOW_LOG_CFG_COMPONENT_ENUM_*) before ipcsrv/detail/common.hpp
 * `#define`s them; hence this ordering. */
#include <flow/util/util.hpp>

#include "ipcsrv/detail/common.hpp"
#include <boost/interprocess/interprocess_fwd.hpp>
#include <boost/filesystem.hpp>

/* The headers use C++17 features (std::optional, std::variant, nested namespace definitions); so does the
 * including translation unit then. */
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any ipcsrv/ API headers, use C++17 compile mode or later."
#endif

/**
 * Catch-all namespace for ipcsrv: a small library providing the server side of a session-oriented local (Unix
 * domain socket) or network (TCP) control/data channel.  A daemon constructs an ipcsrv::server::Server over a
 * transport adapter; clients connect; each connection becomes a *session* that is authenticated and then exchanges
 * raw byte messages under one of a couple of framing disciplines, optionally steered by a tiny in-band command
 * sub-protocol.
 *
 * Modules overview
 * ----------------
 *   - *ipcsrv::util*: Basic building blocks: process credentials, resource permissions, aliases for
 *     boost.asio buffers and Flow time types.
 *     - Dependents: everything else.
 *   - *ipcsrv::transport*: Listening endpoints.  transport::Transport_adapter is the interface the server core
 *     talks to; transport::Local_stream_transport (Unix domain stream socket at a file-system path, with
 *     `SO_PEERCRED` peer identity) and transport::Tcp_transport (TCP, with remote/local endpoint identity)
 *     implement it.
 *     - Dependents: ipcsrv::server.
 *   - *ipcsrv::server*: The connection lifecycle and framing engine: server::Server, server::Connection,
 *     server::Message, server::Connection_pool; and internally server::Session.
 *
 * Relationship with Flow and Boost
 * --------------------------------
 * ipcsrv requires Flow and Boost, not only internally but also in its APIs.  `flow::log` is the logging system;
 * `flow::Error_code` and Flow's error-reporting conventions are used for errors; `flow::async` provides the
 * event-loop thread; boost.asio provides sockets and timers.
 *
 * ### Error reporting ###
 * Inherited from Flow: see the `namespace flow` doc header's "Error reporting" section.  Briefly, a fallible
 * synchronous API takes a trailing `Error_code* err_code = 0`; null means "throw `flow::error::Runtime_error`
 * on error"; non-null means "set `*err_code` (falsy on success) and do not throw."  Async results are
 * `const Error_code&` args to completion handlers.
 *
 * ### Logging ###
 * The user supplies a `flow::log::Logger*` to the various constructors.  (Null means log nowhere.)
 */
namespace ipcsrv
{

// Types.

/**
 * @namespace ipcsrv::bipc
 * @brief Short-hand for boost.interprocess namespace.
 */
namespace bipc = boost::interprocess;

/**
 * @namespace ipcsrv::fs
 * @brief Short-hand for `filesystem` namespace.
 *
 * We use `boost::filesystem` rather than `std::filesystem`, consistently with the rest of our stack.
 */
namespace fs = boost::filesystem;

/// Short-hand for `flow::Error_code` which is very common.
using Error_code = flow::Error_code;

/// Short-hand for polymorphic functor holder which is very common.  This is essentially `std::function`.
template<typename Signature>
using Function = flow::Function<Signature>;

#ifdef IPCSRV_DOXYGEN_ONLY // Actual compilation will ignore the below; but Doxygen will scan it and generate docs.

/**
 * The `flow::log::Component` payload enumeration containing the log components used by ipcsrv internal logging.
 * The user specifies it, rarely, when configuring their program's logging via
 * `flow::log::Config::init_component_to_union_idx_mapping()` and `flow::log::Config::init_component_names()`.
 *
 * The members are generated by `flow::log` macro magic; find them in the source file
 * `log_component_enum_declare.macros.hpp`.
 */
enum class Log_component
{
  /// Placeholder for Doxygen purposes only; see doc header above.
  S_END_SENTINEL
};

/**
 * The map generated by `flow::log` macro magic that maps each enumerated value in ipcsrv::Log_component to its
 * string representation as used in log output and verbosity config.
 */
extern const boost::unordered_multimap<Log_component, std::string> S_IPCSRV_LOG_COMPONENT_NAME_MAP;

#endif // IPCSRV_DOXYGEN_ONLY

} // namespace ipcsrv
