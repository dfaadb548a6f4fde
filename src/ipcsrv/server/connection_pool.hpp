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

#include "ipcsrv/server/server_fwd.hpp"
#include <boost/unordered_map.hpp>
#include <boost/noncopyable.hpp>
#include <optional>
#include <vector>

namespace ipcsrv::server
{

// Types.

/**
 * Bounded registry of running sessions, keyed by Session_handle: admission control plus bulk cancellation.
 * One per Server (a member), used only from its thread W; hence no locking.
 *
 * ### Admission ###
 * A slot is reserved by admit() before a session object is even created, then consumed by register_session()
 * (or released by withdraw_admission()).  Tracked sessions (registered plus reserved) never exceed max_size().
 * admit() does the check and the reservation in one step, so nothing can run in between.
 *
 * @tparam Session_obj
 *         Type of session.  Must have a `void cancel()` that makes the session finish, possibly synchronously
 *         (deregistering itself from within cancel() is allowed).
 */
template<typename Session_obj>
class Connection_pool :
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for ref-counted pointer to session.
  using Session_ptr = boost::shared_ptr<Session_obj>;

  // Constructors/destructor.

  /**
   * Constructs empty pool.
   *
   * @param max_size
   *        See max_size().
   */
  explicit Connection_pool(std::optional<size_t> max_size);

  // Methods.

  /**
   * Reserves a slot if not full().
   * @return `false` (no side effects) if full; `true` if a slot was reserved.
   */
  bool admit();

  /// Releases a slot reserved by admit() that will not be consumed by register_session().
  void withdraw_admission();

  /**
   * Registers a session, consuming a slot reserved by admit().
   *
   * @param handle
   *        Handle not currently registered.
   * @param session
   *        The session.
   */
  void register_session(Session_handle handle, const Session_ptr& session);

  /**
   * Removes the session with the given handle, if registered.  Idempotent.
   *
   * @param handle
   *        Handle.
   * @return Whether it was registered.
   */
  bool deregister_session(Session_handle handle);

  /// Invokes `cancel()` on every registered session.
  void cancel_all();

  /**
   * Whether admit() would fail.
   * @return See above.
   */
  bool full() const;

  /**
   * Tracked sessions: registered plus reserved.
   * @return See above.
   */
  size_t size() const;

  /**
   * Capacity; none means unbounded.
   * @return See above.
   */
  std::optional<size_t> max_size() const;

private:
  // Data.

  /// Registered sessions.
  boost::unordered_map<Session_handle, Session_ptr> m_sessions;

  /// Number of slots reserved by admit() and not yet consumed or released.
  size_t m_n_reserved;

  /// See max_size().
  const std::optional<size_t> m_max_size;
}; // class Connection_pool

// Template implementations.

template<typename Session_obj>
Connection_pool<Session_obj>::Connection_pool(std::optional<size_t> max_size) :
  m_n_reserved(0),
  m_max_size(max_size)
{
  // That's it.
}

template<typename Session_obj>
bool Connection_pool<Session_obj>::admit()
{
  if (full())
  {
    return false;
  }
  // else
  ++m_n_reserved;
  return true;
}

template<typename Session_obj>
void Connection_pool<Session_obj>::withdraw_admission()
{
  assert((m_n_reserved != 0) && "No reservation to withdraw.");
  --m_n_reserved;
}

template<typename Session_obj>
void Connection_pool<Session_obj>::register_session(Session_handle handle, const Session_ptr& session)
{
  assert((m_n_reserved != 0) && "Must admit() first.");
  assert(session);

  [[maybe_unused]] const bool inserted = m_sessions.emplace(handle, session).second;
  assert(inserted && "Handle already registered.");
  --m_n_reserved;
}

template<typename Session_obj>
bool Connection_pool<Session_obj>::deregister_session(Session_handle handle)
{
  return m_sessions.erase(handle) != 0;
}

template<typename Session_obj>
void Connection_pool<Session_obj>::cancel_all()
{
  // Sessions may deregister synchronously from cancel(); so iterate over a snapshot.
  std::vector<Session_ptr> sessions;
  sessions.reserve(m_sessions.size());
  for (const auto& handle_and_session : m_sessions)
  {
    sessions.push_back(handle_and_session.second);
  }

  for (const auto& session : sessions)
  {
    session->cancel();
  }
}

template<typename Session_obj>
bool Connection_pool<Session_obj>::full() const
{
  return m_max_size && (size() >= *m_max_size);
}

template<typename Session_obj>
size_t Connection_pool<Session_obj>::size() const
{
  return m_sessions.size() + m_n_reserved;
}

template<typename Session_obj>
std::optional<size_t> Connection_pool<Session_obj>::max_size() const
{
  return m_max_size;
}

} // namespace ipcsrv::server
