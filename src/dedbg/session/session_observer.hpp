/* dedbg: Debug client sessions
 * Copyright 2026 The dedbg Authors
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

#include "dedbg/transport/message_stream.hpp"
#include <optional>
#include <string>

namespace dedbg::session
{

// Types.

/**
 * Receives lifecycle events from a Client_debug_session.  Override what you need; each default does nothing.
 *
 * All methods are invoked from the session's internal worker thread, never concurrently with each other, and
 * never after the session's destructor has returned.  They must not block for long, and must not invoke the
 * session's request methods (use(), execute(), etc.): those block until the worker thread delivers the reply,
 * which it cannot do while inside the hook.  Posting such work to another thread is fine.
 */
class Session_observer
{
public:
  // Constructors/destructor.

  /// Boring `virtual` destructor.
  virtual ~Session_observer();

  // Methods.

  /// A connection to the server has been established.  Requests may now be sent.
  virtual void on_connection_established();

  /**
   * A previously established connection has been lost (not invoked if the loss was due to session destruction).
   * All requests outstanding on it have been canceled.  Reconnecting begins immediately.
   */
  virtual void on_connection_lost();

  /**
   * A connect attempt failed.  Invoked once per distinct failure: after this returns `false`, further consecutive
   * failures with the same `Error_code` are not reported.
   *
   * @param err_code
   *        Why.
   * @return `true` to be told about the next identical failure too; `false` otherwise.
   */
  virtual bool on_connection_failure(const Error_code& err_code);

  /**
   * Something went wrong on an established connection: a read/write failure (the connection is then torn down),
   * or an incoming message that was malformed (the connection continues) or too large (the connection is closed).
   * Consecutive identical transport failures are reported once.
   *
   * @param err_code
   *        Why.
   */
  virtual void on_communication_fault(const Error_code& err_code);

  /**
   * The current remote node (see Client_debug_session::current_use_path()) has changed.
   *
   * @param use_path
   *        New value.
   */
  virtual void on_current_use_path_changed(const std::string& use_path);
}; // class Session_observer

/**
 * Supplies credentials when a Client_debug_session opens a connection.  The default supplies none.
 * Invoked from the session's internal worker thread before each connect attempt.
 */
class Credential_provider
{
public:
  // Constructors/destructor.

  /// Boring `virtual` destructor.
  virtual ~Credential_provider();

  // Methods.

  /**
   * Returns the credentials to present to the given server; or `nullopt` for none.
   *
   * @param endpoint
   *        The server.
   * @return See above.
   */
  virtual std::optional<transport::Credentials> credentials(const transport::Endpoint& endpoint);
}; // class Credential_provider

} // namespace dedbg::session
