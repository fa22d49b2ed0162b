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
#include "dedbg/session/session_observer.hpp"

namespace dedbg::session
{

// Session_observer implementations.

Session_observer::~Session_observer() = default;

void Session_observer::on_connection_established()
{
  // Nothing.
}

void Session_observer::on_connection_lost()
{
  // Nothing.
}

bool Session_observer::on_connection_failure(const Error_code&)
{
  return false;
}

void Session_observer::on_communication_fault(const Error_code&)
{
  // Nothing.
}

void Session_observer::on_current_use_path_changed(const std::string&)
{
  // Nothing.
}

// Credential_provider implementations.

Credential_provider::~Credential_provider() = default;

std::optional<transport::Credentials> Credential_provider::credentials(const transport::Endpoint&)
{
  return std::nullopt;
}

} // namespace dedbg::session
