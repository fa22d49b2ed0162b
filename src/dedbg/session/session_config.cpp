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
#include "dedbg/session/session_config.hpp"
#include <ostream>

namespace dedbg::session
{

// Static initializations.

const std::string Session_config::S_SUB_PROTOCOL = "dedbg";

// Implementations.

std::ostream& operator<<(std::ostream& os, const Session_config& val)
{
  return os << "[server_uri[" << val.m_server_uri << "] "
               "default_timeout[" << val.m_default_timeout.count() << " ms] "
               "reconnect_delay[" << val.m_reconnect_delay.count() << " ms] "
               "connect_timeout[" << val.m_connect_timeout.count() << " ms] "
               "close_timeout[" << val.m_close_timeout.count() << " ms] "
               "recv_buffer_size[" << val.m_recv_buffer_size << "] "
               "verify_tls_peer[" << val.m_verify_tls_peer << "]]";
}

} // namespace dedbg::session
