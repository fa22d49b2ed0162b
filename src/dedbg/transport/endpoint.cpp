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
#include "dedbg/transport/endpoint.hpp"
#include "dedbg/transport/error.hpp"
#include <flow/error/error.hpp>
#include <boost/algorithm/string/case_conv.hpp>
#include <mutex>
#include <ostream>
#include <regex>

namespace dedbg::transport
{

namespace
{

/// File-local helper variable: the regex used by parse_server_uri().
std::regex server_uri_regex;

/// File-local helper variable: ensures #server_uri_regex is built thread-safely only once.
std::once_flag server_uri_regex_built;

} // namespace (anon)

// Implementations.

bool Endpoint::tls() const
{
  return m_scheme == Scheme::S_WSS;
}

std::string Endpoint::host_header() const
{
  const bool ipv6_literal = m_host.find(':') != std::string::npos;
  std::string host = ipv6_literal ? ('[' + m_host + ']') : m_host;

  const uint16_t default_port = tls() ? 443 : 80;
  if (m_port != default_port)
  {
    host += ':';
    host += std::to_string(m_port);
  }
  return host;
}

Endpoint parse_server_uri(util::String_view uri, Error_code* err_code)
{
  using boost::algorithm::to_lower_copy;
  using std::regex_match;
  using std::smatch;
  using std::string;

  Endpoint endpoint;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> Endpoint { return parse_server_uri(uri, actual_err_code); },
         &endpoint, err_code, "transport::parse_server_uri()"))
  {
    return endpoint;
  }
  // else

  std::call_once(server_uri_regex_built, [&]()
  {
    /* scheme://host[:port][target][#fragment], where host is a reg-name/IPv4 literal or a bracketed IPv6 literal,
     * and target begins with / or ?. */
    server_uri_regex.assign("^([A-Za-z][A-Za-z0-9+.-]*)://(\\[[0-9A-Fa-f:.]+\\]|[^/:?#\\[\\]@]+)"
                            "(?::([0-9]{1,5}))?([/?][^#]*)?(?:#.*)?$");
  });

  const string uri_str(uri);
  smatch matches;
  if (!regex_match(uri_str, matches, server_uri_regex))
  {
    *err_code = error::Code::S_INVALID_URI;
    return endpoint;
  }
  // else

  const auto scheme = to_lower_copy(matches[1].str());
  if ((scheme == "ws") || (scheme == "http"))
  {
    endpoint.m_scheme = Endpoint::Scheme::S_WS;
  }
  else if ((scheme == "wss") || (scheme == "https"))
  {
    endpoint.m_scheme = Endpoint::Scheme::S_WSS;
  }
  else
  {
    *err_code = error::Code::S_UNSUPPORTED_URI_SCHEME;
    return endpoint;
  }

  endpoint.m_host = matches[2].str();
  if (endpoint.m_host.front() == '[')
  {
    endpoint.m_host = endpoint.m_host.substr(1, endpoint.m_host.size() - 2);
  }

  if (matches[3].matched)
  {
    const auto port = std::stoul(matches[3].str()); // Cannot throw: 1-5 digits guaranteed by regex.
    if ((port == 0) || (port > 65535))
    {
      *err_code = error::Code::S_INVALID_URI;
      return endpoint;
    }
    // else
    endpoint.m_port = static_cast<uint16_t>(port);
  }
  else
  {
    endpoint.m_port = endpoint.tls() ? 443 : 80;
  }

  endpoint.m_target = matches[4].matched ? matches[4].str() : string();
  if (endpoint.m_target.empty() || (endpoint.m_target.front() != '/'))
  {
    endpoint.m_target.insert(0, 1, '/');
  }

  err_code->clear();
  return endpoint;
} // parse_server_uri()

std::ostream& operator<<(std::ostream& os, const Endpoint& val)
{
  return os << (val.tls() ? "wss://" : "ws://") << val.host_header() << val.m_target;
}

} // namespace dedbg::transport
