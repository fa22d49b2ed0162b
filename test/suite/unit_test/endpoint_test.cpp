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
#include <flow/util/util.hpp>
#include <gtest/gtest.h>

namespace dedbg::transport::test
{

TEST(Endpoint, Parse)
{
  auto endpoint = parse_server_uri("ws://debug.example.com:8080/dbg?x=1");
  EXPECT_FALSE(endpoint.tls());
  EXPECT_EQ(endpoint.m_host, "debug.example.com");
  EXPECT_EQ(endpoint.m_port, 8080);
  EXPECT_EQ(endpoint.m_target, "/dbg?x=1");
  EXPECT_EQ(endpoint.host_header(), "debug.example.com:8080");

  // Web-style addresses are rewritten; default ports; empty target.
  endpoint = parse_server_uri("HTTPS://debug.example.com");
  EXPECT_TRUE(endpoint.tls());
  EXPECT_EQ(endpoint.m_port, 443);
  EXPECT_EQ(endpoint.m_target, "/");
  EXPECT_EQ(endpoint.host_header(), "debug.example.com");
  EXPECT_EQ(flow::util::ostream_op_string(endpoint), "wss://debug.example.com/");

  endpoint = parse_server_uri("http://127.0.0.1");
  EXPECT_FALSE(endpoint.tls());
  EXPECT_EQ(endpoint.m_port, 80);

  endpoint = parse_server_uri("wss://[::1]:9443/x#frag");
  EXPECT_EQ(endpoint.m_host, "::1");
  EXPECT_EQ(endpoint.m_port, 9443);
  EXPECT_EQ(endpoint.m_target, "/x");
  EXPECT_EQ(endpoint.host_header(), "[::1]:9443");

  endpoint = parse_server_uri("ws://h?q");
  EXPECT_EQ(endpoint.m_target, "/?q");
}

TEST(Endpoint, Errors)
{
  Error_code err_code;

  parse_server_uri("ftp://host/", &err_code);
  EXPECT_EQ(err_code, error::Code::S_UNSUPPORTED_URI_SCHEME);

  for (const std::string uri : { "", "host:80", "ws://", "ws://host:0/", "ws://host:70000/", "ws://host:x/" })
  {
    parse_server_uri(uri, &err_code);
    EXPECT_EQ(err_code, error::Code::S_INVALID_URI) << '[' << uri << ']';
  }

  EXPECT_THROW(parse_server_uri("nope"), flow::error::Runtime_error);

  parse_server_uri("ws://ok", &err_code);
  EXPECT_FALSE(err_code);
}

} // namespace dedbg::transport::test
