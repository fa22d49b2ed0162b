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

#include "dedbg/session/client_debug_session.hpp"
#include "dedbg/session/remote_fault.hpp"
#include <flow/log/config.hpp>
#include <flow/log/simple_ostream_logger.hpp>
#include <flow/util/util.hpp>
#include <boost/chrono.hpp>
#include <iostream>

/* This little thing is *not* a unit-test; it is built to ensure the proper stuff links through our
 * build process.  Pointed at a live debug server (first arg; e.g., ws://localhost:8080/) it also opens a real
 * session, selects the root node, and runs a command (second arg, if any); not so much for correctness testing
 * but to see it build successfully and run without barfing. */
int main(int argc, char const * const * argv)
{
  using dedbg::session::Client_debug_session;
  using dedbg::session::Session_config;
  using dedbg::session::Remote_fault;
  using dedbg::Log_component;
  using flow::log::Simple_ostream_logger;
  using flow::log::Config;
  using flow::log::Sev;
  using flow::Flow_log_component;
  using std::exception;

  /* Set up logging within this function.  We could easily just use `cout` and `cerr` instead, but this
   * Flow stuff will give us time stamps and such for free, so why not?  Normally, one derives from
   * Log_context to do this very trivially, but we just have the one function, main(), so far so: */
  Config std_log_config(Sev::S_INFO);
  std_log_config.init_component_to_union_idx_mapping<Flow_log_component>
    (1000, Config::standard_component_payload_enum_sparse_length<Flow_log_component>(), true);
  std_log_config.init_component_to_union_idx_mapping<Log_component>
    (2000, Config::standard_component_payload_enum_sparse_length<Log_component>(), true);
  std_log_config.init_component_names<Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "flow-");
  std_log_config.init_component_names<Log_component>(dedbg::S_DEDBG_LOG_COMPONENT_NAME_MAP, false, "dedbg-");
  Simple_ostream_logger std_logger(&std_log_config);
  FLOW_LOG_SET_CONTEXT(&std_logger, Flow_log_component::S_UNCAT);

  if (argc < 2)
  {
    FLOW_LOG_INFO("Usage: " << argv[0] << " <server URI> [command].  Without a server we are done once linked.");
    return 0;
  }
  // else

  try
  {
    Session_config config;
    config.m_server_uri = argv[1];
    config.m_default_timeout = std::chrono::seconds(10);

    Client_debug_session session(&std_logger, config);
    FLOW_LOG_INFO("Session started: [" << session << "].  Waiting for it to connect.");

    // Don't judge us.  Again, we aren't demo-ing best practices here!
    for (int i = 0; (i != 50) && (!session.is_connected()); ++i)
    {
      flow::util::this_thread::sleep_for(boost::chrono::milliseconds(100));
    }
    if (!session.is_connected())
    {
      FLOW_LOG_WARNING("Could not connect in time; giving up.");
      return 1;
    }
    // else

    FLOW_LOG_INFO("Connected.  Use path: [" << session.use("/") << "].");
    if (argc >= 3)
    {
      for (const auto& val : session.execute(argv[2]))
      {
        FLOW_LOG_INFO("Result: [" << val << "].");
      }
    }
    for (const auto& val : session.list_members())
    {
      FLOW_LOG_INFO("Member: [" << val << "].");
    }

    FLOW_LOG_INFO("Exiting.");
  } // try
  catch (const Remote_fault& exc)
  {
    FLOW_LOG_WARNING("Server reported fault: [" << exc << "].");
    return 1;
  }
  catch (const exception& exc)
  {
    FLOW_LOG_WARNING("Caught exception: [" << exc.what() << "].");
    return 1;
  }

  return 0;
} // main()
