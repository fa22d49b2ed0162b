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
#include "dedbg/session/client_debug_session.hpp"
#include "dedbg/session/error.hpp"
#include "dedbg/session/remote_fault.hpp"
#include "fake_message_stream.hpp"
#include <flow/log/config.hpp>
#include <flow/log/simple_ostream_logger.hpp>
#include <boost/asio/error.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <thread>

namespace dedbg::session::test
{

namespace
{

using dedbg::test::Fake_server;
using std::chrono::milliseconds;
using std::chrono::seconds;
using Clock = std::chrono::steady_clock;

/// Records observer hooks (which run in the session's thread).
class Test_observer :
  public Session_observer
{
public:
  void on_connection_established() override
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_n_established;
  }

  void on_connection_lost() override
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_n_lost;
  }

  bool on_connection_failure(const Error_code& err_code) override
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_failures.push_back(err_code);
    return m_retell_failures;
  }

  void on_communication_fault(const Error_code& err_code) override
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_faults.push_back(err_code);
  }

  void on_current_use_path_changed(const std::string& use_path) override
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_use_paths.push_back(use_path);
  }

  int n_established() const { std::lock_guard<std::mutex> lock(m_mutex); return m_n_established; }
  int n_lost() const { std::lock_guard<std::mutex> lock(m_mutex); return m_n_lost; }
  std::vector<Error_code> failures() const { std::lock_guard<std::mutex> lock(m_mutex); return m_failures; }
  std::vector<Error_code> faults() const { std::lock_guard<std::mutex> lock(m_mutex); return m_faults; }
  std::vector<std::string> use_paths() const { std::lock_guard<std::mutex> lock(m_mutex); return m_use_paths; }

  /// If set before connecting, on_connection_failure() asks to hear about repeats.
  std::atomic<bool> m_retell_failures{false};

private:
  mutable std::mutex m_mutex;
  int m_n_established = 0;
  int m_n_lost = 0;
  std::vector<Error_code> m_failures;
  std::vector<Error_code> m_faults;
  std::vector<std::string> m_use_paths;
}; // class Test_observer

/// Supplies fixed credentials.
class Test_credential_provider :
  public Credential_provider
{
public:
  std::optional<transport::Credentials> credentials(const transport::Endpoint& endpoint) override
  {
    EXPECT_EQ(endpoint.m_host, "debug.test");
    return transport::Credentials{ "alice", "s3cret" };
  }
};

/**
 * Polls until the given condition holds.
 *
 * @param pred
 *        Condition.
 * @return `false` if it did not hold within a few seconds.
 */
template<typename Pred>
bool wait_until(Pred pred)
{
  const auto deadline = Clock::now() + seconds(5);
  while (!pred())
  {
    if (Clock::now() >= deadline)
    {
      return false;
    }
    std::this_thread::sleep_for(milliseconds(2));
  }
  return true;
}

/**
 * Replies to the given request with the given reply, stamped with the request's token.
 *
 * @param server
 *        Server.
 * @param request_text
 *        What the client sent.
 * @param reply_text
 *        Reply sans token.
 * @param frame_size
 *        See Fake_server::send_to_client().
 */
void reply_to(Fake_server* server, const std::string& request_text, const std::string& reply_text,
              size_t frame_size = 0)
{
  auto reply = parse_document(reply_text);
  stamp_token(&reply, read_token(parse_document(request_text)));
  server->send_to_client(serialize(reply), frame_size);
}

} // namespace (anon)

class Client_debug_session_test :
  public ::testing::Test
{
protected:
  Client_debug_session_test() :
    m_log_config(flow::log::Sev::S_TRACE),
    m_logger(&m_log_config)
  {
    using flow::log::Config;

    m_log_config.init_component_to_union_idx_mapping<Log_component>
      (1000, Config::standard_component_payload_enum_sparse_length<Log_component>(), true);
    m_log_config.init_component_names<Log_component>(S_DEDBG_LOG_COMPONENT_NAME_MAP, false, "dedbg-");

    m_config.m_server_uri = "ws://debug.test:1234/dbg";
    m_config.m_reconnect_delay = milliseconds(20);
    m_config.m_close_timeout = milliseconds(200);
  }

  /// Creates #m_session and waits for it to connect.
  void connect()
  {
    start();
    ASSERT_TRUE(m_server.wait_connected());
    ASSERT_TRUE(m_session->is_connected());
  }

  /// Creates #m_session.
  void start()
  {
    m_session = std::make_unique<Client_debug_session>(&m_logger, m_config, &m_observer, nullptr, &m_server);
  }

  flow::log::Config m_log_config;
  flow::log::Simple_ostream_logger m_logger;
  Session_config m_config;
  Fake_server m_server;
  Test_observer m_observer;
  std::unique_ptr<Client_debug_session> m_session;
};

TEST_F(Client_debug_session_test, Connect)
{
  connect();

  EXPECT_EQ(m_server.last_sub_protocol(), "dedbg");
  EXPECT_FALSE(m_server.last_credentials());
  EXPECT_EQ(m_observer.n_established(), 1);
  EXPECT_EQ(m_session->current_use_path(), "/");
  ASSERT_TRUE(wait_until([&]() { return m_observer.use_paths().size() == 1; }));
  EXPECT_EQ(m_observer.use_paths().front(), "/");

  // Nothing was sent: there was no use path to restore.
  EXPECT_TRUE(m_server.wait_sent(milliseconds(50)).empty());
}

TEST_F(Client_debug_session_test, Credentials)
{
  Test_credential_provider credential_provider;
  m_session = std::make_unique<Client_debug_session>(&m_logger, m_config, &m_observer, &credential_provider,
                                                     &m_server);
  ASSERT_TRUE(m_server.wait_connected());
  const auto credentials = m_server.last_credentials();
  ASSERT_TRUE(credentials);
  EXPECT_EQ(credentials->m_user_name, "alice");
  EXPECT_EQ(credentials->m_password, "s3cret");
  m_session.reset();
}

TEST_F(Client_debug_session_test, Use)
{
  connect();

  auto result = std::async(std::launch::async, [&]() { return m_session->use("/app"); });
  const auto sent = m_server.wait_sent();
  const auto request = parse_document(sent);
  EXPECT_EQ(root_tag(request), "use");
  EXPECT_EQ(attribute(root_element(request), "node"), std::string("/app"));
  EXPECT_NE(read_token(request), 0);

  reply_to(&m_server, sent, "<use node=\"/app\"/>");
  EXPECT_EQ(result.get(), "/app");
  EXPECT_EQ(m_session->current_use_path(), "/app");
  ASSERT_TRUE(wait_until([&]() { return m_observer.use_paths().size() == 2; }));
  EXPECT_EQ(m_observer.use_paths().back(), "/app");

  // Same path again: no notification.
  result = std::async(std::launch::async, [&]() { return m_session->use("/app"); });
  reply_to(&m_server, m_server.wait_sent(), "<use node=\"/app\"/>");
  EXPECT_EQ(result.get(), "/app");
  std::this_thread::sleep_for(milliseconds(50));
  EXPECT_EQ(m_observer.use_paths().size(), 2u);
}

TEST_F(Client_debug_session_test, Execute)
{
  connect();

  auto result = std::async(std::launch::async, [&]() { return m_session->execute("1+1"); });
  const auto sent = m_server.wait_sent();
  const auto request = parse_document(sent);
  EXPECT_EQ(root_tag(request), "execute");
  EXPECT_EQ(root_element(request).data(), "1+1");

  reply_to(&m_server, sent, "<execute><v t=\"int\">2</v></execute>");
  const auto values = result.get();
  ASSERT_EQ(values.size(), 1u);
  EXPECT_EQ(values[0].name(), "$0");
  EXPECT_EQ(values[0].type(), Value_type::S_INT32);
  EXPECT_EQ(std::get<int64_t>(values[0].value()), 2);
}

TEST_F(Client_debug_session_test, Execute_table_in_frames)
{
  connect();

  auto result = std::async(std::launch::async, [&]() { return m_session->execute("tbl"); });
  const auto sent = m_server.wait_sent();
  // A binary message in between contributes nothing.
  m_server.send_binary_to_client("\x01\x02\x03");
  reply_to(&m_server, sent, "<execute><v n=\"rows\" t=\"table\"><v t=\"int\">1</v><v t=\"bool\">false</v></v></execute>",
           7);

  const auto values = result.get();
  ASSERT_EQ(values.size(), 1u);
  ASSERT_TRUE(values[0].is_table());
  const auto& rows = values[0].table();
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0].name(), "$1");
  EXPECT_EQ(rows[0].type(), Value_type::S_INT32);
  EXPECT_EQ(rows[1].name(), "$2");
  EXPECT_EQ(rows[1].type(), Value_type::S_BOOL);
}

TEST_F(Client_debug_session_test, List_members_and_list)
{
  connect();

  auto members = std::async(std::launch::async, [&]() { return m_session->list_members(); });
  auto sent = m_server.wait_sent();
  EXPECT_EQ(root_tag(parse_document(sent)), "member");
  reply_to(&m_server, sent, "<member><v n=\"Count\" t=\"System.Int32\">3</v><v n=\"Name\">x</v></member>");
  const auto values = members.get();
  ASSERT_EQ(values.size(), 2u);
  EXPECT_EQ(values[0].name(), "Count");
  EXPECT_EQ(values[1].value_as_string(), "x");

  auto tree = std::async(std::launch::async, [&]() { return m_session->list(true); });
  sent = m_server.wait_sent();
  const auto request = parse_document(sent);
  EXPECT_EQ(root_tag(request), "list");
  EXPECT_EQ(attribute(root_element(request), "r"), std::string("true"));
  reply_to(&m_server, sent, "<list><node name=\"app\"><node name=\"child\"/></node></list>");
  const auto doc = tree.get();
  EXPECT_EQ(root_tag(doc), "list");
  EXPECT_EQ(attribute(root_element(doc).get_child("node"), "name"), std::string("app"));
}

TEST_F(Client_debug_session_test, Remote_fault)
{
  connect();

  // Error_code mode.
  auto result = std::async(std::launch::async, [&]()
  {
    Error_code err_code;
    const auto values = m_session->execute("boom()", Cancel_scope_ptr(), &err_code);
    EXPECT_TRUE(values.empty());
    return err_code;
  });
  reply_to(&m_server, m_server.wait_sent(),
           "<exception message=\"Division by zero\" type=\"System.DivideByZeroException\">"
           "<stackTrace>at Eval()</stackTrace></exception>");
  EXPECT_EQ(result.get(), error::Code::S_REMOTE_FAULT);

  // Throwing mode: the typed fault.
  auto thrown = std::async(std::launch::async, [&]() { m_session->execute("boom()"); });
  reply_to(&m_server, m_server.wait_sent(), "<exception message=\"Nope\" type=\"E\"/>");
  try
  {
    thrown.get();
    ADD_FAILURE() << "Expected Remote_fault.";
  }
  catch (const Remote_fault& exc)
  {
    EXPECT_EQ(exc.message(), "Nope");
    EXPECT_EQ(exc.exception_type(), "E");
    EXPECT_EQ(exc.code(), error::Code::S_REMOTE_FAULT);
  }

  // The low-level call reports it in the Reply.
  auto reply = std::async(std::launch::async, [&]() { return m_session->sync_request(make_member_envelope()); });
  reply_to(&m_server, m_server.wait_sent(), "<exception message=\"m\"/>");
  const auto fault = reply.get().fault();
  ASSERT_TRUE(fault);
  EXPECT_EQ(fault->message(), "m");

  // A remote fault is not a communication fault; the connection stays.
  EXPECT_TRUE(m_observer.faults().empty());
  EXPECT_EQ(m_server.connect_attempts(), 1u);
}

TEST_F(Client_debug_session_test, Use_fault_resets_path)
{
  connect();

  auto result = std::async(std::launch::async, [&]() { return m_session->use("/app"); });
  reply_to(&m_server, m_server.wait_sent(), "<use node=\"/app\"/>");
  EXPECT_EQ(result.get(), "/app");

  auto faulted = std::async(std::launch::async, [&]()
  {
    Error_code err_code;
    m_session->use("/nonexistent", Cancel_scope_ptr(), &err_code);
    return err_code;
  });
  reply_to(&m_server, m_server.wait_sent(), "<exception message=\"No such node\"/>");
  EXPECT_EQ(faulted.get(), error::Code::S_REMOTE_FAULT);
  EXPECT_EQ(m_session->current_use_path(), "/");
}

TEST_F(Client_debug_session_test, No_cross_talk)
{
  connect();

  constexpr int N_REQS = 5;
  std::vector<std::future<Client_value::Table>> results;
  for (int i = 0; i != N_REQS; ++i)
  {
    results.push_back(std::async(std::launch::async,
                                 [&, i]() { return m_session->execute("cmd" + std::to_string(i)); }));
  }

  std::vector<std::string> sent;
  for (int i = 0; i != N_REQS; ++i)
  {
    sent.push_back(m_server.wait_sent());
    ASSERT_FALSE(sent.back().empty());
  }

  // Answer in reverse order of arrival, each with the number from its own command.
  for (auto it = sent.rbegin(); it != sent.rend(); ++it)
  {
    const auto command = root_element(parse_document(*it)).data();
    reply_to(&m_server, *it, "<execute><v t=\"int\">" + command.substr(3) + "</v></execute>");
  }

  for (int i = 0; i != N_REQS; ++i)
  {
    const auto values = results[i].get();
    ASSERT_EQ(values.size(), 1u);
    EXPECT_EQ(std::get<int64_t>(values[0].value()), i);
  }
}

TEST_F(Client_debug_session_test, Disconnect_cancels)
{
  connect();

  auto result = std::async(std::launch::async, [&]()
  {
    Error_code err_code;
    m_session->execute("wait_forever()", Cancel_scope_ptr(), &err_code);
    return err_code;
  });
  const auto sent = m_server.wait_sent();
  ASSERT_FALSE(sent.empty());

  m_server.drop_connection();
  EXPECT_EQ(result.get(), error::Code::S_REQUEST_CANCELED);

  // Reconnects right away.
  ASSERT_TRUE(m_server.wait_connected());
  ASSERT_TRUE(wait_until([&]() { return m_observer.n_established() == 2; }));
  EXPECT_EQ(m_observer.n_lost(), 1);
  ASSERT_EQ(m_observer.faults().size(), 1u);
  EXPECT_EQ(m_observer.faults().front(), boost::asio::error::connection_reset);

  // A reply to the old request, were it to arrive now, goes nowhere.
  reply_to(&m_server, sent, "<execute><v>late</v></execute>");

  // Throwing mode reports cancellation as a Runtime_error.
  auto thrown = std::async(std::launch::async, [&]() { m_session->execute("again"); });
  ASSERT_FALSE(m_server.wait_sent().empty());
  m_server.drop_connection();
  try
  {
    thrown.get();
    ADD_FAILURE() << "Expected cancellation.";
  }
  catch (const flow::error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), error::Code::S_REQUEST_CANCELED);
  }

  // The same failure again, even across a successful reconnect, is not reported again.
  ASSERT_TRUE(m_server.wait_connected());
  ASSERT_TRUE(wait_until([&]() { return m_observer.n_established() == 3; }));
  EXPECT_EQ(m_observer.n_lost(), 2);
  EXPECT_EQ(m_observer.faults().size(), 1u);

  // A different one is.
  m_server.close_connection(); // Not a fault at all.
  ASSERT_TRUE(m_server.wait_connected());
  ASSERT_TRUE(wait_until([&]() { return m_observer.n_established() == 4; }));
  m_server.send_to_client("this is <not xml");
  ASSERT_TRUE(wait_until([&]() { return m_observer.faults().size() == 2; }));
  EXPECT_EQ(m_observer.faults().back(), error::Code::S_MALFORMED_MESSAGE);
}

TEST_F(Client_debug_session_test, Send_failure)
{
  connect();
  m_server.set_send_error(boost::asio::error::broken_pipe);

  // Reported as the transport's error, not as cancellation; and the request does not linger.
  Error_code err_code;
  const auto values = m_session->execute("lost()", Cancel_scope_ptr(), &err_code);
  EXPECT_EQ(err_code, boost::asio::error::broken_pipe);
  EXPECT_NE(err_code, error::Code::S_REQUEST_CANCELED);
  EXPECT_TRUE(values.empty());
  EXPECT_EQ(m_session->pending_request_count(), 0u);

  try
  {
    m_session->list_members();
    ADD_FAILURE() << "Expected a send failure.";
  }
  catch (const flow::error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), boost::asio::error::broken_pipe);
  }
  EXPECT_EQ(m_session->pending_request_count(), 0u);
  EXPECT_EQ(m_session->current_use_path(), "/");

  // Sending works again once the transport does.
  m_server.set_send_error(Error_code());
  auto result = std::async(std::launch::async, [&]() { return m_session->execute("1+1"); });
  const auto sent = m_server.wait_sent();
  ASSERT_FALSE(sent.empty());
  EXPECT_EQ(m_session->pending_request_count(), 1u);
  reply_to(&m_server, sent, "<execute><v t=\"int\">2</v></execute>");
  const auto table = result.get();
  ASSERT_EQ(table.size(), 1u);
  EXPECT_EQ(table.front().value_as_string(), "2");
  EXPECT_EQ(m_session->pending_request_count(), 0u);
}

TEST_F(Client_debug_session_test, Default_timeout)
{
  m_config.m_default_timeout = milliseconds(100);
  connect();
  EXPECT_EQ(m_session->default_timeout(), milliseconds(100));

  const auto start = Clock::now();
  Error_code err_code;
  m_session->execute("never_answered()", Cancel_scope_ptr(), &err_code);
  const auto elapsed = Clock::now() - start;

  EXPECT_EQ(err_code, error::Code::S_REQUEST_CANCELED);
  EXPECT_GE(elapsed, milliseconds(100));
  EXPECT_LT(elapsed, seconds(3));
  // The connection is unaffected.
  EXPECT_TRUE(m_session->is_connected());
  EXPECT_EQ(m_server.connect_attempts(), 1u);

  m_session->set_default_timeout(milliseconds(-5));
  EXPECT_EQ(m_session->default_timeout(), milliseconds(0));
}

TEST_F(Client_debug_session_test, Caller_cancel)
{
  m_config.m_default_timeout = milliseconds(50); // Not used: the caller supplies a scope.
  connect();

  const auto cancel_scope = Cancel_scope::create();
  auto result = std::async(std::launch::async, [&]()
  {
    Error_code err_code;
    m_session->execute("slow()", cancel_scope, &err_code);
    return err_code;
  });
  ASSERT_FALSE(m_server.wait_sent().empty());

  EXPECT_EQ(result.wait_for(milliseconds(200)), std::future_status::timeout);
  cancel_scope->cancel();
  EXPECT_EQ(result.get(), error::Code::S_REQUEST_CANCELED);

  // Already canceled: returns at once.
  Error_code err_code;
  m_session->execute("x", cancel_scope, &err_code);
  EXPECT_EQ(err_code, error::Code::S_REQUEST_CANCELED);
}

TEST_F(Client_debug_session_test, Not_connected)
{
  m_server.set_connect_error(boost::asio::error::connection_refused);
  start();
  ASSERT_TRUE(m_server.wait_connect_attempts(3));

  Error_code err_code;
  const auto values = m_session->execute("1", Cancel_scope_ptr(), &err_code);
  EXPECT_EQ(err_code, error::Code::S_NOT_CONNECTED);
  EXPECT_TRUE(values.empty());
  EXPECT_THROW(m_session->list_members(), flow::error::Runtime_error);
  EXPECT_FALSE(m_session->is_connected());
  EXPECT_TRUE(m_session->current_use_path().empty());

  // Repeats of the same failure are reported once; a different one is reported.
  ASSERT_EQ(m_observer.failures().size(), 1u);
  EXPECT_EQ(m_observer.failures().front(), boost::asio::error::connection_refused);

  m_server.set_connect_error(boost::asio::error::host_unreachable);
  ASSERT_TRUE(wait_until([&]() { return m_observer.failures().size() == 2; }));
  EXPECT_EQ(m_observer.failures().back(), boost::asio::error::host_unreachable);

  // Then the server comes up.
  m_server.set_connect_error(Error_code());
  ASSERT_TRUE(m_server.wait_connected());
  ASSERT_TRUE(wait_until([&]() { return m_observer.n_established() == 1; }));
  EXPECT_EQ(m_observer.failures().size(), 2u);
  EXPECT_EQ(m_observer.n_lost(), 0);
}

TEST_F(Client_debug_session_test, Failure_retold_on_request)
{
  m_observer.m_retell_failures = true;
  m_server.set_connect_error(boost::asio::error::connection_refused);
  start();
  ASSERT_TRUE(m_server.wait_connect_attempts(4));
  ASSERT_TRUE(wait_until([&]() { return m_observer.failures().size() >= 3; }));
}

TEST_F(Client_debug_session_test, Use_path_restored_after_reconnect)
{
  connect();

  auto result = std::async(std::launch::async, [&]() { return m_session->use("/app"); });
  reply_to(&m_server, m_server.wait_sent(), "<use node=\"/app\"/>");
  EXPECT_EQ(result.get(), "/app");

  m_server.drop_connection();
  ASSERT_TRUE(m_server.wait_connected());

  // The session re-selects the node by itself.
  const auto sent = m_server.wait_sent();
  const auto request = parse_document(sent);
  EXPECT_EQ(root_tag(request), "use");
  EXPECT_EQ(attribute(root_element(request), "node"), std::string("/app"));
  EXPECT_EQ(m_session->current_use_path(), "/app");

  reply_to(&m_server, sent, "<use node=\"/app/moved\"/>");
  ASSERT_TRUE(wait_until([&]() { return m_session->current_use_path() == "/app/moved"; }));

  // If that fails remotely, back to the root.
  m_server.drop_connection();
  ASSERT_TRUE(m_server.wait_connected());
  reply_to(&m_server, m_server.wait_sent(), "<exception message=\"Gone\"/>");
  ASSERT_TRUE(wait_until([&]() { return m_session->current_use_path() == "/"; }));

  const std::vector<std::string> expected_paths{ "/", "/app", "/app/moved", "/" };
  ASSERT_TRUE(wait_until([&]() { return m_observer.use_paths().size() == expected_paths.size(); }));
  EXPECT_EQ(m_observer.use_paths(), expected_paths);
}

TEST_F(Client_debug_session_test, Message_too_large)
{
  m_config.m_recv_buffer_size = 64;
  connect();

  m_server.send_to_client("<execute token=\"1\">" + std::string(200, 'x') + "</execute>", 16);

  ASSERT_TRUE(wait_until([&]() { return m_observer.n_lost() == 1; }));
  ASSERT_EQ(m_observer.faults().size(), 1u);
  EXPECT_EQ(m_observer.faults().front(), error::Code::S_MESSAGE_TOO_LARGE);
  const auto closes = m_server.closes();
  ASSERT_EQ(closes.size(), 1u);
  EXPECT_EQ(closes.front(), transport::Close_status::S_MESSAGE_TOO_BIG);

  // And back.
  ASSERT_TRUE(m_server.wait_connected());
  ASSERT_TRUE(wait_until([&]() { return m_observer.n_established() == 2; }));
}

TEST_F(Client_debug_session_test, Malformed_message_keeps_connection)
{
  connect();

  m_server.send_to_client("this is <not xml");
  ASSERT_TRUE(wait_until([&]() { return m_observer.faults().size() == 1; }));
  EXPECT_EQ(m_observer.faults().front(), error::Code::S_MALFORMED_MESSAGE);

  // Unsolicited and unknown-token messages are ignored too.
  m_server.send_to_client("<notification kind=\"hello\"/>");
  m_server.send_to_client("<execute token=\"12345\"/>");

  auto result = std::async(std::launch::async, [&]() { return m_session->execute("still there?"); });
  reply_to(&m_server, m_server.wait_sent(), "<execute><v t=\"bool\">true</v></execute>");
  const auto values = result.get();
  ASSERT_EQ(values.size(), 1u);
  EXPECT_TRUE(std::get<bool>(values[0].value()));

  EXPECT_EQ(m_server.connect_attempts(), 1u);
  EXPECT_EQ(m_observer.n_lost(), 0);
  EXPECT_EQ(m_observer.faults().size(), 1u);
}

TEST_F(Client_debug_session_test, Server_close_is_not_a_fault)
{
  connect();

  m_server.close_connection();
  ASSERT_TRUE(wait_until([&]() { return m_observer.n_established() == 2; }));
  EXPECT_EQ(m_observer.n_lost(), 1);
  EXPECT_TRUE(m_observer.faults().empty());
}

TEST_F(Client_debug_session_test, Disposal)
{
  connect();
  ASSERT_TRUE(wait_until([&]() { return m_observer.use_paths().size() == 1; }));

  m_session.reset();

  const auto closes = m_server.closes();
  ASSERT_EQ(closes.size(), 1u);
  EXPECT_EQ(closes.front(), transport::Close_status::S_NORMAL);
  // Disposal is not a lost connection; and no reconnect follows.
  EXPECT_EQ(m_observer.n_lost(), 0);
  std::this_thread::sleep_for(milliseconds(50));
  EXPECT_EQ(m_server.connect_attempts(), 1u);
}

TEST_F(Client_debug_session_test, Disposal_while_connecting)
{
  m_server.set_connect_error(boost::asio::error::timed_out);
  start();
  ASSERT_TRUE(m_server.wait_connect_attempts(2));
  m_session.reset();
  EXPECT_TRUE(m_server.closes().empty());
}

TEST(Client_debug_session, Bad_uri)
{
  Session_config config;
  config.m_server_uri = "gopher://debug.test/";
  Fake_server server;
  EXPECT_THROW(Client_debug_session(nullptr, config, nullptr, nullptr, &server), flow::error::Runtime_error);
}

TEST(Client_debug_session, Zero_recv_buffer)
{
  Session_config config;
  config.m_server_uri = "ws://debug.test:1234/dbg";
  config.m_recv_buffer_size = 0;
  Fake_server server;
  try
  {
    Client_debug_session session(nullptr, config, nullptr, nullptr, &server);
    ADD_FAILURE() << "Expected rejection of the config.";
  }
  catch (const flow::error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), error::Code::S_INVALID_CONFIG);
  }
  EXPECT_EQ(server.connect_attempts(), 0u);
}

} // namespace dedbg::session::test
