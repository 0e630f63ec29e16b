/**
 * @file test_session.cpp
 * @brief Session state machine unit tests
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "zklink/session.hpp"

using namespace zk::link;

TEST_CASE("Session initial state")
{
  Session session;

  CHECK(session.state() == SessionState::DISCONNECTED);
  CHECK(session.session_id() == 0);
  CHECK_FALSE(session.is_connected());
  CHECK_FALSE(session.is_authenticated());
}

TEST_CASE("Session transitions")
{
  Session session;

  SUBCASE("Initialize")
  {
    REQUIRE(session.initialize(0x1234) == ErrorCode::OK);
    CHECK(session.state() == SessionState::CONNECTED);
    CHECK(session.session_id() == 0x1234);
    CHECK(session.is_connected());
    CHECK_FALSE(session.is_authenticated());
  }

  SUBCASE("Initialize twice")
  {
    REQUIRE(session.initialize(1) == ErrorCode::OK);
    CHECK(session.initialize(2) == ErrorCode::INVALID_SESSION_STATE);
    CHECK(session.session_id() == 1);
  }

  SUBCASE("Authenticate")
  {
    REQUIRE(session.initialize(7) == ErrorCode::OK);
    REQUIRE(session.authenticate() == ErrorCode::OK);
    CHECK(session.state() == SessionState::AUTHENTICATED);
    CHECK(session.is_connected());
    CHECK(session.is_authenticated());
    CHECK(session.session_id() == 7);
  }

  SUBCASE("Authenticate without handshake")
  {
    CHECK(session.authenticate() == ErrorCode::INVALID_SESSION_STATE);
    CHECK(session.state() == SessionState::DISCONNECTED);
  }

  SUBCASE("Authenticate twice")
  {
    REQUIRE(session.initialize(7) == ErrorCode::OK);
    REQUIRE(session.authenticate() == ErrorCode::OK);
    CHECK(session.authenticate() == ErrorCode::INVALID_SESSION_STATE);
    CHECK(session.state() == SessionState::AUTHENTICATED);
  }

  SUBCASE("Initialize after authentication")
  {
    REQUIRE(session.initialize(7) == ErrorCode::OK);
    REQUIRE(session.authenticate() == ErrorCode::OK);
    CHECK(session.initialize(8) == ErrorCode::INVALID_SESSION_STATE);
  }

  SUBCASE("Close resets everything")
  {
    REQUIRE(session.initialize(0x4242) == ErrorCode::OK);
    REQUIRE(session.authenticate() == ErrorCode::OK);
    session.next_reply_id();
    session.next_reply_id();
    session.next_reply_id();

    session.close();
    CHECK(session.state() == SessionState::DISCONNECTED);
    CHECK(session.session_id() == 0);
    CHECK_FALSE(session.is_connected());

    // Reusable after close
    REQUIRE(session.initialize(0x4343) == ErrorCode::OK);
    CHECK(session.session_id() == 0x4343);
    CHECK(session.next_reply_id() == INITIAL_REPLY_ID);
  }

  SUBCASE("Close when disconnected")
  {
    session.close();
    CHECK(session.state() == SessionState::DISCONNECTED);
  }
}

TEST_CASE("Reply id sequence")
{
  Session session;
  REQUIRE(session.initialize(1) == ErrorCode::OK);

  SUBCASE("Starts at 65534 and wraps after 65535")
  {
    CHECK(session.next_reply_id() == 65534);
    CHECK(session.next_reply_id() == 65535);
    CHECK(session.next_reply_id() == 0);
    CHECK(session.next_reply_id() == 1);
  }

  SUBCASE("Keeps cycling")
  {
    uint16_t last = 0;
    for (int i = 0; i < 70000; i++)
    {
      last = session.next_reply_id();
    }
    // 2 ids before the wrap, then 69998 more: 0..69997 mod 65536
    CHECK(last == static_cast<uint16_t>((70000 - 3) % 65536));
    CHECK(last < 10000);
  }

  SUBCASE("Initialize restarts the sequence")
  {
    session.next_reply_id();
    session.close();
    REQUIRE(session.initialize(2) == ErrorCode::OK);
    CHECK(session.next_reply_id() == 65534);
  }
}

TEST_CASE("Session handles share state")
{
  Session owner;
  const Session reader = owner;

  REQUIRE(owner.initialize(0x0A0B) == ErrorCode::OK);
  CHECK(reader.is_connected());
  CHECK(reader.session_id() == 0x0A0B);

  Session writer = reader;
  CHECK(writer.next_reply_id() == 65534);
  CHECK(owner.next_reply_id() == 65535);

  owner.close();
  CHECK_FALSE(reader.is_connected());
  CHECK(reader.session_id() == 0);
}

TEST_CASE("Concurrent reply ids are unique")
{
  Session session;
  REQUIRE(session.initialize(99) == ErrorCode::OK);

  constexpr int threads = 4;
  constexpr int per_thread = 5000;

  std::vector<std::vector<uint16_t>> ids(threads);
  std::vector<std::thread> workers;
  for (int t = 0; t < threads; t++)
  {
    workers.emplace_back(
        [&session, &ids, t]
        {
          Session handle = session;
          for (int i = 0; i < per_thread; i++)
          {
            ids[t].push_back(handle.next_reply_id());
          }
        });
  }

  // Status reads run alongside
  std::atomic<bool> consistent{true};
  std::thread reader(
      [&session, &consistent]
      {
        for (int i = 0; i < 1000; i++)
        {
          if (session.session_id() != 99 || !session.is_connected())
          {
            consistent = false;
          }
        }
      });

  for (std::thread& worker : workers)
  {
    worker.join();
  }
  reader.join();

  CHECK(consistent);

  // 20000 ids fit in one cycle, so none repeats
  std::vector<bool> seen(65536, false);
  size_t duplicates = 0;
  for (const std::vector<uint16_t>& list : ids)
  {
    REQUIRE(list.size() == static_cast<size_t>(per_thread));
    for (const uint16_t id : list)
    {
      if (seen[id])
      {
        duplicates++;
      }
      seen[id] = true;
    }
  }
  CHECK(duplicates == 0);
}

TEST_CASE("Session state names")
{
  CHECK(std::string(session_state_name(SessionState::DISCONNECTED)) == "DISCONNECTED");
  CHECK(std::string(session_state_name(SessionState::CONNECTED)) == "CONNECTED");
  CHECK(std::string(session_state_name(SessionState::AUTHENTICATED)) == "AUTHENTICATED");
}
