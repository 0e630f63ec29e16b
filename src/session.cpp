/**
 * @file session.cpp
 * @brief Session state implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "zklink/session.hpp"

#include "log.hpp"

namespace zk
{
namespace link
{

Session::Session() : state_(std::make_shared<State>()) {}

ErrorCode Session::initialize(uint16_t session_id)
{
  std::lock_guard<std::mutex> lock(state_->mutex);

  if (state_->state != SessionState::DISCONNECTED)
  {
    ZKLINK_LOG_DEBUG << "Cannot initialize session from state "
                     << session_state_name(state_->state);
    return ErrorCode::INVALID_SESSION_STATE;
  }

  state_->session_id = session_id;
  state_->reply_counter = INITIAL_REPLY_ID;
  state_->state = SessionState::CONNECTED;
  return ErrorCode::OK;
}

ErrorCode Session::authenticate()
{
  std::lock_guard<std::mutex> lock(state_->mutex);

  if (state_->state != SessionState::CONNECTED)
  {
    ZKLINK_LOG_DEBUG << "Cannot authenticate session from state "
                     << session_state_name(state_->state);
    return ErrorCode::INVALID_SESSION_STATE;
  }

  state_->state = SessionState::AUTHENTICATED;
  return ErrorCode::OK;
}

void Session::close()
{
  std::lock_guard<std::mutex> lock(state_->mutex);

  state_->session_id = 0;
  state_->reply_counter = INITIAL_REPLY_ID;
  state_->state = SessionState::DISCONNECTED;
}

uint16_t Session::next_reply_id()
{
  std::lock_guard<std::mutex> lock(state_->mutex);

  const uint16_t current = state_->reply_counter;

  // 65535 is a valid id itself; reset after emitting it
  if (current == 0xFFFF)
  {
    state_->reply_counter = 0;
  }
  else
  {
    state_->reply_counter = static_cast<uint16_t>(current + 1);
  }

  return current;
}

uint16_t Session::session_id() const
{
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->session_id;
}

SessionState Session::state() const
{
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->state;
}

bool Session::is_connected() const
{
  return state() != SessionState::DISCONNECTED;
}

bool Session::is_authenticated() const
{
  return state() == SessionState::AUTHENTICATED;
}

const char* session_state_name(SessionState state)
{
  switch (state)
  {
    case SessionState::DISCONNECTED:
      return "DISCONNECTED";
    case SessionState::CONNECTED:
      return "CONNECTED";
    case SessionState::AUTHENTICATED:
      return "AUTHENTICATED";
  }
  return "UNKNOWN";
}

}  // namespace link
}  // namespace zk
