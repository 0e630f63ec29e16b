/**
 * @file session.hpp
 * @brief Per-connection session state
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>

#include "zklink/errors.hpp"
#include "zklink/protocol.hpp"

namespace zk
{
namespace link
{

/**
 * @brief Coarse connection state
 */
enum class SessionState : uint8_t
{
  DISCONNECTED,   // No handshake, session id is 0
  CONNECTED,      // Handshake complete
  AUTHENTICATED,  // Marked authenticated by the owner
};

/**
 * @brief Session id, reply id counter and connection state
 *
 * Session is a handle: copying it yields another reference to the same
 * underlying state, never a deep copy. The client and any number of
 * status readers may hold copies; every accessor and mutator takes the
 * internal mutex for the duration of the call only.
 *
 * Transitions:
 * - initialize():   DISCONNECTED -> CONNECTED
 * - authenticate(): CONNECTED -> AUTHENTICATED
 * - close():        any -> DISCONNECTED
 *
 * @code
 * Session session;
 * Session status_view = session;  // shares state
 * session.initialize(1234);
 * status_view.is_connected();     // true
 * @endcode
 */
class Session
{
 public:
  /**
   * @brief Create a new disconnected session
   */
  Session();

  /**
   * @brief Adopt a device-assigned session id
   *
   * Resets the reply counter to INITIAL_REPLY_ID.
   *
   * @param session_id Session id from the handshake response
   * @return ErrorCode::OK, or INVALID_SESSION_STATE unless DISCONNECTED
   */
  ErrorCode initialize(uint16_t session_id);

  /**
   * @brief Mark the session authenticated
   *
   * @return ErrorCode::OK, or INVALID_SESSION_STATE unless CONNECTED
   */
  ErrorCode authenticate();

  /**
   * @brief Reset to DISCONNECTED, session id 0, counter INITIAL_REPLY_ID
   *
   * Valid from any state, including DISCONNECTED.
   */
  void close();

  /**
   * @brief Issue a reply id
   *
   * Returns the counter and advances it. The sequence after initialize()
   * is 65534, 65535, 0, 1, ...
   */
  uint16_t next_reply_id();

  uint16_t session_id() const;
  SessionState state() const;

  /**
   * @brief True in CONNECTED and AUTHENTICATED
   */
  bool is_connected() const;

  bool is_authenticated() const;

 private:
  struct State
  {
    std::mutex mutex;
    uint16_t session_id = 0;
    uint16_t reply_counter = INITIAL_REPLY_ID;
    SessionState state = SessionState::DISCONNECTED;
  };

  std::shared_ptr<State> state_;  ///< Shared by all copies of this handle
};

/**
 * @brief Label for logging, e.g. "CONNECTED"
 */
const char* session_state_name(SessionState state);

}  // namespace link
}  // namespace zk
