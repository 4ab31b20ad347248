#include "tpn/role.hpp"

#include "tpn/frame.hpp"
#include "tpn/log.hpp"

namespace tpn {

Role AssignRole(Side side, FirstMoverPolicy policy) {
  bool initiator_first = policy == FirstMoverPolicy::Initiator;
  bool is_initiator = side == Side::Initiator;
  return is_initiator == initiator_first ? Role::FirstMover
                                         : Role::SecondMover;
}

Result<Role> Negotiate(Connection& conn, Side side,
                       const NegotiationOptions& options) {
  Role role = AssignRole(side, options.first_mover);

  if (conn.IsClosed()) {
    TPN_LOG_WARN << "negotiation: connection closed before setup";
    return {role, Error::ConnectionSetupFailed};
  }

  if (!options.exchange_hello) {
    return {role, Error::OK};
  }

  Hello local;
  local.policy = options.first_mover;
  local.frame_size = static_cast<uint32_t>(options.frame_size);

  uint8_t buf[kHelloSize];
  local.Encode(buf);
  if (WriteFull(conn, buf, sizeof(buf)) != Error::OK) {
    TPN_LOG_WARN << "negotiation: failed to send hello";
    return {role, Error::ConnectionSetupFailed};
  }

  auto read = ReadFull(conn, kHelloSize);
  if (!read.ok()) {
    TPN_LOG_WARN << "negotiation: failed to read peer hello ("
                 << ErrorString(read.error) << ")";
    return {role, Error::ConnectionSetupFailed};
  }

  auto remote = Hello::Decode(read.value.data());
  if (!remote.ok()) {
    TPN_LOG_WARN << "negotiation: malformed peer hello";
    return {role, remote.error};
  }

  if (remote.value.policy != options.first_mover) {
    TPN_LOG_WARN << "negotiation: peer uses a different first-mover policy";
    return {role, Error::ConnectionSetupFailed};
  }

  if (remote.value.frame_size != local.frame_size) {
    TPN_LOG_WARN << "negotiation: frame size " << local.frame_size
                 << " does not match peer's " << remote.value.frame_size;
    return {role, Error::FrameSizeMismatch};
  }

  return {role, Error::OK};
}

}  // namespace tpn
