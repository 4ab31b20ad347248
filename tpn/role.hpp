#ifndef TPN_ROLE_HPP
#define TPN_ROLE_HPP

#include <cstddef>

#include "tpn/connection.hpp"
#include "tpn/errors.hpp"
#include "tpn/types.hpp"

namespace tpn {

// Role for one side of the transport under a policy.
// For a fixed policy, Initiator and Acceptor always get complementary roles.
Role AssignRole(Side side, FirstMoverPolicy policy);

// Options for Negotiate (taken from SessionConfig)
struct NegotiationOptions {
  size_t frame_size = kDefaultFrameSize;
  FirstMoverPolicy first_mover = FirstMoverPolicy::Initiator;
  bool exchange_hello = false;
};

// Decide this peer's role on a freshly established connection.
//
// Without a hello nothing touches the wire: the role follows from the
// transport-level initiator/acceptor distinction. With a hello both sides
// write their frame size and policy, then read and check the peer's.
//
// Errors: ConnectionSetupFailed, FrameSizeMismatch.
Result<Role> Negotiate(Connection& conn, Side side,
                       const NegotiationOptions& options);

}  // namespace tpn

#endif  // TPN_ROLE_HPP
