#ifndef TPN_TPN_HPP
#define TPN_TPN_HPP

// Main include header for the tpn library

#include "tpn/connection.hpp"
#include "tpn/errors.hpp"
#include "tpn/frame.hpp"
#include "tpn/log.hpp"
#include "tpn/role.hpp"
#include "tpn/session.hpp"
#include "tpn/tcp_connection.hpp"
#include "tpn/turn.hpp"
#include "tpn/types.hpp"

#endif // TPN_TPN_HPP
