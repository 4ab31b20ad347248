#include "tpn/tcp_connection.hpp"

#include <sys/socket.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>

#include <boost/asio/buffer.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/address.hpp>

#include "tpn/log.hpp"

namespace tpn {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

std::string EndpointString(const tcp::endpoint& endpoint) {
  return FormatTicket(endpoint.address().to_string(), endpoint.port());
}

bool IsWildcard(const std::string& address) {
  return address.empty() || address == "0.0.0.0" || address == "::";
}

}  // namespace

std::string FormatTicket(const std::string& host, uint16_t port) {
  if (host.find(':') != std::string::npos) {
    return "[" + host + "]:" + std::to_string(port);
  }
  return host + ":" + std::to_string(port);
}

Result<TicketAddress> ParseTicket(const std::string& ticket) {
  TicketAddress addr;

  size_t colon = ticket.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == ticket.size()) {
    return {addr, Error::InvalidConfig};
  }

  std::string host = ticket.substr(0, colon);
  std::string port_text = ticket.substr(colon + 1);

  if (host.front() == '[') {
    if (host.size() < 3 || host.back() != ']') {
      return {addr, Error::InvalidConfig};
    }
    host = host.substr(1, host.size() - 2);
  } else if (host.find(':') != std::string::npos) {
    // IPv6 literals must be bracketed
    return {addr, Error::InvalidConfig};
  }

  bool digits = std::all_of(port_text.begin(), port_text.end(), [](char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
  });
  if (!digits || port_text.size() > 5) {
    return {addr, Error::InvalidConfig};
  }

  unsigned long port = std::stoul(port_text);
  if (port == 0 || port > 65535) {
    return {addr, Error::InvalidConfig};
  }

  addr.host = host;
  addr.port = static_cast<uint16_t>(port);
  return {addr, Error::OK};
}

TcpConnection::TcpConnection(std::unique_ptr<asio::io_context> io,
                             tcp::socket socket)
    : io_(std::move(io)),
      socket_(std::move(socket)),
      native_fd_(socket_.native_handle()) {
  boost::system::error_code ec;
  socket_.set_option(tcp::no_delay(true), ec);
  if (ec) {
    TPN_LOG_DEBUG << "tcp: could not disable Nagle: " << ec.message();
  }

  auto remote = socket_.remote_endpoint(ec);
  if (!ec) {
    remote_ = EndpointString(remote);
  }
}

TcpConnection::~TcpConnection() {
  Close();
  boost::system::error_code ec;
  socket_.close(ec);
}

Result<size_t> TcpConnection::Write(const uint8_t* data, size_t len) {
  if (closed_.load()) {
    return {0, Error::ConnectionClosed};
  }

  boost::system::error_code ec;
  size_t n = socket_.write_some(asio::buffer(data, len), ec);
  if (ec) {
    if (closed_.load()) {
      return {0, Error::ConnectionClosed};
    }
    TPN_LOG_DEBUG << "tcp: write to " << remote_ << " failed: " << ec.message();
    return {0, Error::WriteError};
  }
  return {n, Error::OK};
}

Result<size_t> TcpConnection::Read(uint8_t* buf, size_t max_len) {
  if (closed_.load()) {
    return {0, Error::ConnectionClosed};
  }

  boost::system::error_code ec;
  size_t n = socket_.read_some(asio::buffer(buf, max_len), ec);
  if (ec == asio::error::eof) {
    return {0, Error::EOF_};
  }
  if (ec) {
    if (closed_.load()) {
      return {0, Error::ConnectionClosed};
    }
    TPN_LOG_DEBUG << "tcp: read from " << remote_ << " failed: "
                  << ec.message();
    return {0, Error::ReadError};
  }
  return {n, Error::OK};
}

Error TcpConnection::Close() {
  if (closed_.exchange(true)) {
    return Error::OK;  // Already closed
  }

  // Read and Write may be blocked on socket_ in other threads, so shut the
  // descriptor down directly instead of going through the socket object
  if (::shutdown(native_fd_, SHUT_RDWR) != 0 && errno != ENOTCONN) {
    TPN_LOG_DEBUG << "tcp: shutdown of " << remote_ << ": "
                  << std::strerror(errno);
  }
  return Error::OK;
}

Result<std::unique_ptr<Connection>> Dial(const std::string& host,
                                         uint16_t port) {
  auto io = std::make_unique<asio::io_context>();
  boost::system::error_code ec;

  tcp::resolver resolver(*io);
  auto endpoints = resolver.resolve(host, std::to_string(port), ec);
  if (ec) {
    TPN_LOG_WARN << "tcp: cannot resolve " << host << ": " << ec.message();
    return {nullptr, Error::ConnectionSetupFailed};
  }

  tcp::socket socket(*io);
  asio::connect(socket, endpoints, ec);
  if (ec) {
    TPN_LOG_WARN << "tcp: cannot connect to " << FormatTicket(host, port)
                 << ": " << ec.message();
    return {nullptr, Error::ConnectionSetupFailed};
  }

  auto conn = std::make_unique<TcpConnection>(std::move(io), std::move(socket));
  TPN_LOG_INFO << "tcp: connected to " << conn->RemoteAddress();
  return {std::move(conn), Error::OK};
}

Result<std::unique_ptr<Connection>> DialTicket(const std::string& ticket) {
  auto addr = ParseTicket(ticket);
  if (!addr.ok()) {
    TPN_LOG_WARN << "tcp: malformed ticket '" << ticket << "'";
    return {nullptr, Error::ConnectionSetupFailed};
  }
  return Dial(addr.value.host, addr.value.port);
}

TcpListener::TcpListener() : acceptor_(io_) {}

TcpListener::~TcpListener() { Close(); }

Result<std::unique_ptr<TcpListener>> TcpListener::Listen(
    const std::string& address, uint16_t port) {
  std::unique_ptr<TcpListener> listener(new TcpListener());
  boost::system::error_code ec;

  auto ip = asio::ip::make_address(IsWildcard(address) ? "0.0.0.0" : address,
                                   ec);
  if (ec) {
    TPN_LOG_WARN << "tcp: bad listen address '" << address << "'";
    return {nullptr, Error::InvalidConfig};
  }

  tcp::endpoint endpoint(ip, port);
  auto& acceptor = listener->acceptor_;

  acceptor.open(endpoint.protocol(), ec);
  if (!ec) {
    acceptor.set_option(tcp::acceptor::reuse_address(true), ec);
  }
  if (!ec) {
    acceptor.bind(endpoint, ec);
  }
  if (!ec) {
    acceptor.listen(asio::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    TPN_LOG_WARN << "tcp: cannot listen on " << EndpointString(endpoint)
                 << ": " << ec.message();
    return {nullptr, Error::ConnectionSetupFailed};
  }

  auto local = acceptor.local_endpoint(ec);
  if (ec) {
    return {nullptr, Error::ConnectionSetupFailed};
  }

  listener->address_ = ip.to_string();
  listener->port_ = local.port();
  TPN_LOG_INFO << "tcp: listening on " << EndpointString(local);
  return {std::move(listener), Error::OK};
}

Result<std::unique_ptr<Connection>> TcpListener::Accept() {
  auto io = std::make_unique<asio::io_context>();
  boost::system::error_code ec;

  tcp::socket socket(*io);
  acceptor_.accept(socket, ec);
  if (ec) {
    TPN_LOG_WARN << "tcp: accept failed: " << ec.message();
    return {nullptr, Error::ConnectionSetupFailed};
  }

  auto conn = std::make_unique<TcpConnection>(std::move(io), std::move(socket));
  TPN_LOG_INFO << "tcp: accepted " << conn->RemoteAddress();
  return {std::move(conn), Error::OK};
}

std::string TcpListener::Ticket(const std::string& advertise_host) const {
  std::string host = advertise_host;
  if (host.empty()) {
    host = IsWildcard(address_) ? "127.0.0.1" : address_;
  }
  return FormatTicket(host, port_);
}

Error TcpListener::Close() {
  if (!acceptor_.is_open()) {
    return Error::OK;
  }
  boost::system::error_code ec;
  acceptor_.close(ec);
  return ec ? Error::TransportError : Error::OK;
}

}  // namespace tpn
