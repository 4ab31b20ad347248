#ifndef TPN_TCP_CONNECTION_HPP
#define TPN_TCP_CONNECTION_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "tpn/connection.hpp"
#include "tpn/errors.hpp"

namespace tpn {

// Host and port parsed from a ticket
struct TicketAddress {
  std::string host;
  uint16_t port = 0;
};

// "host:port", with IPv6 hosts bracketed ("[::1]:7000")
std::string FormatTicket(const std::string& host, uint16_t port);

// Inverse of FormatTicket. Returns InvalidConfig on malformed input.
Result<TicketAddress> ParseTicket(const std::string& ticket);

// Connection over a blocking TCP socket.
// Owns the io_context its socket was opened on. Read and Write each use
// socket_ from a single thread; Close touches only the descriptor.
class TcpConnection : public Connection {
 public:
  TcpConnection(std::unique_ptr<boost::asio::io_context> io,
                boost::asio::ip::tcp::socket socket);
  ~TcpConnection() override;

  Result<size_t> Write(const uint8_t* data, size_t len) override;
  Result<size_t> Read(uint8_t* buf, size_t max_len) override;

  // Shuts the socket down, which wakes a Read or Write blocked in
  // another thread. The descriptor itself is released on destruction.
  Error Close() override;

  bool IsClosed() const override { return closed_.load(); }

  // "address:port" of the peer, empty if unknown
  std::string RemoteAddress() const { return remote_; }

 private:
  std::unique_ptr<boost::asio::io_context> io_;
  boost::asio::ip::tcp::socket socket_;
  boost::asio::ip::tcp::socket::native_handle_type native_fd_;
  std::string remote_;
  std::atomic<bool> closed_{false};
};

// Dial a peer. Returns ConnectionSetupFailed if it cannot be reached.
Result<std::unique_ptr<Connection>> Dial(const std::string& host,
                                         uint16_t port);

// Dial the peer named by a ticket
Result<std::unique_ptr<Connection>> DialTicket(const std::string& ticket);

// Listening endpoint for the accepting peer
class TcpListener {
 public:
  ~TcpListener();

  // Bind and listen. Port 0 picks an ephemeral port (see Port()).
  static Result<std::unique_ptr<TcpListener>> Listen(
      const std::string& address, uint16_t port);

  // Block until a peer connects
  Result<std::unique_ptr<Connection>> Accept();

  uint16_t Port() const { return port_; }

  // Ticket a peer can dial; advertise_host replaces a wildcard bind address
  std::string Ticket(const std::string& advertise_host = "") const;

  Error Close();

 private:
  TcpListener();

  boost::asio::io_context io_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::string address_;
  uint16_t port_ = 0;
};

}  // namespace tpn

#endif  // TPN_TCP_CONNECTION_HPP
