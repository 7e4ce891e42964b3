#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <string>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>
#include "common/errors.hpp"
#include "transport/tcp_socket.hpp"

namespace mblink {

namespace {

std::string Describe(TcpEndpoint const &endpoint) {
  return endpoint.host + ":" + std::to_string(endpoint.port);
}

// Send small frames immediately
bool SetNoDelay(int fd) {
  int opt = 1;
  return ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)) == 0;
}

enum class ConnectResult { kConnected, kFailed, kTimedOut };

// Non-blocking connect bounded by @p timeout; the socket is left in blocking mode
ConnectResult ConnectWithin(int fd, struct addrinfo const *ai, std::chrono::milliseconds timeout) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != 0) {
    return ConnectResult::kFailed;
  }
  if (::connect(fd, ai->ai_addr, ai->ai_addrlen) != 0) {
    if (errno != EINPROGRESS) {
      return ConnectResult::kFailed;
    }
    struct pollfd pfd {};
    pfd.fd = fd;
    pfd.events = POLLOUT;
    int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready == 0) {
      return ConnectResult::kTimedOut;
    }
    if (ready < 0) {
      return ConnectResult::kFailed;
    }
    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0) {
      return ConnectResult::kFailed;
    }
    if (so_error != 0) {
      errno = so_error;
      return ConnectResult::kFailed;
    }
  }
  return ::fcntl(fd, F_SETFL, flags) == 0 ? ConnectResult::kConnected : ConnectResult::kFailed;
}

}  // namespace

void TcpSocket::Open() {
  if (fd_ >= 0) {
    return;
  }
  if (!endpoint_.has_value()) {
    throw ConnectionError("accepted connection is closed and cannot be reopened");
  }

  struct addrinfo hints {};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  struct addrinfo *results = nullptr;
  std::string service = std::to_string(endpoint_->port);
  int rc = ::getaddrinfo(endpoint_->host.c_str(), service.c_str(), &hints, &results);
  if (rc != 0) {
    throw ConnectionError("cannot resolve " + Describe(*endpoint_) + ": " + ::gai_strerror(rc));
  }

  std::string last_error = "no addresses";
  bool timed_out = false;
  for (struct addrinfo *ai = results; ai != nullptr; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      last_error = std::strerror(errno);
      continue;
    }
    ConnectResult result = ConnectWithin(fd, ai, connect_timeout_);
    if (result == ConnectResult::kConnected && SetNoDelay(fd)) {
      fd_ = fd;
      break;
    }
    timed_out = result == ConnectResult::kTimedOut;
    last_error = timed_out ? "connect timed out" : std::strerror(errno);
    ::close(fd);
  }
  ::freeaddrinfo(results);

  if (fd_ < 0) {
    std::string message = "cannot connect to " + Describe(*endpoint_) + ": " + last_error;
    if (timed_out) {
      throw TimeoutError(message);
    }
    throw ConnectionError(message);
  }
}

void TcpSocket::Close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

int TcpSocket::Read(std::span<uint8_t> buffer) {
  if (fd_ < 0) {
    return -1;
  }
  ssize_t n = ::recv(fd_, buffer.data(), buffer.size(), MSG_DONTWAIT);
  if (n < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
      return 0;
    }
    Close();
    return -1;
  }
  if (n == 0) {
    Close();  // EOF / peer disconnected
    return -1;
  }
  return static_cast<int>(n);
}

bool TcpSocket::HasData() const {
  if (fd_ < 0) {
    return false;
  }
  struct pollfd pfd {};
  pfd.fd = fd_;
  pfd.events = POLLIN;
  return ::poll(&pfd, 1, 0) > 0;
}

size_t TcpSocket::AvailableBytes() const {
  if (fd_ < 0) {
    return 0;
  }
  int n = 0;
  if (::ioctl(fd_, FIONREAD, &n) == 0 && n > 0) {
    return static_cast<size_t>(n);
  }
  return 0;
}

int TcpSocket::Write(std::span<uint8_t const> data) {
  if (fd_ < 0) {
    return -1;
  }
  ssize_t n = ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL | MSG_DONTWAIT);
  if (n < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
      return 0;
    }
    return -1;
  }
  return static_cast<int>(n);
}

bool TcpSocket::WaitWritable(std::chrono::milliseconds wait) {
  if (fd_ < 0) {
    return true;
  }
  struct pollfd pfd {};
  pfd.fd = fd_;
  pfd.events = POLLOUT;
  return ::poll(&pfd, 1, static_cast<int>(wait.count())) != 0;
}

void TcpListener::Listen(int backlog) {
  if (fd_ >= 0) {
    return;
  }
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    throw ConnectionError(std::string("cannot create socket: ") + std::strerror(errno));
  }

  int opt = 1;
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) != 0) {
    std::string message = std::string("cannot set SO_REUSEADDR: ") + std::strerror(errno);
    ::close(fd);
    throw ConnectionError(message);
  }

  struct sockaddr_in addr {};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port_);
  if (bind_address_.empty() || bind_address_ == "0.0.0.0") {
    addr.sin_addr.s_addr = INADDR_ANY;
  } else if (::inet_pton(AF_INET, bind_address_.c_str(), &addr.sin_addr) <= 0) {
    ::close(fd);
    throw ConnectionError("invalid bind address " + bind_address_);
  }

  if (::bind(fd, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) != 0 || ::listen(fd, backlog) != 0) {
    std::string message = "cannot listen on " + bind_address_ + ":" + std::to_string(port_) + ": " +
                          std::strerror(errno);
    ::close(fd);
    throw ConnectionError(message);
  }
  fd_ = fd;
}

void TcpListener::Close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

int TcpListener::Accept(std::chrono::milliseconds wait) {
  if (fd_ < 0) {
    return -1;
  }
  struct pollfd pfd {};
  pfd.fd = fd_;
  pfd.events = POLLIN;
  if (::poll(&pfd, 1, static_cast<int>(wait.count())) <= 0) {
    return -1;
  }
  int client = ::accept(fd_, nullptr, nullptr);
  if (client >= 0 && !SetNoDelay(client)) {
    ::close(client);
    return -1;
  }
  return client;
}

uint16_t TcpListener::GetPort() const {
  if (fd_ < 0) {
    return port_;
  }
  struct sockaddr_in addr {};
  socklen_t len = sizeof(addr);
  if (::getsockname(fd_, reinterpret_cast<struct sockaddr *>(&addr), &len) != 0) {
    return port_;
  }
  return ntohs(addr.sin_port);
}

}  // namespace mblink
