#include "lab-instruments/transport/TcpTransport.hpp"
#include "lab-instruments/Errors.hpp"
#include "lab-instruments/Logger.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <fmt/format.h>
#include <memory>
#include <utility>

namespace labinst {
namespace transport {

namespace {

constexpr size_t RECV_CHUNK = 4096;

using Clock = std::chrono::steady_clock;

// Longest wait poll() can express
constexpr std::chrono::milliseconds MAX_WAIT{INT_MAX};

Clock::time_point deadline_after(std::chrono::milliseconds timeout) {
  return Clock::now() +
         std::clamp(timeout, std::chrono::milliseconds(0), MAX_WAIT);
}

// Milliseconds left before `deadline`, rounded up so poll() never spins
int remaining_ms(Clock::time_point deadline) {
  auto left = std::chrono::ceil<std::chrono::milliseconds>(deadline -
                                                           Clock::now());
  if (left.count() <= 0) {
    return 0;
  }
  return static_cast<int>(std::min(left, MAX_WAIT).count());
}

bool set_nonblocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

} // namespace

TcpTransport::TcpTransport(std::string terminator,
                           std::chrono::milliseconds send_timeout)
    : terminator_(std::move(terminator)), send_timeout_(send_timeout) {
  if (terminator_.empty()) {
    throw ArgumentError("Line terminator must not be empty");
  }
}

TcpTransport::~TcpTransport() { close(); }

void TcpTransport::connect(const Address &address,
                           std::chrono::milliseconds timeout) {
  if (is_open()) {
    throw ConnectionError("Already connected to " + peer_);
  }

  peer_ = address.to_string();
  LOG_DEBUG(peer_, "CONNECT", "Connecting (timeout {} ms)", timeout.count());

  auto deadline = deadline_after(timeout);

  struct addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  struct addrinfo *results = nullptr;
  std::string port = std::to_string(address.port);
  int rc = getaddrinfo(address.host.c_str(), port.c_str(), &hints, &results);
  if (rc != 0) {
    throw ConnectionError(fmt::format("Cannot resolve {}: {}", address.host,
                                      gai_strerror(rc)));
  }
  std::unique_ptr<struct addrinfo, decltype(&freeaddrinfo)> guard(
      results, &freeaddrinfo);

  std::string last_error = "no usable address";
  for (struct addrinfo *ai = results; ai != nullptr; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC,
                      ai->ai_protocol);
    if (fd < 0) {
      last_error = strerror(errno);
      continue;
    }

    if (!set_nonblocking(fd)) {
      last_error = strerror(errno);
      ::close(fd);
      continue;
    }

    int r = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
    if (r < 0 && errno != EINPROGRESS) {
      last_error = strerror(errno);
      ::close(fd);
      continue;
    }

    if (r < 0) {
      struct pollfd pfd = {fd, POLLOUT, 0};
      int pr;
      do {
        pr = ::poll(&pfd, 1, remaining_ms(deadline));
      } while (pr < 0 && errno == EINTR);

      if (pr == 0) {
        ::close(fd);
        LOG_WARN(peer_, "CONNECT", "Handshake timed out after {} ms",
                 timeout.count());
        throw ConnectionError(fmt::format(
            "Connection to {} timed out after {} ms", peer_, timeout.count()));
      }
      if (pr < 0) {
        last_error = strerror(errno);
        ::close(fd);
        continue;
      }

      int so_error = 0;
      socklen_t len = sizeof(so_error);
      if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
        so_error = errno;
      }
      if (so_error != 0) {
        last_error = strerror(so_error);
        ::close(fd);
        continue;
      }
    }

    // Commands are short and latency-bound
    int one = 1;
    if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) < 0) {
      LOG_WARN(peer_, "CONNECT", "Couldn't disable Nagle: {}",
               strerror(errno));
    }

    {
      std::lock_guard lock(io_mutex_);
      rx_buffer_.clear();
    }
    fd_.store(fd);
    LOG_INFO(peer_, "CONNECT", "Connected");
    return;
  }

  LOG_ERROR(peer_, "CONNECT", "Connection failed: {}", last_error);
  throw ConnectionError(
      fmt::format("Cannot connect to {}: {}", peer_, last_error));
}

void TcpTransport::send(const std::string &command) {
  std::lock_guard lock(io_mutex_);
  int fd = checked_fd("send");

  LOG_TRACE(peer_, "SEND", "{}", command);
  std::string frame = command + terminator_;
  auto deadline = deadline_after(send_timeout_);

  size_t sent = 0;
  while (sent < frame.size()) {
    ssize_t w =
        ::send(fd, frame.data() + sent, frame.size() - sent, MSG_NOSIGNAL);
    if (w > 0) {
      sent += static_cast<size_t>(w);
      continue;
    }
    if (w < 0 && errno == EINTR) {
      continue;
    }
    if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      int remaining = remaining_ms(deadline);
      if (remaining == 0) {
        throw TransportError(fmt::format("Write to {} timed out", peer_));
      }
      struct pollfd pfd = {fd, POLLOUT, 0};
      if (::poll(&pfd, 1, remaining) < 0 && errno != EINTR) {
        throw TransportError(
            fmt::format("Write to {} failed: {}", peer_, strerror(errno)));
      }
      continue;
    }
    throw TransportError(
        fmt::format("Write to {} failed: {}", peer_, strerror(errno)));
  }
}

std::string TcpTransport::receive(std::chrono::milliseconds timeout) {
  std::lock_guard lock(io_mutex_);
  auto deadline = deadline_after(timeout);

  std::string line;
  char buf[RECV_CHUNK];
  while (true) {
    if (extract_line(line)) {
      LOG_TRACE(peer_, "RECV", "{}", line);
      return line;
    }

    int fd = checked_fd("receive");
    int remaining = remaining_ms(deadline);
    if (remaining == 0) {
      throw TimeoutError(fmt::format("No reply from {} within {} ms", peer_,
                                     timeout.count()));
    }

    struct pollfd pfd = {fd, POLLIN, 0};
    int pr = ::poll(&pfd, 1, remaining);
    if (pr < 0) {
      if (errno == EINTR)
        continue;
      throw TransportError(
          fmt::format("Read from {} failed: {}", peer_, strerror(errno)));
    }
    if (pr == 0) {
      continue;
    }

    ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
    if (n > 0) {
      rx_buffer_.append(buf, static_cast<size_t>(n));
      continue;
    }
    if (n == 0) {
      if (fd_.load() < 0) {
        throw TransportError(
            fmt::format("Connection to {} was closed", peer_));
      }
      throw TransportError(
          fmt::format("Connection to {} closed by peer", peer_));
    }
    if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
      continue;
    }
    throw TransportError(
        fmt::format("Read from {} failed: {}", peer_, strerror(errno)));
  }
}

void TcpTransport::flush_input() {
  std::lock_guard lock(io_mutex_);
  size_t dropped = rx_buffer_.size();
  rx_buffer_.clear();

  int fd = fd_.load();
  if (fd >= 0) {
    char buf[RECV_CHUNK];
    while (true) {
      ssize_t n = ::recv(fd, buf, sizeof(buf), MSG_DONTWAIT);
      if (n <= 0)
        break;
      dropped += static_cast<size_t>(n);
    }
  }

  if (dropped > 0) {
    LOG_DEBUG(peer_, "FLUSH", "Discarded {} stale bytes", dropped);
  }
}

void TcpTransport::close() {
  int fd = fd_.exchange(-1);
  if (fd < 0) {
    return;
  }

  // Wakes a receive() blocked in poll() on another thread
  ::shutdown(fd, SHUT_RDWR);
  {
    std::lock_guard lock(io_mutex_);
    ::close(fd);
    rx_buffer_.clear();
  }
  LOG_INFO(peer_, "CLOSE", "Connection closed");
}

bool TcpTransport::is_open() const { return fd_.load() >= 0; }

int TcpTransport::checked_fd(const char *operation) const {
  int fd = fd_.load();
  if (fd < 0) {
    throw TransportError(fmt::format("Cannot {}: connection to {} is closed",
                                     operation,
                                     peer_.empty() ? "instrument" : peer_));
  }
  return fd;
}

// Replies end in '\n' (or the terminator's last byte); a preceding '\r' is
// dropped so CRLF instruments need no special casing.
bool TcpTransport::extract_line(std::string &line) {
  auto end = rx_buffer_.find(terminator_.back());
  if (end == std::string::npos) {
    return false;
  }
  line = rx_buffer_.substr(0, end);
  rx_buffer_.erase(0, end + 1);
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return true;
}

} // namespace transport
} // namespace labinst
