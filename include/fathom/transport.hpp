#pragma once

#include <arpa/inet.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <netinet/in.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <sys/socket.h>
#include <sys/un.h>
#include <tuple>
#include <unistd.h>
#include <variant>
#include <vector>

namespace fathom {

/// Default transport URI when --listen / --connect is omitted.
constexpr std::string_view kDefaultURI = "tcp://127.0.0.1:7420";

/// Largest accepted frame (one JSON envelope) in bytes.
constexpr size_t kMaxFrameBytes = 8 * 1024 * 1024;

/// Extract the scheme from a transport URI.
inline std::string scheme(std::string_view uri) {
  auto pos = uri.find("://");
  return pos != std::string_view::npos ? std::string(uri.substr(0, pos))
                                       : std::string(uri);
}

/// Parse --listen, --connect or --port from command-line args.
inline std::string parse_flags(const std::vector<std::string> &args) {
  for (size_t i = 0; i < args.size(); ++i) {
    if ((args[i] == "--listen" || args[i] == "--connect") && i + 1 < args.size())
      return args[i + 1];
    if (args[i] == "--port" && i + 1 < args.size())
      return "tcp://127.0.0.1:" + args[i + 1];
  }
  return std::string(kDefaultURI);
}

/// Parsed transport URI.
struct parsed_uri {
  std::string raw;
  std::string scheme;
  std::string host;
  int port = 0;
  std::string path;
};

struct tcp_listener {
  int fd = -1;
  std::string host;
  int port = 0;
};

struct unix_listener {
  int fd = -1;
  std::string path;
};

struct stdio_listener {
  std::string address = "stdio://";
  bool consumed = false;
};

struct mem_listener {
  std::string address = "mem://";
  int server_fd = -1;
  int client_fd = -1;
  bool server_consumed = false;
  bool client_consumed = false;
};

using listener =
    std::variant<tcp_listener, unix_listener, stdio_listener, mem_listener>;

/// One reliable ordered duplex byte stream.
struct connection {
  int read_fd = -1;
  int write_fd = -1;
  std::string scheme;
  bool owns_read_fd = true;
  bool owns_write_fd = true;
};

inline std::tuple<std::string, int> split_host_port(const std::string &addr,
                                                     int default_port) {
  if (addr.empty())
    return {"0.0.0.0", default_port};

  auto pos = addr.rfind(':');
  if (pos == std::string::npos)
    return {addr, default_port};

  std::string host = addr.substr(0, pos);
  if (host.empty())
    host = "0.0.0.0";
  std::string port_text = addr.substr(pos + 1);
  int port = port_text.empty() ? default_port : std::stoi(port_text);
  return {host, port};
}

inline parsed_uri parse_uri(const std::string &uri) {
  std::string s = scheme(uri);

  if (s == "tcp") {
    if (uri.rfind("tcp://", 0) != 0)
      throw std::invalid_argument("invalid tcp URI: " + uri);
    auto [host, port] = split_host_port(uri.substr(6), 7420);
    if (host == "localhost")
      host = "127.0.0.1";
    return {uri, "tcp", host, port, ""};
  }

  if (s == "unix") {
    if (uri.rfind("unix://", 0) != 0)
      throw std::invalid_argument("invalid unix URI: " + uri);
    auto path = uri.substr(7);
    if (path.empty())
      throw std::invalid_argument("invalid unix URI: " + uri);
    return {uri, "unix", "", 0, path};
  }

  if (s == "stdio")
    return {"stdio://", "stdio", "", 0, ""};

  if (s == "mem") {
    std::string raw = uri.rfind("mem://", 0) == 0 ? uri : "mem://";
    std::string name = raw.size() > 6 ? raw.substr(6) : "";
    return {raw, "mem", "", 0, name};
  }

  throw std::invalid_argument("unsupported transport URI: " + uri);
}

namespace detail {

inline sockaddr_in make_inet_addr(const parsed_uri &parsed) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(parsed.port));
  if (parsed.host == "0.0.0.0") {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else if (::inet_pton(AF_INET, parsed.host.c_str(), &addr.sin_addr) != 1) {
    throw std::invalid_argument("invalid tcp host: " + parsed.host);
  }
  return addr;
}

inline sockaddr_un make_unix_addr(const std::string &path) {
  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", path.c_str());
  return addr;
}

} // namespace detail

inline listener listen(const std::string &uri) {
  auto parsed = parse_uri(uri);

  if (parsed.scheme == "tcp") {
    auto addr = detail::make_inet_addr(parsed);
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0)
      throw std::runtime_error("socket() failed");

    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
      ::close(fd);
      throw std::runtime_error("bind() failed");
    }
    if (::listen(fd, 16) < 0) {
      ::close(fd);
      throw std::runtime_error("listen() failed");
    }
    return tcp_listener{fd, parsed.host, parsed.port};
  }

  if (parsed.scheme == "unix") {
    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0)
      throw std::runtime_error("socket() failed");

    ::unlink(parsed.path.c_str());
    auto addr = detail::make_unix_addr(parsed.path);
    if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
      ::close(fd);
      throw std::runtime_error("bind(unix) failed");
    }
    if (::listen(fd, 16) < 0) {
      ::close(fd);
      throw std::runtime_error("listen(unix) failed");
    }
    return unix_listener{fd, parsed.path};
  }

  if (parsed.scheme == "stdio")
    return stdio_listener{parsed.raw, false};

  if (parsed.scheme == "mem") {
    int fds[2] = {-1, -1};
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0)
      throw std::runtime_error("mem socketpair() failed");
    return mem_listener{parsed.raw, fds[0], fds[1], false, false};
  }

  throw std::invalid_argument("unsupported transport URI: " + uri);
}

/// Accept one connection from a listener.
/// - tcp/unix: OS socket accept
/// - stdio: single connection over stdin/stdout
/// - mem: server side of in-process pair
inline connection accept(listener &lis) {
  if (auto *tcp = std::get_if<tcp_listener>(&lis)) {
    int fd = ::accept(tcp->fd, nullptr, nullptr);
    if (fd < 0) {
      throw std::runtime_error("accept(tcp) failed: " +
                               std::string(std::strerror(errno)));
    }
    return connection{fd, fd, "tcp", true, true};
  }

  if (auto *unix_lis = std::get_if<unix_listener>(&lis)) {
    int fd = ::accept(unix_lis->fd, nullptr, nullptr);
    if (fd < 0) {
      throw std::runtime_error("accept(unix) failed: " +
                               std::string(std::strerror(errno)));
    }
    return connection{fd, fd, "unix", true, true};
  }

  if (auto *stdio = std::get_if<stdio_listener>(&lis)) {
    if (stdio->consumed)
      throw std::runtime_error("stdio:// accepts exactly one connection");
    stdio->consumed = true;
    return connection{STDIN_FILENO, STDOUT_FILENO, "stdio", false, false};
  }

  if (auto *mem = std::get_if<mem_listener>(&lis)) {
    if (mem->server_consumed || mem->server_fd < 0)
      throw std::runtime_error("mem:// server side already consumed");
    mem->server_consumed = true;
    int fd = mem->server_fd;
    mem->server_fd = -1;
    return connection{fd, fd, "mem", true, true};
  }

  throw std::runtime_error("listener variant cannot accept");
}

/// Dial the client side of a mem:// listener.
inline connection mem_dial(listener &lis) {
  auto *mem = std::get_if<mem_listener>(&lis);
  if (mem == nullptr)
    throw std::invalid_argument("mem_dial() requires mem:// listener");
  if (mem->client_consumed || mem->client_fd < 0)
    throw std::runtime_error("mem:// client side already consumed");
  mem->client_consumed = true;
  int fd = mem->client_fd;
  mem->client_fd = -1;
  return connection{fd, fd, "mem", true, true};
}

/// Open an outbound tcp:// or unix:// connection. Throws std::runtime_error
/// when the peer cannot be reached.
inline connection dial(const std::string &uri) {
  auto parsed = parse_uri(uri);

  if (parsed.scheme == "tcp") {
    if (parsed.host == "0.0.0.0")
      parsed.host = "127.0.0.1";
    auto addr = detail::make_inet_addr(parsed);
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0)
      throw std::runtime_error("socket() failed");
    if (::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
      int err = errno;
      ::close(fd);
      throw std::runtime_error("connect(" + uri +
                               ") failed: " + std::strerror(err));
    }
    return connection{fd, fd, "tcp", true, true};
  }

  if (parsed.scheme == "unix") {
    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0)
      throw std::runtime_error("socket() failed");
    auto addr = detail::make_unix_addr(parsed.path);
    if (::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
      int err = errno;
      ::close(fd);
      throw std::runtime_error("connect(" + uri +
                               ") failed: " + std::strerror(err));
    }
    return connection{fd, fd, "unix", true, true};
  }

  throw std::invalid_argument("dial() supports tcp:// and unix:// only: " +
                              uri);
}

inline ssize_t conn_read(const connection &conn, void *buf, size_t n) {
  ssize_t got;
  do {
    got = ::read(conn.read_fd, buf, n);
  } while (got < 0 && errno == EINTR);
  return got;
}

inline ssize_t conn_write(const connection &conn, const void *buf, size_t n) {
  ssize_t sent;
  do {
    sent = ::send(conn.write_fd, buf, n, MSG_NOSIGNAL);
    if (sent < 0 && errno == ENOTSOCK)
      sent = ::write(conn.write_fd, buf, n);
  } while (sent < 0 && errno == EINTR);
  return sent;
}

/// Wake any reader blocked on the connection without releasing the fds.
inline void shutdown_connection(const connection &conn) {
  if (conn.read_fd >= 0)
    ::shutdown(conn.read_fd, SHUT_RDWR);
  if (conn.write_fd >= 0 && conn.write_fd != conn.read_fd)
    ::shutdown(conn.write_fd, SHUT_RDWR);
}

inline void close_connection(connection &conn) {
  if (conn.owns_read_fd && conn.read_fd >= 0) {
    ::close(conn.read_fd);
  }
  if (conn.owns_write_fd && conn.write_fd >= 0 &&
      conn.write_fd != conn.read_fd) {
    ::close(conn.write_fd);
  }
  conn.read_fd = -1;
  conn.write_fd = -1;
}

inline void close_listener(listener &lis) {
  if (auto *tcp = std::get_if<tcp_listener>(&lis)) {
    if (tcp->fd >= 0) {
      ::close(tcp->fd);
      tcp->fd = -1;
    }
    return;
  }
  if (auto *unix_lis = std::get_if<unix_listener>(&lis)) {
    if (unix_lis->fd >= 0) {
      ::close(unix_lis->fd);
      unix_lis->fd = -1;
    }
    if (!unix_lis->path.empty())
      ::unlink(unix_lis->path.c_str());
    return;
  }
  if (auto *mem = std::get_if<mem_listener>(&lis)) {
    if (mem->server_fd >= 0) {
      ::close(mem->server_fd);
      mem->server_fd = -1;
    }
    if (mem->client_fd >= 0) {
      ::close(mem->client_fd);
      mem->client_fd = -1;
    }
  }
}

/// Write one newline-terminated frame. Returns false when the peer is gone.
inline bool write_frame(const connection &conn, const std::string &text) {
  std::string frame;
  frame.reserve(text.size() + 1);
  frame.append(text);
  frame.push_back('\n');

  size_t sent = 0;
  while (sent < frame.size()) {
    ssize_t n = conn_write(conn, frame.data() + sent, frame.size() - sent);
    if (n <= 0)
      return false;
    sent += static_cast<size_t>(n);
  }
  return true;
}

/// Splits the inbound byte stream into newline-terminated frames.
class frame_reader {
public:
  explicit frame_reader(size_t max_frame = kMaxFrameBytes)
      : max_frame_(max_frame) {}

  /// Blocks until a full frame is available. Returns false on EOF or read
  /// failure; throws std::runtime_error when a frame exceeds the limit.
  bool read(const connection &conn, std::string &out) {
    for (;;) {
      auto nl = buffer_.find('\n', scanned_);
      if (nl != std::string::npos) {
        out.assign(buffer_, 0, nl);
        buffer_.erase(0, nl + 1);
        scanned_ = 0;
        if (!out.empty() && out.back() == '\r')
          out.pop_back();
        return true;
      }
      scanned_ = buffer_.size();
      if (buffer_.size() > max_frame_)
        throw std::runtime_error("frame exceeds " + std::to_string(max_frame_) +
                                 " bytes");

      char chunk[4096];
      ssize_t n = conn_read(conn, chunk, sizeof(chunk));
      if (n <= 0)
        return false;
      buffer_.append(chunk, static_cast<size_t>(n));
    }
  }

private:
  size_t max_frame_;
  std::string buffer_;
  size_t scanned_ = 0;
};

} // namespace fathom
