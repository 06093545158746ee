// Example HTTP client for the Chemical Saver REST API
// Queries every read-only endpoint for one well and prints the status line
// followed by the JSON body

#include <arpa/inet.h>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <netinet/in.h>
#include <sstream>
#include <string>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

struct HttpReply final {
  bool ok = false;
  std::string status_line;
  std::string body;
};

// Closes the socket on every return path
class SocketHandle final {
public:
  explicit SocketHandle(int fd) : fd_(fd) {}
  ~SocketHandle() {
    if (fd_ >= 0) close(fd_);
  }
  SocketHandle(const SocketHandle&) = delete;
  SocketHandle& operator=(const SocketHandle&) = delete;

  int get() const { return fd_; }

private:
  int fd_;
};

static HttpReply httpGet(const std::string& host, int port, const std::string& path) {
  HttpReply reply;

  SocketHandle sock(socket(AF_INET, SOCK_STREAM, 0));
  if (sock.get() < 0) {
    reply.status_line = "socket() failed";
    return reply;
  }

  struct timeval tv;
  tv.tv_sec = 5;
  tv.tv_usec = 0;
  setsockopt(sock.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

  struct sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(port));
  if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
    reply.status_line = "invalid address " + host;
    return reply;
  }

  if (connect(sock.get(), reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    reply.status_line = "connection refused by " + host + ":" + std::to_string(port);
    return reply;
  }

  std::ostringstream request;
  request << "GET " << path << " HTTP/1.1\r\n"
          << "Host: " << host << "\r\n"
          << "Accept: application/json\r\n"
          << "Connection: close\r\n\r\n";
  const std::string wire = request.str();

  size_t sent = 0;
  while (sent < wire.size()) {
    ssize_t n = send(sock.get(), wire.data() + sent, wire.size() - sent, 0);
    if (n <= 0) {
      reply.status_line = "send failed";
      return reply;
    }
    sent += static_cast<size_t>(n);
  }

  std::string raw;
  char chunk[4096];
  ssize_t n;
  while ((n = recv(sock.get(), chunk, sizeof(chunk), 0)) > 0) {
    raw.append(chunk, static_cast<size_t>(n));
  }

  const size_t eol = raw.find("\r\n");
  const size_t header_end = raw.find("\r\n\r\n");
  if (eol == std::string::npos || header_end == std::string::npos) {
    reply.status_line = "malformed response";
    reply.body = raw;
    return reply;
  }

  reply.ok = true;
  reply.status_line = raw.substr(0, eol);
  reply.body = raw.substr(header_end + 4);
  return reply;
}

static void show(const std::string& host, int port, const std::string& path,
                 size_t max_chars = 0) {
  std::cout << "=== GET " << path << " ===\n";
  HttpReply r = httpGet(host, port, path);
  if (!r.ok) {
    std::cout << "ERROR: " << r.status_line << "\n\n";
    return;
  }
  std::cout << r.status_line << "\n";
  if (max_chars > 0 && r.body.size() > max_chars) {
    std::cout << r.body.substr(0, max_chars) << "\n... (truncated)\n\n";
  } else {
    std::cout << r.body << "\n\n";
  }
}

int main(int argc, char* argv[]) {
  std::string host = "127.0.0.1";
  int port = 8080;
  std::string well = "well-001";

  // Allow override from command line: [host] [port] [well_id]
  if (argc > 1) host = argv[1];
  if (argc > 2) port = std::stoi(argv[2]);
  if (argc > 3) well = argv[3];

  std::cout << "Chemical Saver REST API Client Example\n";
  std::cout << "======================================\n";
  std::cout << "Connecting to " << host << ":" << port << "\n\n";

  show(host, port, "/health");
  show(host, port, "/api/wells");

  const std::string base = "/api/wells/" + well;
  show(host, port, base + "/latest");
  show(host, port, base + "/summary");
  show(host, port, base + "/settings");
  show(host, port, base + "/audit?limit=5");
  show(host, port, base + "/history?limit=5", 500);

  std::cout << "Client test complete!\n";
  return 0;
}
