#pragma once

// Read-only HTTP/JSON REST API over the dosing result stream
//
// SAFETY PRINCIPLES:
// - Strictly read-only (GET endpoints only); no setpoint is ever written here
// - Thread-safe: all data comes from the mutex-protected ResultHistory
// - Runs in dedicated thread, non-blocking to the dosing triggers
// - Lightweight POSIX sockets implementation
//
// Endpoints:
//   GET /health
//   GET /api/wells
//   GET /api/wells/<id>/latest
//   GET /api/wells/<id>/history
//   GET /api/wells/<id>/summary
//   GET /api/wells/<id>/audit
//   GET /api/wells/<id>/settings

#include "chemsaver/result_history.hpp"
#include "chemsaver/well_store.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

namespace chemsaver {

// Configuration for REST API server
struct RestAPIConfig {
  std::string bind_address = "0.0.0.0";
  uint16_t port = 8080;
  size_t max_history_size = 100;  // default and cap for /history and /audit ?limit=
  int listen_backlog = 10;
  int socket_timeout_ms = 5000;
};

// REST API Server
// Runs in dedicated thread, provides read-only observability
class RestAPIServer {
public:
  // `settings` may be null; /settings then answers with defaults.
  RestAPIServer(ResultHistory& history, SettingsStore* settings,
                RestAPIConfig config = RestAPIConfig{});
  ~RestAPIServer();

  // Start server thread
  bool start();

  // Stop server thread
  void stop();

  // Check if server is running
  bool isRunning() const;

  // Route a request path to a JSON body. Exposed for tests; the socket loop
  // uses the same function.
  struct Response {
    int status_code = 200;
    std::string status_text = "OK";
    std::string body;
  };
  Response route(const std::string& method, const std::string& path);

private:
  ResultHistory& history_;
  SettingsStore* settings_;
  RestAPIConfig config_;
  std::atomic<bool> running_;
  std::atomic<bool> should_stop_;
  std::thread server_thread_;
  int server_socket_;

  // Server thread entry point
  void serverLoop();

  // Handle single client connection
  void handleClient(int client_socket);

  // HTTP request parsing
  struct HttpRequest {
    std::string method;
    std::string path;
    std::string version;
  };

  bool parseRequest(const std::string& request, HttpRequest& parsed);

  // Endpoint handlers
  std::string handleHealth();
  std::string handleWells();
  Response handleLatest(const std::string& well_id);
  std::string handleHistory(const std::string& well_id, size_t limit);
  std::string handleSummary(const std::string& well_id);
  std::string handleAudit(const std::string& well_id, size_t limit);
  Response handleSettings(const std::string& well_id);

  // Response generation
  std::string makeHttpResponse(int status_code, const std::string& status_text,
                               const std::string& body, const std::string& content_type = "application/json");
  static std::string makeJsonError(int code, const std::string& message);

  // "/api/wells/abc/latest" -> {"api", "wells", "abc", "latest"}
  static std::vector<std::string> splitPath(const std::string& path);
  // false when ?limit= is present but not a positive integer
  static bool parseLimit(const std::string& path, size_t default_limit, size_t& limit);
};

} // namespace chemsaver
