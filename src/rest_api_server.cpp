#include "chemsaver/rest_api_server.hpp"
#include "chemsaver/optimization_pipeline.hpp"
#include "chemsaver/record_format.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cstring>
#include <errno.h>
#include <netinet/in.h>
#include <sstream>
#include <stdexcept>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace chemsaver {

// -----------------------------------------------------------------------------
// RestAPIServer Implementation
// -----------------------------------------------------------------------------

RestAPIServer::RestAPIServer(ResultHistory& history, SettingsStore* settings,
                             RestAPIConfig config)
    : history_(history)
    , settings_(settings)
    , config_(config)
    , running_(false)
    , should_stop_(false)
    , server_socket_(-1)
{}

RestAPIServer::~RestAPIServer() {
  stop();
}

bool RestAPIServer::start() {
  if (running_.load()) {
    return false; // Already running
  }

  // Create socket
  server_socket_ = socket(AF_INET, SOCK_STREAM, 0);
  if (server_socket_ < 0) {
    return false;
  }

  // Set socket options
  int opt = 1;
  if (setsockopt(server_socket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
    close(server_socket_);
    server_socket_ = -1;
    return false;
  }

  // Accept timeout so the loop can observe should_stop_
  struct timeval timeout;
  timeout.tv_sec = config_.socket_timeout_ms / 1000;
  timeout.tv_usec = (config_.socket_timeout_ms % 1000) * 1000;
  if (setsockopt(server_socket_, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) < 0) {
    close(server_socket_);
    server_socket_ = -1;
    return false;
  }

  // Bind
  struct sockaddr_in address;
  std::memset(&address, 0, sizeof(address));
  address.sin_family = AF_INET;
  address.sin_port = htons(config_.port);

  if (config_.bind_address == "0.0.0.0") {
    address.sin_addr.s_addr = INADDR_ANY;
  } else {
    if (inet_pton(AF_INET, config_.bind_address.c_str(), &address.sin_addr) <= 0) {
      close(server_socket_);
      server_socket_ = -1;
      return false;
    }
  }

  if (bind(server_socket_, (struct sockaddr*)&address, sizeof(address)) < 0) {
    close(server_socket_);
    server_socket_ = -1;
    return false;
  }

  // Listen
  if (listen(server_socket_, config_.listen_backlog) < 0) {
    close(server_socket_);
    server_socket_ = -1;
    return false;
  }

  // Start server thread
  should_stop_.store(false);
  running_.store(true);
  server_thread_ = std::thread(&RestAPIServer::serverLoop, this);

  return true;
}

void RestAPIServer::stop() {
  should_stop_.store(true);

  if (server_thread_.joinable()) {
    server_thread_.join();
  }

  if (server_socket_ >= 0) {
    close(server_socket_);
    server_socket_ = -1;
  }

  running_.store(false);
}

bool RestAPIServer::isRunning() const {
  return running_.load();
}

void RestAPIServer::serverLoop() {
  while (!should_stop_.load()) {
    struct sockaddr_in client_address;
    socklen_t client_len = sizeof(client_address);

    int client_socket = accept(server_socket_, (struct sockaddr*)&client_address, &client_len);

    if (client_socket < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
        // Timeout, continue
        continue;
      }
      // Error or shutdown
      break;
    }

    handleClient(client_socket);
    close(client_socket);
  }

  running_.store(false);
}

void RestAPIServer::handleClient(int client_socket) {
  char buffer[4096];
  ssize_t bytes_read = recv(client_socket, buffer, sizeof(buffer) - 1, 0);

  if (bytes_read <= 0) {
    return;
  }

  buffer[bytes_read] = '\0';
  std::string request(buffer);

  Response res;
  HttpRequest parsed;
  if (!parseRequest(request, parsed)) {
    res.status_code = 400;
    res.status_text = "Bad Request";
    res.body = makeJsonError(400, "Invalid HTTP request");
  } else {
    res = route(parsed.method, parsed.path);
  }

  std::string response = makeHttpResponse(res.status_code, res.status_text, res.body);
  send(client_socket, response.c_str(), response.length(), 0);
}

bool RestAPIServer::parseRequest(const std::string& request, HttpRequest& parsed) {
  std::istringstream iss(request);
  std::string line;

  if (!std::getline(iss, line)) {
    return false;
  }

  // Remove trailing \r if present
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }

  std::istringstream line_stream(line);
  if (!(line_stream >> parsed.method >> parsed.path >> parsed.version)) {
    return false;
  }

  return true;
}

std::vector<std::string> RestAPIServer::splitPath(const std::string& path) {
  std::vector<std::string> parts;
  const std::string clean = path.substr(0, path.find('?'));
  std::string current;
  for (char c : clean) {
    if (c == '/') {
      if (!current.empty()) {
        parts.push_back(current);
        current.clear();
      }
    } else {
      current += c;
    }
  }
  if (!current.empty()) {
    parts.push_back(current);
  }
  return parts;
}

bool RestAPIServer::parseLimit(const std::string& path, size_t default_limit, size_t& limit) {
  limit = default_limit;
  const size_t q = path.find('?');
  if (q == std::string::npos) {
    return true;
  }

  std::istringstream query(path.substr(q + 1));
  std::string pair;
  while (std::getline(query, pair, '&')) {
    if (pair.compare(0, 6, "limit=") != 0) {
      continue;
    }
    const std::string value = pair.substr(6);
    if (value.empty() || value.size() > 9 ||
        value.find_first_not_of("0123456789") != std::string::npos) {
      return false;
    }
    const size_t n = static_cast<size_t>(std::stoul(value));
    if (n == 0) {
      return false;
    }
    limit = std::min(n, default_limit);
  }
  return true;
}

RestAPIServer::Response RestAPIServer::route(const std::string& method, const std::string& path) {
  Response res;

  // Only allow GET requests
  if (method != "GET") {
    res.status_code = 405;
    res.status_text = "Method Not Allowed";
    res.body = makeJsonError(405, "Only GET requests are allowed");
    return res;
  }

  const std::vector<std::string> parts = splitPath(path);

  try {
    if (parts.size() == 1 && parts[0] == "health") {
      res.body = handleHealth();
      return res;
    }
    if (parts.size() == 2 && parts[0] == "api" && parts[1] == "wells") {
      res.body = handleWells();
      return res;
    }
    if (parts.size() == 4 && parts[0] == "api" && parts[1] == "wells") {
      const std::string& well_id = parts[2];
      const std::string& action = parts[3];

      if (action == "latest") return handleLatest(well_id);
      if (action == "settings") return handleSettings(well_id);
      if (action == "history" || action == "audit") {
        size_t limit = 0;
        if (!parseLimit(path, config_.max_history_size, limit)) {
          res.status_code = 400;
          res.status_text = "Bad Request";
          res.body = makeJsonError(400, "limit must be a positive integer");
          return res;
        }
        res.body = action == "history" ? handleHistory(well_id, limit)
                                       : handleAudit(well_id, limit);
        return res;
      }
      if (action == "summary") {
        res.body = handleSummary(well_id);
        return res;
      }
    }

    res.status_code = 404;
    res.status_text = "Not Found";
    res.body = makeJsonError(404, "Endpoint not found");
  } catch (const std::exception& e) {
    res.status_code = 500;
    res.status_text = "Internal Server Error";
    res.body = makeJsonError(500, std::string("Internal error: ") + e.what());
  }
  return res;
}

std::string RestAPIServer::handleHealth() {
  std::ostringstream json;
  json << "{\n";
  json << "  \"status\": \"ok\",\n";
  json << "  \"service\": \"Chemical Saver Dosage Engine\",\n";
  json << "  \"version\": \"1.0.0\"\n";
  json << "}";
  return json.str();
}

std::string RestAPIServer::handleWells() {
  auto wells = history_.getWells();

  std::ostringstream json;
  json << "{\n";
  json << "  \"count\": " << wells.size() << ",\n";
  json << "  \"wells\": [";
  for (size_t i = 0; i < wells.size(); ++i) {
    json << json_string(wells[i]);
    if (i < wells.size() - 1) {
      json << ", ";
    }
  }
  json << "]\n";
  json << "}";
  return json.str();
}

RestAPIServer::Response RestAPIServer::handleLatest(const std::string& well_id) {
  Response res;
  OptimizationResult latest;
  if (!history_.getLatest(well_id, latest)) {
    res.status_code = 404;
    res.status_text = "Not Found";
    res.body = makeJsonError(404, "No result for well " + well_id);
    return res;
  }

  std::ostringstream json;
  json << "{\n";
  json << "  \"well_id\": " << json_string(well_id) << ",\n";
  json << "  \"result\": " << result_to_json(latest, 2) << "\n";
  json << "}";
  res.body = json.str();
  return res;
}

std::string RestAPIServer::handleHistory(const std::string& well_id, size_t limit) {
  auto history = history_.getHistory(well_id, limit);

  std::ostringstream json;
  json << "{\n";
  json << "  \"well_id\": " << json_string(well_id) << ",\n";
  json << "  \"count\": " << history.size() << ",\n";
  json << "  \"results\": [\n";

  for (size_t i = 0; i < history.size(); ++i) {
    json << "    " << result_to_json(history[i], 4);
    if (i < history.size() - 1) {
      json << ",";
    }
    json << "\n";
  }

  json << "  ]\n";
  json << "}";
  return json.str();
}

std::string RestAPIServer::handleSummary(const std::string& well_id) {
  const ResultSummary s = summarize(history_.getHistory(well_id, config_.max_history_size));

  std::ostringstream json;
  json << "{\n";
  json << "  \"well_id\": " << json_string(well_id) << ",\n";
  json << "  \"count\": " << s.count << ",\n";
  json << "  \"cumulative_savings_usd\": " << json_number(s.cumulative_savings_usd, 2) << ",\n";
  json << "  \"net_gap_usd\": " << json_number(s.net_gap_usd, 2) << ",\n";
  json << "  \"status_counts\": {\n";
  json << "    \"OPTIMAL\": " << s.optimal << ",\n";
  json << "    \"OVER_DOSING\": " << s.over_dosing << ",\n";
  json << "    \"UNDER_DOSING\": " << s.under_dosing << ",\n";
  json << "    \"PUMP_OFF\": " << s.pump_off << "\n";
  json << "  },\n";
  json << "  \"latest_status\": \"" << status_flag_to_string(s.latest_status) << "\",\n";
  json << "  \"corrosion_risk\": \"" << corrosion_risk_to_string(s.corrosion_risk) << "\",\n";
  json << "  \"avg_recommended_gpd\": " << json_number(s.avg_recommended_gpd, 3) << ",\n";
  json << "  \"avg_actual_gpd\": " << json_number(s.avg_actual_gpd, 3) << "\n";
  json << "}";
  return json.str();
}

std::string RestAPIServer::handleAudit(const std::string& well_id, size_t limit) {
  auto audit = history_.getAudit(well_id, limit);

  std::ostringstream json;
  json << "{\n";
  json << "  \"well_id\": " << json_string(well_id) << ",\n";
  json << "  \"count\": " << audit.size() << ",\n";
  json << "  \"entries\": [\n";

  for (size_t i = 0; i < audit.size(); ++i) {
    const auto& e = audit[i];
    json << "    {\n";
    json << "      \"timestamp\": " << e.timestamp << ",\n";
    json << "      \"outcome\": \"" << outcome_to_string(e.outcome) << "\",\n";
    json << "      \"status_flag\": \"" << status_flag_to_string(e.tag) << "\",\n";
    json << "      \"flags\": " << e.flags << ",\n";
    json << "      \"reason\": " << json_string(e.reason) << "\n";
    json << "    }";
    if (i < audit.size() - 1) {
      json << ",";
    }
    json << "\n";
  }

  json << "  ]\n";
  json << "}";
  return json.str();
}

RestAPIServer::Response RestAPIServer::handleSettings(const std::string& well_id) {
  Response res;
  ResolvedSettings resolved;
  if (settings_ != nullptr) {
    const StoreStatus st = load_well_settings(*settings_, well_id, resolved);
    if (st != StoreStatus::OK) {
      res.status_code = 503;
      res.status_text = "Service Unavailable";
      res.body = makeJsonError(503, std::string("Settings store: ") + store_status_to_string(st));
      return res;
    }
  } else {
    resolved.used_defaults_only = true;
  }

  std::ostringstream json;
  json << "{\n";
  json << "  \"well_id\": " << json_string(well_id) << ",\n";
  json << "  \"defaults\": " << (resolved.used_defaults_only ? "true" : "false") << ",\n";
  json << "  \"settings\": " << settings_to_json(resolved.settings, 2) << ",\n";
  json << "  \"issues\": [";
  for (size_t i = 0; i < resolved.issues.size(); ++i) {
    json << "{\"field\": " << json_string(resolved.issues[i].field)
         << ", \"message\": " << json_string(resolved.issues[i].message) << "}";
    if (i < resolved.issues.size() - 1) {
      json << ", ";
    }
  }
  json << "]\n";
  json << "}";
  res.body = json.str();
  return res;
}

std::string RestAPIServer::makeHttpResponse(int status_code, const std::string& status_text,
                                            const std::string& body, const std::string& content_type) {
  std::ostringstream response;
  response << "HTTP/1.1 " << status_code << " " << status_text << "\r\n";
  response << "Content-Type: " << content_type << "\r\n";
  response << "Content-Length: " << body.length() << "\r\n";
  response << "Connection: close\r\n";
  response << "\r\n";
  response << body;
  return response.str();
}

std::string RestAPIServer::makeJsonError(int code, const std::string& message) {
  std::ostringstream json;
  json << "{\n";
  json << "  \"error\": {\n";
  json << "    \"code\": " << code << ",\n";
  json << "    \"message\": " << json_string(message) << "\n";
  json << "  }\n";
  json << "}";
  return json.str();
}

} // namespace chemsaver
