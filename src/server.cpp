#include "server.h"

#include <cstring>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <runbox/utils.h>
#include "http_utils.h"

std::string kListenHost = "0.0.0.0";
int kPort = 8194;
std::string kApiKey = "runbox";
size_t kHttpThreads = 16;

namespace {

constexpr char kSandboxPrefix[] = "/v1/sandbox";
constexpr size_t kPreviewLength = 1000;
constexpr size_t kPreloadPreviewLength = 100;

bool StartsWith(const std::string& str, const char* prefix) {
  return str.compare(0, strlen(prefix), prefix) == 0;
}

// throws nlohmann::json::exception or std::invalid_argument
ExecutionRequest ParseRunRequest(const std::string& body, std::string& language) {
  using nlohmann::json;
  json data = json::parse(body);
  if (!data.is_object()) throw std::invalid_argument("body must be a JSON object");
  if (!data.contains("language")) throw std::invalid_argument("missing field language");
  if (!data.contains("code")) throw std::invalid_argument("missing field code");
  language = data["language"].get<std::string>();
  ExecutionRequest req(GetLanguage(language), data["code"].get<std::string>());
  if (auto it = data.find("preload"); it != data.end() && !it->is_null()) {
    req.preload = it->get<std::string>();
  }
  if (auto it = data.find("enable_network"); it != data.end() && !it->is_null()) {
    req.enable_network = it->get<bool>();
  }
  return req;
}

} // namespace

SandboxServer::SandboxServer(Engine& engine, const std::string& api_key, size_t spare_threads) :
    engine_(engine), api_key_(api_key) {
  // Handlers block until their execution ends, and httplib queues
  // connections beyond the pool without bound. Every admissible request
  // gets its own thread so that rejections never wait in that queue.
  size_t threads = engine_.Admission().MaxRequests() + spare_threads;
  spdlog::info("HTTP thread pool: {} threads", threads);
  svr_.new_task_queue = [threads]() { return new httplib::ThreadPool(threads); };
  svr_.set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
    return Authenticate_(req, res);
  });
  svr_.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.set_content(nlohmann::json("ok").dump(), "application/json");
  });
  svr_.Post("/v1/sandbox/run", [this](const httplib::Request& req, httplib::Response& res) {
    HandleRun_(req, res);
  });
  svr_.set_logger([](const httplib::Request& req, const httplib::Response& res) {
    spdlog::debug("{} {} from {} -> {} headers: {}", req.method, req.path, req.remote_addr,
                  res.status, http_utils::FormatHeaders(req.headers));
  });
}

httplib::Server::HandlerResponse SandboxServer::Authenticate_(
    const httplib::Request& req, httplib::Response& res) {
  if (!StartsWith(req.path, kSandboxPrefix)) return httplib::Server::HandlerResponse::Unhandled;
  if (req.has_header("X-Api-Key") && req.get_header_value("X-Api-Key") == api_key_) {
    return httplib::Server::HandlerResponse::Unhandled;
  }
  spdlog::info("Unauthorized {} {} from {}", req.method, req.path, req.remote_addr);
  http_utils::Reply(res, ApiCode::UNAUTHORIZED);
  return httplib::Server::HandlerResponse::Handled;
}

void SandboxServer::HandleRun_(const httplib::Request& http_req, httplib::Response& res) {
  std::string language;
  ExecutionRequest req;
  try {
    req = ParseRunRequest(http_req.body, language);
  } catch (const nlohmann::json::exception& e) {
    spdlog::info("Invalid run request: {}", e.what());
    http_utils::Reply(res, ApiCode::INVALID_REQUEST, std::string("invalid request: ") + e.what(), nullptr);
    return;
  } catch (const std::invalid_argument& e) {
    spdlog::info("Invalid run request: {}", e.what());
    http_utils::Reply(res, ApiCode::INVALID_REQUEST, std::string("invalid request: ") + e.what(), nullptr);
    return;
  }
  spdlog::info("Run request: language={} enable_network={} code={}B", language, req.enable_network, req.source.size());
  if (!req.preload.empty()) {
    spdlog::info("Preload: {}", Truncate(req.preload, kPreloadPreviewLength));
  }

  EngineResponse resp = engine_.Run(req);
  switch (resp.status) {
    case EngineStatus::OVERLOADED:
      spdlog::warn("Rejected run request: {} requests in flight", engine_.Admission().InFlight());
      http_utils::Reply(res, ApiCode::TOO_MANY_REQUESTS);
      return;
    case EngineStatus::UNSUPPORTED:
      spdlog::warn("Unsupported language: {}", language);
      http_utils::Reply(res, ApiCode::UNSUPPORTED_LANGUAGE);
      return;
    case EngineStatus::ACCEPTED:
      break;
  }

  const ExecutionResult& result = resp.result;
  spdlog::info("Run finished: success={} outcome={}", result.success, OutcomeToAbr(result.outcome));
  if (!result.output.empty()) spdlog::info("stdout: {}", Truncate(result.output, kPreviewLength));
  if (result.error && !result.error->empty()) {
    spdlog::warn("error: {}", Truncate(*result.error, kPreviewLength));
  }
  http_utils::Reply(res, ApiCode::SUCCESS, {
    {"stdout", result.output},
    {"error", result.error.value_or("")},
  });
}

bool SandboxServer::Listen(const std::string& host, int port) {
  spdlog::warn("Listening on {}:{}", host, port);
  return svr_.listen(host, port);
}

int SandboxServer::BindToAnyPort(const std::string& host) {
  return svr_.bind_to_any_port(host);
}

bool SandboxServer::ListenAfterBind() {
  return svr_.listen_after_bind();
}

void SandboxServer::Stop() {
  svr_.stop();
}
