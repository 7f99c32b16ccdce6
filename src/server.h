#ifndef SERVER_H_
#define SERVER_H_

#include <string>
#include <httplib.h>
#include <runbox/executor.h>

extern std::string kListenHost;
extern int kPort;
extern std::string kApiKey;
// threads beyond one per admissible request
extern size_t kHttpThreads;

// HTTP front of an Engine: GET /health and POST /v1/sandbox/run, the
// latter (and anything else under /v1/sandbox) behind X-Api-Key.
class SandboxServer {
  Engine& engine_;
  std::string api_key_;
  httplib::Server svr_;

  httplib::Server::HandlerResponse Authenticate_(const httplib::Request&, httplib::Response&);
  void HandleRun_(const httplib::Request&, httplib::Response&);
 public:
  SandboxServer(Engine& engine, const std::string& api_key, size_t spare_threads);
  SandboxServer(const SandboxServer&) = delete;
  SandboxServer& operator=(const SandboxServer&) = delete;

  // Blocks until Stop() is called; false if the address cannot be bound.
  bool Listen(const std::string& host, int port);
  // For tests: bind an ephemeral port, then serve with ListenAfterBind().
  int BindToAnyPort(const std::string& host);
  bool ListenAfterBind();
  void Stop();
  bool IsRunning() const { return svr_.is_running(); }
};

#endif  // SERVER_H_
