#ifndef RUNBOX_PROTOCOL_H_
#define RUNBOX_PROTOCOL_H_

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

#include <runbox/execution.h>

// Frames exchanged between the daemon and runbox-worker over pipes.
// Layout: a native long holding the payload size, then the payload.
// Platform dependent, only intended for the same machine.

constexpr long kMaxFrameSize = 1L << 30;

class WorkerRequest {
  using Int = long; // serialize
 public:
  RunnerKind kind;
  std::string source;
  std::string preload;
  bool enable_network;

  WorkerRequest() : kind(RunnerKind::EMBEDDED), enable_network(false) {}
  WorkerRequest(RunnerKind kind, const ExecutionRequest& req) :
      kind(kind), source(req.source), preload(req.preload), enable_network(req.enable_network) {}
  // throws std::out_of_range on a truncated or malformed payload
  explicit WorkerRequest(const std::vector<uint8_t>& serial);

  std::vector<uint8_t> Serialize() const;
};

class WorkerResponse {
  using Int = long; // serialize
 public:
  bool success;
  std::string output;
  std::optional<std::string> error;
  Outcome outcome;

  WorkerResponse() : success(false), outcome(Outcome::INTERNAL_ERROR) {}
  explicit WorkerResponse(const ExecutionResult& res) :
      success(res.success), output(res.output), error(res.error), outcome(res.outcome) {}
  // throws std::out_of_range on a truncated or malformed payload
  explicit WorkerResponse(const std::vector<uint8_t>& serial);

  std::vector<uint8_t> Serialize() const;
};

// blocking; false on EOF or error
bool WriteFrame(int fd, const std::vector<uint8_t>& payload);
bool ReadFrame(int fd, std::vector<uint8_t>& payload);

#endif  // RUNBOX_PROTOCOL_H_
