#include "protocol.h"

#include <cstring>
#include <stdexcept>

#include "utils.h"

namespace {

template <class Int>
class FrameReader {
  const std::vector<uint8_t>& vec_;
  size_t cur_;

  void Check_(size_t len) {
    if (len > vec_.size() || cur_ > vec_.size() - len) {
      throw std::out_of_range("truncated worker frame");
    }
  }
 public:
  explicit FrameReader(const std::vector<uint8_t>& vec) : vec_(vec), cur_(0) {}
  Int ReadInt() {
    Check_(sizeof(Int));
    Int r;
    memcpy(&r, vec_.data() + cur_, sizeof(Int));
    cur_ += sizeof(Int);
    return r;
  }
  std::string ReadString() {
    Int size = ReadInt();
    if (size < 0) throw std::out_of_range("negative string length in worker frame");
    Check_(size);
    std::string str(size, '\0');
    memcpy(str.data(), vec_.data() + cur_, size);
    cur_ += size;
    return str;
  }
  void Finish() {
    if (cur_ != vec_.size()) throw std::out_of_range("trailing bytes in worker frame");
  }
};

template <class Int>
class FrameWriter {
  std::vector<uint8_t> ret_;

  void AddLenWrite_(size_t len, const void* ptr) {
    size_t cur = ret_.size();
    ret_.resize(cur + len);
    memcpy(ret_.data() + cur, ptr, len);
  }
 public:
  void PushInt(Int r) { AddLenWrite_(sizeof(Int), &r); }
  void PushString(const std::string& str) {
    PushInt(str.size());
    AddLenWrite_(str.size(), str.data());
  }
  std::vector<uint8_t> Get() { return std::move(ret_); }
};

} // namespace

WorkerRequest::WorkerRequest(const std::vector<uint8_t>& vec) {
  FrameReader<Int> reader(vec);
  Int kind_id = reader.ReadInt();
  if (kind_id != (Int)RunnerKind::EMBEDDED && kind_id != (Int)RunnerKind::EXTERNAL) {
    throw std::out_of_range("unknown runner kind in worker frame");
  }
  kind = (RunnerKind)kind_id;
  source = reader.ReadString();
  preload = reader.ReadString();
  enable_network = reader.ReadInt();
  reader.Finish();
}

std::vector<uint8_t> WorkerRequest::Serialize() const {
  FrameWriter<Int> writer;
  writer.PushInt((Int)kind);
  writer.PushString(source);
  writer.PushString(preload);
  writer.PushInt(enable_network);
  return writer.Get();
}

WorkerResponse::WorkerResponse(const std::vector<uint8_t>& vec) {
  FrameReader<Int> reader(vec);
  success = reader.ReadInt();
  output = reader.ReadString();
  if (reader.ReadInt()) error = reader.ReadString();
  Int outcome_id = reader.ReadInt();
  if (outcome_id < 0 || outcome_id > (Int)Outcome::INTERNAL_ERROR) {
    throw std::out_of_range("unknown outcome in worker frame");
  }
  outcome = (Outcome)outcome_id;
  reader.Finish();
}

std::vector<uint8_t> WorkerResponse::Serialize() const {
  FrameWriter<Int> writer;
  writer.PushInt(success);
  writer.PushString(output);
  writer.PushInt(error.has_value());
  if (error) writer.PushString(*error);
  writer.PushInt((Int)outcome);
  return writer.Get();
}

bool WriteFrame(int fd, const std::vector<uint8_t>& payload) {
  long size = payload.size();
  return WriteFull(fd, &size, sizeof(size)) && WriteFull(fd, payload.data(), payload.size());
}

bool ReadFrame(int fd, std::vector<uint8_t>& payload) {
  long size = 0;
  if (!ReadFull(fd, &size, sizeof(size))) return false;
  if (size < 0 || size > kMaxFrameSize) return false;
  payload.resize(size);
  return ReadFull(fd, payload.data(), size);
}
