#ifndef SCRIPTJAIL_EXTRACTOR_H_
#define SCRIPTJAIL_EXTRACTOR_H_

#include <string>

#include <cjail/cjail.h>
#include <scriptjail/execution.h>

// Keeps the first `cap` bytes of a stream and counts the rest.
class BoundedBuffer {
  size_t cap_;
  size_t total_;
  std::string data_;
 public:
  explicit BoundedBuffer(size_t cap) : cap_(cap), total_(0) {}

  void Append(const char* buf, size_t len);
  bool Truncated() const { return total_ > cap_; }
  size_t Total() const { return total_; }
  // the kept bytes only
  const std::string& Data() const { return data_; }
  // the kept bytes, plus "[output truncated after N bytes]" once if anything was dropped
  std::string Text() const;
};

// Everything observed about one run; the input of ClassifyRun.
struct RunRecord {
  bool helper_reported; // a complete cjail_result was received
  bool watchdog_fired;
  struct cjail_result result;
  BoundedBuffer out, err, channel;

  RunRecord(size_t out_cap, size_t err_cap, size_t channel_cap) :
      helper_reported(false), watchdog_fired(false), result{},
      out(out_cap), err(err_cap), channel(channel_cap) {}
};

class SandboxRun;
// Drain the capture pipes and the helper's report of a spawned run, killing the
// jail when the wall-clock watchdog expires; reaps the helper before returning.
void CollectRun(SandboxRun&, const SandboxPolicy&);

// Pure; the first matching rule wins:
// sandbox failure, time, memory/process, contract records, abnormal exit,
// bad result channel, success.
ExecutionOutcome ClassifyRun(const RunRecord&, const SandboxPolicy&);

#endif  // SCRIPTJAIL_EXTRACTOR_H_
