#include "extractor.h"

#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <algorithm>

#include <spdlog/spdlog.h>
#include "result_record.h"
#include "sandbox_run.h"

namespace {

using Clock = std::chrono::steady_clock;

// how long the capture pipes may stay open after the helper is gone
constexpr auto kLinger = std::chrono::milliseconds(200);
constexpr auto kPollInterval = std::chrono::milliseconds(50);
constexpr size_t kStderrExcerpt = 2000;

// false on EOF or error; the fd is then closed and set to -1
bool DrainPipe(int& fd, BoundedBuffer& buf) {
  char tmp[65536];
  while (true) {
    ssize_t n = read(fd, tmp, sizeof(tmp));
    if (n > 0) {
      buf.Append(tmp, n);
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
    if (n < 0) spdlog::warn("Failed reading capture pipe: {}", strerror(errno));
    close(fd);
    fd = -1;
    return false;
  }
}

std::string StderrTail(const BoundedBuffer& err) {
  const std::string& data = err.Data();
  if (data.size() <= kStderrExcerpt) return data;
  return data.substr(data.size() - kStderrExcerpt);
}

} // namespace

void BoundedBuffer::Append(const char* buf, size_t len) {
  if (data_.size() < cap_) data_.append(buf, std::min(len, cap_ - data_.size()));
  total_ += len;
}

std::string BoundedBuffer::Text() const {
  if (!Truncated()) return data_;
  std::string ret = data_;
  if (!ret.empty() && ret.back() != '\n') ret.push_back('\n');
  ret += "[output truncated after " + std::to_string(cap_) + " bytes]";
  return ret;
}

void CollectRun(SandboxRun& run, const SandboxPolicy& policy) {
  RunRecord& rec = run.record;
  BoundedBuffer report(sizeof(struct cjail_result));
  auto deadline = Clock::now() + std::chrono::microseconds(policy.wall_time_us + policy.kill_grace_us);
  Clock::time_point linger_end = Clock::time_point::max();

  struct {
    int* fd;
    BoundedBuffer* buf;
  } streams[] = {
    {&run.control_fd, &report},
    {&run.stdout_fd, &rec.out},
    {&run.stderr_fd, &rec.err},
    {&run.result_fd, &rec.channel},
  };
  while (true) {
    auto now = Clock::now();
    if (run.control_fd < 0 && linger_end == Clock::time_point::max()) linger_end = now + kLinger;
    if (now >= linger_end) break;
    if (now >= deadline && !rec.watchdog_fired && run.control_fd >= 0) {
      spdlog::info("Run {}: watchdog expired, killing sandbox", run.id);
      kill(-run.helper, SIGKILL);
      rec.watchdog_fired = true;
    }

    struct pollfd fds[4];
    nfds_t nfds = 0;
    for (auto& i : streams) {
      if (*i.fd < 0) continue;
      fds[nfds].fd = *i.fd;
      fds[nfds].events = POLLIN;
      fds[nfds].revents = 0;
      nfds++;
    }
    if (!nfds) break;
    auto wait = std::min<Clock::duration>(kPollInterval, std::max(Clock::duration(0),
        (rec.watchdog_fired ? linger_end : deadline) - now));
    int timeout = std::chrono::ceil<std::chrono::milliseconds>(wait).count();
    if (poll(fds, nfds, timeout) < 0 && errno != EINTR) {
      spdlog::warn("Run {}: poll failed: {}", run.id, strerror(errno));
      break;
    }
    for (auto& i : streams) {
      if (*i.fd >= 0) DrainPipe(*i.fd, *i.buf);
    }
  }
  if (report.Total() == sizeof(struct cjail_result)) {
    memcpy(&rec.result, report.Data().data(), sizeof(struct cjail_result));
    rec.helper_reported = true;
  } else if (report.Total()) {
    spdlog::warn("Run {}: unexpected report size {}", run.id, report.Total());
  }
  if (run.helper > 0) {
    // the helper should already be gone; do not let a stuck one hold the request
    if (run.control_fd >= 0) kill(-run.helper, SIGKILL);
    run.Reap();
  }
}

ExecutionOutcome ClassifyRun(const RunRecord& rec, const SandboxPolicy& policy) {
  const struct cjail_result& res = rec.result;
  if (!rec.helper_reported && !rec.watchdog_fired) {
    return ExecutionOutcome::SandboxFailure("sandbox helper exited without a report");
  }
  if (rec.helper_reported && res.timekill == -1) {
    return ExecutionOutcome::SandboxFailure(
        std::string("cjail_exec failed: ") + strerror(res.oomkill));
  }

  bool signaled = rec.helper_reported &&
      (res.info.si_code == CLD_KILLED || res.info.si_code == CLD_DUMPED);
  auto Finish = [&rec](ExecutionOutcome&& outcome) {
    outcome.stdout_text = rec.out.Text();
    return std::move(outcome);
  };
  if (rec.watchdog_fired || res.timekill || (signaled && res.info.si_status == SIGXCPU)) {
    return Finish(ExecutionOutcome::ResourceExceeded(ResourceKind::TIME));
  }
  // oomkill = -1 means cjail failed to read the oom counter
  if (res.oomkill > 0 ||
      (signaled && policy.memory_kib > 0 && res.rus.ru_maxrss >= policy.memory_kib)) {
    return Finish(ExecutionOutcome::ResourceExceeded(ResourceKind::MEMORY));
  }

  ResultRecord record = ParseResultRecord(rec.channel.Data(), rec.channel.Truncated());
  if (record.status == RecordStatus::RESOURCE) {
    return Finish(ExecutionOutcome::ResourceExceeded(record.resource));
  }
  if (record.IsContractViolation()) {
    return Finish(ExecutionOutcome::ContractViolation(record.ContractReason()));
  }
  if (record.status == RecordStatus::ERROR) {
    return Finish(ExecutionOutcome::RuntimeFailure(record.ErrorExcerpt()));
  }
  if (signaled) {
    std::string excerpt = std::string("killed by signal: ") + strsignal(res.info.si_status);
    std::string tail = StderrTail(rec.err);
    if (!tail.empty()) excerpt += "\n" + tail;
    return Finish(ExecutionOutcome::RuntimeFailure(excerpt));
  }
  if (res.info.si_status != 0) {
    std::string tail = StderrTail(rec.err);
    if (tail.empty()) tail = "exited with status " + std::to_string(res.info.si_status);
    return Finish(ExecutionOutcome::RuntimeFailure(tail));
  }
  if (record.status != RecordStatus::OK) {
    spdlog::debug("Result channel: status={}, {} bytes, truncated={}",
        RecordStatusName(record.status), rec.channel.Total(), rec.channel.Truncated());
    return Finish(ExecutionOutcome::ContractViolation(record.ContractReason()));
  }
  return ExecutionOutcome::Success(std::move(record.result), rec.out.Text());
}
