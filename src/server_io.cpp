#include "server_io.h"

#include <mutex>
#include <chrono>
#include <condition_variable>

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "http_utils.h"
#include <scriptjail/execution.h>

std::string kListenHost = "127.0.0.1";
int kListenPort = 8080;
int kMaxParallel = 4;
size_t kMaxQueue = 20;
SandboxPolicy kPolicy;

namespace {

// extra body bytes allowed around the script (JSON framing)
constexpr size_t kBodyOverhead = 4096;

/// --- admission control ---
// at most kMaxParallel runs execute; at most kMaxQueue more may wait for a slot
std::mutex admission_mtx;
std::condition_variable admission_cv;
size_t running = 0, waiting = 0;

bool Admit() {
  std::unique_lock lck(admission_mtx);
  if (running >= (size_t)kMaxParallel) {
    if (waiting >= kMaxQueue) return false;
    waiting++;
    admission_cv.wait(lck, []{ return running < (size_t)kMaxParallel; });
    waiting--;
  }
  running++;
  return true;
}

// releases the slot taken by a successful Admit()
struct AdmissionSlot {
  ~AdmissionSlot() {
    {
      std::lock_guard lck(admission_mtx);
      running--;
    }
    admission_cv.notify_one();
  }
};

void SetResponse(httplib::Response& res, const Response& resp) {
  res.status = resp.status;
  res.set_content(resp.Dump(), "application/json");
}

long ElapsedUs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - start).count();
}

} // namespace

Response HandleExecute(const std::string& body, const SandboxPolicy& policy) {
  nlohmann::json req;
  try {
    req = nlohmann::json::parse(body);
  } catch (nlohmann::json::exception& e) {
    spdlog::debug("Malformed request body: {}", e.what());
    return InvalidRequestResponse(400, "request body must be a JSON object");
  }
  if (!req.is_object() || !req.contains("script")) {
    return InvalidRequestResponse(400, "missing 'script' in request");
  }
  auto& script = req["script"];
  if (!script.is_string()) {
    return InvalidRequestResponse(400, "'script' must be a string");
  }
  ExecutionRequest exec_req;
  exec_req.script = script.get<std::string>();
  if (exec_req.script.empty()) {
    return InvalidRequestResponse(400, "'script' must not be empty");
  }
  if (exec_req.script.size() > policy.max_script_bytes) {
    return InvalidRequestResponse(413, "script exceeds " + std::to_string(policy.max_script_bytes) + " bytes");
  }
  return ComposeResponse(Execute(exec_req, policy));
}

void ServerWorkLoop() {
  httplib::Server svr;
  // waiting requests hold a worker thread, so the pool covers both
  size_t threads = kMaxParallel + kMaxQueue + 1;
  svr.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
  svr.set_payload_max_length(kPolicy.max_script_bytes + kBodyOverhead);

  svr.Post("/execute", [](const httplib::Request& req, httplib::Response& res) {
    auto start = std::chrono::steady_clock::now();
    if (!Admit()) {
      SetResponse(res, BusyResponse());
    } else {
      AdmissionSlot slot;
      SetResponse(res, HandleExecute(req.body, kPolicy));
    }
    http_utils::LogRequest(req, res, ElapsedUs(start));
  });
  svr.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
    if (res.status == 413) {
      SetResponse(res, InvalidRequestResponse(413, "request body too large"));
    } else if (res.status == 404 || res.status == 405) {
      SetResponse(res, InvalidRequestResponse(res.status, "not found"));
    }
    http_utils::LogRequest(req, res, 0);
  });

  spdlog::info("Listening on {}:{}, parallel={}, max_queue={}", kListenHost, kListenPort,
      kMaxParallel, kMaxQueue);
  if (!svr.listen(kListenHost.c_str(), kListenPort)) {
    spdlog::error("Failed to listen on {}:{}", kListenHost, kListenPort);
  }
}
