#include <signal.h>
#include <unistd.h>
#include <fstream>
#include <iostream>
#include <filesystem>
#include <type_traits>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <scriptjail/logger.h>
#include <scriptjail/paths.h>
#include "server_io.h"

namespace {

std::vector<std::string> SplitList(const std::string& str) {
  std::vector<std::string> ret;
  size_t pos = 0;
  while (pos <= str.size()) {
    size_t nxt = str.find(',', pos);
    if (nxt == std::string::npos) nxt = str.size();
    std::string item = str.substr(pos, nxt - pos);
    item.erase(0, item.find_first_not_of(" \t"));
    item.erase(item.find_last_not_of(" \t") + 1);
    if (item.size()) ret.push_back(item);
    pos = nxt + 1;
  }
  return ret;
}

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  SandboxPolicy& policy = kPolicy;
  std::string box_root = ini[""]["box_root"] | "";
  std::string python = ini[""]["python"] | "";
  std::string library_dirs = ini[""]["library_dirs"] | "";
  std::string allowed_modules = ini[""]["allowed_modules"] | "";
  std::string denied_patterns = ini[""]["denied_patterns"] | "";
  if (box_root.size()) policy.box_root = box_root;
  if (python.size()) policy.python = python;
  if (library_dirs.size()) policy.library_dirs = SplitList(library_dirs);
  if (allowed_modules.size()) policy.allowed_modules = SplitList(allowed_modules);
  if (denied_patterns.size()) policy.denied_patterns = SplitList(denied_patterns);
  kListenHost = ini[""]["listen_host"] | kListenHost;
  kListenPort = ini[""]["port"] | kListenPort;
  kMaxParallel = ini[""]["parallel"] | kMaxParallel;
  kMaxQueue = ini[""]["max_queue"] | kMaxQueue;

  // config values are in coarser units than the policy fields
  auto Scaled = [&](const char* key, auto& field, long unit) {
    using T = std::remove_reference_t<decltype(field)>;
    field = static_cast<T>((ini[""][key] | static_cast<long>(field / unit)) * unit);
  };
  Scaled("wall_time_ms", policy.wall_time_us, 1000);
  Scaled("cpu_time_ms", policy.cpu_time_us, 1000);
  Scaled("memory_mb", policy.memory_kib, 1024);
  Scaled("address_space_mb", policy.address_space_kib, 1024);
  policy.max_processes = ini[""]["max_processes"] | policy.max_processes;
  policy.max_open_files = ini[""]["max_open_files"] | policy.max_open_files;
  Scaled("max_file_mb", policy.max_file_kib, 1024);
  Scaled("scratch_mb", policy.scratch_kib, 1024);
  Scaled("max_script_kb", policy.max_script_bytes, 1024);
  Scaled("max_stdout_kb", policy.max_stdout_bytes, 1024);
  Scaled("max_stderr_kb", policy.max_stderr_bytes, 1024);
  Scaled("max_result_kb", policy.max_result_bytes, 1024);
  policy.share_network = ini[""]["share_network"] | policy.share_network;
  policy.uid_base = ini[""]["uid_base"] | policy.uid_base;
  policy.uid_count = ini[""]["uid_count"] | policy.uid_count;
  policy.gid = ini[""]["gid"] | policy.gid;
  return true;
}

bool CheckConfig() {
  const SandboxPolicy& policy = kPolicy;
  if (kMaxParallel <= 0) {
    spdlog::error("parallel must be positive");
    return false;
  }
  if (policy.wall_time_us <= 0 || policy.cpu_time_us <= 0 || policy.memory_kib <= 0) {
    spdlog::error("wall_time_ms, cpu_time_ms and memory_mb must be positive");
    return false;
  }
  if (policy.uid_base <= 0 || policy.uid_count <= 0 || policy.gid < 0) {
    spdlog::error("The sandbox must not run as root: check uid_base, uid_count and gid");
    return false;
  }
  if (policy.uid_count < kMaxParallel) {
    spdlog::warn("uid_count ({}) < parallel ({}): concurrent runs may share a uid",
        policy.uid_count, kMaxParallel);
  }
  if (policy.box_root.is_relative() || policy.python.empty() || policy.python[0] != '/') {
    spdlog::error("box_root and python must be absolute paths");
    return false;
  }
  return true;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "scriptjail-server");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/scriptjail.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--parallel")
    .scan<'d', int>()
    .help("Number of maximum parallel script runs");
  parser.add_argument("--port")
    .scan<'d', int>()
    .help("Port to listen on");
  parser.add_argument("--host")
    .help("Address to listen on");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file)) {
    spdlog::error("Failed to parse configuration file {}", std::string(config_file));
    exit(1);
  }
  if (auto val = parser.present<int>("--parallel")) {
    kMaxParallel = val.value();
  }
  if (auto val = parser.present<int>("--port")) {
    kListenPort = val.value();
  }
  if (auto val = parser.present("--host")) {
    kListenHost = val.value();
  }
  if (!CheckConfig()) exit(1);
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  if (geteuid() != 0) {
    spdlog::error("Must be run as root.");
    return 1;
  }
  ParseArgs(argc, argv);
  // a helper dying before reading its options must not kill the server
  signal(SIGPIPE, SIG_IGN);
  ServerWorkLoop();
  return 1;
}
