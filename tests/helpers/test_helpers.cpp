#include "tests/helpers/test_helpers.hpp"

#include "pathfence/cli/commands.hpp"
#include "pathfence/config/config.hpp"
#include "pathfence/observability/global.hpp"
#include "pathfence/observability/noop_observer.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <random>

namespace pathfence::testing {

TempWorkspace::TempWorkspace() : TempWorkspace("pathfence-test-workspace") {}

TempWorkspace::TempWorkspace(const std::string &prefix) {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / (prefix + "-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

std::filesystem::path TempWorkspace::canonical() const {
  return std::filesystem::canonical(path_);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

void TempWorkspace::create_dir(const std::string &name) const {
  std::filesystem::create_directories(path_ / name);
}

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = existing;
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

CapturedOutput::CapturedOutput()
    : old_out_(std::cout.rdbuf(out_.rdbuf())), old_err_(std::cerr.rdbuf(err_.rdbuf())) {}

CapturedOutput::~CapturedOutput() {
  std::cout.rdbuf(old_out_);
  std::cerr.rdbuf(old_err_);
}

std::size_t RecordedEvents::event_count() {
  std::lock_guard<std::mutex> lock(mutex);
  return events.size();
}

std::size_t RecordedEvents::metric_count() {
  std::lock_guard<std::mutex> lock(mutex);
  return metrics.size();
}

void RecordingObserver::record_event(const observability::ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(sink_->mutex);
  sink_->events.push_back(event);
}

void RecordingObserver::record_metric(const observability::ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(sink_->mutex);
  sink_->metrics.push_back(metric);
}

ObserverScope::ObserverScope() : sink_(std::make_shared<RecordedEvents>()) {
  observability::set_global_observer(std::make_unique<RecordingObserver>(sink_));
}

ObserverScope::~ObserverScope() {
  observability::set_global_observer(std::make_unique<observability::NoopObserver>());
}

int run_cli_args(const std::vector<std::string> &args) {
  std::vector<std::string> storage;
  storage.reserve(args.size() + 1);
  storage.emplace_back("pathfence");
  storage.insert(storage.end(), args.begin(), args.end());

  std::vector<char *> argv;
  argv.reserve(storage.size());
  for (auto &arg : storage) {
    argv.push_back(arg.data());
  }

  const int code = cli::run_cli(static_cast<int>(argv.size()), argv.data());
  config::clear_config_path_override();
  observability::set_global_observer(std::make_unique<observability::NoopObserver>());
  return code;
}

} // namespace pathfence::testing
