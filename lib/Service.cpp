#include "Service.h"

namespace hl {

Service::Service(const std::string &name) : Module(name) {}

Service::~Service() {
  if (!isStopSet_ || thread_.joinable()) {
    stop();
  }
}

Service::Roe<void> Service::start() {
  if (!isStopSet_) {
    return Error(E_RUNNING, "Service is already running");
  }

  auto result = onStart();
  if (!result) {
    return Error(E_ON_START,
                 "Service onStart() failed: " + result.error().message);
  }

  isStopSet_ = false;
  thread_ = std::thread(&Service::runLoop, this);

  log().info << "Service started";
  return {};
}

void Service::stop() {
  if (isStopSet_ && !thread_.joinable()) {
    log().debug << "Service is not running";
    return;
  }

  log().info << "Stopping service";

  isStopSet_ = true;

  if (thread_.joinable()) {
    thread_.join();
  }

  onStop();

  log().info << "Service stopped";
}

} // namespace hl
