#pragma once

#include "Module.h"
#include "ResultOrError.hpp"
#include <atomic>
#include <thread>

namespace hl {

/**
 * Service - Base class for components that run in a dedicated thread.
 *
 * Provides thread lifecycle management with start/stop functionality.
 * Derived classes implement the runLoop() method which executes in the service
 * thread.
 */
class Service : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_RUNNING = 1;  // Service already running
  constexpr static int32_t E_ON_START = 2; // onStart() hook failed

  explicit Service(const std::string &name);

  /**
   * Virtual destructor - stops the service if running.
   * Derived classes owning state used by runLoop() must call stop() in their
   * own destructor.
   */
  ~Service() override;

  bool isStopSet() const { return isStopSet_; }
  bool isRunning() const { return !isStopSet_; }

  Roe<void> start();
  void stop();

protected:
  /**
   * Main service loop - implement in derived classes.
   * Runs in the service thread.
   * Should check isStopSet() periodically to allow graceful shutdown.
   */
  virtual void runLoop() = 0;

  /**
   * Called before the thread starts (in the calling thread context).
   * Return an error to abort start.
   */
  virtual Roe<void> onStart() { return {}; }

  /**
   * Called after the thread has stopped (in the calling thread context).
   */
  virtual void onStop() {}

private:
  std::atomic<bool> isStopSet_{ true };
  std::thread thread_;
};

} // namespace hl
