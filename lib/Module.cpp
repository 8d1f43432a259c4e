#include "Module.h"

namespace hl {

Module::Module(const std::string &name)
    : spLogger_(std::make_shared<logging::Logger>(logging::getLogger(name))) {}

void Module::redirectLogger(const std::string &targetLoggerName) {
  spLogger_->redirectTo(targetLoggerName);
}

logging::Logger &Module::log() const { return *spLogger_; }

} // namespace hl
