#include "log_manager.h"

LogManager logger;

void LogManager::begin(Stream& out) {
  out_ = &out;
}

void LogManager::log(const String& message) {
  if (!out_) return;
  out_->println(message);
}
