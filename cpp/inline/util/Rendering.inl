#include "util/Rendering.hpp"

#include <unistd.h>

namespace util {

inline Rendering::Guard::Guard(Mode mode) : prev_mode_(Rendering::mode()) { set(mode); }

inline Rendering::Guard::~Guard() { set(prev_mode_); }

inline Rendering::Rendering() : mode_(isatty(STDOUT_FILENO) ? kTerminal : kText) {}

inline Rendering& Rendering::instance() {
  static Rendering instance;
  return instance;
}

}  // namespace util
