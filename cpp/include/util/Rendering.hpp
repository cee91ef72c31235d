#pragma once

#include <cstdint>

namespace util {

/*
 * Rendering mode for text vs. terminal output.
 *
 * Rendering::mode() is by default determined by isatty(STDOUT_FILENO): kTerminal if true, kText
 * otherwise. Code branches on it to decide whether to emit colors and glyphs.
 *
 * The mode can be temporarily overridden with the RAII Guard:
 *
 *   {
 *     util::Rendering::Guard g(util::Rendering::kText);  // force text mode in this scope
 *     ...
 *   }
 */
class Rendering {
 public:
  enum Mode : int8_t { kText, kTerminal };

  class Guard {
   public:
    Guard(Mode mode);
    ~Guard();

    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;

   private:
    const Mode prev_mode_;
  };

  static Mode mode() { return instance().mode_; }
  static void set(Mode mode) { instance().mode_ = mode; }

 private:
  Rendering();
  static Rendering& instance();

  Mode mode_;
};

}  // namespace util

#include "inline/util/Rendering.inl"
