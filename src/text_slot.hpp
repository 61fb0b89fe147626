#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>

// Holds at most one received text. The only mutator is try_fill, an atomic
// empty -> filled transition; once filled the slot is read-only.
class TextSlot {
public:
  TextSlot() = default;
  TextSlot(const TextSlot&) = delete;
  TextSlot& operator=(const TextSlot&) = delete;

  // True when this call filled the slot, false when it was already filled.
  bool try_fill(std::string text);

  bool filled() const;
  std::optional<std::string> value() const;

  // Blocks until the slot is filled or the timeout expires.
  std::optional<std::string> wait_for(std::chrono::milliseconds timeout) const;

private:
  mutable std::mutex m_;
  mutable std::condition_variable cv_;
  bool present_ = false;
  std::string text_;
};
