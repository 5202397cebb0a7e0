#ifndef ERROR_LOG_H
#define ERROR_LOG_H

#include "params.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

struct ErrorEntry {
  std::chrono::system_clock::time_point stamp{};
  std::string message;

  std::string to_string() const; // "[HH:MM:SS] message"
};

// Recent-errors ring. Any thread may record; appends are serialized so the
// insertion order is the order in which record() calls took the lock.
class ErrorLog {
public:
  explicit ErrorLog(std::size_t capacity = param::MAX_ERRORS_DISPLAYED) : capacity_(capacity == 0 ? 1 : capacity) {}

  ErrorLog(const ErrorLog&) = delete;
  ErrorLog& operator=(const ErrorLog&) = delete;

  void record(const std::string& message);

  // Up to n most recent entries, oldest first.
  std::vector<ErrorEntry> recent(std::size_t n = param::MAX_ERRORS_DISPLAYED) const;

  std::size_t size() const;
  std::size_t capacity() const { return capacity_; }

private:
  const std::size_t capacity_;

  mutable std::mutex mtx_;
  std::deque<ErrorEntry> entries_;
};

#endif // ERROR_LOG_H
