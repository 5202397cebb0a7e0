#include "error_log.hpp"
#include "utils.hpp"

#include <utility>

std::string ErrorEntry::to_string() const {
  return "[" + format_clock(stamp) + "] " + message;
}

void ErrorLog::record(const std::string& message) {
  ErrorEntry e;
  e.stamp = std::chrono::system_clock::now();
  e.message = message;

  std::lock_guard<std::mutex> lk(mtx_);
  entries_.push_back(std::move(e));
  while (entries_.size() > capacity_) entries_.pop_front();
}

std::vector<ErrorEntry> ErrorLog::recent(std::size_t n) const {
  std::lock_guard<std::mutex> lk(mtx_);
  const std::size_t k = (n < entries_.size()) ? n : entries_.size();
  return std::vector<ErrorEntry>(entries_.end() - static_cast<std::ptrdiff_t>(k), entries_.end());
}

std::size_t ErrorLog::size() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return entries_.size();
}
