#ifndef RECSYNC_CORE_TIME_UTILS_HPP_
#define RECSYNC_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace recsync::core {

namespace detail {

inline bool ToUtcTm(std::time_t epoch_seconds, std::tm& out) {
#if defined(_WIN32)
  return gmtime_s(&out, &epoch_seconds) == 0;
#else
  return gmtime_r(&epoch_seconds, &out) != nullptr;
#endif
}

inline bool ToLocalTm(std::time_t epoch_seconds, std::tm& out) {
#if defined(_WIN32)
  return localtime_s(&out, &epoch_seconds) == 0;
#else
  return localtime_r(&epoch_seconds, &out) != nullptr;
#endif
}

} // namespace detail

// Millisecond UTC timestamp used in log lines and manifest bookkeeping fields.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  std::tm utc_time{};
  if (!detail::ToUtcTm(std::chrono::system_clock::to_time_t(timestamp), utc_time)) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

// Session timestamps use the operator's local wall clock and a strftime-style
// format from configuration (default `%Y-%m-%d_%H-%M-%S`). Returns an empty
// string when the time cannot be converted.
inline std::string FormatLocalTimestamp(std::chrono::system_clock::time_point timestamp,
                                        std::string_view format) {
  std::tm local_time{};
  if (!detail::ToLocalTm(std::chrono::system_clock::to_time_t(timestamp), local_time)) {
    return "";
  }
  std::ostringstream out;
  out << std::put_time(&local_time, std::string(format).c_str());
  return out.str();
}

} // namespace recsync::core

#endif // RECSYNC_CORE_TIME_UTILS_HPP_
