#include "artifacts/abort_marker_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"

#include <sstream>

namespace fs = std::filesystem;

namespace recsync::artifacts {

std::string ToJson(const AbortMarker& marker) {
  std::ostringstream out;
  out << "{\n"
      << "  \"status\": \"aborted\",\n"
      << "  \"timestamp\": " << core::QuoteJson(marker.timestamp) << ",\n"
      << "  \"mode\": " << core::QuoteJson(naming::ToString(marker.mode)) << ",\n"
      << "  \"session_dir\": " << core::QuoteJson(marker.session_dir.generic_string()) << ",\n"
      << "  \"reason\": " << core::QuoteJson(marker.reason) << ",\n"
      << "  \"aborted_at_utc\": " << core::QuoteJson(marker.aborted_at_utc) << ",\n"
      << "  \"tracked_files\": [";
  for (std::size_t i = 0; i < marker.tracked_files.size(); ++i) {
    out << (i == 0 ? "\n" : ",\n") << "    " << core::QuoteJson(marker.tracked_files[i]);
  }
  if (!marker.tracked_files.empty()) {
    out << "\n  ";
  }
  out << "]\n"
      << "}\n";
  return out.str();
}

bool WriteAbortMarkerJson(const AbortMarker& marker, const fs::path& session_dir,
                          fs::path& written_path, std::string& error) {
  if (session_dir.empty()) {
    error = "session directory cannot be empty";
    return false;
  }

  const fs::path target = session_dir / std::string(kAbortMarkerFileName);
  if (!core::WriteTextFileAtomic(target, ToJson(marker), error)) {
    return false;
  }
  written_path = target;
  return true;
}

} // namespace recsync::artifacts
