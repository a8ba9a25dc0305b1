#pragma once
#include <optional>
#include <string>

namespace radio_service {

enum class StreamKind {
  Audio,
  Video,
  HlsPlaylist,
  PlsPlaylist,
  Dash,
  IcyShoutcast,
  Unknown
};

inline const char* toString(StreamKind kind) {
  switch (kind) {
    case StreamKind::Audio:        return "Audio stream";
    case StreamKind::Video:        return "Video stream";
    case StreamKind::HlsPlaylist:  return "HLS playlist";
    case StreamKind::PlsPlaylist:  return "PLS playlist";
    case StreamKind::Dash:         return "DASH stream";
    case StreamKind::IcyShoutcast: return "ICY/Shoutcast stream";
    case StreamKind::Unknown:      return "Unknown stream type";
  }
  return "Unknown stream type";
}

struct ProbeResult {
  bool valid{false};
  std::string reason;
  std::optional<std::string> content_type;  // lower-cased
  std::optional<long> status_code;
  std::optional<StreamKind> stream_kind;
};

} // namespace radio_service
