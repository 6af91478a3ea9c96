#pragma once
#include <string>

namespace frl {

struct VideoMessage {
  std::string filePath;
  std::string fileName;        // name shown to recipients
  std::string caption;
  int         width = 0;
  int         height = 0;
  int         durationSeconds = 0;
  bool        supportsStreaming = true;
};

// Delivery channel for finished chunks. Bound to one destination chat.
// Any failure is reported as TransportError and is transient for that item.
class Transport {
public:
  virtual ~Transport() = default;

  virtual void sendVideo(const VideoMessage& msg) = 0;
  virtual void sendMessage(const std::string& text) = 0;
};

} // namespace frl
