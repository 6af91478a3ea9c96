#pragma once
#include <optional>
#include <string>

#include "core/upload/Transport.hpp"

namespace frl {

// Telegram Bot API client (sendVideo / sendMessage / getMe) over cpp-httplib.
// apiUrl may point at a self-hosted Bot API server to lift the 50 MB limit.
class TelegramTransport : public Transport {
public:
  TelegramTransport(std::string apiUrl, std::string botToken, std::string chatId);

  void sendVideo(const VideoMessage& msg) override;
  void sendMessage(const std::string& text) override;

  // Bot username from getMe, nullopt if the API is unreachable.
  std::optional<std::string> botUsername();

private:
  std::string apiUrl_;
  std::string botToken_;
  std::string chatId_;
};

} // namespace frl
