#include "TelegramTransport.hpp"

#include <fstream>
#include <memory>
#include <stdexcept>

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/errors/Errors.hpp"

using nlohmann::json;

namespace frl {

namespace {

// httplib rejects unknown schemes (https without OpenSSL) with invalid_argument.
httplib::Client make_client(const std::string& apiUrl) {
  try {
    httplib::Client cli(apiUrl);
    cli.set_connection_timeout(30, 0);
    cli.set_read_timeout(15 * 60, 0);   // large videos are processed before the reply
    cli.set_write_timeout(15 * 60, 0);
    return cli;
  } catch (const std::invalid_argument& e) {
    throw TransportError("unusable Bot API url " + apiUrl + ": " + e.what());
  }
}

// Bot API answers {"ok":bool, "result":..., "description":"..."}
json check_reply(const httplib::Result& res, const std::string& method) {
  if (!res)
    throw TransportError(method + ": " + httplib::to_string(res.error()));

  json body;
  try {
    body = json::parse(res->body);
  } catch (const json::parse_error&) {
    throw TransportError(method + ": HTTP " + std::to_string(res->status) + " with non-JSON body");
  }
  if (res->status != 200 || !body.value("ok", false)) {
    throw TransportError(method + ": HTTP " + std::to_string(res->status) + " " +
                         body.value("description", std::string("no description")));
  }
  return body.contains("result") ? body["result"] : json();
}

} // namespace

TelegramTransport::TelegramTransport(std::string apiUrl, std::string botToken, std::string chatId)
  : apiUrl_(std::move(apiUrl)), botToken_(std::move(botToken)), chatId_(std::move(chatId)) {
  while (!apiUrl_.empty() && apiUrl_.back() == '/') apiUrl_.pop_back();
}

void TelegramTransport::sendVideo(const VideoMessage& msg) {
  auto in = std::make_shared<std::ifstream>(msg.filePath, std::ios::binary);
  if (!*in) throw TransportError("cannot open " + msg.filePath);

  httplib::MultipartFormDataItems fields = {
    {"chat_id",            chatId_,                                   "", ""},
    {"caption",            msg.caption,                               "", ""},
    {"width",              std::to_string(msg.width),                 "", ""},
    {"height",             std::to_string(msg.height),                "", ""},
    {"duration",           std::to_string(msg.durationSeconds),       "", ""},
    {"supports_streaming", msg.supportsStreaming ? "true" : "false",  "", ""},
  };

  // streamed from disk; chunks can be up to 2 GB
  httplib::MultipartFormDataProviderItems files = {
    {"video",
     [in](size_t /*offset*/, httplib::DataSink& sink) {
       char buf[64 * 1024];
       in->read(buf, sizeof(buf));
       const auto n = in->gcount();
       if (n > 0 && !sink.write(buf, static_cast<size_t>(n))) return false;
       if (in->eof()) sink.done();
       return !in->bad();
     },
     msg.fileName, "video/mp4"},
  };

  auto cli = make_client(apiUrl_);
  auto res = cli.Post("/bot" + botToken_ + "/sendVideo", httplib::Headers{}, fields, files);
  check_reply(res, "sendVideo");
  spdlog::debug("sendVideo accepted for {}", msg.filePath);
}

void TelegramTransport::sendMessage(const std::string& text) {
  json req = {{"chat_id", chatId_}, {"text", text}};
  auto cli = make_client(apiUrl_);
  auto res = cli.Post("/bot" + botToken_ + "/sendMessage", req.dump(), "application/json");
  check_reply(res, "sendMessage");
}

std::optional<std::string> TelegramTransport::botUsername() {
  try {
    auto cli = make_client(apiUrl_);
    auto res = cli.Get("/bot" + botToken_ + "/getMe");
    json me = check_reply(res, "getMe");
    return me.value("username", std::string());
  } catch (const TransportError& e) {
    spdlog::warn("Telegram getMe failed: {}", e.what());
    return std::nullopt;
  }
}

} // namespace frl
