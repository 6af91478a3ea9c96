#include "FleetClient.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/errors/Errors.hpp"
#include "core/util/TimeFormat.hpp"

using nlohmann::json;

namespace frl {

namespace {

bool is_unreserved(char c) {
  return (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~');
}

std::string url_escape(const std::string& s) {
  std::ostringstream o;
  for (unsigned char c : s) {
    if (is_unreserved(static_cast<char>(c))) o << c;
    else o << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c)
           << std::nouppercase << std::dec;
  }
  return o.str();
}

// "http://host:8080/prefix" -> {"http://host:8080", "/prefix"}
std::pair<std::string, std::string> split_base(const std::string& url) {
  auto scheme = url.find("://");
  auto slash = url.find('/', scheme == std::string::npos ? 0 : scheme + 3);
  if (slash == std::string::npos) return {url, ""};
  std::string prefix = url.substr(slash);
  while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();
  return {url.substr(0, slash), prefix};
}

} // namespace

FleetClient::FleetClient(std::string baseUrl, std::string token)
  : baseUrl_(std::move(baseUrl)), token_(std::move(token)) {}

std::vector<std::string> FleetClient::listRoutes() {
  auto [host, prefix] = split_base(baseUrl_);
  httplib::Client cli(host);
  cli.set_connection_timeout(30, 0);
  cli.set_read_timeout(60, 0);

  const std::string path = prefix + "/api/routes?bypass_token=" + url_escape(token_);
  spdlog::debug("Listing routes from {}{}/api/routes", host, prefix);

  auto res = cli.Get(path);
  if (!res) throw FleetError("GET /api/routes: " + httplib::to_string(res.error()));
  if (res->status != 200)
    throw FleetError("GET /api/routes: HTTP " + std::to_string(res->status));

  std::vector<std::string> routes;
  try {
    routes = json::parse(res->body).get<std::vector<std::string>>();
  } catch (const json::exception& e) {
    throw FleetError(std::string("GET /api/routes: unexpected body: ") + e.what());
  }
  std::sort(routes.begin(), routes.end());
  spdlog::debug("Got {} routes", routes.size());
  return routes;
}

std::uint64_t FleetClient::download(const std::string& routeId,
                                    const std::string& camera,
                                    const std::string& dest) {
  namespace fs = std::filesystem;
  auto [host, prefix] = split_base(baseUrl_);
  httplib::Client cli(host);
  cli.set_connection_timeout(30, 0);
  cli.set_read_timeout(5 * 60, 0);

  const std::string path = prefix + "/footage/full/" + url_escape(camera) + "/" + url_escape(routeId) +
                           "?bypass_token=" + url_escape(token_);
  const std::string partial = dest + ".tmp";

  std::uint64_t written = 0;
  int status = 0;
  {
    std::ofstream out(partial, std::ios::binary | std::ios::trunc);
    if (!out) throw FleetError("cannot write " + partial);

    auto res = cli.Get(
      path,
      [&](const httplib::Response& r) {
        status = r.status;
        return r.status == 200;
      },
      [&](const char* data, size_t len) {
        out.write(data, static_cast<std::streamsize>(len));
        written += len;
        return static_cast<bool>(out);
      });

    if (!res || status != 200 || !out) {
      out.close();
      std::error_code ec;
      fs::remove(partial, ec);
      if (status != 0 && status != 200)
        throw FleetError("GET footage " + routeId + "/" + camera + ": HTTP " + std::to_string(status));
      if (!res)
        throw FleetError("GET footage " + routeId + "/" + camera + ": " + httplib::to_string(res.error()));
      throw FleetError("write failed for " + partial);
    }
  }

  std::error_code ec;
  fs::rename(partial, dest, ec);
  if (ec) throw FleetError("rename " + partial + " failed: " + ec.message());

  spdlog::info("Downloaded {} ({})", dest, human_bytes(written));
  return written;
}

} // namespace frl
