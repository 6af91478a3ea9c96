#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>
#include <thread>

#include "core/ledger/ProgressLedger.hpp"
#include "core/media/RouteFileName.hpp"
#include "core/upload/UploadQueue.hpp"
#include "core/util/ShutdownSignal.hpp"

using nlohmann::json;

// -------- helpers --------

static bool check_api_key(const httplib::Request& req,
                          const std::string& apiKey,
                          httplib::Response& res) {
  if (apiKey.empty()) return true; // auth disabled
  auto k = req.get_header_value("X-API-Key");
  if (k == apiKey) return true;
  res.status = 401;
  res.set_content("unauthorized", "text/plain");
  return false;
}

static json entry_to_json(const frl::LedgerEntry& e) {
  return {
    {"route_id",       e.route_id},
    {"camera",         e.camera},
    {"downloaded_at",  e.downloaded_at ? json(*e.downloaded_at) : json(nullptr)},
    {"processed_at",   e.processed_at ? json(*e.processed_at) : json(nullptr)},
    {"uploaded_until", e.uploaded_until},
    {"updated_at",     e.updated_at}
  };
}

// Ledger failures become 503 so the operator can retry.
template <class Fn>
static void with_ledger(httplib::Response& res, Fn&& fn) {
  try {
    fn();
  } catch (const std::exception& e) {
    spdlog::error("operator request failed: {}", e.what());
    res.status = 503;
    res.set_content(std::string("ledger unavailable: ") + e.what(), "text/plain");
  }
}

// -------- server --------

namespace frl {

void run_http_server(ProgressLedger& ledger,
                     UploadQueue* queue,
                     ShutdownSignal& shutdown,
                     std::atomic<bool>& restartRequested,
                     int port,
                     const std::string& apiKey) {
  httplib::Server svr;
  const auto startedAt = std::chrono::steady_clock::now();

  // Health check
  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  // GET /queue -> [{route_id, camera, file, bytes, range_end, in_flight}]
  svr.Get("/queue", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    json out = json::array();
    if (queue) {
      for (const auto& item : queue->snapshot()) {
        std::error_code ec;
        auto bytes = std::filesystem::file_size(item.filePath, ec);
        out.push_back({
          {"route_id",  item.routeId},
          {"camera",    item.camera},
          {"file",      item.filePath},
          {"bytes",     ec ? json(nullptr) : json(bytes)},
          {"range_end", item.rangeEnd},
          {"in_flight", item.inFlight}
        });
      }
    }
    res.status = 200;
    res.set_content(out.dump(), "application/json");
  });

  // GET /routes -> ledger entries
  svr.Get("/routes", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    with_ledger(res, [&] {
      json out = json::array();
      for (const auto& e : ledger.list()) out.push_back(entry_to_json(e));
      res.status = 200;
      res.set_content(out.dump(), "application/json");
    });
  });

  // POST /routes/{routeId}/{camera}/reupload
  svr.Post(R"(/routes/([^/]+)/([^/]+)/reupload)", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    const std::string routeId = req.matches[1];
    const std::string camera  = req.matches[2];
    with_ledger(res, [&] {
      ledger.resetUpload(routeId, camera);
      spdlog::info("Operator: re-upload {} {}", routeId, camera);
      res.status = 200;
      res.set_content(json({{"route_id", routeId}, {"camera", camera}, {"reupload", true}}).dump(),
                      "application/json");
    });
  });

  // POST /routes/{fleetRouteId}/redownload
  // Download rows are keyed by the fleet route id, upload rows by the id parsed
  // back out of the saved file name; both go so the new copy is uploaded again.
  svr.Post(R"(/routes/([^/]+)/redownload)", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    const std::string routeId = req.matches[1];
    with_ledger(res, [&] {
      json forgotten = json::array({routeId});
      ledger.forgetRoute(routeId);
      if (auto uploadId = uploadRouteId(routeId); uploadId && *uploadId != routeId) {
        ledger.forgetRoute(*uploadId);
        forgotten.push_back(*uploadId);
      }
      spdlog::info("Operator: re-download {}", routeId);
      res.status = 200;
      res.set_content(json({{"route_id", routeId}, {"redownload", true}, {"forgotten", forgotten}}).dump(),
                      "application/json");
    });
  });

  svr.Post("/ledger/reset", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    with_ledger(res, [&] {
      ledger.clear();
      spdlog::warn("Operator: ledger reset");
      res.status = 200;
      res.set_content("ledger reset", "text/plain");
    });
  });

  // Ignored right after startup so a replayed request cannot loop restarts.
  svr.Post("/restart", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    if (std::chrono::steady_clock::now() - startedAt < std::chrono::seconds(30)) {
      res.status = 409;
      res.set_content("started less than 30s ago", "text/plain");
      return;
    }
    spdlog::warn("Operator: restart requested");
    restartRequested = true;
    shutdown.request();
    res.status = 202;
    res.set_content("restarting", "text/plain");
  });

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404) res.set_content("not found", "text/plain");
  });

  // stop() is a no-op until listen() is running, so keep poking until it returns
  std::atomic<bool> listenReturned{false};
  std::thread stopper([&] {
    while (shutdown.waitFor(std::chrono::milliseconds(500))) {}
    while (!listenReturned) {
      svr.stop();
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  });

  spdlog::info("Operator API listening on http://0.0.0.0:{}", port);
  const bool listened = svr.listen("0.0.0.0", port);
  listenReturned = true;
  if (!listened && !shutdown.requested()) {
    spdlog::error("Failed to bind port {}, operator API disabled", port);
    while (shutdown.waitFor(std::chrono::seconds(1))) {}
  }
  stopper.join();
}

} // namespace frl
