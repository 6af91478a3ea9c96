// src/main.cpp
#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/config/Config.hpp"
#include "core/ledger/InitDb.hpp"
#include "core/ledger/ProgressLedger.hpp"
#include "core/media/ChunkPlanner.hpp"
#include "core/media/MediaExtractor.hpp"
#include "core/media/MediaProber.hpp"
#include "core/storage/ResourceGuard.hpp"
#include "core/storage/ScratchStore.hpp"
#include "core/upload/TransferOrchestrator.hpp"
#include "core/upload/UploadQueue.hpp"
#include "core/util/ShutdownSignal.hpp"
#include "services/api/HttpServer.hpp"
#include "services/fleet/FleetClient.hpp"
#include "services/pipeline/DownloadPoller.hpp"
#include "services/pipeline/UploadPoller.hpp"
#include "services/telegram/TelegramTransport.hpp"

// ---------- helpers ----------

static std::atomic<bool> g_signalled{false};

static void on_signal(int) { g_signalled = true; }

// Look for schema.sql in CWD first (the build copies it there), then fallback.
static std::string findSchemaPath() {
  namespace fs = std::filesystem;
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/ledger/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw std::runtime_error("schema.sql not found (looked in CWD and src/core/ledger)");
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init        # create/upgrade the ledger database\n"
            << "  " << argv0 << " --serve       # run download/upload pipelines + operator API (FRL_PORT or 8080)\n";
}

// Requests shutdown and joins the pipeline threads however serve() exits.
// The queue goes down before the joins: it fails the future an orchestrator
// may be blocked on.
class WorkerThreads {
public:
  WorkerThreads(frl::ShutdownSignal& shutdown, frl::UploadQueue* queue)
    : shutdown_(shutdown), queue_(queue) {}
  ~WorkerThreads() { stopAndJoin(); }

  WorkerThreads(const WorkerThreads&) = delete;
  WorkerThreads& operator=(const WorkerThreads&) = delete;

  template <class Fn>
  void spawn(Fn&& fn) { threads_.emplace_back(std::forward<Fn>(fn)); }

  void stopAndJoin() {
    shutdown_.request();
    if (queue_) queue_->shutdown();
    for (auto& t : threads_)
      if (t.joinable()) t.join();
    threads_.clear();
  }

private:
  frl::ShutdownSignal&     shutdown_;
  frl::UploadQueue*        queue_;
  std::vector<std::thread> threads_;
};

static int serve(const frl::Config& cfg) {
  using namespace frl;

  initDatabase(cfg.dbPath, findSchemaPath());

  ScratchStore scratch(cfg.videosPath, cfg.tmpPath);
  scratch.ensureDirs();
  scratch.removePartialDownloads();
  scratch.removeOrphanedChunks();

  ProgressLedger ledger(cfg.dbPath);
  ShutdownSignal shutdown;
  std::atomic<bool> restartRequested{false};

  // Everything that can throw is built before the first thread starts.
  std::unique_ptr<FleetClient> fleet;
  std::unique_ptr<DownloadPoller> downloader;
  if (cfg.downloadEnabled()) {
    fleet = std::make_unique<FleetClient>(cfg.fleetUrl, cfg.fleetToken);
    downloader = std::make_unique<DownloadPoller>(*fleet, scratch, ledger, cfg.cameras, shutdown,
                                                  std::chrono::milliseconds(cfg.pollInterval));
  } else {
    spdlog::info("FRL_FLEET_URL not set, downloads disabled");
  }

  std::unique_ptr<TelegramTransport> transport;
  std::unique_ptr<UploadQueue> queue;
  FfprobeProber prober(cfg.ffprobePath);
  FfmpegExtractor extractor(cfg.ffmpegPath);
  ResourceGuard guard(cfg.tmpPath, cfg.maxTmpBytes, shutdown);
  std::unique_ptr<TransferOrchestrator> orchestrator;
  std::unique_ptr<UploadPoller> uploader;
  if (cfg.uploadEnabled()) {
    transport = std::make_unique<TelegramTransport>(cfg.telegramApiUrl, cfg.telegramBotToken, cfg.telegramChatId);
    if (auto name = transport->botUsername()) {
      spdlog::info("Telegram bot started: {}", *name);
      try {
        transport->sendMessage("\xF0\x9F\x9A\x98 Car started. Drive safe!");
      } catch (const std::exception& e) {
        spdlog::warn("Start notice not sent: {}", e.what());
      }
    }

    queue = std::make_unique<UploadQueue>(*transport, ledger);

    OrchestratorOptions opts;
    opts.capBytes = cfg.chunkSizeBytes;
    opts.planner.windowSeconds = cfg.chunkWindowSeconds;
    opts.planner.shrinkSeconds = cfg.chunkShrinkSeconds;
    opts.deleteSourceWhenDone = cfg.deleteUploadedVideos;
    orchestrator = std::make_unique<TransferOrchestrator>(prober, extractor, ledger, *queue, guard, scratch, opts);
    uploader = std::make_unique<UploadPoller>(scratch, ledger, *orchestrator, shutdown,
                                              std::chrono::milliseconds(cfg.pollInterval));
  } else {
    spdlog::info("Telegram token/chat id not set, uploads disabled");
  }

  // Declared after everything the threads use, so it joins them first on any exit.
  WorkerThreads workers(shutdown, queue.get());

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
  workers.spawn([&] {
    while (shutdown.waitFor(std::chrono::milliseconds(200))) {
      if (g_signalled) {
        spdlog::info("Signal received, shutting down");
        shutdown.request();
      }
    }
  });
  if (downloader) workers.spawn([&] { downloader->run(); });
  if (uploader) {
    queue->start();
    workers.spawn([&] { uploader->run(); });
  }

  if (cfg.port > 0) {
    run_http_server(ledger, queue.get(), shutdown, restartRequested, cfg.port, cfg.apiKey);
  } else {
    while (shutdown.waitFor(std::chrono::seconds(1))) {}
  }

  workers.stopAndJoin();
  spdlog::info("Stopped");
  return restartRequested ? 1 : 0;
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    const frl::Config cfg = frl::loadConfigFromEnv();
    spdlog::set_level(spdlog::level::from_str(cfg.logLevel));

    if (argc > 1 && std::string(argv[1]) == "--init") {
      frl::initDatabase(cfg.dbPath, findSchemaPath());
      std::cout << "DB initialized at: " << cfg.dbPath << "\n";
      return 0;
    }

    if (argc > 1 && std::string(argv[1]) == "--serve") {
      return serve(cfg);
    }

    print_usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
