#pragma once
#include <atomic>
#include <string>

namespace frl {

class ProgressLedger;
class UploadQueue;
class ShutdownSignal;

// Start a blocking operator HTTP server; returns once shutdown is requested.
// queue may be null when uploads are disabled.
// apiKey: if empty, auth is disabled.
// POST /restart sets restartRequested and requests shutdown.
void run_http_server(ProgressLedger& ledger,
                     UploadQueue* queue,
                     ShutdownSignal& shutdown,
                     std::atomic<bool>& restartRequested,
                     int port,
                     const std::string& apiKey);

} // namespace frl
