#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace frl {

struct LedgerEntry {
  std::string route_id;
  std::string camera;
  std::optional<std::string> downloaded_at;  // ISO 8601, set by the download poller
  std::optional<std::string> processed_at;   // ISO 8601, set once a file reaches DONE
  double      uploaded_until = 0;            // seconds confirmed delivered
  int64_t     updated_at = 0;
};

// Durable per-(route, camera) transfer progress backed by SQLite.
//
// uploaded_until is merged with max() inside an immediate transaction, so
// advance() is commutative and idempotent and tolerates out-of-order
// confirmations. Every failure surfaces as LedgerIOError; callers decide
// whether to retry.
//
// Thread-safety: all methods are serialized by an internal mutex.
class ProgressLedger {
public:
  explicit ProgressLedger(const std::string& dbPath);
  ~ProgressLedger();

  ProgressLedger(const ProgressLedger&) = delete;
  ProgressLedger& operator=(const ProgressLedger&) = delete;

  // 0 when the entry does not exist.
  double read(const std::string& route_id, const std::string& camera);

  // Persists max(stored, candidate) and returns the stored result.
  double advance(const std::string& route_id, const std::string& camera, double candidate);

  void markProcessed(const std::string& route_id, const std::string& camera, const std::string& at);
  bool isProcessed(const std::string& route_id, const std::string& camera);

  void markDownloaded(const std::string& route_id, const std::string& camera, const std::string& at);
  bool isDownloaded(const std::string& route_id, const std::string& camera);

  // Operator overrides. These are the only paths that move progress backwards.
  void resetUpload(const std::string& route_id, const std::string& camera);
  void forgetRoute(const std::string& route_id);
  void clear();

  std::optional<LedgerEntry> get(const std::string& route_id, const std::string& camera);
  std::vector<LedgerEntry> list();

private:
  std::optional<LedgerEntry> getLocked(const std::string& route_id, const std::string& camera);
  void setTimestampLocked(const char* column,
                          const std::string& route_id,
                          const std::string& camera,
                          const std::string& at);

  std::mutex mtx_;
  void* db_; // sqlite3*
};

} // namespace frl
