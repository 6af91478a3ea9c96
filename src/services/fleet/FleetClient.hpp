#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace frl {

// Route source. Listing and footage are both authorized with ?bypass_token=.
class FleetSource {
public:
  virtual ~FleetSource() = default;

  // Sorted route ids. Throws FleetError.
  virtual std::vector<std::string> listRoutes() = 0;

  // Streams the full camera video to `dest`, via "<dest>.tmp" renamed on
  // success. Returns bytes written. Throws FleetError.
  virtual std::uint64_t download(const std::string& routeId,
                                 const std::string& camera,
                                 const std::string& dest) = 0;
};

class FleetClient : public FleetSource {
public:
  FleetClient(std::string baseUrl, std::string token);

  std::vector<std::string> listRoutes() override;
  std::uint64_t download(const std::string& routeId,
                         const std::string& camera,
                         const std::string& dest) override;

private:
  std::string baseUrl_;
  std::string token_;
};

} // namespace frl
