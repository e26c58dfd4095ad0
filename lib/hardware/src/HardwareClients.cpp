#include "AnalyzerClient.hpp"
#include "IHardwareClient.hpp"
#include "StageClient.hpp"

namespace PROBEFLOW::Hardware
{

Result<HardwareClients> MakeHttpClients(const RunConfig &config)
{
  for (const auto *endpoint : {&config.stage_endpoint, &config.analyzer_endpoint}) {
    auto address = ParseServiceAddress(endpoint->base_url);
    if (!isOk(address)) {
      return Err<HardwareClients>(getError(address));
    }
  }

  HardwareClients clients;
  clients.stage = std::make_shared<StageClient>(config.stage_endpoint);
  clients.analyzer = std::make_shared<AnalyzerClient>(config.analyzer_endpoint);
  return Ok(std::move(clients));
}

}  // namespace PROBEFLOW::Hardware
