#pragma once

#include "cancellation_token.hpp"
#include "random_source.hpp"
#include "sample_collector.hpp"
#include "system_metrics.hpp"
#include "workload_profile.hpp"
#include "workload_simulator.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace net = boost::asio;

namespace loadplus {

struct SchedulerSettings {
  double jitterMinMs = 50.0;
  double jitterMaxMs = 150.0;
  double snapshotProbability = 0.1; // per completed sample
};

/**
 * Drives `concurrency` virtual users on a single io_context.
 *
 * User i starts after rampUpSeconds * i / concurrency, then loops:
 * check exit condition, simulate, record the sample, sleep a random
 * jitter. A user exits once `duration` seconds have passed since its own
 * start or the token is cancelled. In-flight operations always complete.
 */
class VirtualUserScheduler {
public:
  VirtualUserScheduler(net::io_context &ioc, const WorkloadProfile &profile,
                       WorkloadSimulator &simulator, SampleCollector &collector,
                       ResourceProbe &probe, RandomSource &random,
                       std::shared_ptr<CancellationToken> token,
                       SchedulerSettings settings = {}, std::string runId = "");
  ~VirtualUserScheduler();

  VirtualUserScheduler(const VirtualUserScheduler &) = delete;
  VirtualUserScheduler &operator=(const VirtualUserScheduler &) = delete;

  // Blocks until every user has exited. Returns the observed span in ms,
  // from scheduling start to the last user's exit. Exceptions raised by a
  // simulator or probe propagate to the caller.
  double run();

  int finishedUsers() const { return finishedUsers_; }

  static double startOffsetMs(const WorkloadProfile &profile, int index);

private:
  class VirtualUser;

  void interruptWaits();
  void onUserFinished();

  net::io_context &ioc_;
  const WorkloadProfile &profile_;
  WorkloadSimulator &simulator_;
  SampleCollector &collector_;
  ResourceProbe &probe_;
  RandomSource &random_;
  std::shared_ptr<CancellationToken> token_;
  SchedulerSettings settings_;
  std::string runId_;

  std::vector<std::shared_ptr<VirtualUser>> users_;
  int finishedUsers_ = 0;
  std::chrono::steady_clock::time_point startedAt_;
  std::chrono::steady_clock::time_point lastFinishedAt_;
  CancellationToken::CallbackId callbackId_ = 0;
};

} // namespace loadplus
