#include "virtual_user_scheduler.hpp"
#include "logger.hpp"
#include <algorithm>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>

namespace loadplus {

namespace {

double millisSince(std::chrono::steady_clock::time_point from,
                   std::chrono::steady_clock::time_point to) {
    return std::chrono::duration<double, std::milli>(to - from).count();
}

} // namespace

// One simulated session. Only ever touched from the io_context thread.
class VirtualUserScheduler::VirtualUser
    : public std::enable_shared_from_this<VirtualUserScheduler::VirtualUser> {
public:
    VirtualUser(VirtualUserScheduler& scheduler, int index)
        : scheduler_(scheduler), index_(index), waitTimer_(scheduler.ioc_) {}

    void start(double offsetMs) {
        waitTimer_.expires_after(toTimerDelay(offsetMs));
        waitTimer_.async_wait([self = shared_from_this()](const boost::system::error_code&) {
            // An interrupted ramp-up wait still proceeds to the loop head
            self->startedAt_ = std::chrono::steady_clock::now();
            self->iterate();
        });
    }

    void interrupt() { waitTimer_.cancel(); }

private:
    void iterate() {
        auto& s = scheduler_;
        double elapsedMs = millisSince(startedAt_, std::chrono::steady_clock::now());
        if (s.token_->isCancelled() || elapsedMs >= s.profile_.duration * 1000.0) {
            SCHED_LOG_DEBUG("Virtual user {} exiting after {} operations", index_, operations_);
            s.onUserFinished();
            return;
        }

        auto operationStart = std::chrono::steady_clock::now();
        s.simulator_.simulate([self = shared_from_this(), operationStart](
                                  const SimulationOutcome& outcome) {
            self->onOperationComplete(outcome, operationStart);
        });
    }

    void onOperationComplete(const SimulationOutcome& outcome,
                             std::chrono::steady_clock::time_point operationStart) {
        auto& s = scheduler_;
        ExecutionSample sample;
        sample.success = outcome.success;
        sample.latencyMs = millisSince(operationStart, std::chrono::steady_clock::now());
        sample.error = outcome.error;
        s.collector_.recordSample(std::move(sample));
        ++operations_;

        if (s.random_.chance(s.settings_.snapshotProbability)) {
            s.collector_.recordSnapshot(s.probe_.sample());
        }

        double jitterMs = s.random_.uniform(s.settings_.jitterMinMs, s.settings_.jitterMaxMs);
        waitTimer_.expires_after(toTimerDelay(jitterMs));
        waitTimer_.async_wait([self = shared_from_this()](const boost::system::error_code&) {
            self->iterate();
        });
    }

    VirtualUserScheduler& scheduler_;
    int index_;
    net::steady_timer waitTimer_;
    std::chrono::steady_clock::time_point startedAt_;
    int operations_ = 0;
};

VirtualUserScheduler::VirtualUserScheduler(net::io_context& ioc, const WorkloadProfile& profile,
                                           WorkloadSimulator& simulator,
                                           SampleCollector& collector, ResourceProbe& probe,
                                           RandomSource& random,
                                           std::shared_ptr<CancellationToken> token,
                                           SchedulerSettings settings, std::string runId)
    : ioc_(ioc), profile_(profile), simulator_(simulator), collector_(collector), probe_(probe),
      random_(random), token_(std::move(token)), settings_(settings), runId_(std::move(runId)) {
    if (!token_) {
        token_ = std::make_shared<CancellationToken>();
    }
}

VirtualUserScheduler::~VirtualUserScheduler() {
    if (callbackId_ != 0) {
        token_->removeCallback(callbackId_);
    }
}

double VirtualUserScheduler::startOffsetMs(const WorkloadProfile& profile, int index) {
    if (profile.concurrency <= 0) {
        return 0.0;
    }
    return profile.rampUpSeconds * 1000.0 * index / profile.concurrency;
}

double VirtualUserScheduler::run() {
    SCHED_LOG_INFO_RUN("Scheduling {} virtual users for {}s with {}s ramp-up", runId_,
                       profile_.concurrency, profile_.duration, profile_.rampUpSeconds);

    startedAt_ = std::chrono::steady_clock::now();
    lastFinishedAt_ = startedAt_;
    finishedUsers_ = 0;

    callbackId_ = token_->addCallback([this]() {
        net::post(ioc_, [this]() { interruptWaits(); });
    });

    users_.clear();
    users_.reserve(static_cast<size_t>(profile_.concurrency));
    for (int i = 0; i < profile_.concurrency; ++i) {
        auto user = std::make_shared<VirtualUser>(*this, i);
        users_.push_back(user);
        user->start(startOffsetMs(profile_, i));
    }

    ioc_.run();

    token_->removeCallback(callbackId_);
    callbackId_ = 0;
    users_.clear();

    double observedMs = millisSince(startedAt_, lastFinishedAt_);
    SCHED_LOG_INFO_RUN("All {} virtual users finished after {} ms{}", runId_, finishedUsers_,
                       observedMs, token_->isCancelled() ? " (cancelled)" : "");
    return observedMs;
}

void VirtualUserScheduler::interruptWaits() {
    SCHED_LOG_DEBUG_RUN("Cancellation requested, waking waiting users", runId_);
    for (auto& user : users_) {
        user->interrupt();
    }
}

void VirtualUserScheduler::onUserFinished() {
    ++finishedUsers_;
    lastFinishedAt_ = std::chrono::steady_clock::now();
}

} // namespace loadplus
