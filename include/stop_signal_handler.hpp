#pragma once

#include <atomic>
#include <boost/asio.hpp>
#include <functional>
#include <initializer_list>

namespace loadplus {

/**
 * Waits for termination signals on an io_context. The first signal runs
 * the graceful stop action, every later one runs the force action. The
 * wait is re-armed after each delivery until cancel().
 */
class StopSignalHandler {
public:
  using Action = std::function<void(int signalNumber)>;

  StopSignalHandler(boost::asio::io_context &ioc,
                    std::initializer_list<int> signalNumbers, Action onFirst,
                    Action onRepeat);

  StopSignalHandler(const StopSignalHandler &) = delete;
  StopSignalHandler &operator=(const StopSignalHandler &) = delete;

  void cancel();
  int signalsReceived() const { return received_.load(); }

private:
  void arm();

  boost::asio::signal_set signals_;
  Action onFirst_;
  Action onRepeat_;
  std::atomic<int> received_{0};
};

} // namespace loadplus
