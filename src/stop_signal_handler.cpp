#include "stop_signal_handler.hpp"
#include "logger.hpp"
#include <boost/system/error_code.hpp>

namespace loadplus {

StopSignalHandler::StopSignalHandler(boost::asio::io_context& ioc,
                                     std::initializer_list<int> signalNumbers,
                                     Action onFirst, Action onRepeat)
    : signals_(ioc), onFirst_(std::move(onFirst)), onRepeat_(std::move(onRepeat)) {
    for (int signalNumber : signalNumbers) {
        signals_.add(signalNumber);
    }
    arm();
}

void StopSignalHandler::cancel() {
    boost::system::error_code ec;
    signals_.cancel(ec);
    if (ec) {
        SIGNAL_LOG_WARN("Cancelling signal wait failed: {}", ec.message());
    }
}

void StopSignalHandler::arm() {
    signals_.async_wait([this](const boost::system::error_code& ec, int signalNumber) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        if (ec) {
            SIGNAL_LOG_ERROR("Signal wait failed: {}", ec.message());
            return;
        }

        int count = ++received_;
        arm();

        if (count == 1) {
            SIGNAL_LOG_INFO("Received signal {}, stopping gracefully", signalNumber);
            if (onFirst_) {
                onFirst_(signalNumber);
            }
        } else {
            SIGNAL_LOG_WARN("Received signal {} again ({} total), forcing shutdown",
                            signalNumber, count);
            if (onRepeat_) {
                onRepeat_(signalNumber);
            }
        }
    });
}

} // namespace loadplus
