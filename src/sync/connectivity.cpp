#include "cloudsync/sync/connectivity.hpp"

#include <boost/asio/dispatch.hpp>
#include <spdlog/spdlog.h>

namespace cloudsync::sync {

ConnectivityMonitor::ConnectivityMonitor(asio::io_context& io_context,
                                         std::string host,
                                         std::chrono::milliseconds interval,
                                         TransitionHandler on_transition,
                                         std::shared_ptr<spdlog::logger> logger)
    : strand_(asio::make_strand(io_context)),
      resolver_(strand_),
      timer_(strand_),
      host_(std::move(host)),
      interval_(interval),
      on_transition_(std::move(on_transition)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

void ConnectivityMonitor::start() {
    asio::dispatch(strand_, [this]() {
        if (!stopped_) {
            return;
        }
        stopped_ = false;
        probe();
    });
}

void ConnectivityMonitor::stop() {
    asio::dispatch(strand_, [this]() {
        stopped_ = true;
        resolver_.cancel();
        timer_.cancel();
    });
}

bool ConnectivityMonitor::report(bool reachable) {
    bool previous = online_.exchange(reachable);
    if (previous == reachable) {
        return false;
    }
    logger_->info("Connectivity changed: {}", reachable ? "online" : "offline");
    if (on_transition_) {
        on_transition_(reachable);
    }
    return true;
}

void ConnectivityMonitor::probe() {
    resolver_.async_resolve(host_, "443",
        [this](boost::system::error_code ec, asio::ip::tcp::resolver::results_type results) {
            if (ec == asio::error::operation_aborted || stopped_) {
                return;
            }
            if (ec) {
                logger_->warn("Connectivity probe for {} failed: {}", host_, ec.message());
            } else {
                logger_->debug("Connectivity probe for {} resolved {} endpoints", host_, results.size());
            }
            report(!ec && !results.empty());
            arm();
        });
}

void ConnectivityMonitor::arm() {
    timer_.expires_after(interval_);
    timer_.async_wait([this](boost::system::error_code ec) {
        if (ec || stopped_) {
            return;
        }
        probe();
    });
}

} // namespace cloudsync::sync
