#include "cloudsync/events/components.hpp"

#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>

#include <sstream>

using namespace cloudsync::events;
using cloudsync::jobs::ActivityEntry;
using cloudsync::jobs::ActivityType;

namespace {

std::shared_ptr<spdlog::logger> capture_logger(std::ostringstream& out) {
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto logger = std::make_shared<spdlog::logger>("capture", sink);
    logger->set_pattern("%l %v");
    logger->set_level(spdlog::level::info);
    return logger;
}

ActivityEntry entry(ActivityType type, const std::string& message) {
    ActivityEntry e;
    e.type = type;
    e.job_id = "1";
    e.job_name = "Photos";
    e.message = message;
    return e;
}

} // namespace

TEST(LoggerComponentTest, MirrorsActivityAtMatchingLevel) {
    std::ostringstream out;
    EventBus bus;
    LoggerComponent component(bus, capture_logger(out));

    bus.emit(ActivityLoggedEvent{entry(ActivityType::Error, "Sync failed: boom")});
    bus.emit(ActivityLoggedEvent{entry(ActivityType::Warning, "Job \"Photos\" stopped by user")});
    bus.emit(ActivityLoggedEvent{entry(ActivityType::Progress, "Syncing: a.jpg")});

    auto text = out.str();
    EXPECT_NE(text.find("error [Photos] Sync failed: boom"), std::string::npos);
    EXPECT_NE(text.find("warning [Photos] Job \"Photos\" stopped by user"), std::string::npos);
    EXPECT_EQ(text.find("Syncing: a.jpg"), std::string::npos);
}

TEST(LoggerComponentTest, UnsubscribesOnDestruction) {
    EventBus bus;
    std::ostringstream out;
    {
        LoggerComponent component(bus, capture_logger(out));
        EXPECT_EQ(bus.subscriber_count<ActivityLoggedEvent>(), 1u);
        bus.emit(ConnectivityChangedEvent{false});
    }
    EXPECT_EQ(bus.subscriber_count<ActivityLoggedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<ConnectivityChangedEvent>(), 0u);
    EXPECT_NE(out.str().find("[Connectivity] offline"), std::string::npos);
}
