#include "av/events/components.hpp"
#include "av/events/event_bus.hpp"
#include "av/events/events.hpp"

#include <gtest/gtest.h>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <sstream>
#include <string>

using av::Error;
using av::ErrorCode;
using av::events::EventBus;
using av::events::EventDebouncedEvent;
using av::events::FilePromotedEvent;
using av::events::FileVersionedEvent;
using av::events::LoggerComponent;
using av::events::MetricsComponent;
using av::events::PromotionFailedEvent;

TEST(MetricsComponentTest, CountsVersioningOutcomes) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(FileVersionedEvent{"/dl", "invoice.pdf", "invoice_v2024-05-01.pdf"});
    bus.emit(FilePromotedEvent{"/dl", "invoice (1).pdf", "invoice.pdf", true});
    bus.emit(FilePromotedEvent{"/dl", "report (1).pdf", "report.pdf", false});
    bus.emit(PromotionFailedEvent{"/dl/x (1).pdf", "x.pdf", Error(ErrorCode::Io, "denied")});
    bus.emit(EventDebouncedEvent{"/dl/invoice (1).pdf"});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.files_versioned.load(), 1u);
    EXPECT_EQ(stats.files_promoted.load(), 2u);
    EXPECT_EQ(stats.promotions_failed.load(), 1u);
    EXPECT_EQ(stats.events_debounced.load(), 1u);
}

TEST(MetricsComponentTest, UnsubscribesOnDestruction) {
    EventBus bus;
    {
        MetricsComponent metrics(bus);
        EXPECT_EQ(bus.subscriber_count<FilePromotedEvent>(), 1u);
    }
    EXPECT_EQ(bus.subscriber_count<FilePromotedEvent>(), 0u);
    EXPECT_NO_THROW(bus.emit(FilePromotedEvent{"/dl", "a (1).txt", "a.txt", false}));
}

class LoggerComponentTest : public ::testing::Test {
protected:
    void SetUp() override {
        previous_ = spdlog::default_logger();
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(output_);
        sink->set_pattern("%v");
        auto logger = std::make_shared<spdlog::logger>("test", sink);
        logger->set_level(spdlog::level::trace);
        spdlog::set_default_logger(logger);
    }

    void TearDown() override {
        spdlog::set_default_logger(previous_);
    }

    std::ostringstream output_;
    std::shared_ptr<spdlog::logger> previous_;
};

TEST_F(LoggerComponentTest, WritesOperatorLogLines) {
    EventBus bus;
    LoggerComponent logger(bus);

    bus.emit(FileVersionedEvent{"/dl", "invoice.pdf", "invoice_v2024-05-01.pdf"});
    bus.emit(FilePromotedEvent{"/dl", "invoice (1).pdf", "invoice.pdf", true});

    const auto text = output_.str();
    EXPECT_NE(text.find("Versioned: invoice.pdf → invoice_v2024-05-01.pdf"), std::string::npos) << text;
    EXPECT_NE(text.find("Updated: invoice (1).pdf → invoice.pdf"), std::string::npos) << text;
}

TEST_F(LoggerComponentTest, ReportsFailuresWithPath) {
    EventBus bus;
    LoggerComponent logger(bus);

    bus.emit(PromotionFailedEvent{"/dl/invoice (1).pdf", "invoice.pdf",
                                  Error(ErrorCode::Io, "Failed to promote", "/dl/invoice (1).pdf")});

    const auto text = output_.str();
    EXPECT_NE(text.find("/dl/invoice (1).pdf"), std::string::npos) << text;
    EXPECT_NE(text.find("[io]"), std::string::npos) << text;
}
