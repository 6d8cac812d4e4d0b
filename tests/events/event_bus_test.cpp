#include <gtest/gtest.h>
#include "av/events/event_bus.hpp"
#include "av/events/events.hpp"

#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace av::events;

TEST(EventBus, DeliversPromotionToSubscriber) {
    EventBus bus;

    std::string seen;
    bus.subscribe<FilePromotedEvent>([&](const FilePromotedEvent& e) {
        seen = e.incoming_filename + " -> " + e.base_filename;
    });

    bus.emit(FilePromotedEvent{"/dl", "invoice (1).pdf", "invoice.pdf", true});

    EXPECT_EQ(seen, "invoice (1).pdf -> invoice.pdf");
}

TEST(EventBus, RoutesByEventType) {
    EventBus bus;

    int versioned = 0;
    int promoted = 0;
    bus.subscribe<FileVersionedEvent>([&](const FileVersionedEvent&) { versioned++; });
    bus.subscribe<FilePromotedEvent>([&](const FilePromotedEvent&) { promoted++; });

    bus.emit(FileVersionedEvent{"/dl", "invoice.pdf", "invoice_v2024-05-01.pdf"});
    bus.emit(FilePromotedEvent{"/dl", "invoice (1).pdf", "invoice.pdf", true});
    bus.emit(FilePromotedEvent{"/dl", "report (1).pdf", "report.pdf", false});

    EXPECT_EQ(versioned, 1);
    EXPECT_EQ(promoted, 2);
}

TEST(EventBus, UnsubscribeStopsDelivery) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<EventDebouncedEvent>([&](const EventDebouncedEvent&) { count++; });

    bus.emit(EventDebouncedEvent{"/dl/a.pdf"});
    bus.unsubscribe<EventDebouncedEvent>(id);
    bus.emit(EventDebouncedEvent{"/dl/a.pdf"});

    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus.subscriber_count<EventDebouncedEvent>(), 0u);
}

TEST(EventBus, EmitWithoutSubscribersIsNoop) {
    EventBus bus;
    EXPECT_NO_THROW(bus.emit(WatchStoppedEvent{"test"}));
}

TEST(EventBus, ThrowingHandlerDoesNotBlockOthers) {
    EventBus bus;

    int after = 0;
    bus.subscribe<WatchStartedEvent>([](const WatchStartedEvent&) {
        throw std::runtime_error("boom");
    });
    bus.subscribe<WatchStartedEvent>([&](const WatchStartedEvent&) { after++; });

    EXPECT_NO_THROW(bus.emit(WatchStartedEvent{2}));
    EXPECT_EQ(after, 1);
}

TEST(EventBus, ConcurrentEmit) {
    EventBus bus;
    std::atomic<int> count{0};

    bus.subscribe<EventDebouncedEvent>([&count](const EventDebouncedEvent&) {
        count++;
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 50; ++i) {
        threads.emplace_back([&bus, i]() {
            bus.emit(EventDebouncedEvent{"/dl/file" + std::to_string(i)});
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(count, 50);
}

TEST(EventBus, Clear) {
    EventBus bus;

    bus.subscribe<FileVersionedEvent>([](const FileVersionedEvent&) {});
    bus.subscribe<PromotionFailedEvent>([](const PromotionFailedEvent&) {});
    bus.clear();

    EXPECT_EQ(bus.subscriber_count<FileVersionedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<PromotionFailedEvent>(), 0u);
}
