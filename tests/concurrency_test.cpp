#include <coedit-cpp/engine.hpp>

#include "recording_transport.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace coedit_cpp;
using test_support::RecordingTransport;
using test_support::make_user;

TEST(Concurrency, parallel_edits_get_unique_contiguous_versions) {
    constexpr auto writers = 8;
    constexpr auto edits_per_writer = 50;

    auto engine = CollaborationEngine{std::make_shared<SequentialIdGenerator>(),
                                      EngineOptions{.delivery_threads = 2}};
    const auto session = engine.create_session("doc", make_user("w0"));
    for (int w = 1; w < writers; ++w) {
        ASSERT_TRUE(engine.join_session(session.id, make_user("w" + std::to_string(w))).has_value());
    }

    auto versions_mutex = std::mutex{};
    auto versions = std::vector<std::uint64_t>{};
    auto threads = std::vector<std::thread>{};
    for (int w = 0; w < writers; ++w) {
        threads.emplace_back([&, w] {
            const auto author = "w" + std::to_string(w);
            for (int i = 0; i < edits_per_writer; ++i) {
                auto applied = engine.apply_edit(session.id, make_insert(0, "x", author));
                if (!applied) continue;
                auto lock = std::scoped_lock{versions_mutex};
                versions.push_back(applied->version);
            }
        });
    }
    for (auto& t : threads) t.join();

    constexpr auto total = static_cast<std::size_t>(writers * edits_per_writer);
    ASSERT_EQ(versions.size(), total);
    std::ranges::sort(versions);
    for (std::size_t i = 0; i < total; ++i) {
        EXPECT_EQ(versions[i], i + 1);
    }

    const auto doc = engine.get_document(session.id);
    EXPECT_EQ(doc->version, total);
    EXPECT_EQ(doc->content.size(), total);
}

TEST(Concurrency, every_member_sees_every_edit_in_version_order) {
    auto engine = CollaborationEngine{std::make_shared<SequentialIdGenerator>(),
                                      EngineOptions{.outbound_queue_capacity = 4096,
                                                    .delivery_threads = 4}};
    auto observer = std::make_shared<RecordingTransport>();
    engine.connect("observer", observer);

    const auto session = engine.create_session("doc", make_user("observer"));
    ASSERT_TRUE(engine.join_session(session.id, make_user("a")).has_value());
    ASSERT_TRUE(engine.join_session(session.id, make_user("b")).has_value());

    auto run = [&](const UserId& author) {
        for (int i = 0; i < 100; ++i) {
            EXPECT_TRUE(engine.apply_edit(session.id, make_insert(0, "y", author)).has_value());
        }
    };
    auto ta = std::thread{run, UserId{"a"}};
    auto tb = std::thread{run, UserId{"b"}};
    ta.join();
    tb.join();
    engine.flush();

    const auto edits = observer->events_of(EventType::edit_applied);
    ASSERT_EQ(edits.size(), 200u);
    for (std::size_t i = 0; i < edits.size(); ++i) {
        EXPECT_EQ(std::get<Edit>(edits[i].payload).version, i + 1);
    }
}

TEST(Concurrency, independent_sessions_progress_in_parallel) {
    constexpr auto sessions = 6;

    auto engine = CollaborationEngine{std::make_shared<SequentialIdGenerator>(),
                                      EngineOptions{.delivery_threads = 2}};
    auto ids = std::vector<SessionId>{};
    for (int s = 0; s < sessions; ++s) {
        ids.push_back(engine.create_session("doc", make_user("owner")).id);
    }

    auto threads = std::vector<std::thread>{};
    for (const auto& id : ids) {
        threads.emplace_back([&engine, id] {
            for (int i = 0; i < 100; ++i) {
                EXPECT_TRUE(engine.apply_edit(id, make_insert(0, "z", "owner")).has_value());
            }
        });
    }
    for (auto& t : threads) t.join();

    for (const auto& id : ids) {
        EXPECT_EQ(engine.get_document(id)->version, 100u);
    }
    EXPECT_EQ(engine.get_user_sessions("owner").size(), static_cast<std::size_t>(sessions));
}

TEST(Concurrency, joins_and_leaves_race_with_edits) {
    auto engine = CollaborationEngine{std::make_shared<SequentialIdGenerator>(),
                                      EngineOptions{.delivery_threads = 2}};
    const auto session = engine.create_session("doc", make_user("owner"));

    auto churn = std::thread{[&] {
        for (int i = 0; i < 200; ++i) {
            const auto id = "guest" + std::to_string(i % 5);
            if (engine.join_session(session.id, make_user(id)).has_value()) {
                engine.leave_session(session.id, id);
            }
        }
    }};
    auto writer = std::thread{[&] {
        for (int i = 0; i < 200; ++i) {
            EXPECT_TRUE(engine.apply_edit(session.id, make_insert(0, "q", "owner")).has_value());
        }
    }};
    churn.join();
    writer.join();

    const auto snapshot = engine.get_session(session.id);
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->members.size(), 1u);
    EXPECT_EQ(engine.get_document(session.id)->version, 200u);
}
