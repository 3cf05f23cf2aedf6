// coedit-cpp benchmarks: throughput of transform, edit application and fan-out.

#include <coedit-cpp/coedit.hpp>
#include <coedit-cpp/json.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

using namespace coedit_cpp;

static auto make_user(const std::string& id) -> User {
    return User{.id = id, .display_name = id, .email = id + "@example.com"};
}

static auto make_engine(unsigned int delivery_threads = 0) -> std::unique_ptr<CollaborationEngine> {
    return std::make_unique<CollaborationEngine>(
        std::make_shared<SequentialIdGenerator>(),
        EngineOptions{.delivery_threads = delivery_threads, .log_level = "error"});
}

// =============================================================================
// Transform
// =============================================================================

static void bm_transform_insert_insert(benchmark::State& state) {
    const auto incoming = make_insert(40, "abc", "a");
    const auto applied = make_insert(10, "xyz", "b");
    for (auto _ : state) {
        benchmark::DoNotOptimize(transform(incoming, applied));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_transform_insert_insert);

static void bm_transform_against_log(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto log = std::vector<Edit>{};
    log.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        log.push_back(i % 3 == 0 ? make_delete(i, 2, "b") : make_insert(i, "xy", "b"));
    }
    const auto incoming = make_replace(n / 2, 4, "q", "a");
    for (auto _ : state) {
        benchmark::DoNotOptimize(transform_against(incoming, log));
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_transform_against_log)->Range(8, 100);

// =============================================================================
// Engine
// =============================================================================

static void bm_apply_edit_single_author(benchmark::State& state) {
    auto engine = make_engine();
    const auto session = engine->create_session("doc", make_user("a"));
    std::uint64_t base = 1;
    for (auto _ : state) {
        auto applied = engine->apply_edit(session.id, make_insert(0, "x", "a", base));
        base = applied->version + 1;
        benchmark::DoNotOptimize(applied);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_apply_edit_single_author);

// Every edit is concurrent with the whole retained log.
static void bm_apply_edit_stale_base(benchmark::State& state) {
    auto engine = make_engine();
    const auto session = engine->create_session("doc", make_user("a"));
    for (auto _ : state) {
        benchmark::DoNotOptimize(engine->apply_edit(session.id, make_insert(0, "x", "a", 0)));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_apply_edit_stale_base);

static void bm_apply_edit_fan_out(benchmark::State& state) {
    const auto members = static_cast<int>(state.range(0));
    auto engine = make_engine(2);
    const auto session = engine->create_session("doc", make_user("m0"));
    auto sink = std::make_shared<CallbackTransport>(
        [](const UserId&, const SessionEvent& e) { benchmark::DoNotOptimize(e); });
    engine->connect("m0", sink);
    for (int i = 1; i < members; ++i) {
        const auto id = "m" + std::to_string(i);
        engine->connect(id, sink);
        (void)engine->join_session(session.id, make_user(id));
    }
    engine->flush();

    std::uint64_t base = 1;
    for (auto _ : state) {
        auto applied = engine->apply_edit(session.id, make_insert(0, "x", "m0", base));
        base = applied->version + 1;
    }
    engine->flush();
    state.SetItemsProcessed(state.iterations() * (members - 1));
}
BENCHMARK(bm_apply_edit_fan_out)->Arg(2)->Arg(10)->Arg(50);

static void bm_cursor_update(benchmark::State& state) {
    auto engine = make_engine();
    const auto session = engine->create_session("doc", make_user("a"));
    (void)engine->join_session(session.id, make_user("b"));
    std::int64_t x = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(engine->update_cursor(session.id, "a", CursorPosition{x++, 0}));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_cursor_update);

// =============================================================================
// Wire protocol
// =============================================================================

static void bm_decode_edit_frame(benchmark::State& state) {
    const auto frame = std::string{
        R"({"type":"edit","sessionId":"s1",)"
        R"("edit":{"operation":"insert","position":12,"content":"hello","version":7}})"};
    for (auto _ : state) {
        benchmark::DoNotOptimize(decode_client_message(frame));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_decode_edit_frame);

static void bm_encode_edit_event(benchmark::State& state) {
    auto edit = make_insert(12, "hello", "u1", 7);
    edit.id = "e1";
    edit.version = 8;
    const auto event = SessionEvent{
        .type = EventType::edit_applied,
        .author_id = "u1",
        .session_id = "s1",
        .payload = edit,
    };
    for (auto _ : state) {
        benchmark::DoNotOptimize(encode_event(event));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_encode_edit_event);
