// Fuzz target for inbound frame decoding and routing: arbitrary bytes are fed
// to the decoder and then to a live engine with one session.

#include <coedit-cpp/engine.hpp>
#include <coedit-cpp/protocol.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto frame = std::string_view{reinterpret_cast<const char*>(data), size};

    auto decoded = coedit_cpp::decode_client_message(frame);
    (void)decoded;

    static auto engine = [] {
        auto e = std::make_unique<coedit_cpp::CollaborationEngine>(
            std::make_shared<coedit_cpp::SequentialIdGenerator>("fz-"),
            coedit_cpp::EngineOptions{.delivery_threads = 0, .log_level = "off"});
        e->connect("fuzzer", std::make_shared<coedit_cpp::CallbackTransport>(
            [](const coedit_cpp::UserId&, const coedit_cpp::SessionEvent&) {}));
        return e;
    }();
    // Keep one live session for frames to target.
    if (engine->session_count() == 0) {
        (void)engine->create_session("doc", coedit_cpp::User{.id = "fuzzer"});
    }

    auto status = engine->handle_message("fuzzer", frame);
    (void)status;

    return 0;
}
