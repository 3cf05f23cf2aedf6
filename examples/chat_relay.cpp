// chat_relay: the engine driven purely by JSON frames
//
// Demonstrates: handle_message routing, presence and chat fan-out, error
//               events returned to the sender only, disconnect cleanup,
//               loading options from a file
//
// Build: cmake --build build
// Run:   ./build/chat_relay [options.json]

#include <coedit-cpp/coedit.hpp>
#include <coedit-cpp/json.hpp>

#include <cstdio>
#include <memory>
#include <string>

namespace ce = coedit_cpp;

int main(int argc, char** argv) {
    auto options = ce::EngineOptions{};
    if (argc > 1) {
        auto loaded = ce::load_options(argv[1]);
        if (!loaded) {
            std::fprintf(stderr, "%s\n", loaded.error().message.c_str());
            return 1;
        }
        options = *loaded;
    }

    auto engine = ce::CollaborationEngine{options};
    for (const auto* name : {"ana", "ben", "cy"}) {
        engine.connect(name, std::make_shared<ce::CallbackTransport>(
            [](const ce::UserId& to, const ce::SessionEvent& event) {
                std::printf("[%s] %s\n", to.c_str(), ce::encode_event(event).c_str());
            }));
    }

    const auto session = engine.create_session(
        "design-review", ce::User{.id = "ana", .display_name = "Ana"});
    const auto sid = session.id;

    auto send = [&](const ce::UserId& from, const std::string& frame) {
        if (auto status = engine.handle_message(from, frame); !status) {
            std::printf("(%s rejected: %s)\n", from.c_str(), status.error().message.c_str());
        }
        engine.flush();
    };

    send("ben", R"({"type":"join","sessionId":")" + sid + R"(","user":{"name":"Ben"}})");
    send("cy", R"({"type":"join","sessionId":")" + sid + R"(","user":{"name":"Cy"}})");
    send("ben", R"({"type":"cursor","sessionId":")" + sid + R"(","cursor":{"x":4,"y":1}})");
    send("cy", R"({"type":"chat","sessionId":")" + sid + R"(","message":"looks good"})");

    // Malformed and unauthorized frames only reach their sender
    send("ben", R"({"type":"teleport"})");
    send("ben", R"({"type":"chat","sessionId":"no-such-session","message":"hello?"})");

    std::printf("\ncy disconnects\n");
    engine.disconnect("cy");
    engine.flush();

    for (const auto& member : engine.get_active_members(sid)) {
        std::printf("member %s (%s)\n", member.id.c_str(), member.color.c_str());
    }
    return 0;
}
