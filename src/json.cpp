#include <coedit-cpp/json.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace coedit_cpp {

namespace {

// Positions and lengths must be non-negative integers. nlohmann stores
// parsed non-negative integers as number_unsigned.
auto get_unsigned(const nlohmann::json& j, const char* key) -> std::uint64_t {
    const auto& v = j.at(key);
    if (!v.is_number_unsigned()) {
        throw std::runtime_error{std::string{"expected non-negative integer for \""} + key + "\""};
    }
    return v.get<std::uint64_t>();
}

auto get_unsigned_or(const nlohmann::json& j, const char* key, std::uint64_t fallback)
    -> std::uint64_t {
    if (!j.contains(key) || j.at(key).is_null()) return fallback;
    return get_unsigned(j, key);
}

template <typename T>
void read_optional(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    if (j.contains(key) && !j.at(key).is_null()) {
        out = j.at(key).get<T>();
    } else {
        out.reset();
    }
}

constexpr auto all_error_kinds = std::array{
    ErrorKind::session_not_found, ErrorKind::session_full,
    ErrorKind::guest_not_allowed, ErrorKind::read_only_violation,
    ErrorKind::invalid_message,   ErrorKind::member_not_found,
};

constexpr auto all_event_types = std::array{
    EventType::join,         EventType::leave,        EventType::cursor_moved,
    EventType::selection_changed, EventType::edit_applied, EventType::chat_message,
    EventType::sync,         EventType::error,
};

}  // anonymous namespace

// =============================================================================
// Timestamps
// =============================================================================

auto to_millis(Timestamp t) -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

auto from_millis(std::int64_t millis) -> Timestamp {
    return Timestamp{std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::milliseconds{millis})};
}

// =============================================================================
// Enums
// =============================================================================

void to_json(nlohmann::json& j, EditKind kind) {
    j = std::string{to_string_view(kind)};
}

void from_json(const nlohmann::json& j, EditKind& kind) {
    const auto name = j.get<std::string>();
    if (name == "insert") {
        kind = EditKind::insert;
    } else if (name == "delete") {
        kind = EditKind::del;
    } else if (name == "replace") {
        kind = EditKind::replace;
    } else {
        throw std::runtime_error{"unknown edit operation: " + name};
    }
}

void to_json(nlohmann::json& j, EventType type) {
    j = std::string{to_string_view(type)};
}

void from_json(const nlohmann::json& j, EventType& type) {
    const auto name = j.get<std::string>();
    for (auto candidate : all_event_types) {
        if (to_string_view(candidate) == name) {
            type = candidate;
            return;
        }
    }
    throw std::runtime_error{"unknown event type: " + name};
}

void to_json(nlohmann::json& j, ErrorKind kind) {
    j = std::string{to_string_view(kind)};
}

void from_json(const nlohmann::json& j, ErrorKind& kind) {
    const auto name = j.get<std::string>();
    for (auto candidate : all_error_kinds) {
        if (to_string_view(candidate) == name) {
            kind = candidate;
            return;
        }
    }
    throw std::runtime_error{"unknown error kind: " + name};
}

// =============================================================================
// Participants and sessions
// =============================================================================

void to_json(nlohmann::json& j, const CursorPosition& c) {
    j = nlohmann::json{{"x", c.x}, {"y", c.y}};
}

void from_json(const nlohmann::json& j, CursorPosition& c) {
    c.x = j.at("x").get<std::int64_t>();
    c.y = j.at("y").get<std::int64_t>();
}

void to_json(nlohmann::json& j, const SelectionRange& s) {
    j = nlohmann::json{{"start", s.start}, {"end", s.end}};
}

void from_json(const nlohmann::json& j, SelectionRange& s) {
    s.start = get_unsigned(j, "start");
    s.end = get_unsigned(j, "end");
    if (s.end < s.start) {
        throw std::runtime_error{"selection end precedes start"};
    }
}

void to_json(nlohmann::json& j, const User& u) {
    j = nlohmann::json{
        {"id", u.id},
        {"name", u.display_name},
        {"email", u.email},
        {"color", u.color},
    };
    if (u.avatar) j["avatar"] = *u.avatar;
    if (u.cursor) j["cursor"] = *u.cursor;
    if (u.selection) j["selection"] = *u.selection;
}

void from_json(const nlohmann::json& j, User& u) {
    u.id = j.value("id", std::string{});
    u.display_name = j.value("name", std::string{});
    u.email = j.value("email", std::string{});
    u.color = j.value("color", std::string{});
    read_optional(j, "avatar", u.avatar);
    read_optional(j, "cursor", u.cursor);
    read_optional(j, "selection", u.selection);
}

void to_json(nlohmann::json& j, const SessionSettings& s) {
    j = nlohmann::json{
        {"maxMembers", s.max_members},
        {"allowGuests", s.allow_guests},
        {"readOnly", s.read_only},
        {"authorizedUsers", s.authorized_users},
    };
}

void from_json(const nlohmann::json& j, SessionSettings& s) {
    const auto defaults = SessionSettings{};
    s.max_members =
        std::max<std::uint64_t>(get_unsigned_or(j, "maxMembers", defaults.max_members), 1);
    s.allow_guests = j.value("allowGuests", defaults.allow_guests);
    s.read_only = j.value("readOnly", defaults.read_only);
    s.authorized_users = j.value("authorizedUsers", defaults.authorized_users);
}

void to_json(nlohmann::json& j, const Session& s) {
    auto members = nlohmann::json::array();
    for (const auto& [_, user] : s.members) {
        members.push_back(user);
    }
    j = nlohmann::json{
        {"id", s.id},
        {"documentId", s.document_id},
        {"members", std::move(members)},
        {"owner", s.owner_id},
        {"createdAt", to_millis(s.created_at)},
        {"settings", s.settings},
    };
}

// =============================================================================
// Edits
// =============================================================================

void to_json(nlohmann::json& j, const Edit& e) {
    j = nlohmann::json{
        {"id", e.id},
        {"operation", e.kind},
        {"position", e.position},
        {"userId", e.author_id},
        {"baseVersion", e.base_version},
        {"version", e.version},
    };
    if (e.kind != EditKind::del) j["content"] = e.content;
    if (e.kind != EditKind::insert) j["length"] = e.length;
}

void from_json(const nlohmann::json& j, Edit& e) {
    e.id = j.value("id", std::string{});
    e.kind = j.at("operation").get<EditKind>();
    e.position = get_unsigned(j, "position");
    e.content = j.value("content", std::string{});
    e.length = get_unsigned_or(j, "length", 0);
    e.author_id = j.value("userId", std::string{});
    if (j.contains("baseVersion")) {
        e.base_version = get_unsigned(j, "baseVersion");
        e.version = get_unsigned_or(j, "version", 0);
    } else {
        // "version" is the last version the client has applied; every
        // later version is concurrent with this edit.
        e.base_version = get_unsigned_or(j, "version", 0) + 1;
        e.version = 0;
    }
}

// =============================================================================
// Events
// =============================================================================

void to_json(nlohmann::json& j, const LeaveNotice& n) {
    j = nlohmann::json{{"userId", n.user_id}};
}

void to_json(nlohmann::json& j, const ChatMessage& m) {
    j = nlohmann::json{
        {"id", m.id},
        {"userId", m.author_id},
        {"userName", m.author_name},
        {"message", m.text},
        {"timestamp", to_millis(m.timestamp)},
    };
    if (m.author_avatar) j["userAvatar"] = *m.author_avatar;
}

void to_json(nlohmann::json& j, const SyncRequest& s) {
    j = nlohmann::json{{"version", s.version}, {"content", s.content}};
}

void to_json(nlohmann::json& j, const ErrorNotice& e) {
    j = nlohmann::json{{"kind", e.kind}, {"message", e.message}};
}

void to_json(nlohmann::json& j, const SessionEvent& e) {
    auto data = nlohmann::json{};
    std::visit(overload{
        [&](const User& u) { data = nlohmann::json{{"user", u}}; },
        [&](const LeaveNotice& n) { data = n; },
        [&](const CursorPosition& c) { data = nlohmann::json{{"cursor", c}}; },
        [&](const SelectionRange& s) { data = nlohmann::json{{"selection", s}}; },
        [&](const Edit& edit) { data = edit; },
        [&](const ChatMessage& m) { data = m; },
        [&](const SyncRequest& s) { data = s; },
        [&](const ErrorNotice& n) { data = n; },
    }, e.payload);

    j = nlohmann::json{
        {"type", e.type},
        {"userId", e.author_id},
        {"sessionId", e.session_id},
        {"data", std::move(data)},
        {"timestamp", to_millis(e.timestamp)},
    };
}

// =============================================================================
// Configuration
// =============================================================================

void to_json(nlohmann::json& j, const EngineOptions& o) {
    auto settings = nlohmann::json{
        {"max_members", o.default_settings.max_members},
        {"allow_guests", o.default_settings.allow_guests},
        {"read_only", o.default_settings.read_only},
        {"authorized_users", o.default_settings.authorized_users},
    };
    j = nlohmann::json{
        {"default_settings", std::move(settings)},
        {"log_capacity", o.log_capacity},
        {"log_retain", o.log_retain},
        {"outbound_queue_capacity", o.outbound_queue_capacity},
        {"delivery_threads", o.delivery_threads},
        {"palette", o.palette},
        {"log_level", o.log_level},
    };
}

void from_json(const nlohmann::json& j, EngineOptions& o) {
    const auto defaults = EngineOptions{};
    if (j.contains("default_settings")) {
        const auto& s = j.at("default_settings");
        const auto& d = defaults.default_settings;
        o.default_settings.max_members =
            std::max<std::uint64_t>(get_unsigned_or(s, "max_members", d.max_members), 1);
        o.default_settings.allow_guests = s.value("allow_guests", d.allow_guests);
        o.default_settings.read_only = s.value("read_only", d.read_only);
        o.default_settings.authorized_users = s.value("authorized_users", d.authorized_users);
    } else {
        o.default_settings = defaults.default_settings;
    }
    o.log_capacity = get_unsigned_or(j, "log_capacity", defaults.log_capacity);
    o.log_retain = get_unsigned_or(j, "log_retain", defaults.log_retain);
    o.outbound_queue_capacity =
        get_unsigned_or(j, "outbound_queue_capacity", defaults.outbound_queue_capacity);
    o.delivery_threads = static_cast<unsigned int>(
        get_unsigned_or(j, "delivery_threads", defaults.delivery_threads));
    o.palette = j.value("palette", defaults.palette);
    o.log_level = j.value("log_level", defaults.log_level);
}

auto load_options(const std::filesystem::path& path) -> Result<EngineOptions> {
    auto in = std::ifstream{path};
    if (!in) {
        return fail(ErrorKind::invalid_message, "cannot open options file: " + path.string());
    }
    auto j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return fail(ErrorKind::invalid_message, "options file is not a JSON object: " + path.string());
    }
    try {
        return j.get<EngineOptions>();
    } catch (const nlohmann::json::exception& e) {
        return fail(ErrorKind::invalid_message, std::string{"invalid options: "} + e.what());
    } catch (const std::runtime_error& e) {
        return fail(ErrorKind::invalid_message, std::string{"invalid options: "} + e.what());
    }
}

}  // namespace coedit_cpp
