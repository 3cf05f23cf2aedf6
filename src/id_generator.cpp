#include <coedit-cpp/transport.hpp>

#include <uuid/uuid.h>

#include <array>

namespace coedit_cpp {

auto UuidGenerator::next_id() -> std::string {
    uuid_t raw;
    uuid_generate_random(raw);
    // 36 characters plus the terminating NUL
    auto text = std::array<char, 37>{};
    uuid_unparse_lower(raw, text.data());
    return std::string{text.data()};
}

auto SequentialIdGenerator::next_id() -> std::string {
    auto n = counter_.fetch_add(1, std::memory_order_relaxed) + 1;
    return prefix_ + std::to_string(n);
}

}  // namespace coedit_cpp
