#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <xxhash.h>
#include "../error_handler/error.hpp"

namespace coldsend::infra {

// Incremental XXH64 over a chunk body. Move-only, owns its XXH64 state.
class Xxh64Digest {
public:
    Xxh64Digest();
    ~Xxh64Digest();

    Xxh64Digest(const Xxh64Digest&) = delete;
    Xxh64Digest& operator=(const Xxh64Digest&) = delete;
    Xxh64Digest(Xxh64Digest&& other) noexcept;
    Xxh64Digest& operator=(Xxh64Digest&& other) noexcept;

    void reset();
    void update(const char* data, std::size_t len);
    [[nodiscard]] auto digest() const -> std::uint64_t;

    [[nodiscard]] static auto of(std::string_view data) -> std::uint64_t;

private:
    XXH64_state_t* state_ = nullptr;
};

// Fixed width lowercase hex, as stored in the state file and object metadata
[[nodiscard]] auto digest_to_hex(std::uint64_t digest) -> std::string;
[[nodiscard]] auto digest_from_hex(std::string_view hex) -> std::optional<std::uint64_t>;

} // namespace coldsend::infra
