#include "xxhash_digest.hpp"
#include <charconv>
#include <new>
#include <fmt/core.h>

namespace coldsend::infra {

Xxh64Digest::Xxh64Digest()
    : state_(XXH64_createState())
{
    if (!state_) {
        throw std::bad_alloc();
    }
    XXH64_reset(state_, 0); // seed = 0
}

Xxh64Digest::~Xxh64Digest() {
    if (state_) {
        XXH64_freeState(state_);
    }
}

Xxh64Digest::Xxh64Digest(Xxh64Digest&& other) noexcept
    : state_(other.state_)
{
    other.state_ = nullptr;
}

Xxh64Digest& Xxh64Digest::operator=(Xxh64Digest&& other) noexcept {
    if (this != &other) {
        if (state_) {
            XXH64_freeState(state_);
        }
        state_ = other.state_;
        other.state_ = nullptr;
    }
    return *this;
}

void Xxh64Digest::reset() {
    XXH64_reset(state_, 0);
}

void Xxh64Digest::update(const char* data, std::size_t len) {
    XXH64_update(state_, data, len);
}

auto Xxh64Digest::digest() const -> std::uint64_t {
    return XXH64_digest(state_);
}

auto Xxh64Digest::of(std::string_view data) -> std::uint64_t {
    return XXH64(data.data(), data.size(), 0);
}

auto digest_to_hex(std::uint64_t digest) -> std::string {
    return fmt::format("{:016x}", digest);
}

auto digest_from_hex(std::string_view hex) -> std::optional<std::uint64_t> {
    if (hex.size() != 16) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), value, 16);
    if (ec != std::errc{} || ptr != hex.data() + hex.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace coldsend::infra
