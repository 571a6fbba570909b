#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace beacon::crypto {

enum class DigestAlgorithm { MD5, SHA256 };

// Streaming message digest backed by OpenSSL EVP
class Hasher {
public:
    explicit Hasher(DigestAlgorithm algorithm = DigestAlgorithm::SHA256);
    ~Hasher();

    // Disable copy, enable move
    Hasher(const Hasher&) = delete;
    Hasher& operator=(const Hasher&) = delete;
    Hasher(Hasher&&) noexcept;
    Hasher& operator=(Hasher&&) noexcept;

    void init();
    void update(std::span<const std::byte> data);
    void update(std::string_view text);

    // Lower-case hex digest; the hasher is re-initialised afterwards
    std::string finalize();

    DigestAlgorithm algorithm() const noexcept { return algorithm_; }

    // Static utility for one-shot hashing
    static std::string hex(DigestAlgorithm algorithm, std::string_view text);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
    DigestAlgorithm algorithm_;
};

} // namespace beacon::crypto
