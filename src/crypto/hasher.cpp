#include <beacon/crypto/hasher.h>

#include <openssl/evp.h>
#include <spdlog/fmt/fmt.h>

#include <array>
#include <stdexcept>

namespace beacon::crypto {

namespace {
const EVP_MD* digestFor(DigestAlgorithm algorithm) {
    switch (algorithm) {
        case DigestAlgorithm::MD5:
            return EVP_md5();
        case DigestAlgorithm::SHA256:
            return EVP_sha256();
    }
    return EVP_sha256();
}
} // namespace

struct Hasher::Impl {
    EVP_MD_CTX* ctx = nullptr;

    Impl() : ctx(EVP_MD_CTX_new()) {
        if (!ctx) {
            throw std::runtime_error("Failed to create EVP_MD_CTX");
        }
    }

    ~Impl() {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;
};

Hasher::Hasher(DigestAlgorithm algorithm)
    : pImpl(std::make_unique<Impl>()), algorithm_(algorithm) {
    init();
}

Hasher::~Hasher() = default;

Hasher::Hasher(Hasher&&) noexcept = default;
Hasher& Hasher::operator=(Hasher&&) noexcept = default;

void Hasher::init() {
    if (EVP_DigestInit_ex(pImpl->ctx, digestFor(algorithm_), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize digest");
    }
}

void Hasher::update(std::span<const std::byte> data) {
    if (EVP_DigestUpdate(pImpl->ctx, data.data(), data.size()) != 1) {
        throw std::runtime_error("Failed to update digest");
    }
}

void Hasher::update(std::string_view text) {
    update(std::as_bytes(std::span<const char>(text.data(), text.size())));
}

std::string Hasher::finalize() {
    std::array<unsigned char, EVP_MAX_MD_SIZE> hash{};
    unsigned int hashLen = 0;

    if (EVP_DigestFinal_ex(pImpl->ctx, hash.data(), &hashLen) != 1) {
        throw std::runtime_error("Failed to finalize digest");
    }

    std::string result;
    result.reserve(hashLen * 2);
    for (unsigned int i = 0; i < hashLen; ++i) {
        result += fmt::format("{:02x}", hash[i]);
    }

    init();
    return result;
}

std::string Hasher::hex(DigestAlgorithm algorithm, std::string_view text) {
    Hasher hasher(algorithm);
    hasher.update(text);
    return hasher.finalize();
}

} // namespace beacon::crypto
