#include "s3xfer/store/content_hasher.hpp"
#include "s3xfer/store/store_error.hpp"
#include "s3xfer/core/logger.hpp"
#include <sodium.h>
#include <array>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace s3xfer::store {

namespace {

void ensure_sodium() {
    static std::once_flag once;
    static bool ready = false;
    std::call_once(once, []() {
        ready = sodium_init() >= 0;
        if (!ready) {
            LOG_CRITICAL("Failed to initialize libsodium");
        }
    });
    if (!ready) {
        throw StoreError::from_backend("InternalError", "", "libsodium initialization failed");
    }
}

} // namespace

struct ContentHasher::Impl {
    crypto_generichash_state state;
};

ContentHasher::ContentHasher()
    : impl_(std::make_unique<Impl>())
    , finalized_(false) {
    ensure_sodium();
    if (crypto_generichash_init(&impl_->state, nullptr, 0, DIGEST_SIZE) != 0) {
        throw StoreError::from_backend("InternalError", "", "Failed to initialize content hasher");
    }
}

ContentHasher::~ContentHasher() = default;

void ContentHasher::update(std::span<const std::uint8_t> data) {
    if (finalized_) {
        throw std::logic_error("Content hasher already finalized");
    }
    if (crypto_generichash_update(&impl_->state, data.data(), data.size()) != 0) {
        throw StoreError::from_backend("InternalError", "", "Failed to update content hash");
    }
}

void ContentHasher::update(const std::string& text) {
    update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

std::string ContentHasher::finalize_hex() {
    if (finalized_) {
        throw std::logic_error("Content hasher already finalized");
    }
    
    std::array<std::uint8_t, DIGEST_SIZE> digest{};
    if (crypto_generichash_final(&impl_->state, digest.data(), digest.size()) != 0) {
        throw StoreError::from_backend("InternalError", "", "Failed to finalize content hash");
    }
    finalized_ = true;
    
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : digest) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

std::string ContentHasher::hex_digest(std::span<const std::uint8_t> data) {
    ContentHasher hasher;
    hasher.update(data);
    return hasher.finalize_hex();
}

} // namespace s3xfer::store
