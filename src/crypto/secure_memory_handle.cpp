#include "witnesschain/crypto/secure_memory_handle.hpp"
#include "witnesschain/crypto/sodium_interop.hpp"

#include <cstring>

namespace witnesschain::vault::crypto {

namespace {
constexpr const char* kReleasedHandle = "Secure memory handle has been released";
}

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::Allocate(size_t size) {
    if (!SodiumInterop::IsInitialized()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed("libsodium is not initialized"));
    }
    if (size == 0) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::AllocationFailed("Cannot allocate zero-sized secure memory"));
    }
    void* ptr = SodiumInterop::AllocateSecure(size);
    if (ptr == nullptr) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::AllocationFailed(
                "Failed to allocate " + std::to_string(size) + " bytes of secure memory"));
    }
    std::memset(ptr, 0, size);
    return Result<SecureMemoryHandle, SodiumFailure>::Ok(SecureMemoryHandle(ptr, size));
}

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::FromBytes(
    std::span<const uint8_t> bytes) {
    auto allocate_result = Allocate(bytes.size());
    if (allocate_result.IsErr()) {
        return allocate_result;
    }
    auto handle = std::move(allocate_result).Unwrap();
    if (auto write_result = handle.Write(bytes); write_result.IsErr()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(write_result.UnwrapErr());
    }
    return Result<SecureMemoryHandle, SodiumFailure>::Ok(std::move(handle));
}

SecureMemoryHandle::~SecureMemoryHandle() {
    Reset();
}

SecureMemoryHandle::SecureMemoryHandle(SecureMemoryHandle&& other) noexcept
    : ptr_(other.ptr_)
    , size_(other.size_) {
    other.ptr_ = nullptr;
    other.size_ = 0;
}

SecureMemoryHandle& SecureMemoryHandle::operator=(SecureMemoryHandle&& other) noexcept {
    if (this != &other) {
        Reset();
        ptr_ = other.ptr_;
        size_ = other.size_;
        other.ptr_ = nullptr;
        other.size_ = 0;
    }
    return *this;
}

void SecureMemoryHandle::Reset() noexcept {
    if (ptr_ != nullptr) {
        SodiumInterop::FreeSecure(ptr_);
        ptr_ = nullptr;
        size_ = 0;
    }
}

Result<Unit, SodiumFailure> SecureMemoryHandle::Write(std::span<const uint8_t> data) {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(kReleasedHandle));
    }
    if (data.size() > size_) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall(
                "Data exceeds secure buffer (data: " + std::to_string(data.size()) +
                ", buffer: " + std::to_string(size_) + ")"));
    }
    if (!data.empty()) {
        std::memcpy(ptr_, data.data(), data.size());
    }
    if (data.size() < size_) {
        std::memset(static_cast<uint8_t*>(ptr_) + data.size(), 0, size_ - data.size());
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SecureMemoryHandle::Read(std::span<uint8_t> output) const {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(kReleasedHandle));
    }
    if (output.size() < size_) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall(
                "Output buffer too small (requested: " + std::to_string(size_) +
                ", provided: " + std::to_string(output.size()) + ")"));
    }
    std::memcpy(output.data(), ptr_, size_);
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, SodiumFailure> SecureMemoryHandle::ReadBytes(size_t size) const {
    if (IsInvalid()) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(kReleasedHandle));
    }
    if (size > size_) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall("Requested size exceeds allocated size"));
    }
    std::vector<uint8_t> result(size);
    if (size > 0) {
        std::memcpy(result.data(), ptr_, size);
    }
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(result));
}

}
