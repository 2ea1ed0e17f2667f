#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>

namespace assetcat::hasher {

// Bytes sampled from each end of a file for the partial fingerprint.
inline constexpr size_t chunk_size = 64 * 1024;

// partial_hash returns hex MD5(first 64 KiB + last 64 KiB + decimal size).
// Files between 64 and 128 KiB contribute their remainder after the head once.
// Reads at most 128 KiB. Throws IOError when the file cannot be read.
std::string partial_hash(const std::filesystem::path& file);

// partial_hash over an in-memory buffer; identical to the file form for equal content.
std::string partial_hash(std::span<const uint8_t> data);

// full_hash returns hex SHA-256 of the whole file. Throws IOError on read failure.
std::string full_hash(const std::filesystem::path& file);

std::string full_hash(std::span<const uint8_t> data);

// PartialHasher computes partial_hash over content that can only be read front
// to back, such as an inflating archive member. Only the sampled ranges reach
// the digest, so memory use does not depend on size. finish throws IOError when
// the bytes fed differ from the declared size.
class PartialHasher {
public:
    explicit PartialHasher(uint64_t size);
    ~PartialHasher();

    PartialHasher(const PartialHasher&) = delete;
    PartialHasher& operator=(const PartialHasher&) = delete;

    void update(const void* data, size_t n);
    std::string finish();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// FullHasher is the incremental form of full_hash.
class FullHasher {
public:
    FullHasher();
    ~FullHasher();

    FullHasher(const FullHasher&) = delete;
    FullHasher& operator=(const FullHasher&) = delete;

    void update(const void* data, size_t n);
    std::string finish();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace assetcat::hasher
