#include "assetcat/hasher.h"
#include "assetcat/errors.h"

#include <openssl/evp.h>

#include <algorithm>
#include <format>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

namespace assetcat::hasher {

// ---------------------------------------------------------------------------
// EVP digest wrapper
// ---------------------------------------------------------------------------

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

class Digest {
public:
    explicit Digest(const EVP_MD* md) : ctx_(EVP_MD_CTX_new()) {
        if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), md, nullptr) != 1)
            throw std::runtime_error("hasher: EVP_DigestInit_ex failed");
    }

    void update(const void* data, size_t size) {
        if (size == 0) return;
        if (EVP_DigestUpdate(ctx_.get(), data, size) != 1)
            throw std::runtime_error("hasher: EVP_DigestUpdate failed");
    }

    std::string hex() {
        unsigned char md[EVP_MAX_MD_SIZE];
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), md, &len) != 1)
            throw std::runtime_error("hasher: EVP_DigestFinal_ex failed");
        static constexpr char digits[] = "0123456789abcdef";
        std::string out;
        out.reserve(len * 2);
        for (unsigned int i = 0; i < len; ++i) {
            out += digits[md[i] >> 4];
            out += digits[md[i] & 0x0f];
        }
        return out;
    }

private:
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx_;
};

} // namespace

// ---------------------------------------------------------------------------
// Partial hash
// ---------------------------------------------------------------------------

std::string partial_hash(const fs::path& file) {
    std::error_code ec;
    auto size = fs::file_size(file, ec);
    if (ec)
        throw IOError(std::format("{}: {}", file.string(), ec.message()));

    std::ifstream f(file, std::ios::binary);
    if (!f)
        throw IOError(std::format("{}: cannot open for reading", file.string()));

    Digest d(EVP_md5());
    std::vector<char> buf(chunk_size);

    auto read_into = [&](size_t n) {
        if (n == 0) return;
        if (!f.read(buf.data(), static_cast<std::streamsize>(n)))
            throw IOError(std::format("{}: short read", file.string()));
        d.update(buf.data(), n);
    };

    read_into(std::min<uint64_t>(size, chunk_size));
    if (size > chunk_size * 2) {
        f.seekg(-static_cast<std::streamoff>(chunk_size), std::ios::end);
        if (!f)
            throw IOError(std::format("{}: seek failed", file.string()));
        read_into(chunk_size);
    } else if (size > chunk_size) {
        read_into(static_cast<size_t>(size - chunk_size));
    }

    std::string size_str = std::to_string(size);
    d.update(size_str.data(), size_str.size());
    return d.hex();
}

std::string partial_hash(std::span<const uint8_t> data) {
    Digest d(EVP_md5());
    const size_t size = data.size();
    d.update(data.data(), std::min(size, chunk_size));
    if (size > chunk_size * 2)
        d.update(data.data() + size - chunk_size, chunk_size);
    else if (size > chunk_size)
        d.update(data.data() + chunk_size, size - chunk_size);

    std::string size_str = std::to_string(size);
    d.update(size_str.data(), size_str.size());
    return d.hex();
}

// Sampled ranges are [0, min(size, chunk)) and, past the first chunk,
// [max(chunk, size - chunk), size). Both are visited in stream order.
struct PartialHasher::Impl {
    Digest digest{EVP_md5()};
    uint64_t size = 0;
    uint64_t fed = 0;
    uint64_t tail_from = 0;
};

PartialHasher::PartialHasher(uint64_t size) : impl_(std::make_unique<Impl>()) {
    impl_->size = size;
    impl_->tail_from = size > chunk_size ? std::max<uint64_t>(chunk_size, size - chunk_size)
                                         : size;
}

PartialHasher::~PartialHasher() = default;

void PartialHasher::update(const void* data, size_t n) {
    auto& s = *impl_;
    const auto* p = static_cast<const uint8_t*>(data);
    const uint64_t begin = s.fed;
    const uint64_t end = begin + n;
    s.fed = end;

    auto take = [&](uint64_t from, uint64_t to) {
        from = std::max(from, begin);
        to = std::min(to, end);
        if (from < to) s.digest.update(p + (from - begin), static_cast<size_t>(to - from));
    };
    take(0, std::min<uint64_t>(s.size, chunk_size));
    take(s.tail_from, s.size);
}

std::string PartialHasher::finish() {
    if (impl_->fed != impl_->size)
        throw IOError(std::format("hasher: fed {} bytes, expected {}", impl_->fed, impl_->size));
    std::string size_str = std::to_string(impl_->size);
    impl_->digest.update(size_str.data(), size_str.size());
    return impl_->digest.hex();
}

// ---------------------------------------------------------------------------
// Full hash
// ---------------------------------------------------------------------------

std::string full_hash(const fs::path& file) {
    std::ifstream f(file, std::ios::binary);
    if (!f)
        throw IOError(std::format("{}: cannot open for reading", file.string()));

    Digest d(EVP_sha256());
    constexpr size_t buf_size = 1 << 16;
    std::vector<char> buf(buf_size);
    while (f) {
        f.read(buf.data(), static_cast<std::streamsize>(buf_size));
        auto got = f.gcount();
        if (got > 0) d.update(buf.data(), static_cast<size_t>(got));
    }
    if (f.bad())
        throw IOError(std::format("{}: read failed", file.string()));
    return d.hex();
}

std::string full_hash(std::span<const uint8_t> data) {
    Digest d(EVP_sha256());
    d.update(data.data(), data.size());
    return d.hex();
}

struct FullHasher::Impl {
    Digest digest{EVP_sha256()};
};

FullHasher::FullHasher() : impl_(std::make_unique<Impl>()) {}
FullHasher::~FullHasher() = default;

void FullHasher::update(const void* data, size_t n) { impl_->digest.update(data, n); }

std::string FullHasher::finish() { return impl_->digest.hex(); }

} // namespace assetcat::hasher
