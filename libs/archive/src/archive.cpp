#include "assetcat/archive.h"
#include "assetcat/errors.h"

#include <zlib.h>

#include <algorithm>
#include <array>
#include <bit>
#include <cctype>
#include <cstring>
#include <format>
#include <fstream>
#include <functional>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;

namespace assetcat::archive {

static_assert(std::endian::native == std::endian::little,
              "assetcat archive reader assumes a little-endian platform");

// ---------------------------------------------------------------------------
// Record signatures
// ---------------------------------------------------------------------------

static constexpr uint32_t sig_local_header = 0x04034b50;
static constexpr uint32_t sig_central_header = 0x02014b50;
static constexpr uint32_t sig_eocd = 0x06054b50;
static constexpr uint32_t sig_zip64_eocd = 0x06064b50;
static constexpr uint32_t sig_zip64_locator = 0x07064b50;

static constexpr size_t eocd_size = 22;
static constexpr size_t zip64_locator_size = 20;
static constexpr size_t max_comment = 0xFFFF;

// ---------------------------------------------------------------------------
// Little-endian readers
// ---------------------------------------------------------------------------

static uint16_t read_u16(std::istream& r) {
    uint16_t v;
    if (!r.read(reinterpret_cast<char*>(&v), 2))
        throw IOError("zip: truncated record (u16)");
    return v;
}

static uint32_t read_u32(std::istream& r) {
    uint32_t v;
    if (!r.read(reinterpret_cast<char*>(&v), 4))
        throw IOError("zip: truncated record (u32)");
    return v;
}

static uint64_t read_u64(std::istream& r) {
    uint64_t v;
    if (!r.read(reinterpret_cast<char*>(&v), 8))
        throw IOError("zip: truncated record (u64)");
    return v;
}

static std::string read_string(std::istream& r, size_t n) {
    std::string s(n, '\0');
    if (n > 0 && !r.read(s.data(), static_cast<std::streamsize>(n)))
        throw IOError("zip: truncated string");
    return s;
}

static uint16_t get_u16(const uint8_t* p) {
    uint16_t v;
    std::memcpy(&v, p, 2);
    return v;
}

static uint32_t get_u32(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, 4);
    return v;
}

static uint64_t get_u64(const uint8_t* p) {
    uint64_t v;
    std::memcpy(&v, p, 8);
    return v;
}

static void seek_to(std::istream& r, uint64_t offset, const char* what) {
    r.clear();
    r.seekg(static_cast<std::streamoff>(offset));
    if (!r)
        throw IOError(std::format("zip: cannot seek to {} at {}", what, offset));
}

// ---------------------------------------------------------------------------
// Detection
// ---------------------------------------------------------------------------

static std::string lower_ext(const fs::path& file) {
    std::string ext = file.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

Format detect(const fs::path& file) {
    std::ifstream f(file, std::ios::binary);
    std::array<char, 7> magic{};
    if (f && f.read(magic.data(), magic.size())) {
        if (std::memcmp(magic.data(), "PK\x03\x04", 4) == 0 ||
            std::memcmp(magic.data(), "PK\x05\x06", 4) == 0)
            return Format::Zip;
        if (std::memcmp(magic.data(), "Rar!\x1a\x07", 6) == 0)
            return Format::Rar;
    }
    auto ext = lower_ext(file);
    if (ext == ".zip") return Format::Zip;
    if (ext == ".rar") return Format::Rar;
    return Format::Unknown;
}

// ---------------------------------------------------------------------------
// Central directory
// ---------------------------------------------------------------------------

struct DirectoryLocation {
    uint64_t entries = 0;
    uint64_t size = 0;
    uint64_t offset = 0;
    std::string comment;
};

static DirectoryLocation locate_directory(std::istream& r) {
    r.clear();
    r.seekg(0, std::ios::end);
    auto end_pos = r.tellg();
    if (end_pos == std::istream::pos_type(-1))
        throw IOError("zip: cannot determine archive size");
    const uint64_t file_size = static_cast<uint64_t>(end_pos);
    if (file_size < eocd_size)
        throw IOError("zip: file too small for an end-of-central-directory record");

    const uint64_t tail_size = std::min<uint64_t>(file_size, eocd_size + max_comment);
    const uint64_t tail_start = file_size - tail_size;
    std::vector<uint8_t> tail(static_cast<size_t>(tail_size));
    seek_to(r, tail_start, "archive tail");
    if (!r.read(reinterpret_cast<char*>(tail.data()), static_cast<std::streamsize>(tail.size())))
        throw IOError("zip: cannot read archive tail");

    // Scan backwards; the comment may contain anything, so take the last
    // signature whose comment length reaches exactly to the end.
    size_t pos = tail.size() - eocd_size + 1;
    bool found = false;
    while (pos-- > 0) {
        if (get_u32(&tail[pos]) != sig_eocd) continue;
        uint16_t comment_len = get_u16(&tail[pos + 20]);
        if (pos + eocd_size + comment_len <= tail.size()) {
            found = true;
            break;
        }
    }
    if (!found)
        throw IOError("zip: end-of-central-directory record not found");

    const uint8_t* e = &tail[pos];
    DirectoryLocation loc;
    loc.entries = get_u16(e + 10);
    loc.size = get_u32(e + 12);
    loc.offset = get_u32(e + 16);
    uint16_t comment_len = get_u16(e + 20);
    loc.comment.assign(reinterpret_cast<const char*>(e + eocd_size), comment_len);

    const bool needs_zip64 = loc.entries == 0xFFFF || loc.size == 0xFFFFFFFF ||
                             loc.offset == 0xFFFFFFFF;
    const uint64_t eocd_abs = tail_start + pos;
    if (needs_zip64 && eocd_abs >= zip64_locator_size) {
        seek_to(r, eocd_abs - zip64_locator_size, "zip64 locator");
        if (read_u32(r) == sig_zip64_locator) {
            read_u32(r); // disk with zip64 eocd
            uint64_t zip64_eocd = read_u64(r);
            seek_to(r, zip64_eocd, "zip64 end of central directory");
            if (read_u32(r) != sig_zip64_eocd)
                throw IOError("zip: bad zip64 end-of-central-directory signature");
            read_u64(r); // record size
            read_u16(r); // version made by
            read_u16(r); // version needed
            read_u32(r); // this disk
            read_u32(r); // directory disk
            read_u64(r); // entries on this disk
            loc.entries = read_u64(r);
            loc.size = read_u64(r);
            loc.offset = read_u64(r);
        }
    }

    if (loc.offset + loc.size > file_size)
        throw IOError(std::format("zip: central directory ({} bytes at {}) exceeds file size {}",
                                  loc.size, loc.offset, file_size));
    return loc;
}

// Zip64 extended information replaces saturated 32-bit fields, in order.
static void apply_zip64_extra(const std::string& extra, Member& m,
                              bool size_sat, bool csize_sat, bool offset_sat) {
    size_t pos = 0;
    const auto* p = reinterpret_cast<const uint8_t*>(extra.data());
    while (pos + 4 <= extra.size()) {
        uint16_t id = get_u16(p + pos);
        uint16_t len = get_u16(p + pos + 2);
        size_t body = pos + 4;
        if (body + len > extra.size()) break;
        if (id == 0x0001) {
            size_t q = body;
            auto take = [&](uint64_t& field) {
                if (q + 8 > body + len)
                    throw IOError(std::format("zip: short zip64 extra field for {}", m.name));
                field = get_u64(p + q);
                q += 8;
            };
            if (size_sat) take(m.size);
            if (csize_sat) take(m.compressed_size);
            if (offset_sat) take(m.local_header_offset);
            return;
        }
        pos = body + len;
    }
}

Archive read_zip(std::istream& r) {
    auto loc = locate_directory(r);
    seek_to(r, loc.offset, "central directory");

    Archive a;
    a.comment = std::move(loc.comment);
    a.members.reserve(static_cast<size_t>(std::min<uint64_t>(loc.entries, 1 << 20)));

    for (uint64_t i = 0; i < loc.entries; ++i) {
        if (read_u32(r) != sig_central_header)
            throw IOError(std::format("zip: bad central directory header at entry {}", i));

        Member m;
        read_u16(r); // version made by
        read_u16(r); // version needed
        m.flags = read_u16(r);
        m.method = read_u16(r);
        m.dos_time = read_u16(r);
        m.dos_date = read_u16(r);
        m.crc32 = read_u32(r);
        uint32_t csize = read_u32(r);
        uint32_t usize = read_u32(r);
        uint16_t name_len = read_u16(r);
        uint16_t extra_len = read_u16(r);
        uint16_t comment_len = read_u16(r);
        read_u16(r); // disk number start
        read_u16(r); // internal attributes
        read_u32(r); // external attributes
        uint32_t offset = read_u32(r);

        m.name = read_string(r, name_len);
        std::string extra = read_string(r, extra_len);
        read_string(r, comment_len);

        std::replace(m.name.begin(), m.name.end(), '\\', '/');
        m.size = usize;
        m.compressed_size = csize;
        m.local_header_offset = offset;
        apply_zip64_extra(extra, m, usize == 0xFFFFFFFF, csize == 0xFFFFFFFF,
                          offset == 0xFFFFFFFF);
        m.is_dir = !m.name.empty() && m.name.back() == '/';

        a.members.push_back(std::move(m));
    }

    return a;
}

// ---------------------------------------------------------------------------
// Extraction
// ---------------------------------------------------------------------------

// inflate_member feeds sink until the member ends or limit bytes were produced.
// Returns false when it stopped at limit; the size and CRC checks are skipped then.
static bool inflate_member(std::istream& r, const Member& m, const Sink& sink,
                           uint64_t limit = std::numeric_limits<uint64_t>::max()) {
    if (m.encrypted())
        throw UnsupportedFormatError(std::format("zip: {} is encrypted", m.name));
    if (m.method != 0 && m.method != 8)
        throw UnsupportedFormatError(
            std::format("zip: {} uses unsupported compression method {}", m.name, m.method));

    seek_to(r, m.local_header_offset, "local header");
    if (read_u32(r) != sig_local_header)
        throw IOError(std::format("zip: bad local header for {}", m.name));
    r.seekg(22, std::ios::cur); // version .. uncompressed size
    uint16_t name_len = read_u16(r);
    uint16_t extra_len = read_u16(r);
    r.seekg(name_len + extra_len, std::ios::cur);
    if (!r)
        throw IOError(std::format("zip: cannot reach data of {}", m.name));
    if (m.method == 0 && m.compressed_size != m.size)
        throw IOError(std::format("zip: stored member {} holds {} bytes, declares {}",
                                  m.name, m.compressed_size, m.size));

    constexpr size_t buf_size = 1 << 16;
    std::vector<char> in(buf_size);
    uLong crc = crc32(0L, Z_NULL, 0);
    uint64_t produced = 0;
    uint64_t remaining = m.compressed_size;

    bool stopped = false;

    auto emit = [&](const char* data, size_t n) {
        if (produced + n > m.size)
            throw IOError(std::format("zip: {} inflates past its declared {} bytes",
                                      m.name, m.size));
        if (produced + n >= limit) {
            n = static_cast<size_t>(limit - produced);
            stopped = true;
        }
        crc = crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(n));
        produced += n;
        if (n > 0) sink(data, n);
    };

    if (limit == 0) return false;

    if (m.method == 0) {
        while (remaining > 0 && !stopped) {
            size_t n = static_cast<size_t>(std::min<uint64_t>(remaining, buf_size));
            if (!r.read(in.data(), static_cast<std::streamsize>(n)))
                throw IOError(std::format("zip: truncated data for {}", m.name));
            emit(in.data(), n);
            remaining -= n;
        }
    } else {
        z_stream zs{};
        if (inflateInit2(&zs, -MAX_WBITS) != Z_OK)
            throw std::runtime_error("zip: inflateInit2 failed");
        struct InflateGuard {
            z_stream& zs;
            ~InflateGuard() { inflateEnd(&zs); }
        } guard{zs};

        std::vector<char> out(buf_size);
        int ret = Z_OK;
        while (ret != Z_STREAM_END && !stopped) {
            if (zs.avail_in == 0) {
                if (remaining == 0)
                    throw IOError(std::format("zip: deflate stream of {} ends early", m.name));
                size_t n = static_cast<size_t>(std::min<uint64_t>(remaining, buf_size));
                if (!r.read(in.data(), static_cast<std::streamsize>(n)))
                    throw IOError(std::format("zip: truncated data for {}", m.name));
                remaining -= n;
                zs.next_in = reinterpret_cast<Bytef*>(in.data());
                zs.avail_in = static_cast<uInt>(n);
            }
            zs.next_out = reinterpret_cast<Bytef*>(out.data());
            zs.avail_out = static_cast<uInt>(out.size());
            ret = inflate(&zs, Z_NO_FLUSH);
            if (ret != Z_OK && ret != Z_STREAM_END)
                throw IOError(std::format("zip: inflate failed for {}: {}", m.name,
                                          zs.msg ? zs.msg : "corrupt data"));
            size_t have = out.size() - zs.avail_out;
            if (have > 0) emit(out.data(), have);
        }
    }

    if (stopped && produced < m.size) return false;
    if (produced != m.size)
        throw IOError(std::format("zip: {} inflated to {} bytes, expected {}",
                                  m.name, produced, m.size));
    if (static_cast<uint32_t>(crc) != m.crc32)
        throw IOError(std::format("zip: CRC mismatch for {}", m.name));
    return true;
}

void extract_each(std::istream& r, const Member& m, const Sink& sink) {
    inflate_member(r, m, sink);
}

void extract_to(std::istream& r, const Member& m, std::ostream& w) {
    inflate_member(r, m, [&](const char* data, size_t n) {
        if (!w.write(data, static_cast<std::streamsize>(n)))
            throw IOError(std::format("zip: failed to write {}", m.name));
    });
}

std::vector<uint8_t> extract_head(std::istream& r, const Member& m, size_t max) {
    std::vector<uint8_t> out;
    out.reserve(static_cast<size_t>(std::min<uint64_t>(m.size, max)));
    inflate_member(r, m, [&](const char* data, size_t n) {
        out.insert(out.end(), reinterpret_cast<const uint8_t*>(data),
                   reinterpret_cast<const uint8_t*>(data) + n);
    }, max);
    return out;
}

std::vector<uint8_t> extract(std::istream& r, const Member& m) {
    std::vector<uint8_t> out;
    out.reserve(static_cast<size_t>(std::min<uint64_t>(m.size, 64ull << 20)));
    inflate_member(r, m, [&](const char* data, size_t n) {
        out.insert(out.end(), reinterpret_cast<const uint8_t*>(data),
                   reinterpret_cast<const uint8_t*>(data) + n);
    });
    return out;
}

// ---------------------------------------------------------------------------
// File-level helpers
// ---------------------------------------------------------------------------

Archive list(const fs::path& file) {
    switch (detect(file)) {
        case Format::Zip: break;
        case Format::Rar:
            throw UnsupportedFormatError(std::format("{}: RAR archives are not supported",
                                                     file.string()));
        case Format::Unknown:
            throw UnsupportedFormatError(std::format("{}: unrecognised container", file.string()));
    }
    std::ifstream f(file, std::ios::binary);
    if (!f)
        throw IOError(std::format("{}: cannot open archive", file.string()));
    return read_zip(f);
}

std::string virtual_path(const std::string& archive_path, const std::string& member) {
    return archive_path + "::" + member;
}

std::pair<std::string, std::string> split_virtual_path(const std::string& relative_path) {
    auto pos = relative_path.find("::");
    if (pos == std::string::npos) return {relative_path, ""};
    return {relative_path.substr(0, pos), relative_path.substr(pos + 2)};
}

} // namespace assetcat::archive
