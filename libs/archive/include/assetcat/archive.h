#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace assetcat::archive {

enum class Format { Unknown, Zip, Rar };

// Member is one central-directory record of a ZIP archive.
struct Member {
    std::string name;            // path inside the archive, '/' separated
    uint16_t flags = 0;
    uint16_t method = 0;         // 0 = stored, 8 = deflate
    uint32_t crc32 = 0;
    uint64_t compressed_size = 0;
    uint64_t size = 0;           // uncompressed
    uint16_t dos_time = 0;
    uint16_t dos_date = 0;
    uint64_t local_header_offset = 0;
    bool is_dir = false;

    bool encrypted() const { return (flags & 0x0001) != 0; }
};

struct Archive {
    std::vector<Member> members;
    std::string comment;
};

// detect identifies a container by signature, falling back to the extension.
Format detect(const std::filesystem::path& file);


// read_zip parses the end-of-central-directory record (Zip64 aware) and the
// central directory. The stream must support seekg.
Archive read_zip(std::istream& r);

// Sink receives uncompressed member bytes in order.
using Sink = std::function<void(const char*, size_t)>;

// extract_each streams one member's uncompressed bytes to sink, verifying the
// declared size and CRC-32. Inflation stops with IOError as soon as output runs
// past the declared size. Throws UnsupportedFormatError for encrypted members
// and unknown methods.
void extract_each(std::istream& r, const Member& m, const Sink& sink);

// extract_to streams one member to w; see extract_each.
void extract_to(std::istream& r, const Member& m, std::ostream& w);

// extract_head returns at most the first max bytes of a member, inflating no
// further than needed. The CRC is not checked unless the whole member is read.
std::vector<uint8_t> extract_head(std::istream& r, const Member& m, size_t max);

// extract returns one member's uncompressed bytes.
std::vector<uint8_t> extract(std::istream& r, const Member& m);

// list opens an archive file and returns its members.
// Throws UnsupportedFormatError for RAR and unrecognised containers.
Archive list(const std::filesystem::path& file);

// virtual_path joins container and member as "archive_path::member".
std::string virtual_path(const std::string& archive_path, const std::string& member);

// split_virtual_path reverses virtual_path. Returns {path, ""} for plain paths.
std::pair<std::string, std::string> split_virtual_path(const std::string& relative_path);

} // namespace assetcat::archive
