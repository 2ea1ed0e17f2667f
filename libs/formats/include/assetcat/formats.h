#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace assetcat::formats {

enum class AssetKind { Document, Model };

// "document" / "model"
const char* kind_name(AssetKind k);
// Catalog table: "documents" / "models"
const char* table_name(AssetKind k);
// Accepts singular and plural names. Throws std::runtime_error otherwise.
AssetKind parse_kind(std::string_view s);

enum class PreviewKind { Mesh, Scene, Vector, Page };

// Thumbnail category keeps central thumbnails of different kinds apart.
enum class ThumbCategory { Model3D, Pdf, Other };

const char* category_name(ThumbCategory c); // "3d", "pdf", "other"

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

// ValidationInput abstracts over plain files and archive members.
struct ValidationInput {
    std::string name;                                       // file or member name
    std::function<std::vector<uint8_t>(size_t)> read;       // first N bytes at most
    std::function<std::unique_ptr<std::istream>()> open;    // whole content, front to back
    std::function<bool(const std::string&)> companion_exists; // path relative to the item's dir
};

struct ValidationResult {
    bool ok = true;
    std::string reason;
    std::vector<std::string> missing;
};

using Validator = std::function<ValidationResult(const ValidationInput&)>;

// Upper bound on bytes a validator may pull from one item through read.
inline constexpr size_t max_validation_bytes = 16 * 1024 * 1024;

// validate_gltf walks the JSON with a SAX parser over open, so embedded
// data: buffers of any size are accepted. Falls back to read when open is unset.
ValidationResult validate_gltf(const ValidationInput& in);
ValidationResult validate_glb(const ValidationInput& in);
ValidationResult validate_pdf(const ValidationInput& in);

// file_input reads from disk; companions are resolved beside the file.
ValidationInput file_input(const std::filesystem::path& file);

// percent_decode turns "%20" sequences into bytes. Malformed escapes are kept.
std::string percent_decode(std::string_view s);

// ---------------------------------------------------------------------------
// Registry
// ---------------------------------------------------------------------------

struct FormatInfo {
    std::string id;                       // "stl", "pdf", ...
    AssetKind kind = AssetKind::Model;
    std::vector<std::string> extensions;  // lower-case, with dot
    PreviewKind preview = PreviewKind::Mesh;
    ThumbCategory category = ThumbCategory::Other;
    bool allowed_in_archive = true;
    Validator validator;                  // empty = no structural checks
};

class Registry {
public:
    // Throws std::runtime_error on a duplicate id or extension.
    void register_format(FormatInfo info);

    const FormatInfo* find(std::string_view id) const;
    // Extension with or without the dot, any case.
    const FormatInfo* find_by_extension(std::string_view ext) const;
    const FormatInfo* for_path(const std::filesystem::path& p) const;

    std::vector<const FormatInfo*> formats() const;
    std::vector<std::string> ids(AssetKind kind) const;

    bool is_archive(const std::filesystem::path& p) const;

    // Runs the format's validator; a format without one always passes.
    ValidationResult validate(const FormatInfo& f, const ValidationInput& in) const;
    // Same, but throws ValidationError on failure.
    void require_valid(const FormatInfo& f, const ValidationInput& in) const;

    // A registry holding the built-in formats.
    static Registry with_builtins();

private:
    std::map<std::string, FormatInfo, std::less<>> formats_;
    std::unordered_map<std::string, std::string> by_extension_;
};

} // namespace assetcat::formats
