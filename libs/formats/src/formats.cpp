#include "assetcat/formats.h"
#include "assetcat/errors.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <format>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace assetcat::formats {

// ---------------------------------------------------------------------------
// Names
// ---------------------------------------------------------------------------

const char* kind_name(AssetKind k) {
    return k == AssetKind::Document ? "document" : "model";
}

const char* table_name(AssetKind k) {
    return k == AssetKind::Document ? "documents" : "models";
}

AssetKind parse_kind(std::string_view s) {
    if (s == "model" || s == "models") return AssetKind::Model;
    if (s == "document" || s == "documents") return AssetKind::Document;
    throw std::runtime_error(std::format("unknown asset kind '{}' (want models or documents)", s));
}

const char* category_name(ThumbCategory c) {
    switch (c) {
        case ThumbCategory::Model3D: return "3d";
        case ThumbCategory::Pdf: return "pdf";
        case ThumbCategory::Other: return "other";
    }
    return "other";
}

static std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

static std::string normalize_ext(std::string_view ext) {
    auto e = to_lower(ext);
    if (!e.empty() && e.front() != '.') e.insert(e.begin(), '.');
    return e;
}

// ---------------------------------------------------------------------------
// Validation helpers
// ---------------------------------------------------------------------------

std::string percent_decode(std::string_view s) {
    auto hex = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hex(s[i + 1]);
            int lo = hex(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += s[i];
    }
    return out;
}

ValidationInput file_input(const fs::path& file) {
    ValidationInput in;
    in.name = file.filename().string();
    in.read = [file](size_t max) {
        std::ifstream f(file, std::ios::binary);
        if (!f)
            throw IOError(std::format("{}: cannot open for reading", file.string()));
        std::vector<uint8_t> buf(max);
        f.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(max));
        if (f.bad())
            throw IOError(std::format("{}: read failed", file.string()));
        buf.resize(static_cast<size_t>(f.gcount()));
        return buf;
    };
    in.open = [file]() -> std::unique_ptr<std::istream> {
        auto f = std::make_unique<std::ifstream>(file, std::ios::binary);
        if (!*f)
            throw IOError(std::format("{}: cannot open for reading", file.string()));
        return f;
    };
    in.companion_exists = [dir = file.parent_path()](const std::string& rel) {
        std::error_code ec;
        return fs::is_regular_file(dir / fs::path(rel), ec);
    };
    return in;
}

static bool starts_with(const std::vector<uint8_t>& data, const char* magic) {
    size_t n = std::strlen(magic);
    return data.size() >= n && std::memcmp(data.data(), magic, n) == 0;
}

ValidationResult validate_pdf(const ValidationInput& in) {
    auto head = in.read(1024);
    // Some writers emit junk before the header; the format allows it within 1 KiB.
    std::string_view view(reinterpret_cast<const char*>(head.data()), head.size());
    if (view.find("%PDF-") == std::string_view::npos)
        return {.ok = false, .reason = "Missing %PDF- header"};
    return {};
}

ValidationResult validate_glb(const ValidationInput& in) {
    auto head = in.read(12);
    if (!starts_with(head, "glTF"))
        return {.ok = false, .reason = "Missing glTF binary magic"};
    return {};
}

namespace {

// GltfUriCollector keeps the "uri" strings of top-level "buffers" and "images"
// entries and drops everything else as it streams past.
class GltfUriCollector : public nlohmann::json_sax<nlohmann::json> {
public:
    std::vector<std::string> buffer_uris;
    std::vector<std::string> image_uris;
    bool root_is_object = false;
    std::string error;

    bool null() override { return true; }
    bool boolean(bool) override { return true; }
    bool number_integer(number_integer_t) override { return true; }
    bool number_unsigned(number_unsigned_t) override { return true; }
    bool number_float(number_float_t, const string_t&) override { return true; }
    bool binary(binary_t&) override { return true; }

    bool string(string_t& val) override {
        if (in_uri_slot()) (stack_[1].key == "buffers" ? buffer_uris : image_uris).push_back(val);
        return true;
    }

    bool key(string_t& val) override {
        key_ = val;
        return true;
    }

    bool start_object(std::size_t) override { return push(true); }
    bool end_object() override { return pop(); }
    bool start_array(std::size_t) override { return push(false); }
    bool end_array() override { return pop(); }

    bool parse_error(std::size_t, const std::string&, const nlohmann::json::exception& ex) override {
        error = ex.what();
        return false;
    }

private:
    struct Frame {
        bool object = false;
        std::string key; // key under which this container sits in its parent
    };

    bool push(bool object) {
        if (stack_.empty()) root_is_object = object;
        const bool parent_object = !stack_.empty() && stack_.back().object;
        stack_.push_back({.object = object, .key = parent_object ? key_ : std::string()});
        key_.clear();
        return true;
    }

    bool pop() {
        stack_.pop_back();
        key_.clear();
        return true;
    }

    bool in_uri_slot() const {
        return stack_.size() == 3 && stack_[0].object && !stack_[1].object &&
               (stack_[1].key == "buffers" || stack_[1].key == "images") &&
               stack_[2].object && key_ == "uri";
    }

    std::vector<Frame> stack_;
    std::string key_;
};

} // namespace

ValidationResult validate_gltf(const ValidationInput& in) {
    GltfUriCollector sax;
    bool parsed = false;
    if (in.open) {
        auto stream = in.open();
        parsed = nlohmann::json::sax_parse(*stream, &sax);
    } else {
        auto data = in.read(max_validation_bytes);
        parsed = nlohmann::json::sax_parse(data.begin(), data.end(), &sax);
    }
    if (!parsed)
        return {.ok = false, .reason = std::format("GLTF validation error: {}", sax.error)};
    if (!sax.root_is_object)
        return {.ok = false, .reason = "GLTF validation error: top level is not an object"};

    std::vector<std::string> missing;
    auto check = [&](const std::vector<std::string>& uris) {
        for (const auto& uri : uris) {
            if (uri.starts_with("data:")) continue;
            auto rel = percent_decode(uri);
            if (in.companion_exists && in.companion_exists(rel)) continue;
            if (std::find(missing.begin(), missing.end(), rel) == missing.end())
                missing.push_back(rel);
        }
    };
    check(sax.buffer_uris);
    check(sax.image_uris);

    if (!missing.empty()) {
        std::string names;
        for (const auto& m : missing) {
            if (!names.empty()) names += ", ";
            names += m;
        }
        return {.ok = false,
                .reason = std::format("Missing companion files: {}", names),
                .missing = std::move(missing)};
    }
    return {};
}

// ---------------------------------------------------------------------------
// Registry
// ---------------------------------------------------------------------------

void Registry::register_format(FormatInfo info) {
    if (info.id.empty())
        throw std::runtime_error("formats: empty format id");
    if (formats_.contains(info.id))
        throw std::runtime_error(std::format("formats: '{}' already registered", info.id));
    for (auto& ext : info.extensions) {
        ext = normalize_ext(ext);
        if (by_extension_.contains(ext))
            throw std::runtime_error(std::format("formats: extension {} already claimed by '{}'",
                                                 ext, by_extension_.at(ext)));
    }
    for (const auto& ext : info.extensions) by_extension_[ext] = info.id;
    auto id = info.id;
    formats_.emplace(std::move(id), std::move(info));
}

const FormatInfo* Registry::find(std::string_view id) const {
    auto it = formats_.find(id);
    return it == formats_.end() ? nullptr : &it->second;
}

const FormatInfo* Registry::find_by_extension(std::string_view ext) const {
    auto it = by_extension_.find(normalize_ext(ext));
    if (it == by_extension_.end()) return nullptr;
    return find(it->second);
}

const FormatInfo* Registry::for_path(const fs::path& p) const {
    auto ext = p.extension().string();
    if (ext.empty()) return nullptr;
    return find_by_extension(ext);
}

std::vector<const FormatInfo*> Registry::formats() const {
    std::vector<const FormatInfo*> out;
    out.reserve(formats_.size());
    for (const auto& [id, f] : formats_) out.push_back(&f);
    return out;
}

std::vector<std::string> Registry::ids(AssetKind kind) const {
    std::vector<std::string> out;
    for (const auto& [id, f] : formats_)
        if (f.kind == kind) out.push_back(id);
    return out;
}

bool Registry::is_archive(const fs::path& p) const {
    auto ext = to_lower(p.extension().string());
    return ext == ".zip" || ext == ".rar";
}

ValidationResult Registry::validate(const FormatInfo& f, const ValidationInput& in) const {
    if (!f.validator) return {};
    return f.validator(in);
}

void Registry::require_valid(const FormatInfo& f, const ValidationInput& in) const {
    auto r = validate(f, in);
    if (!r.ok)
        throw ValidationError(std::format("{}: {}", in.name, r.reason), std::move(r.missing));
}

Registry Registry::with_builtins() {
    Registry r;
    auto model = [&](const char* id, PreviewKind preview, ThumbCategory cat,
                     Validator v = {}) {
        r.register_format({
            .id = id,
            .kind = AssetKind::Model,
            .extensions = {std::string(".") + id},
            .preview = preview,
            .category = cat,
            .allowed_in_archive = true,
            .validator = std::move(v),
        });
    };

    model("stl", PreviewKind::Mesh, ThumbCategory::Model3D);
    model("obj", PreviewKind::Mesh, ThumbCategory::Model3D);
    model("3mf", PreviewKind::Mesh, ThumbCategory::Model3D);
    model("glb", PreviewKind::Scene, ThumbCategory::Model3D, validate_glb);
    model("gltf", PreviewKind::Scene, ThumbCategory::Model3D, validate_gltf);
    model("svg", PreviewKind::Vector, ThumbCategory::Other);
    model("dae", PreviewKind::Scene, ThumbCategory::Other);
    model("3ds", PreviewKind::Mesh, ThumbCategory::Other);
    model("ply", PreviewKind::Mesh, ThumbCategory::Other);
    model("x3d", PreviewKind::Scene, ThumbCategory::Other);

    r.register_format({
        .id = "pdf",
        .kind = AssetKind::Document,
        .extensions = {".pdf"},
        .preview = PreviewKind::Page,
        .category = ThumbCategory::Pdf,
        .allowed_in_archive = false,
        .validator = validate_pdf,
    });
    return r;
}

} // namespace assetcat::formats
