#include "assetcat/formats.h"
#include "assetcat/errors.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <random>
#include <set>
#include <string>

namespace fs = std::filesystem;
using namespace assetcat::formats;

namespace {

ValidationInput memory_input(const std::string& name, const std::string& body,
                             std::set<std::string> companions = {}) {
    ValidationInput in;
    in.name = name;
    in.read = [body](size_t max) {
        auto n = std::min(max, body.size());
        return std::vector<uint8_t>(body.begin(), body.begin() + static_cast<std::ptrdiff_t>(n));
    };
    in.companion_exists = [companions = std::move(companions)](const std::string& rel) {
        return companions.contains(rel);
    };
    return in;
}

fs::path make_temp_dir() {
    std::random_device rd;
    auto dir = fs::temp_directory_path() / ("assetcat-formats-" + std::to_string(rd()));
    fs::create_directories(dir);
    return dir;
}

void write_file(const fs::path& p, const std::string& body) {
    std::ofstream out(p, std::ios::binary);
    out << body;
}

} // namespace

TEST(Formats, BuiltinTable) {
    auto reg = Registry::with_builtins();

    for (const char* id : {"stl", "obj", "3mf", "glb", "gltf"}) {
        auto* f = reg.find(id);
        ASSERT_NE(f, nullptr) << id;
        EXPECT_EQ(f->kind, AssetKind::Model);
        EXPECT_EQ(f->category, ThumbCategory::Model3D) << id;
    }
    for (const char* id : {"svg", "dae", "3ds", "ply", "x3d"}) {
        auto* f = reg.find(id);
        ASSERT_NE(f, nullptr) << id;
        EXPECT_EQ(f->category, ThumbCategory::Other) << id;
    }
    auto* pdf = reg.find("pdf");
    ASSERT_NE(pdf, nullptr);
    EXPECT_EQ(pdf->kind, AssetKind::Document);
    EXPECT_EQ(pdf->category, ThumbCategory::Pdf);
    EXPECT_FALSE(pdf->allowed_in_archive);

    EXPECT_EQ(reg.ids(AssetKind::Document), std::vector<std::string>{"pdf"});
    EXPECT_EQ(reg.ids(AssetKind::Model).size(), 10u);
}

TEST(Formats, LookupByExtensionIsCaseInsensitive) {
    auto reg = Registry::with_builtins();
    ASSERT_NE(reg.for_path("a/b/Cube.STL"), nullptr);
    EXPECT_EQ(reg.for_path("a/b/Cube.STL")->id, "stl");
    EXPECT_EQ(reg.find_by_extension("gltf")->id, "gltf");
    EXPECT_EQ(reg.find_by_extension(".PDF")->id, "pdf");
    EXPECT_EQ(reg.for_path("notes.txt"), nullptr);
    EXPECT_EQ(reg.for_path("Makefile"), nullptr);

    EXPECT_TRUE(reg.is_archive("kits/Pack.ZIP"));
    EXPECT_TRUE(reg.is_archive("kits/pack.rar"));
    EXPECT_FALSE(reg.is_archive("kits/pack.7z"));
}

TEST(Formats, RegisterAddsFormatEverywhere) {
    auto reg = Registry::with_builtins();
    reg.register_format({
        .id = "fbx",
        .kind = AssetKind::Model,
        .extensions = {"FBX"},
        .preview = PreviewKind::Scene,
        .category = ThumbCategory::Model3D,
    });
    ASSERT_NE(reg.for_path("x/rig.fbx"), nullptr);
    EXPECT_EQ(reg.for_path("x/rig.fbx")->id, "fbx");
    EXPECT_EQ(reg.ids(AssetKind::Model).size(), 11u);

    EXPECT_THROW(reg.register_format({.id = "fbx"}), std::runtime_error);
    EXPECT_THROW(reg.register_format({.id = "stl2", .extensions = {".stl"}}), std::runtime_error);
}

TEST(Formats, KindNames) {
    EXPECT_STREQ(table_name(AssetKind::Model), "models");
    EXPECT_STREQ(table_name(AssetKind::Document), "documents");
    EXPECT_EQ(parse_kind("models"), AssetKind::Model);
    EXPECT_EQ(parse_kind("document"), AssetKind::Document);
    EXPECT_THROW(parse_kind("images"), std::runtime_error);
    EXPECT_STREQ(category_name(ThumbCategory::Model3D), "3d");
}

TEST(Formats, PercentDecode) {
    EXPECT_EQ(percent_decode("my%20mesh.bin"), "my mesh.bin");
    EXPECT_EQ(percent_decode("tex%2Fa.png"), "tex/a.png");
    EXPECT_EQ(percent_decode("100%"), "100%");
    EXPECT_EQ(percent_decode("bad%zzname"), "bad%zzname");
}

TEST(Formats, GltfCompanionsPresent) {
    const std::string doc = R"({
        "asset": {"version": "2.0"},
        "buffers": [{"uri": "mesh.bin", "byteLength": 4}],
        "images": [{"uri": "tex%20a.png"}, {"uri": "data:image/png;base64,AAAA"}]
    })";
    auto r = validate_gltf(memory_input("scene.gltf", doc, {"mesh.bin", "tex a.png"}));
    EXPECT_TRUE(r.ok) << r.reason;
}

TEST(Formats, GltfMissingCompanionsAreAllListed) {
    const std::string doc = R"({
        "buffers": [{"uri": "a.bin"}, {"uri": "a.bin"}],
        "images": [{"uri": "b.png"}, {"uri": "ok.png"}]
    })";
    auto r = validate_gltf(memory_input("scene.gltf", doc, {"ok.png"}));
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.reason, "Missing companion files: a.bin, b.png");
    EXPECT_EQ(r.missing, (std::vector<std::string>{"a.bin", "b.png"}));
}

TEST(Formats, GltfMalformedJsonFails) {
    auto r = validate_gltf(memory_input("broken.gltf", "{ not json"));
    EXPECT_FALSE(r.ok);
    EXPECT_TRUE(r.reason.starts_with("GLTF validation error"));
}

TEST(Formats, GltfLargerThanTheReadCapIsParsedWhole) {
    auto dir = make_temp_dir();
    std::string doc = R"({"buffers":[{"uri":"data:application/octet-stream;base64,)";
    doc.append(max_validation_bytes + (1 << 20), 'A');
    doc += R"("}],"images":[{"uri":"skin.png"}]})";
    write_file(dir / "big.gltf", doc);
    ASSERT_GT(fs::file_size(dir / "big.gltf"), max_validation_bytes);

    auto r = validate_gltf(file_input(dir / "big.gltf"));
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.missing, std::vector<std::string>{"skin.png"});

    write_file(dir / "skin.png", "png");
    r = validate_gltf(file_input(dir / "big.gltf"));
    EXPECT_TRUE(r.ok) << r.reason;
    fs::remove_all(dir);
}

TEST(Formats, GltfUrisOutsideBuffersAndImagesAreIgnored) {
    const std::string doc = R"({
        "extras": {"buffers": [{"uri": "nested.bin"}]},
        "images": [{"uri": "ok.png", "extras": {"uri": "deep.png"}}],
        "samplers": [{"uri": "sampler.bin"}]
    })";
    auto r = validate_gltf(memory_input("scene.gltf", doc, {"ok.png"}));
    EXPECT_TRUE(r.ok) << r.reason;

    r = validate_gltf(memory_input("array.gltf", "[1, 2]"));
    EXPECT_FALSE(r.ok);
}

TEST(Formats, MagicChecks) {
    EXPECT_TRUE(validate_pdf(memory_input("a.pdf", "%PDF-1.7\n...")).ok);
    EXPECT_FALSE(validate_pdf(memory_input("a.pdf", "<html>")).ok);
    EXPECT_TRUE(validate_glb(memory_input("a.glb", std::string("glTF\x02\0\0\0", 8))).ok);
    EXPECT_FALSE(validate_glb(memory_input("a.glb", "nope")).ok);
}

TEST(Formats, RequireValidThrowsWithMissingList) {
    auto reg = Registry::with_builtins();
    auto dir = make_temp_dir();
    write_file(dir / "scene.gltf", R"({"buffers":[{"uri":"scene.bin"}]})");

    const auto* gltf = reg.find("gltf");
    ASSERT_NE(gltf, nullptr);
    try {
        reg.require_valid(*gltf, file_input(dir / "scene.gltf"));
        FAIL() << "expected ValidationError";
    } catch (const assetcat::ValidationError& e) {
        EXPECT_EQ(e.missing(), std::vector<std::string>{"scene.bin"});
        EXPECT_NE(std::string(e.what()).find("Missing companion files: scene.bin"), std::string::npos);
    }

    write_file(dir / "scene.bin", "abcd");
    EXPECT_NO_THROW(reg.require_valid(*gltf, file_input(dir / "scene.gltf")));

    // Formats without a validator always pass.
    EXPECT_NO_THROW(reg.require_valid(*reg.find("stl"), file_input(dir / "scene.bin")));

    fs::remove_all(dir);
}
