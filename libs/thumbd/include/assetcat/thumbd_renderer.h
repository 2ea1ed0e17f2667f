#pragma once

#include "assetcat/formats.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

// Thumbnail renderers and the fallback chain built from them.
//
// A renderer is either built in (external tools with known command lines, and
// the libpng placeholder) or declared in configuration as a command template.
// The registry probes each one once at registration; chain() then orders the
// available renderers that support a format by score.
namespace assetcat::thumbd {

// Result of probing a renderer to see if it can run on this machine.
struct ProbeResult {
    bool available = false;
    int score = 0;          // Higher = tried first.
    std::string reason;     // Explanation for unavailability (empty = available).
};

struct RenderRequest {
    std::filesystem::path input;   // readable source file (members are extracted first)
    std::filesystem::path output;  // PNG to create; the caller renames it into place
    std::string format;            // format id, e.g. "stl"
    formats::ThumbCategory category = formats::ThumbCategory::Other;
    int size = 512;
    std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max();
    const std::atomic<bool>* abort = nullptr;
};

// Renderer implementations throw RenderBackendError when they cannot produce
// output and RenderTimeoutError when the deadline passes.
class Renderer {
public:
    virtual ~Renderer() = default;

    virtual const std::string& id() const = 0;
    virtual ProbeResult probe() const = 0;
    virtual bool supports(const std::string& format) const = 0;
    virtual void render(const RenderRequest& req) const = 0;
};

// ExternalRenderer runs a command template. Arguments may contain {input},
// {output}, {output_stem} (output without ".png") and {size}.
class ExternalRenderer : public Renderer {
public:
    ExternalRenderer(std::string id, std::vector<std::string> command,
                     std::vector<std::string> formats, int score);

    const std::string& id() const override { return id_; }
    ProbeResult probe() const override;
    bool supports(const std::string& format) const override;
    void render(const RenderRequest& req) const override;

    const std::vector<std::string>& command() const { return command_; }

private:
    std::string id_;
    std::vector<std::string> command_;
    std::vector<std::string> formats_; // empty = every format
    int score_ = 0;
};

// PlaceholderRenderer draws a flat category badge with libpng. Always available.
class PlaceholderRenderer : public Renderer {
public:
    const std::string& id() const override { return id_; }
    ProbeResult probe() const override { return {.available = true, .score = 0}; }
    bool supports(const std::string&) const override { return true; }
    void render(const RenderRequest& req) const override;

private:
    std::string id_ = "placeholder";
};

// expand_template substitutes the request placeholders in one argument.
std::string expand_template(const std::string& arg, const RenderRequest& req);

struct RendererRecord {
    std::shared_ptr<const Renderer> renderer;
    ProbeResult probe;
    std::string source; // "builtin" or "config"
};

class RendererRegistry {
public:
    // add probes the renderer and records it. A renderer with the id of an
    // earlier one replaces it, so configuration can override built-ins.
    void add(std::shared_ptr<const Renderer> renderer, std::string source);

    const std::vector<RendererRecord>& renderers() const { return records_; }

    // chain returns the available renderers supporting format, best score
    // first, ties broken by id.
    std::vector<const Renderer*> chain(const std::string& format) const;

private:
    std::vector<RendererRecord> records_;
};

struct BuiltinOptions {
    bool use_xvfb = false;    // run f3d through "xvfb-run -a"
    bool placeholder = true;
};

// register_builtin_renderers adds f3d, stl-thumb, pdftoppm, rsvg-convert and
// (unless disabled) the placeholder.
void register_builtin_renderers(RendererRegistry& registry, const BuiltinOptions& opts);

// render_with_chain tries each renderer in turn. RenderBackendError moves on to
// the next one; RenderTimeoutError propagates at once. Returns the id of the
// renderer that succeeded, or throws RenderBackendError listing every failure.
std::string render_with_chain(const std::vector<const Renderer*>& chain, const RenderRequest& req);

} // namespace assetcat::thumbd
