#include "assetcat/thumbd_renderer.h"
#include "assetcat/errors.h"
#include "assetcat/log.h"
#include "assetcat/thumbd_png.h"
#include "assetcat/thumbd_process.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <utility>

namespace fs = std::filesystem;

namespace assetcat::thumbd {

// ---------------------------------------------------------------------------
// Command templates
// ---------------------------------------------------------------------------

static void replace_all(std::string& s, std::string_view from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string expand_template(const std::string& arg, const RenderRequest& req) {
    std::string out = arg;
    fs::path stem = req.output;
    if (stem.extension() == ".png") stem.replace_extension();
    replace_all(out, "{input}", req.input.string());
    replace_all(out, "{output_stem}", stem.string());
    replace_all(out, "{output}", req.output.string());
    replace_all(out, "{size}", std::to_string(req.size));
    return out;
}

// ---------------------------------------------------------------------------
// ExternalRenderer
// ---------------------------------------------------------------------------

ExternalRenderer::ExternalRenderer(std::string id, std::vector<std::string> command,
                                   std::vector<std::string> formats, int score)
    : id_(std::move(id)), command_(std::move(command)), formats_(std::move(formats)),
      score_(score) {}

ProbeResult ExternalRenderer::probe() const {
    if (command_.empty())
        return {.reason = "empty command"};

    std::vector<std::string> programs{command_[0]};
    // Wrappers: the wrapped program must exist too.
    if (command_[0] == "xvfb-run") {
        auto it = std::find_if(command_.begin() + 1, command_.end(),
                               [](const std::string& a) { return !a.starts_with('-'); });
        if (it != command_.end()) programs.push_back(*it);
    }
    for (const auto& p : programs) {
        if (!on_path(p))
            return {.reason = std::format("'{}' not found on PATH", p)};
    }
    return {.available = true, .score = score_};
}

bool ExternalRenderer::supports(const std::string& format) const {
    if (formats_.empty()) return true;
    return std::find(formats_.begin(), formats_.end(), format) != formats_.end();
}

void ExternalRenderer::render(const RenderRequest& req) const {
    if (command_.empty())
        throw RenderBackendError(std::format("{}: empty command", id_));

    std::vector<std::string> args;
    args.reserve(command_.size() - 1);
    for (size_t i = 1; i < command_.size(); ++i)
        args.push_back(expand_template(command_[i], req));

    ChildProcess child;
    if (!child.launch(command_[0], args))
        throw RenderBackendError(std::format("{}: cannot start {}", id_, command_[0]));

    if (!child.wait_until(req.deadline, req.abort)) {
        child.stop();
        if (req.abort && req.abort->load())
            throw RenderTimeoutError(std::format("{}: aborted", id_));
        throw RenderTimeoutError(std::format("{}: timed out on {}", id_, req.input.string()));
    }
    if (child.exit_code() != 0)
        throw RenderBackendError(std::format("{}: exited with status {}", id_, child.exit_code()));
    if (!is_png(req.output))
        throw RenderBackendError(std::format("{}: no PNG written to {}", id_, req.output.string()));
}

// ---------------------------------------------------------------------------
// PlaceholderRenderer
// ---------------------------------------------------------------------------

using Rgb = std::array<uint8_t, 3>;

static Rgb background_for(formats::ThumbCategory c) {
    switch (c) {
    case formats::ThumbCategory::Model3D: return {44, 62, 92};
    case formats::ThumbCategory::Pdf: return {110, 38, 38};
    case formats::ThumbCategory::Other: return {64, 64, 64};
    }
    return {64, 64, 64};
}

// Glyph coverage at (x, y) in unit coordinates: a cube outline for models,
// a page with a folded corner for documents, a disc for everything else.
static bool glyph(formats::ThumbCategory c, double x, double y) {
    switch (c) {
    case formats::ThumbCategory::Model3D: {
        double dx = std::abs(x - 0.5), dy = std::abs(y - 0.5);
        double d = dx + dy;
        return d > 0.26 && d < 0.32;
    }
    case formats::ThumbCategory::Pdf: {
        bool page = x > 0.28 && x < 0.72 && y > 0.2 && y < 0.8;
        bool fold = x > 0.58 && y < 0.34 && (x - 0.58) > (y - 0.2);
        return page && !fold;
    }
    case formats::ThumbCategory::Other: {
        double dx = x - 0.5, dy = y - 0.5;
        return dx * dx + dy * dy < 0.07;
    }
    }
    return false;
}

void PlaceholderRenderer::render(const RenderRequest& req) const {
    if (req.size <= 0 || req.size > 4096)
        throw RenderBackendError(std::format("placeholder: invalid size {}", req.size));

    const Rgb bg = background_for(req.category);
    const int n = req.size;
    Image img(n, n, 3);
    for (int y = 0; y < n; ++y) {
        for (int x = 0; x < n; ++x) {
            const double u = (x + 0.5) / n;
            const double v = (y + 0.5) / n;
            const bool border = u < 0.03 || u > 0.97 || v < 0.03 || v > 0.97;
            const bool ink = border || glyph(req.category, u, v);
            uint8_t* px = img.at(x, y);
            for (int c = 0; c < 3; ++c) {
                // Slight vertical shade so placeholders are not flat.
                int base = static_cast<int>(bg[c] * (1.1 - 0.2 * v));
                int value = ink ? std::min(255, base + 120) : base;
                px[c] = static_cast<uint8_t>(std::clamp(value, 0, 255));
            }
        }
    }
    try {
        write_png(req.output, img);
    } catch (const IOError& e) {
        throw RenderBackendError(std::format("placeholder: {}", e.what()));
    }
}

// ---------------------------------------------------------------------------
// Registry and chain
// ---------------------------------------------------------------------------

void RendererRegistry::add(std::shared_ptr<const Renderer> renderer, std::string source) {
    RendererRecord rec{.probe = renderer->probe(), .source = std::move(source)};
    rec.renderer = std::move(renderer);
    LOGD("thumbd: renderer", rec.renderer->id(), rec.probe.available ? "available" : "unavailable",
         rec.probe.reason);

    auto it = std::find_if(records_.begin(), records_.end(), [&](const RendererRecord& r) {
        return r.renderer->id() == rec.renderer->id();
    });
    if (it != records_.end())
        *it = std::move(rec);
    else
        records_.push_back(std::move(rec));
}

std::vector<const Renderer*> RendererRegistry::chain(const std::string& format) const {
    std::vector<const RendererRecord*> usable;
    for (const auto& r : records_) {
        if (r.probe.available && r.renderer->supports(format)) usable.push_back(&r);
    }
    std::sort(usable.begin(), usable.end(), [](const RendererRecord* a, const RendererRecord* b) {
        if (a->probe.score != b->probe.score) return a->probe.score > b->probe.score;
        return a->renderer->id() < b->renderer->id();
    });

    std::vector<const Renderer*> out;
    out.reserve(usable.size());
    for (const auto* r : usable) out.push_back(r->renderer.get());
    return out;
}

void register_builtin_renderers(RendererRegistry& registry, const BuiltinOptions& opts) {
    std::vector<std::string> f3d{"f3d", "--output", "{output}", "--resolution", "{size},{size}",
                                 "--up", "+Z", "--camera-direction=0,1,-0.3", "{input}"};
    if (opts.use_xvfb) {
        const std::vector<std::string> wrapper{"xvfb-run", "-a"};
        f3d.insert(f3d.begin(), wrapper.begin(), wrapper.end());
    }

    registry.add(std::make_shared<ExternalRenderer>(
                     "f3d", std::move(f3d),
                     std::vector<std::string>{"stl", "obj", "3mf", "glb", "gltf", "ply", "3ds", "dae", "x3d"},
                     90),
                 "builtin");
    registry.add(std::make_shared<ExternalRenderer>(
                     "stl-thumb",
                     std::vector<std::string>{"stl-thumb", "-s", "{size}", "{input}", "{output}"},
                     std::vector<std::string>{"stl", "obj", "3mf"}, 80),
                 "builtin");
    registry.add(std::make_shared<ExternalRenderer>(
                     "pdftoppm",
                     std::vector<std::string>{"pdftoppm", "-png", "-singlefile", "-scale-to", "{size}",
                                              "-f", "1", "-l", "1", "{input}", "{output_stem}"},
                     std::vector<std::string>{"pdf"}, 90),
                 "builtin");
    registry.add(std::make_shared<ExternalRenderer>(
                     "rsvg-convert",
                     std::vector<std::string>{"rsvg-convert", "-a", "-w", "{size}", "-h", "{size}",
                                              "-o", "{output}", "{input}"},
                     std::vector<std::string>{"svg"}, 90),
                 "builtin");
    if (opts.placeholder)
        registry.add(std::make_shared<PlaceholderRenderer>(), "builtin");
}

std::string render_with_chain(const std::vector<const Renderer*>& chain, const RenderRequest& req) {
    if (chain.empty())
        throw RenderBackendError(std::format("no renderer for format '{}'", req.format));

    std::string failures;
    for (const auto* r : chain) {
        if (req.abort && req.abort->load())
            throw RenderTimeoutError("render aborted");
        try {
            r->render(req);
            return r->id();
        } catch (const RenderBackendError& e) {
            LOGD("thumbd:", e.what());
            if (!failures.empty()) failures += "; ";
            failures += e.what();
            std::error_code ec;
            fs::remove(req.output, ec);
        }
    }
    throw RenderBackendError(std::format("all renderers failed for {}: {}",
                                         req.input.filename().string(), failures));
}

} // namespace assetcat::thumbd
