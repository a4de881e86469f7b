// Disk treemap viewer: ImGui + SDL3 + OpenGL3 (C++20)
#define SDL_MAIN_HANDLED

#include "imgui.h"
#include "imgui_impl_sdl3.h"
#include "imgui_impl_opengl3.h"
#include <canvas/canvas.hpp>
#include <treemap_loaders/json_loader.hpp>
#include <treemap_placement/placer.hpp>
#include <treemap_render/renderer.hpp>
#include <SDL3/SDL.h>
#include <SDL3/SDL_main.h>
#include <SDL3/SDL_opengl.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <optional>
#include <string>
#include <utility>

namespace {

// Verifies the settled layout tiles the canvas exactly once.
bool layout_tiles_canvas(const canvas::TreemapCanvas& treemap) {
    const auto& placed = treemap.placed();
    if (placed.placed_nodes.empty()) return treemap.root() && treemap.root()->size == 0;
    const double expected = placed.bounds.area();
    const double covered = treemap_placement::covered_area(placed);
    const std::size_t overlaps = treemap_placement::count_overlaps(placed);
    (void)fprintf(stderr, "[auto-layout-test] rects=%zu expected_area=%.3f covered_area=%.3f overlaps=%zu\n",
        placed.placed_nodes.size(), expected, covered, overlaps);
    return overlaps == 0 && std::abs(covered - expected) <= std::max(1e-6, expected * 1e-9);
}

} // namespace

int main(int argc, char* argv[])
{
    bool auto_layout_test = false;
    std::optional<std::string> root_arg;
    std::optional<std::string> config_path;
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        if (arg == "--auto-layout-test") {
            auto_layout_test = true;
        } else if (arg == "--verbose") {
            spdlog::set_level(spdlog::level::debug);
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (!arg.empty() && arg[0] != '-') {
            root_arg = arg;
        } else {
            (void)fprintf(stderr, "usage: %s [path] [--config <file>] [--verbose] [--auto-layout-test]\n", argv[0]);
            return 1;
        }
    }

    treemap_loaders::ViewerConfig config = treemap_loaders::default_viewer_config();
    if (config_path) {
        auto loaded = treemap_loaders::load_viewer_config_from_json_file(*config_path);
        if (!loaded) {
            (void)fprintf(stderr, "Cannot load config %s\n", config_path->c_str());
            return 1;
        }
        config = std::move(*loaded);
    }
    if (root_arg) config.root_path = *root_arg;

    SDL_SetMainReady();
    // SDL3: SDL_Init returns true on success, false on failure
    if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
        (void)fprintf(stderr, "SDL_Init failed: %s\n", SDL_GetError());
        return 1;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);

    int window_width = 1100;
    int window_height = 700;
    {
        SDL_Rect bounds{};
        if (SDL_GetDisplayUsableBounds(SDL_GetPrimaryDisplay(), &bounds)) {
            window_width = bounds.w * 2 / 3;
            window_height = bounds.h * 2 / 3;
        }
    }
    const SDL_WindowFlags window_flags = SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE
        | SDL_WINDOW_HIGH_PIXEL_DENSITY;
    SDL_Window* window = SDL_CreateWindow("Disk Map", window_width, window_height, window_flags);
    if (!window) {
        (void)fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_GLContext gl_context = SDL_GL_CreateContext(window);
    if (!gl_context) {
        (void)fprintf(stderr, "SDL_GL_CreateContext failed: %s\n", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr;

    ImGui::StyleColorsDark();

    ImFontConfig font_cfg;
    font_cfg.OversampleH = 2;
    font_cfg.OversampleV = 2;
    font_cfg.PixelSnapH = true;
    const float font_size_px = 17.0f;
    const char* font_paths[] = {
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
    };
    for (const char* path : font_paths) {
        if (io.Fonts->AddFontFromFileTTF(path, font_size_px, &font_cfg) != nullptr)
            break;
    }

    ImGui_ImplSDL3_InitForOpenGL(window, gl_context);
    ImGui_ImplOpenGL3_Init("#version 130");

    bool show_legend = config.show_legend;
    canvas::TreemapCanvas treemap(config);
    treemap.open(config.root_path);

    bool running = true;
    int frame = 0;
    int settled_frames = 0;
    const int max_test_frames = 60 * 60;
    int test_exit_code = 0;

    while (running) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL3_ProcessEvent(&event);
            if (event.type == SDL_EVENT_QUIT)
                running = false;
            if (event.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED &&
                event.window.windowID == SDL_GetWindowID(window))
                running = false;
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL3_NewFrame();
        ImGui::NewFrame();

        ImGui::SetNextWindowPos(ImVec2(0, 0));
        ImGui::SetNextWindowSize(io.DisplaySize);
        ImGui::Begin("Disk Map", nullptr,
            ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove
            | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoBringToFrontOnFocus);

        ImGui::BeginDisabled(!treemap.can_go_back());
        if (ImGui::Button("<"))
            treemap.navigate_back();
        ImGui::EndDisabled();
        ImGui::SameLine();
        ImGui::BeginDisabled(treemap.is_scanning());
        if (ImGui::Button("Refresh"))
            treemap.refresh();
        ImGui::EndDisabled();
        ImGui::SameLine();
        ImGui::TextUnformatted(treemap.current_path().c_str());
        if (treemap.last_scan_timed_out()) {
            ImGui::SameLine();
            ImGui::TextDisabled("(partial: scan timed out)");
        }
        ImGui::SameLine(ImGui::GetWindowWidth() - 110.0f);
        ImGui::Checkbox("Legend", &show_legend);

        const treemap_model::TreemapNode* selected = treemap.selected_node();
        const float legend_width = show_legend ? 200.0f : 0.0f;
        const float detail_height = selected ? ImGui::GetFrameHeightWithSpacing() : 0.0f;
        ImVec2 avail = ImGui::GetContentRegionAvail();
        ImVec2 canvas_size(avail.x - legend_width, avail.y - detail_height);
        if (canvas_size.x > 0 && canvas_size.y > 0) {
            ImGui::BeginChild("canvas", canvas_size, false, ImGuiWindowFlags_NoScrollbar);
            treemap.update_and_draw(canvas_size.x, canvas_size.y);
            ImGui::EndChild();
        }
        if (show_legend) {
            ImGui::SameLine();
            ImGui::BeginChild("legend", ImVec2(legend_width - ImGui::GetStyle().ItemSpacing.x, canvas_size.y), true);
            treemap_render::render_legend(treemap.root());
            ImGui::EndChild();
        }
        if (selected)
            treemap_render::render_detail_bar(*selected);
        ImGui::End();

        if (auto_layout_test) {
            if (treemap.is_layout_settled()) {
                ++settled_frames;
            } else {
                settled_frames = 0;
            }

            if (settled_frames >= 30 || frame >= max_test_frames) {
                const bool ok = settled_frames >= 30 && layout_tiles_canvas(treemap);
                (void)fprintf(stderr, "[auto-layout-test] finished frame=%d settled=%d ok=%d\n",
                    frame, settled_frames >= 30 ? 1 : 0, ok ? 1 : 0);
                test_exit_code = ok ? 0 : 2;
                running = false;
            }
        }

        ImGui::Render();
        SDL_GL_MakeCurrent(window, gl_context);
        // HiDPI: use framebuffer size in pixels, not logical DisplaySize
        const int fb_w = (int)(io.DisplaySize.x * io.DisplayFramebufferScale.x);
        const int fb_h = (int)(io.DisplaySize.y * io.DisplayFramebufferScale.y);
        glViewport(0, 0, fb_w, fb_h);
        glClearColor(0.1f, 0.1f, 0.12f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(window);
        ++frame;
    }

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();

    SDL_GL_DestroyContext(gl_context);
    SDL_DestroyWindow(window);
    SDL_Quit();
    if (auto_layout_test) {
        return test_exit_code;
    }
    return 0;
}
