#include <SDL.h>

#include <exception>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

#include <imgui.h>
#include <imgui_impl_sdl2.h>
#include <imgui_impl_sdlrenderer2.h>

#include "agrisim/util/log.h"

#include "ui/app.h"

namespace {

struct WindowDeleter {
  void operator()(SDL_Window* w) const { SDL_DestroyWindow(w); }
};
struct RendererDeleter {
  void operator()(SDL_Renderer* r) const { SDL_DestroyRenderer(r); }
};

using WindowPtr = std::unique_ptr<SDL_Window, WindowDeleter>;
using RendererPtr = std::unique_ptr<SDL_Renderer, RendererDeleter>;

// SDL_Init/SDL_Quit pair.
class SdlSession {
 public:
  SdlSession() {
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
      throw std::runtime_error(std::string("SDL_Init failed: ") + SDL_GetError());
    }
  }
  ~SdlSession() { SDL_Quit(); }
  SdlSession(const SdlSession&) = delete;
  SdlSession& operator=(const SdlSession&) = delete;
};

// Dear ImGui context plus the SDL2 and SDL_Renderer2 backends.
class ImGuiSession {
 public:
  ImGuiSession(SDL_Window* window, SDL_Renderer* renderer) {
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();
    ImGui::GetIO().ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    ImGui_ImplSDL2_InitForSDLRenderer(window, renderer);
    ImGui_ImplSDLRenderer2_Init(renderer);
  }
  ~ImGuiSession() {
    ImGui_ImplSDLRenderer2_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();
  }
  ImGuiSession(const ImGuiSession&) = delete;
  ImGuiSession& operator=(const ImGuiSession&) = delete;
};

struct LaunchOptions {
  std::string config_path{"data/configs/example.json"};
  std::string overrides_path;
};

// agrisim [CONFIG | --config PATH] [--overrides PATH] [--log-level L]
LaunchOptions parse_options(int argc, char** argv) {
  LaunchOptions opts;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    if (arg == "--config" && has_value) {
      opts.config_path = argv[++i];
    } else if (arg == "--overrides" && has_value) {
      opts.overrides_path = argv[++i];
    } else if (arg == "--log-level" && has_value) {
      agrisim::log::Level level = agrisim::log::Level::Info;
      const std::string name = argv[++i];
      if (!agrisim::log::parse_level(name, level)) throw std::invalid_argument("Unknown --log-level: '" + name + "'");
      agrisim::log::set_level(level);
    } else if (!arg.empty() && arg[0] != '-') {
      opts.config_path = arg;
    } else {
      throw std::invalid_argument("Unknown argument: '" + arg + "'");
    }
  }
  return opts;
}

} // namespace

int main(int argc, char** argv) {
  try {
    agrisim::log::set_level(agrisim::log::Level::Info);
    const LaunchOptions opts = parse_options(argc, argv);

    agrisim::ui::App app(opts.config_path, opts.overrides_path);

    SdlSession sdl;
    const std::string title = "agrisim - " + std::filesystem::path(opts.config_path).filename().string();
    WindowPtr window(SDL_CreateWindow(title.c_str(), SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, 1280, 800,
                                      SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI));
    if (!window) throw std::runtime_error(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
    RendererPtr renderer(
        SDL_CreateRenderer(window.get(), -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC));
    if (!renderer) throw std::runtime_error(std::string("SDL_CreateRenderer failed: ") + SDL_GetError());

    ImGuiSession imgui(window.get(), renderer.get());
    const Uint32 window_id = SDL_GetWindowID(window.get());

    bool running = true;
    while (running) {
      SDL_Event e;
      while (SDL_PollEvent(&e)) {
        ImGui_ImplSDL2_ProcessEvent(&e);
        const bool closed = e.type == SDL_WINDOWEVENT && e.window.event == SDL_WINDOWEVENT_CLOSE &&
                            e.window.windowID == window_id;
        if (e.type == SDL_QUIT || closed) {
          running = false;
          continue;
        }
        app.on_event(e);
      }

      ImGui_ImplSDLRenderer2_NewFrame();
      ImGui_ImplSDL2_NewFrame();
      ImGui::NewFrame();
      app.frame();
      ImGui::Render();

      SDL_SetRenderDrawColor(renderer.get(), 24, 28, 24, 255);
      SDL_RenderClear(renderer.get());
      ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), renderer.get());
      SDL_RenderPresent(renderer.get());
    }
    return 0;
  } catch (const std::invalid_argument& e) {
    agrisim::log::error(e.what());
    return 2;
  } catch (const std::exception& e) {
    agrisim::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
