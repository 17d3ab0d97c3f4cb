#include <SDL.h>

#include <iostream>

#include <imgui.h>

#include "ui/app.h"

#define AGRISIM_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

SDL_Event key_down(SDL_Keycode sym, Uint16 mod = KMOD_NONE, Uint8 repeat = 0) {
  SDL_Event e{};
  e.type = SDL_KEYDOWN;
  e.key.keysym.sym = sym;
  e.key.keysym.mod = mod;
  e.key.repeat = repeat;
  return e;
}

// The App reads ImGui IO state; no renderer backend is needed for that.
struct ImGuiContextGuard {
  ImGuiContextGuard() { ImGui::CreateContext(); }
  ~ImGuiContextGuard() { ImGui::DestroyContext(); }
};

} // namespace

int test_ui_app() {
  using agrisim::ui::App;
  ImGuiContextGuard imgui;

  {
    App app("data/configs/example.json");
    AGRISIM_ASSERT(app.has_report());
    AGRISIM_ASSERT(app.runs() == 1);

    app.on_event(key_down(SDLK_r, KMOD_LCTRL));
    AGRISIM_ASSERT(app.runs() == 2);

    // Plain R, held-key repeats and key releases do nothing.
    app.on_event(key_down(SDLK_r));
    app.on_event(key_down(SDLK_r, KMOD_RCTRL, 1));
    SDL_Event up = key_down(SDLK_r, KMOD_LCTRL);
    up.type = SDL_KEYUP;
    app.on_event(up);
    AGRISIM_ASSERT(app.runs() == 2);

    // F5 reloads from disk, which reruns the year.
    app.on_event(key_down(SDLK_F5));
    AGRISIM_ASSERT(app.runs() == 3);
    AGRISIM_ASSERT(app.has_report());
  }

  // Saves load through the importer.
  {
    App app("tests/data/save_fixture.xml");
    AGRISIM_ASSERT(app.has_report());
    AGRISIM_ASSERT(app.runs() == 1);
  }

  // A missing config leaves nothing to rerun.
  {
    App app("tests/data/no_such_config.json");
    AGRISIM_ASSERT(!app.has_report());
    app.on_event(key_down(SDLK_r, KMOD_LCTRL));
    AGRISIM_ASSERT(app.runs() == 0);
  }
  return 0;
}
