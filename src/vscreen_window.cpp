/**
 * @file vscreen_window.cpp
 * @brief Implementation for the matching vscreen_window.hpp (presentation-only SDL2 shim).
 *
 * Notes:
 * - API/overview lives in vscreen_window.hpp. Keep this file focused on "how" not "what".
 * - Style: block-by-block reasoning; only line comments where maintainers trip.
 */

#include "vscreen_window.hpp"   // Public API surface; keep SDL types out of this header.
#include "vscreen_log.hpp"

/* SDL2. Repo: https://github.com/libsdl-org/SDL (SDL2 branch) */
#include <SDL.h>

/*------------------------------------------------------------------------------
  Internal state
  --------------
  Concrete SDL handles live in an anonymous namespace so no other translation
  unit ever sees them. There is exactly one window per process.
------------------------------------------------------------------------------*/
namespace {
const char* kTag = "window";

SDL_Window*   g_window   = nullptr;
SDL_Renderer* g_renderer = nullptr;
SDL_Texture*  g_texture  = nullptr;
int           g_w        = 0;        // source image size (texture size)
int           g_h        = 0;

// Latched "window ready" flag. Every call below short-circuits if false.
bool g_ok = false;
} // namespace

/*------------------------------------------------------------------------------
  vscreen_window_begin
  --------------------
  Bring up SDL video, a fixed-size window, a renderer and a streaming texture
  the size of the device's framebuffer.

  Invariants:
  - g_ok reflects whether everything was created.
  - On failure every partially created object is destroyed again.

  Phases:
  1) Init the video subsystem.
  2) Window at w*scale x h*scale, not resizable.
  3) Renderer (vsync off; the session paces frames) and nearest scaling.
  4) Streaming ARGB8888 texture of w x h.
------------------------------------------------------------------------------*/
bool vscreen_window_begin(const char* title, int w, int h, int scale) {
  if (g_ok) vscreen_window_end();
  if (w <= 0 || h <= 0 || scale <= 0) return false;

  // Phase 1
  if (SDL_InitSubSystem(SDL_INIT_VIDEO) != 0) {
    VS_LOGE(kTag, "SDL video init failed: %s", SDL_GetError());
    return false;
  }

  // Phase 2
  g_window = SDL_CreateWindow(title ? title : VSCREEN_WINDOW_TITLE,
                              SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                              w * scale, h * scale, SDL_WINDOW_SHOWN);
  if (!g_window) {
    VS_LOGE(kTag, "cannot create window: %s", SDL_GetError());
    vscreen_window_end();
    return false;
  }

  // Phase 3
  SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "0");    // nearest neighbor
  g_renderer = SDL_CreateRenderer(g_window, -1, SDL_RENDERER_ACCELERATED);
  if (!g_renderer) g_renderer = SDL_CreateRenderer(g_window, -1, SDL_RENDERER_SOFTWARE);
  if (!g_renderer) {
    VS_LOGE(kTag, "cannot create renderer: %s", SDL_GetError());
    vscreen_window_end();
    return false;
  }

  // Phase 4
  g_texture = SDL_CreateTexture(g_renderer, SDL_PIXELFORMAT_ARGB8888,
                                SDL_TEXTUREACCESS_STREAMING, w, h);
  if (!g_texture) {
    VS_LOGE(kTag, "cannot create %dx%d texture: %s", w, h, SDL_GetError());
    vscreen_window_end();
    return false;
  }

  g_w = w;
  g_h = h;
  g_ok = true;
  VS_LOGD(kTag, "window %dx%d (x%d)", w * scale, h * scale, scale);
  return true;
}

/*------------------------------------------------------------------------------
  vscreen_window_present
  ----------------------
  Copy the frame into the texture and stretch it over the whole window.
  The pitch is w*4 bytes because the session keeps pixels tightly packed.
------------------------------------------------------------------------------*/
void vscreen_window_present(const uint32_t* argb) {
  if (!g_ok || !argb) return;
  if (SDL_UpdateTexture(g_texture, nullptr, argb, g_w * static_cast<int>(sizeof(uint32_t))) != 0) {
    VS_LOGW(kTag, "texture upload failed: %s", SDL_GetError());
    return;
  }
  SDL_RenderClear(g_renderer);
  SDL_RenderCopy(g_renderer, g_texture, nullptr, nullptr);
  SDL_RenderPresent(g_renderer);
}

/*------------------------------------------------------------------------------
  vscreen_window_poll
  -------------------
  Drain the SDL queue. Quit and close map to "stop"; S raises the snapshot
  flag. Everything else is ignored.
------------------------------------------------------------------------------*/
bool vscreen_window_poll(bool& snapshot) {
  if (!g_ok) return false;

  bool keep = true;
  SDL_Event ev;
  while (SDL_PollEvent(&ev)) {
    switch (ev.type) {
      case SDL_QUIT:
        keep = false;
        break;
      case SDL_WINDOWEVENT:
        if (ev.window.event == SDL_WINDOWEVENT_CLOSE) keep = false;
        break;
      case SDL_KEYDOWN:
        if (ev.key.repeat) break;
        switch (ev.key.keysym.sym) {
          case SDLK_ESCAPE:
          case SDLK_q:
            keep = false;
            break;
          case SDLK_s:
            snapshot = true;
            break;
          default:
            break;
        }
        break;
      default:
        break;
    }
  }
  return keep;
}

void vscreen_window_end() {
  if (g_texture)  SDL_DestroyTexture(g_texture);
  if (g_renderer) SDL_DestroyRenderer(g_renderer);
  if (g_window)   SDL_DestroyWindow(g_window);
  g_texture = nullptr;
  g_renderer = nullptr;
  g_window = nullptr;
  g_ok = false;
  if (SDL_WasInit(SDL_INIT_VIDEO)) SDL_Quit();   // video is the only subsystem we start
}

namespace {
const DisplayOps kWindowOps = {
  vscreen_window_begin,
  vscreen_window_present,
  vscreen_window_poll,
  vscreen_window_end,
};
} // namespace

const DisplayOps* vscreen_window_ops() {
  return &kWindowOps;
}
