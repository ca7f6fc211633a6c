#ifndef SCREEN_H
#define SCREEN_H

#include <SDL2/SDL.h>
#include <SDL2/SDL_ttf.h>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "sdl-ptrs.h"

struct Color {
  unsigned char r, g, b;

  static const Color& Black() {
    static const Color c{0, 0, 0};
    return c;
  }

  static const Color& White() {
    static const Color c{255, 255, 255};
    return c;
  }

  static const Color& Gray() {
    static const Color c{64, 64, 64};
    return c;
  }
};

// A nice wrapper around an SDL window with a renderer and an optional font for
// status text.
class Screen {
public:
  Screen(const std::string& title, int width, int height, int font_size)
      : width_(width), height_(height) {
    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
      error_ = SDL_GetError();
      return;
    }
    sdl_initialized_ = true;
    if (TTF_Init() == 0) {
      ttf_initialized_ = true;
      // Text is optional, the emulator still works without a font.
      font_.reset(TTF_OpenFont("./font.ttf", font_size));
    }

    window_.reset(SDL_CreateWindow(title.c_str(), SDL_WINDOWPOS_CENTERED,
                                   SDL_WINDOWPOS_CENTERED, width_, height_,
                                   SDL_WINDOW_SHOWN));
    if (!window_) {
      error_ = SDL_GetError();
      return;
    }

    // The renderer is created here on every platform. `renderer_` owns it.
    renderer_.reset(
        SDL_CreateRenderer(window_.get(), /* index = */ -1, /* flags= */ 0));
    if (!renderer_) {
      error_ = SDL_GetError();
    }
  }

  Screen(const Screen&) = delete;
  Screen& operator=(const Screen&) = delete;

  // False if the window or renderer couldn't be created; `error()` says why.
  bool ok() const { return error_.empty(); }
  const std::string& error() const { return error_; }

  int width() const { return width_; }
  int height() const { return height_; }

  // Fire `handler` when the provided key is pressed down. Keyboard auto
  // repeat is filtered out.
  void OnKeyDown(SDL_Scancode key, std::function<void()> handler) {
    key_down_handlers_[key].push_back(std::move(handler));
  }

  // Fire `handler` when the provided key is released.
  void OnKeyUp(SDL_Scancode key, std::function<void()> handler) {
    key_up_handlers_[key].push_back(std::move(handler));
  }

  // Drains the event queue. Returns false if you should stop polling for
  // events.
  bool PollEvent() {
    SDL_Event sdl_event;
    while (SDL_PollEvent(&sdl_event)) {
      switch (sdl_event.type) {
      case SDL_QUIT: {
        return false;
      }
      case SDL_KEYDOWN: {
        if (sdl_event.key.repeat) {
          break;
        }
        Dispatch(key_down_handlers_, sdl_event.key.keysym.scancode);
        break;
      }
      case SDL_KEYUP: {
        Dispatch(key_up_handlers_, sdl_event.key.keysym.scancode);
        break;
      }
      }
    }
    return open_;
  }

  // Makes the next `PollEvent` report that the window should close.
  void RequestClose() { open_ = false; }

  // Commit all rendering and update the screen.
  void Update() { SDL_RenderPresent(renderer_.get()); }

  // Draw the provided rects to the screen.
  void DrawRects(const std::vector<SDL_Rect>& rects, const Color& c) {
    SDL_SetRenderDrawColor(renderer_.get(), c.r, c.g, c.b, 255);
    SDL_RenderFillRects(renderer_.get(), rects.data(),
                        static_cast<int>(rects.size()));
  }

  // Draws the provided text to the screen at the given x,y coordinates and
  // returns the rect which encapsulates the text. Without a font nothing is
  // drawn and the rect is empty.
  SDL_Rect DrawText(const std::string& text, int x, int y, const Color& c) {
    SDL_Rect rect{x, y, 0, 0};
    if (!font_ || text.empty()) {
      return rect;
    }
    SDL_Color color = {c.r, c.g, c.b, 255};
    auto message_surface =
        SdlSurfacePtr(TTF_RenderText_Solid(font_.get(), text.c_str(), color));
    if (!message_surface) {
      return rect;
    }
    auto message_texture = SdlTexturePtr(
        SDL_CreateTextureFromSurface(renderer_.get(), message_surface.get()));
    TTF_SizeText(font_.get(), text.c_str(), &rect.w, &rect.h);
    SDL_RenderCopy(renderer_.get(), message_texture.get(),
                   /* crop_rect= */ nullptr, &rect);
    return rect;
  }

  // Clear the screen with the provided color.
  void Clear(const Color& c) {
    SDL_SetRenderDrawColor(renderer_.get(), c.r, c.g, c.b, 255);
    SDL_RenderClear(renderer_.get());
  }

  void Close() {
    font_.reset();
    renderer_.reset();
    window_.reset();
    if (ttf_initialized_) {
      TTF_Quit();
      ttf_initialized_ = false;
    }
    if (sdl_initialized_) {
      SDL_Quit();
      sdl_initialized_ = false;
    }
    open_ = false;
  }

  ~Screen() { Close(); }

private:
  using HandlerMap =
      std::unordered_map<SDL_Scancode, std::vector<std::function<void()>>>;

  static void Dispatch(HandlerMap& handlers, SDL_Scancode key) {
    auto found = handlers.find(key);
    if (found == handlers.end()) {
      return;
    }
    for (const auto& handler : found->second) {
      handler();
    }
  }

  SdlWindowPtr window_;
  SdlRendererPtr renderer_;
  TtfFontPtr font_;
  bool open_ = true;
  bool sdl_initialized_ = false;
  bool ttf_initialized_ = false;
  int width_;
  int height_;
  std::string error_;
  HandlerMap key_down_handlers_;
  HandlerMap key_up_handlers_;
};

#endif /* SCREEN_H */
