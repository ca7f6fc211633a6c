#ifndef SDL_PTRS_H
#define SDL_PTRS_H

#include <memory>

#include <SDL2/SDL.h>
#include <SDL2/SDL_ttf.h>

namespace detail {

struct SdlWindowDeleter {
  void operator()(SDL_Window* window) const { SDL_DestroyWindow(window); }
};

struct SdlRendererDeleter {
  void operator()(SDL_Renderer* renderer) const {
    SDL_DestroyRenderer(renderer);
  }
};

struct SdlSurfaceDeleter {
  void operator()(SDL_Surface* surface) const { SDL_FreeSurface(surface); }
};

struct SdlTextureDeleter {
  void operator()(SDL_Texture* texture) const { SDL_DestroyTexture(texture); }
};

struct TtfFontDeleter {
  void operator()(TTF_Font* font) const { TTF_CloseFont(font); }
};

} // namespace detail

// Managed RAII pointers to SDL and SDL_ttf objects.
using SdlWindowPtr = std::unique_ptr<SDL_Window, detail::SdlWindowDeleter>;
using SdlRendererPtr =
    std::unique_ptr<SDL_Renderer, detail::SdlRendererDeleter>;
using SdlSurfacePtr = std::unique_ptr<SDL_Surface, detail::SdlSurfaceDeleter>;
using SdlTexturePtr = std::unique_ptr<SDL_Texture, detail::SdlTextureDeleter>;
using TtfFontPtr = std::unique_ptr<TTF_Font, detail::TtfFontDeleter>;

#endif /* SDL_PTRS_H */
