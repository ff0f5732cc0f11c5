#include "PreviewTexture.h"

#include <SDL_opengl.h>

#include <utility>

namespace promptart::viewer {

PreviewTexture::~PreviewTexture() { destroy(); }

PreviewTexture::PreviewTexture(PreviewTexture&& o) noexcept
  : tex_(std::exchange(o.tex_, 0u)), w_(std::exchange(o.w_, 0)), h_(std::exchange(o.h_, 0)) {}

PreviewTexture& PreviewTexture::operator=(PreviewTexture&& o) noexcept {
  if (this != &o) {
    destroy();
    tex_ = std::exchange(o.tex_, 0u);
    w_ = std::exchange(o.w_, 0);
    h_ = std::exchange(o.h_, 0);
  }
  return *this;
}

void PreviewTexture::destroy() {
  if (tex_) {
    GLuint t = (GLuint)tex_;
    glDeleteTextures(1, &t);
  }
  tex_ = 0;
  w_ = h_ = 0;
}

void PreviewTexture::upload(const art::Canvas& canvas) {
  const bool resize = !tex_ || w_ != canvas.width() || h_ != canvas.height();

  if (!tex_) {
    GLuint t = 0;
    glGenTextures(1, &t);
    tex_ = t;
  }

  glBindTexture(GL_TEXTURE_2D, (GLuint)tex_);
  // Rows are tightly packed RGB8.
  glPixelStorei(GL_UNPACK_ALIGNMENT, 1);

  if (resize) {
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGB8, canvas.width(), canvas.height(), 0,
                 GL_RGB, GL_UNSIGNED_BYTE, canvas.pixels().data());
    w_ = canvas.width();
    h_ = canvas.height();
  } else {
    glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, w_, h_, GL_RGB, GL_UNSIGNED_BYTE, canvas.pixels().data());
  }

  glPixelStorei(GL_UNPACK_ALIGNMENT, 4);
  glBindTexture(GL_TEXTURE_2D, 0);
}

} // namespace promptart::viewer
