#pragma once

#include "promptart/art/Canvas.h"

namespace promptart::viewer {

// GL texture holding the last rendered canvas. Needs a current GL context for
// every call, including destruction.
class PreviewTexture {
public:
  PreviewTexture() = default;
  ~PreviewTexture();

  PreviewTexture(const PreviewTexture&) = delete;
  PreviewTexture& operator=(const PreviewTexture&) = delete;

  PreviewTexture(PreviewTexture&&) noexcept;
  PreviewTexture& operator=(PreviewTexture&&) noexcept;

  // Reallocates when the size changes, otherwise updates in place.
  void upload(const art::Canvas& canvas);

  unsigned int handle() const { return tex_; }
  int width() const { return w_; }
  int height() const { return h_; }
  bool valid() const { return tex_ != 0; }

private:
  void destroy();

  unsigned int tex_{0};
  int w_{0};
  int h_{0};
};

} // namespace promptart::viewer
