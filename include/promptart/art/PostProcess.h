#pragma once

#include "promptart/art/Canvas.h"

#include <vector>

namespace promptart::art {

// Default softening applied to finished scenes.
inline constexpr double kDefaultBlurSigma = 0.5;

// Normalised 1D Gaussian weights, radius ceil(3*sigma), size 2*radius+1.
// sigma <= 0 yields the identity kernel {1}.
std::vector<float> gaussianKernel(double sigma);

// Separable Gaussian blur, edges clamped. No-op for sigma <= 0.
void gaussianBlur(Canvas& canvas, double sigma);

} // namespace promptart::art
