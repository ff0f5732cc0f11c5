#pragma once

#include <type_traits>

namespace promptart::core {

// Clamp helpers that tolerate mixed argument types (int vs u8 vs double),
// where std::clamp would need every argument to share one type.

template <class T>
constexpr T clamp(T v, T lo, T hi) {
  return (v < lo) ? lo : ((v > hi) ? hi : v);
}

// Clamp in the common type of the inputs, then cast to Out.
// Typical use: clampCast<u8>(channel + delta, 0, 255).
template <class Out, class In, class Lo, class Hi>
constexpr Out clampCast(In v, Lo lo, Hi hi) {
  using C = std::common_type_t<In, Lo, Hi>;
  C cv = static_cast<C>(v);
  const C clo = static_cast<C>(lo);
  const C chi = static_cast<C>(hi);
  if (cv < clo) cv = clo;
  if (cv > chi) cv = chi;
  return static_cast<Out>(cv);
}

} // namespace promptart::core
