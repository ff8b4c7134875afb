#pragma once
#include "tessera/core/algebra/rotor4.hpp"
#include "tessera/core/common/constants.hpp"
#include "tessera/core/math/vector_traits.hpp"

namespace tessera::core {

// Similarity transform of 4D space, p -> rotate(p) * scale + translation.
//
// rotated(), scaled() and translated() append an operation after this one;
// compose(other) appends all of `other`. The translation is carried along by
// every appended rotation and scale since those act on the whole image.
template <typename V>
class RotateScaleTranslate4 {
  static_assert(kVectorDimension<V> == 4, "RotateScaleTranslate4 needs 4-component vectors");

public:
  using Vector = V;
  using Matrix = typename VectorTraits<V>::Matrix4;

  RotateScaleTranslate4()
      : rotation_(), scale_(1.0f), translation_(VectorTraits<V>::zero()) {}
  RotateScaleTranslate4(const Rotor4& rotation, float scale, const V& translation)
      : rotation_(rotation), scale_(scale), translation_(translation) {}

  static RotateScaleTranslate4 identity() { return RotateScaleTranslate4(); }

  const Rotor4& rotation() const { return rotation_; }
  float scale() const { return scale_; }
  const V& translation() const { return translation_; }

  V transform(const V& p) const {
    using T = VectorTraits<V>;
    return T::add(T::scale(rotation_.transform(p), scale_), translation_);
  }

  // Rotation only; directions ignore scale and translation.
  V transformDirection(const V& d) const { return rotation_.transform(d); }

  RotateScaleTranslate4 rotated(const Rotor4& r) const {
    return {rotation_.compose(r), scale_, r.transform(translation_)};
  }

  RotateScaleTranslate4 scaled(float s) const {
    return {rotation_, scale_ * s, VectorTraits<V>::scale(translation_, s)};
  }

  RotateScaleTranslate4 translated(const V& offset) const {
    return {rotation_, scale_, VectorTraits<V>::add(translation_, offset)};
  }

  // this, then other
  RotateScaleTranslate4 compose(const RotateScaleTranslate4& other) const {
    return rotated(other.rotation_).scaled(other.scale_).translated(other.translation_);
  }

  // p -> R^-1 (p - t) / s. A zero scale has no inverse and is returned as is.
  RotateScaleTranslate4 inverse() const {
    if (scale_ == 0.0f) {
      log(LogLevel::Error, "rst4", "inverse: zero scale has no inverse");
      return *this;
    }
    const Rotor4 inv_rot = rotation_.inverse();
    const float inv_scale = 1.0f / scale_;
    const V t = VectorTraits<V>::scale(inv_rot.transform(translation_), -inv_scale);
    return {inv_rot, inv_scale, t};
  }

  // Linear in scale and translation, spherical in rotation.
  RotateScaleTranslate4 interpolateWith(const RotateScaleTranslate4& other, float t,
                                        const Thresholds& thr = kDefaultThresholds) const {
    return {rotation_.interpolateWith(other.rotation_, t, thr),
            scale_ + (other.scale_ - scale_) * t,
            lerp(translation_, other.translation_, t)};
  }

  // Rotation and scale as one 4x4 matrix. The translation has no place in a
  // 4x4 matrix of 4D space and is applied separately.
  Matrix rotateScaleMatrix() const {
    Mat4Array m = rotation_.toMat4Array();
    for (auto& col : m) {
      for (float& v : col) v *= scale_;
    }
    return Matrix4Traits<Matrix>::fromColumns(m);
  }

private:
  Rotor4 rotation_;
  float scale_;
  V translation_;
};

}  // namespace tessera::core
