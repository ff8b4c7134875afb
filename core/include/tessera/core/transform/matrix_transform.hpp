#pragma once
#include <utility>

namespace tessera::core {

// Lets any linear or affine map with an `m * v` product (Eigen::Matrix3f,
// Eigen::Affine3f, Eigen::Matrix4f, ...) be applied wherever a transform with
// a transform(v) member is expected, e.g. SimplexMesh::applyTransform.
template <typename M>
class MatrixTransform {
public:
  explicit MatrixTransform(M m) : m_(std::move(m)) {}

  const M& matrix() const { return m_; }

  template <typename V>
  V transform(const V& v) const {
    return V(m_ * v);
  }

private:
  M m_;
};

template <typename M>
MatrixTransform<M> makeMatrixTransform(M m) {
  return MatrixTransform<M>(std::move(m));
}

}  // namespace tessera::core
