// Ticket: 0011_preview_app

#include "tilt-gui/src/CardProjection.hpp"

#include <cmath>
#include <stdexcept>

namespace tilt_gui
{

CardProjection::CardProjection(float fovDegrees,
                               float cameraDistance,
                               float nearPlane,
                               float farPlane)
  : fovRadians_{fovDegrees * static_cast<float>(M_PI) / 180.0f},
    cameraDistance_{cameraDistance},
    nearPlane_{nearPlane},
    farPlane_{farPlane}
{
  if (!(fovDegrees > 0.0f && fovDegrees < 180.0f))
  {
    throw std::invalid_argument{"CardProjection: fov must be in (0, 180)"};
  }
  if (!(nearPlane > 0.0f && farPlane > nearPlane))
  {
    throw std::invalid_argument{
      "CardProjection: clipping planes must satisfy 0 < near < far"};
  }
  if (!(cameraDistance > nearPlane))
  {
    throw std::invalid_argument{
      "CardProjection: camera must sit beyond the near plane"};
  }
}

Eigen::Matrix4f CardProjection::getModelMatrix(const tilt_core::Pose& pose)
{
  const Eigen::Matrix3f rotation =
    (Eigen::AngleAxisf{static_cast<float>(pose.yaw), Eigen::Vector3f::UnitY()} *
     Eigen::AngleAxisf{static_cast<float>(pose.pitch), Eigen::Vector3f::UnitX()})
      .toRotationMatrix();

  Eigen::Matrix4f model = Eigen::Matrix4f::Identity();
  model.block<3, 3>(0, 0) = rotation * static_cast<float>(pose.scale);
  return model;
}

Eigen::Matrix4f CardProjection::getViewMatrix() const
{
  // Camera on +Z with identity rotation: the view is a pure translation
  Eigen::Matrix4f view = Eigen::Matrix4f::Identity();
  view(2, 3) = -cameraDistance_;
  return view;
}

Eigen::Matrix4f CardProjection::getProjectionMatrix(float aspectRatio) const
{
  const float f = 1.0f / std::tan(fovRadians_ / 2.0f);
  const float rangeInv = 1.0f / (nearPlane_ - farPlane_);

  Eigen::Matrix4f projection = Eigen::Matrix4f::Zero();
  projection(0, 0) = f / aspectRatio;
  projection(1, 1) = f;
  projection(2, 2) = (farPlane_ + nearPlane_) * rangeInv;
  projection(2, 3) = 2.0f * farPlane_ * nearPlane_ * rangeInv;
  projection(3, 2) = -1.0f;  // W = -Z
  return projection;
}

CardProjection::ProjectedCard CardProjection::project(
  const tilt_core::Pose& pose,
  float width,
  float height) const
{
  if (!(width > 0.0f && height > 0.0f))
  {
    throw std::invalid_argument{"CardProjection: viewport must be non-empty"};
  }

  const Eigen::Matrix4f model = getModelMatrix(pose);
  const Eigen::Matrix4f modelView = getViewMatrix() * model;
  const Eigen::Matrix4f mvp = getProjectionMatrix(width / height) * modelView;

  const float halfW = kCardWidth / 2.0f;
  const float halfH = kCardHeight / 2.0f;
  const std::array<Eigen::Vector4f, 4> local{
    Eigen::Vector4f{-halfW, halfH, 0.0f, 1.0f},
    Eigen::Vector4f{halfW, halfH, 0.0f, 1.0f},
    Eigen::Vector4f{halfW, -halfH, 0.0f, 1.0f},
    Eigen::Vector4f{-halfW, -halfH, 0.0f, 1.0f}};

  ProjectedCard result;
  for (size_t i = 0; i < local.size(); ++i)
  {
    const Eigen::Vector4f clip = mvp * local[i];
    const Eigen::Vector2f ndc = clip.head<2>() / clip.w();
    result.corners[i] = Eigen::Vector2f{(ndc.x() + 1.0f) * 0.5f * width,
                                        (1.0f - ndc.y()) * 0.5f * height};
  }

  // Front face visible when its normal points at the camera (view origin)
  const Eigen::Vector3f normal = modelView.block<3, 3>(0, 0) *
                                 Eigen::Vector3f::UnitZ();
  const Eigen::Vector3f centre = modelView.block<3, 1>(0, 3);
  result.frontFacing = normal.dot(-centre) > 0.0f;

  return result;
}

}  // namespace tilt_gui
