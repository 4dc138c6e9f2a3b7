// Ticket: 0011_preview_app

#ifndef TILT_GUI_CARD_PROJECTION_HPP
#define TILT_GUI_CARD_PROJECTION_HPP

#include <array>

#include <Eigen/Dense>

#include "tilt-core/src/DataTypes/Pose.hpp"

namespace tilt_gui
{

/**
 * @brief Perspective camera fixed in front of a single card
 *
 * Right-handed coordinates with X right, Y up and Z toward the viewer. The
 * card lies in the XY plane at the origin, with its front face along +Z,
 * and the camera sits on the +Z axis looking at it.
 */
class CardProjection
{
public:
  /// ISO/IEC 7810 ID-1 proportions, card width normalized to 1
  static constexpr float kCardWidth = 1.0f;
  static constexpr float kCardHeight = 53.98f / 85.6f;

  struct ProjectedCard
  {
    // Top-left, top-right, bottom-right, bottom-left, in window pixels
    std::array<Eigen::Vector2f, 4> corners;
    bool frontFacing{true};
  };

  /**
   * @param fovDegrees Vertical field of view
   * @param cameraDistance Distance from the camera to the card centre
   */
  explicit CardProjection(float fovDegrees = 40.0f,
                          float cameraDistance = 2.2f,
                          float nearPlane = 0.1f,
                          float farPlane = 100.0f);

  /// Yaw about Y, then pitch about X, then uniform scale
  [[nodiscard]] static Eigen::Matrix4f getModelMatrix(
    const tilt_core::Pose& pose);

  [[nodiscard]] Eigen::Matrix4f getViewMatrix() const;

  /**
   * @brief Perspective projection for a viewport
   * @param aspectRatio Width/height of the viewport
   */
  [[nodiscard]] Eigen::Matrix4f getProjectionMatrix(float aspectRatio) const;

  /**
   * @brief Project the card outline into window pixels
   * @param pose Pose as currently displayed
   * @param width Viewport width [px], > 0
   * @param height Viewport height [px], > 0
   */
  [[nodiscard]] ProjectedCard project(const tilt_core::Pose& pose,
                                      float width,
                                      float height) const;

private:
  float fovRadians_;
  float cameraDistance_;
  float nearPlane_;
  float farPlane_;
};

}  // namespace tilt_gui

#endif  // TILT_GUI_CARD_PROJECTION_HPP
