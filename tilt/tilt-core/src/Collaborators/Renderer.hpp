// Ticket: 0007_card_controller

#ifndef TILT_CORE_COLLABORATORS_RENDERER_HPP
#define TILT_CORE_COLLABORATORS_RENDERER_HPP

#include <cstdint>

#include "tilt-core/src/Animation/AnimationHint.hpp"
#include "tilt-core/src/DataTypes/CardConfiguration.hpp"
#include "tilt-core/src/DataTypes/Pose.hpp"

namespace tilt_core
{

/**
 * @brief Opaque identifier of a built card scene
 *
 * Issued by the renderer on rebuild. The controller never interprets the
 * value; it only stores it so the host can tell scenes apart.
 */
struct SceneHandle
{
  uint64_t id{0};

  bool operator==(const SceneHandle&) const = default;
};

/**
 * @brief Abstract interface for whatever draws the card
 *
 * Geometry, materials, text layout, lights and camera all live behind this
 * boundary. The controller only ever asks for two things:
 * - rebuild the card scene for a new identity/appearance
 * - show a pose, animating there according to a hint
 *
 * commitPose() is fire-and-forget and must not block. rebuild() may throw
 * any std::exception; the controller then stays inert until the next
 * successful rebuild.
 *
 * Thread safety: Called from the controller's thread only
 */
class Renderer
{
public:
  virtual ~Renderer() = default;

  /**
   * @brief Show a pose
   * @param pose Target orientation, already validated by the controller
   * @param hint How to animate from the currently shown pose
   */
  virtual void commitPose(const Pose& pose, const AnimationHint& hint) = 0;

  /**
   * @brief Discard the current scene and build one for the given card
   * @return Handle of the new scene
   */
  virtual SceneHandle rebuild(const CardIdentity& identity,
                              const CardStyle& style,
                              const FieldVisibility& visibility) = 0;

protected:
  Renderer() = default;
  Renderer(const Renderer&) = default;
  Renderer& operator=(const Renderer&) = default;
  Renderer(Renderer&&) noexcept = default;
  Renderer& operator=(Renderer&&) noexcept = default;
};

}  // namespace tilt_core

#endif  // TILT_CORE_COLLABORATORS_RENDERER_HPP
