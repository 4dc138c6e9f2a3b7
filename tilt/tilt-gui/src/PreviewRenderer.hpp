// Ticket: 0011_preview_app

#ifndef TILT_GUI_PREVIEW_RENDERER_HPP
#define TILT_GUI_PREVIEW_RENDERER_HPP

#include <chrono>
#include <cstdint>
#include <memory>

#include <SDL3/SDL.h>
#include <spdlog/spdlog.h>

#include "tilt-core/src/Collaborators/Renderer.hpp"
#include "tilt-gui/src/CardProjection.hpp"
#include "tilt-gui/src/PoseAnimator.hpp"

namespace tilt_gui
{

/**
 * @brief Flat-shaded card preview drawn with the SDL 2D renderer
 *
 * The card is a single quad projected by CardProjection and filled with the
 * style colour, darker on the back face. Visible identity fields are
 * printed with SDL's debug text on the side they belong to.
 *
 * Thread safety: Not thread-safe (SDL renderer thread only)
 */
class PreviewRenderer final : public tilt_core::Renderer
{
public:
  PreviewRenderer(SDL_Renderer& renderer,
                  std::shared_ptr<spdlog::logger> logger);

  void commitPose(const tilt_core::Pose& pose,
                  const tilt_core::AnimationHint& hint) override;

  tilt_core::SceneHandle rebuild(
    const tilt_core::CardIdentity& identity,
    const tilt_core::CardStyle& style,
    const tilt_core::FieldVisibility& visibility) override;

  /// Advance the pose animation
  void update(std::chrono::milliseconds deltaTime);

  /**
   * @brief Draw the card into the current render target
   * @throws SDLException if SDL rejects the geometry
   */
  void draw(float width, float height) const;

  [[nodiscard]] const PoseAnimator& getAnimator() const
  {
    return animator_;
  }

  /// Fill colour for a style, as RGBA
  static uint32_t styleColor(const tilt_core::CardStyle& style);

private:
  void drawFields(const CardProjection::ProjectedCard& card) const;

  SDL_Renderer& renderer_;
  std::shared_ptr<spdlog::logger> logger_;
  CardProjection projection_;
  PoseAnimator animator_;

  uint64_t sceneCounter_{0};
  tilt_core::CardIdentity identity_;
  tilt_core::FieldVisibility visibility_;
  uint32_t color_{0};
};

}  // namespace tilt_gui

#endif  // TILT_GUI_PREVIEW_RENDERER_HPP
