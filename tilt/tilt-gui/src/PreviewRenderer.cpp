// Ticket: 0011_preview_app

#include "tilt-gui/src/PreviewRenderer.hpp"

#include <array>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "tilt-gui/src/SDLUtils.hpp"

namespace tilt_gui
{

namespace
{

// One colour per textured design, RGBA
constexpr std::array<uint32_t, 5> kDesignPalette{
  0x1F3A93FF, 0x2E2E2EFF, 0xB8860BFF, 0x8E44ADFF, 0x16A085FF};

constexpr float kBackShade = 0.55f;
constexpr float kDebugGlyphSize = 8.0f;  // SDL_DEBUG_TEXT_FONT_CHARACTER_SIZE

SDL_FColor toFColor(uint32_t rgba, float shade)
{
  return SDL_FColor{static_cast<float>((rgba >> 24) & 0xFF) / 255.0f * shade,
                    static_cast<float>((rgba >> 16) & 0xFF) / 255.0f * shade,
                    static_cast<float>((rgba >> 8) & 0xFF) / 255.0f * shade,
                    static_cast<float>(rgba & 0xFF) / 255.0f};
}

}  // namespace

PreviewRenderer::PreviewRenderer(SDL_Renderer& renderer,
                                 std::shared_ptr<spdlog::logger> logger)
  : renderer_{renderer}, logger_{std::move(logger)}
{
  if (!logger_)
  {
    throw std::invalid_argument{"PreviewRenderer: logger must not be null"};
  }
}

void PreviewRenderer::commitPose(const tilt_core::Pose& pose,
                                 const tilt_core::AnimationHint& hint)
{
  logger_->trace("Commit {} over {} ms", pose, hint.duration.count());
  animator_.commit(pose, hint);
}

tilt_core::SceneHandle PreviewRenderer::rebuild(
  const tilt_core::CardIdentity& identity,
  const tilt_core::CardStyle& style,
  const tilt_core::FieldVisibility& visibility)
{
  identity_ = identity;
  visibility_ = visibility;
  color_ = styleColor(style);

  const tilt_core::SceneHandle handle{++sceneCounter_};
  logger_->info("Built scene {} for design {}", handle.id, style.designNumber());
  return handle;
}

void PreviewRenderer::update(std::chrono::milliseconds deltaTime)
{
  animator_.update(deltaTime);
}

void PreviewRenderer::draw(float width, float height) const
{
  if (sceneCounter_ == 0)
  {
    return;
  }

  const auto card = projection_.project(animator_.getDisplayed(), width, height);
  const SDL_FColor fill =
    toFColor(color_, card.frontFacing ? 1.0f : kBackShade);

  std::array<SDL_Vertex, 4> vertices{};
  for (size_t i = 0; i < vertices.size(); ++i)
  {
    vertices[i].position = SDL_FPoint{card.corners[i].x(), card.corners[i].y()};
    vertices[i].color = fill;
  }
  constexpr std::array<int, 6> indices{0, 1, 2, 0, 2, 3};

  if (!SDL_RenderGeometry(&renderer_,
                          nullptr,
                          vertices.data(),
                          static_cast<int>(vertices.size()),
                          indices.data(),
                          static_cast<int>(indices.size())))
  {
    throw SDLException("Failed to render card geometry");
  }

  drawFields(card);
}

uint32_t PreviewRenderer::styleColor(const tilt_core::CardStyle& style)
{
  if (style.kind == tilt_core::CardStyle::Kind::AlphaTextured)
  {
    return style.backgroundColor.value_or(0xFFFFFF80);
  }
  return kDesignPalette[static_cast<size_t>(
    style.designNumber() - tilt_core::CardStyle::kMinDesign)];
}

void PreviewRenderer::drawFields(const CardProjection::ProjectedCard& card) const
{
  std::vector<std::string> lines;
  if (card.frontFacing)
  {
    if (visibility_.cardNumber)
    {
      lines.push_back(identity_.cardNumber);
    }
    if (visibility_.cardholderName)
    {
      lines.push_back(identity_.cardholderName);
    }
    if (visibility_.expiryDate)
    {
      lines.push_back(fmt::format("VALID THRU {}", identity_.expiryDate));
    }
  }
  else if (visibility_.cvv)
  {
    lines.push_back(fmt::format("CVV {}", identity_.cvv));
  }

  // Anchor the text block on the projected card centre
  Eigen::Vector2f centre = Eigen::Vector2f::Zero();
  for (const auto& corner : card.corners)
  {
    centre += corner / 4.0f;
  }

  SDL_SetRenderDrawColor(&renderer_, 255, 255, 255, 255);
  float y = centre.y() - kDebugGlyphSize * static_cast<float>(lines.size());
  for (const auto& line : lines)
  {
    const float x =
      centre.x() - kDebugGlyphSize * static_cast<float>(line.size()) / 2.0f;
    SDL_RenderDebugText(&renderer_, x, y, line.c_str());
    y += 2.0f * kDebugGlyphSize;
  }
}

}  // namespace tilt_gui
