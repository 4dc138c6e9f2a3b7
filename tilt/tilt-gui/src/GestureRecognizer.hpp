// Ticket: 0011_preview_app

#ifndef TILT_GUI_GESTURE_RECOGNIZER_HPP
#define TILT_GUI_GESTURE_RECOGNIZER_HPP

#include <chrono>
#include <functional>
#include <utility>

#include <Eigen/Dense>
#include <SDL3/SDL.h>

#include "tilt-core/src/DataTypes/GestureEvents.hpp"
#include "tilt-gui/src/PointerState.hpp"

namespace tilt_gui
{

/**
 * @brief Turns raw mouse input into drag samples and taps
 *
 * Every press starts a drag (Began), motion while pressed produces Changed
 * samples with the cumulative translation, and release produces Ended with
 * the velocity of the last few samples. A release that stayed within
 * tapSlop and tapMaxDuration is additionally reported as a tap, before the
 * Ended sample.
 *
 * Thread safety: Not thread-safe
 */
class GestureRecognizer
{
public:
  using DragHandler = std::function<void(const tilt_core::DragEvent&)>;
  using TapHandler = std::function<void()>;

  struct Config
  {
    double tapSlop{8.0};  // [units]
    std::chrono::milliseconds tapMaxDuration{300};
    std::chrono::milliseconds velocityWindow{
      PointerState::kDefaultVelocityWindow};

    /// @throws std::invalid_argument naming the offending field
    void validate() const;
  };

  GestureRecognizer();
  explicit GestureRecognizer(Config config);
  ~GestureRecognizer() = default;

  GestureRecognizer(const GestureRecognizer&) = delete;
  GestureRecognizer& operator=(const GestureRecognizer&) = delete;
  GestureRecognizer(GestureRecognizer&&) noexcept = default;
  GestureRecognizer& operator=(GestureRecognizer&&) noexcept = default;

  void setDragHandler(DragHandler handler)
  {
    onDrag_ = std::move(handler);
  }

  void setTapHandler(TapHandler handler)
  {
    onTap_ = std::move(handler);
  }

  /**
   * @brief Handle an SDL event
   *
   * Processes left-button down/up, mouse motion and focus loss. Other event
   * types are ignored.
   */
  void handleSDLEvent(const SDL_Event& event);

  void pointerDown(const Eigen::Vector2d& position);
  void pointerMove(const Eigen::Vector2d& position);
  void pointerUp(const Eigen::Vector2d& position);

  /// Abort the current press, reporting Cancelled
  void cancel();

  /// Advance the recognizer clock; call once per frame
  void update(std::chrono::milliseconds deltaTime);

  [[nodiscard]] const PointerState& getPointerState() const
  {
    return pointer_;
  }

private:
  void emitDrag(tilt_core::GesturePhase phase,
                const Eigen::Vector2d& velocity = Eigen::Vector2d::Zero());

  Config config_;
  PointerState pointer_;
  DragHandler onDrag_;
  TapHandler onTap_;
};

}  // namespace tilt_gui

#endif  // TILT_GUI_GESTURE_RECOGNIZER_HPP
