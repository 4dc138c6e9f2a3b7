// Ticket: 0011_preview_app

#ifndef TILT_GUI_POINTER_STATE_HPP
#define TILT_GUI_POINTER_STATE_HPP

#include <chrono>
#include <deque>

#include <Eigen/Dense>

namespace tilt_gui
{

/**
 * @brief A timestamped pointer position
 */
struct PointerSample
{
  Eigen::Vector2d position{Eigen::Vector2d::Zero()};
  std::chrono::milliseconds time{0};
};

/**
 * @brief Tracks the primary pointer between press and release
 *
 * Keeps the press position and a short window of recent samples so the
 * release velocity reflects the last movement rather than the whole drag.
 *
 * Thread safety: Not thread-safe (single-threaded GUI operation assumed)
 */
class PointerState
{
public:
  static constexpr std::chrono::milliseconds kDefaultVelocityWindow{100};

  explicit PointerState(
    std::chrono::milliseconds velocityWindow = kDefaultVelocityWindow);
  ~PointerState() = default;

  PointerState(const PointerState&) = default;
  PointerState& operator=(const PointerState&) = default;
  PointerState(PointerState&&) noexcept = default;
  PointerState& operator=(PointerState&&) noexcept = default;

  /**
   * @brief Start tracking at the given position
   *
   * A press while already pressed restarts tracking from the new position.
   */
  void press(const Eigen::Vector2d& position);

  /// Record a motion sample; ignored while released
  void move(const Eigen::Vector2d& position);

  /// Record the final sample and stop tracking
  void release(const Eigen::Vector2d& position);

  /**
   * @brief Advance the internal clock
   * @param deltaTime Time elapsed since last update
   */
  void update(std::chrono::milliseconds deltaTime);

  [[nodiscard]] bool isPressed() const
  {
    return pressed_;
  }

  [[nodiscard]] const Eigen::Vector2d& getPosition() const
  {
    return position_;
  }

  /// Cumulative translation since press
  [[nodiscard]] Eigen::Vector2d getTranslation() const
  {
    return position_ - pressPosition_;
  }

  /// Largest distance from the press position seen during this press
  [[nodiscard]] double getMaxTravel() const
  {
    return maxTravel_;
  }

  /// Time since press (0 if released)
  [[nodiscard]] std::chrono::milliseconds getPressDuration() const;

  /**
   * @brief Velocity over the sample window [units/s]
   *
   * Zero with fewer than two samples or when the samples share a timestamp.
   */
  [[nodiscard]] Eigen::Vector2d getVelocity() const;

  void reset();

private:
  void record(const Eigen::Vector2d& position);

  std::chrono::milliseconds velocityWindow_;
  std::chrono::milliseconds currentTime_{0};
  std::chrono::milliseconds pressTime_{0};
  bool pressed_{false};
  Eigen::Vector2d pressPosition_{Eigen::Vector2d::Zero()};
  Eigen::Vector2d position_{Eigen::Vector2d::Zero()};
  double maxTravel_{0.0};
  std::deque<PointerSample> samples_;
};

}  // namespace tilt_gui

#endif  // TILT_GUI_POINTER_STATE_HPP
