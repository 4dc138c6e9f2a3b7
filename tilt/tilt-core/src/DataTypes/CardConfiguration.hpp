// Ticket: 0006_rotation_arbiter

#ifndef TILT_CORE_CARD_CONFIGURATION_HPP
#define TILT_CORE_CARD_CONFIGURATION_HPP

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace tilt_core
{

/**
 * @brief Printed data that identifies a card
 *
 * Any change here invalidates the built scene.
 */
struct CardIdentity
{
  std::string cardholderName;
  std::string cardNumber;  // "4532 1234 5678 9010"
  std::string expiryDate;  // "12/28"
  std::string cvv;

  bool operator==(const CardIdentity&) const = default;
};

/**
 * @brief Visual style of the card body
 *
 * Designs are numbered 1..5; out-of-range numbers are clamped on read so two
 * styles that render identically also compare equal.
 */
struct CardStyle
{
  enum class Kind : uint8_t
  {
    OpaqueTextured,
    AlphaTextured  // Transparent texture over backgroundColor
  };

  static constexpr int kMinDesign = 1;
  static constexpr int kMaxDesign = 5;

  Kind kind{Kind::OpaqueTextured};
  int design{1};
  std::optional<uint32_t> backgroundColor;  // RGBA, AlphaTextured only

  [[nodiscard]] int designNumber() const
  {
    return std::clamp(design, kMinDesign, kMaxDesign);
  }

  bool operator==(const CardStyle& other) const
  {
    return kind == other.kind && designNumber() == other.designNumber() &&
           (kind == Kind::OpaqueTextured ||
            backgroundColor == other.backgroundColor);
  }
};

/**
 * @brief Which printed fields are laid out on the card
 */
struct FieldVisibility
{
  bool cardNumber{true};
  bool cardholderName{true};
  bool expiryDate{true};
  bool cvv{true};

  bool operator==(const FieldVisibility&) const = default;
};

/**
 * @brief How the card reacts to pointer input
 *
 * Closed set; each mode is attached/detached by InteractionHandler.
 */
enum class InteractionMode : uint8_t
{
  FreeRotation,  // Drag to rotate with inertia, tap to flip
  TapOnly,       // Tap to flip, drags ignored
  Disabled       // Purely externally driven
};

/**
 * @brief Everything a host pushes to a card controller
 *
 * externalYaw / externalPitch are optional: an absent value means the host
 * does not drive that axis. Invalid values (non-finite rotation, non-positive
 * scale or duration) are rejected field by field by the RotationArbiter.
 *
 * Thread safety: Value type (safe to copy)
 */
struct HostConfiguration
{
  CardIdentity identity;
  CardStyle style;
  FieldVisibility visibility;

  std::optional<double> externalYaw;    // [rad]
  std::optional<double> externalPitch;  // [rad]
  double scale{1.0};

  InteractionMode interactionMode{InteractionMode::FreeRotation};

  // Duration used to animate toward external rotation/scale
  std::chrono::milliseconds animationDuration{150};
};

}  // namespace tilt_core

#endif  // TILT_CORE_CARD_CONFIGURATION_HPP
