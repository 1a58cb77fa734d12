#ifndef BOXFLOW_CORE_CONFIG_H
#define BOXFLOW_CORE_CONFIG_H

#include <cstddef>
#include <cstdint>

namespace boxflow::core::config {

inline constexpr std::uint32_t kDefaultViewportWidth = 1280;
inline constexpr std::uint32_t kDefaultViewportHeight = 720;

// Float drop search bounds (CSS 2.1 §9.5.1 rule 6). Past either bound the
// float is placed at its original candidate Y.
inline constexpr int kMaxFloatDropIterations = 100;
inline constexpr float kMaxFloatDropDistance = 1000.0f;

// Break -> Construct attempts before the last result is accepted.
inline constexpr int kMaxInlineLayoutAttempts = 3;

// Size used for <img> when no dimension can be resolved.
inline constexpr float kImagePlaceholderWidth = 100.0f;
inline constexpr float kImagePlaceholderHeight = 100.0f;

// Fallback text metrics when no measurer is injected.
inline constexpr float kFallbackAdvanceFactor = 0.6f;
inline constexpr float kDefaultLineHeightFactor = 1.2f;
inline constexpr float kDefaultFontSize = 16.0f;

inline constexpr int kMaxLayoutDepth = 256;

}  // namespace boxflow::core::config

#endif  // BOXFLOW_CORE_CONFIG_H
