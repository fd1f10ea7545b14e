/// \file common.h
/// \brief Common enumerations and types used throughout TraceDigit.

#pragma once

#include <cstdint>
#include <string>

namespace TraceDigit {

/// Image resizing algorithm.
enum class ResizeMethod : uint8_t {
    Nearest = 0, ///< Nearest neighbor interpolation (fastest, lowest quality).
    Area    = 1, ///< Area-based resampling (good for downscaling).
    Linear  = 2, ///< Bilinear interpolation (balanced quality/speed).
    Cubic   = 3, ///< Bicubic interpolation (highest quality, slower).
};

/// Convert ResizeMethod to its string representation.
std::string ToResizeMethodString(ResizeMethod method);

/// Parse ResizeMethod from a string ("nearest" / "area" / "linear" / "cubic").
ResizeMethod FromResizeMethodString(const std::string& str);

/// Outcome of digitizing one image.
enum class DigitizeStatus : uint8_t {
    Ok                = 0, ///< At least one cycle produced a sample.
    InsufficientPeaks = 1, ///< Fewer than two peaks; the image is skipped.
    NoLandmarks       = 2, ///< Regions found but none held a bright pixel.
};

/// Convert DigitizeStatus to its string representation.
std::string ToStatusString(DigitizeStatus status);

} // namespace TraceDigit
