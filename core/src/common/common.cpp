#include "tracedigit/common.h"
#include "tracedigit/error.h"

#include <algorithm>
#include <cctype>

namespace TraceDigit {

std::string ToResizeMethodString(ResizeMethod method) {
    switch (method) {
    case ResizeMethod::Nearest:
        return "nearest";
    case ResizeMethod::Area:
        return "area";
    case ResizeMethod::Linear:
        return "linear";
    case ResizeMethod::Cubic:
        return "cubic";
    }
    return "area";
}

ResizeMethod FromResizeMethodString(const std::string& str) {
    std::string s = str;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "nearest") { return ResizeMethod::Nearest; }
    if (s == "area") { return ResizeMethod::Area; }
    if (s == "linear") { return ResizeMethod::Linear; }
    if (s == "cubic") { return ResizeMethod::Cubic; }
    throw FormatError("Invalid resize method string: " + str);
}

std::string ToStatusString(DigitizeStatus status) {
    switch (status) {
    case DigitizeStatus::Ok:
        return "ok";
    case DigitizeStatus::InsufficientPeaks:
        return "insufficient_peaks";
    case DigitizeStatus::NoLandmarks:
        return "no_landmarks";
    }
    return "ok";
}

} // namespace TraceDigit
