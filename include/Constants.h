#ifndef NEOCR_CONSTANTS_H
#define NEOCR_CONSTANTS_H

namespace NeoCR {

// ============================================================================
// SELECTION
// ============================================================================
namespace Selection {
constexpr int kMinimumSize = 10;              // Both sides must exceed this (px)
}  // namespace Selection

// ============================================================================
// TIMEOUTS (milliseconds)
// ============================================================================
namespace Timeout {
constexpr int kModelListRequest = 5000;       // /api/tags and /api/show
constexpr int kOCRRequest = 300000;           // /api/generate (5 minutes)
constexpr int kNotification = 5000;           // notify-send
constexpr int kClipboardHelper = 5000;        // wl-copy / xclip / xsel
constexpr int kScreenGrabProcess = 10000;     // grim
}  // namespace Timeout

// ============================================================================
// NOTIFICATION
// ============================================================================
namespace Notification {
constexpr int kPreviewLength = 200;
constexpr const char* kEllipsis = "...";
constexpr const char* kTitle = "Neocr: text captured";
}  // namespace Notification

// ============================================================================
// CONTROL BAR (pixels)
// ============================================================================
namespace ControlBar {
constexpr int kButtonHeight = 40;
constexpr int kButtonSpacing = 10;
constexpr int kCancelWidth = 120;
constexpr int kChangeModelMinWidth = 250;
constexpr int kPixelsPerChar = 7;
constexpr double kBottomMarginRatio = 0.10;   // 10% of screen height
}  // namespace ControlBar

}  // namespace NeoCR

#endif // NEOCR_CONSTANTS_H
