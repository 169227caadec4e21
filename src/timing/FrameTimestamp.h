#pragma once

#include <QString>
#include <cstdint>

struct FrameTimestamp {
    int64_t index = 0;
    double timeSeconds = 0.0;       // presentation time, audio offset applied
    double durationSeconds = 0.0;   // 1 / fps
};

// Exact frame rate as a ratio (30000/1001 for NTSC 29.97).
struct FrameRate {
    int64_t num = 30;
    int64_t den = 1;

    bool isValid() const { return num > 0 && den > 0; }
    double toDouble() const { return static_cast<double>(num) / static_cast<double>(den); }
    double frameDuration() const { return static_cast<double>(den) / static_cast<double>(num); }

    // "30", "29.97", "30000/1001". Invalid text yields {0, 1}.
    static FrameRate fromString(const QString& text);
    // Snaps the NTSC family (23.976, 29.97, 59.94) to their exact ratios.
    static FrameRate fromDouble(double fps);

    QString toString() const;
};

inline bool operator==(const FrameRate& a, const FrameRate& b) {
    return a.num * b.den == b.num * a.den;
}
inline bool operator!=(const FrameRate& a, const FrameRate& b) { return !(a == b); }
