#pragma once

#include <QString>
#include <QStringList>
#include <cmath>

namespace TimeUtil {

// Parses ffmpeg's "HH:MM:SS.micro" out_time. Returns -1 when malformed.
inline double parseClockTime(const QString& text) {
    const QStringList parts = text.trimmed().split(':');
    if (parts.size() != 3) return -1.0;

    bool okH = false, okM = false, okS = false;
    int hours = parts[0].toInt(&okH);
    int minutes = parts[1].toInt(&okM);
    double seconds = parts[2].toDouble(&okS);
    if (!okH || !okM || !okS) return -1.0;

    return hours * 3600.0 + minutes * 60.0 + seconds;
}

// Remaining-time text for progress output; "--:--" when unknown.
inline QString etaText(double seconds) {
    if (seconds < 0.0 || !std::isfinite(seconds)) return QStringLiteral("--:--");
    const int whole = static_cast<int>(std::ceil(seconds));
    return QString("%1:%2").arg(whole / 60).arg(whole % 60, 2, 10, QChar('0'));
}

} // namespace TimeUtil
