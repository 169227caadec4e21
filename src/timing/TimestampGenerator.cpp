#include "TimestampGenerator.h"
#include "Logging.h"

#include <QStringList>
#include <algorithm>
#include <cmath>

namespace {

constexpr double CountTolerance = 1e-9;

struct KnownRate {
    double approx;
    int64_t num;
    int64_t den;
};

constexpr KnownRate NtscRates[] = {
    {23.976, 24000, 1001},
    {29.97, 30000, 1001},
    {47.952, 48000, 1001},
    {59.94, 60000, 1001},
    {119.88, 120000, 1001},
};

} // namespace

FrameRate FrameRate::fromDouble(double fps) {
    if (!(fps > 0.0) || !std::isfinite(fps)) return {0, 1};

    for (const KnownRate& r : NtscRates) {
        if (std::abs(fps - r.approx) < 0.005) return {r.num, r.den};
    }

    if (std::abs(fps - std::round(fps)) < 1e-9)
        return {static_cast<int64_t>(std::llround(fps)), 1};

    // Arbitrary rate: keep three decimals exactly.
    int64_t num = std::llround(fps * 1000.0);
    int64_t den = 1000;
    int64_t a = num, b = den;
    while (b != 0) { int64_t t = a % b; a = b; b = t; }
    return {num / a, den / a};
}

FrameRate FrameRate::fromString(const QString& text) {
    const QString t = text.trimmed();
    if (t.contains('/')) {
        const QStringList parts = t.split('/');
        if (parts.size() != 2) return {0, 1};
        bool okNum = false, okDen = false;
        qlonglong num = parts[0].trimmed().toLongLong(&okNum);
        qlonglong den = parts[1].trimmed().toLongLong(&okDen);
        if (!okNum || !okDen || num <= 0 || den <= 0) return {0, 1};
        return {num, den};
    }
    bool ok = false;
    double fps = t.toDouble(&ok);
    if (!ok) return {0, 1};
    return fromDouble(fps);
}

QString FrameRate::toString() const {
    if (den == 1) return QString::number(num);
    return QString("%1/%2").arg(num).arg(den);
}

int64_t TimestampSequence::frameCount(double durationSeconds, FrameRate rate) {
    if (!rate.isValid() || durationSeconds <= 0.0) return 0;
    double exact = durationSeconds * static_cast<double>(rate.num) / static_cast<double>(rate.den);
    return static_cast<int64_t>(std::ceil(exact - CountTolerance));
}

TimestampSequence TimestampSequence::create(double durationSeconds, FrameRate rate,
                                            double audioOffsetSeconds, PipelineError* error) {
    TimestampSequence seq;
    if (!rate.isValid()) {
        if (error) *error = PipelineError::invalidParameter(
            QString("frame rate must be positive (got %1)").arg(rate.toString()));
        return seq;
    }
    if (durationSeconds < 0.0 || !std::isfinite(durationSeconds)) {
        if (error) *error = PipelineError::invalidParameter(
            QString("duration must be >= 0 (got %1)").arg(durationSeconds));
        return seq;
    }
    if (!std::isfinite(audioOffsetSeconds)) {
        if (error) *error = PipelineError::invalidParameter("audio offset must be finite");
        return seq;
    }

    seq.m_valid = true;
    seq.m_rate = rate;
    seq.m_duration = durationSeconds;
    seq.m_offset = audioOffsetSeconds;
    seq.m_count = frameCount(durationSeconds, rate);

    qCDebug(lcTiming) << "timestamp sequence:" << seq.m_count << "frames @" << rate.toString()
                      << "offset" << audioOffsetSeconds;
    if (error) *error = PipelineError::none();
    return seq;
}

TimestampSequence TimestampSequence::create(double durationSeconds, double fps,
                                            double audioOffsetSeconds, PipelineError* error) {
    if (!(fps > 0.0)) {
        if (error) *error = PipelineError::invalidParameter(
            QString("frame rate must be positive (got %1)").arg(fps));
        return TimestampSequence();
    }
    return create(durationSeconds, FrameRate::fromDouble(fps), audioOffsetSeconds, error);
}

FrameTimestamp TimestampSequence::at(int64_t index) const {
    FrameTimestamp ts;
    ts.index = index;
    // One division per frame; never accumulated.
    ts.timeSeconds = static_cast<double>(index * m_rate.den) / static_cast<double>(m_rate.num)
                   + m_offset;
    ts.durationSeconds = m_rate.frameDuration();
    return ts;
}

int64_t TimestampSequence::indexForTime(double seconds) const {
    if (m_count == 0) return 0;
    double local = seconds - m_offset;
    int64_t index = static_cast<int64_t>(
        std::floor(local * static_cast<double>(m_rate.num) / static_cast<double>(m_rate.den)
                   + CountTolerance));
    return std::clamp<int64_t>(index, 0, m_count - 1);
}
