#include "DiagnosticParser.h"
#include "TimeUtil.h"

namespace {

constexpr int MaxTailKept = 200;

const QStringList ProgressKeys = {
    "frame", "fps", "bitrate", "total_size", "out_time", "out_time_us", "out_time_ms",
    "dup_frames", "drop_frames", "speed", "progress", "stream_0_0_q"
};

struct KnownFailure {
    const char* pattern;
    const char* explanation;
};

const KnownFailure KnownFailures[] = {
    {"No such file or directory", "an input or output path does not exist"},
    {"Permission denied",         "permission denied while accessing the output path"},
    {"Unknown encoder",           "the requested codec is not available in this encoder build"},
    {"Encoder not found",         "the requested codec is not available in this encoder build"},
    {"No space left on device",   "the output disk is full"},
    {"Invalid data found",        "the encoder could not parse its input data"},
    {"Broken pipe",               "the encoder stopped reading frames"},
    {"Invalid argument",          "the encoder rejected an argument (check codec, preset, pixel format and size)"},
    {"Conversion failed",         "the conversion failed"},
    {"Immediate exit requested",  "the encoder was interrupted"},
};

} // namespace

DiagnosticParser::DiagnosticParser()
    : m_rules(defaultRules())
{
}

std::vector<DiagnosticRule> DiagnosticParser::defaultRules() {
    const auto ci = QRegularExpression::CaseInsensitiveOption;
    std::vector<DiagnosticRule> rules;
    for (const KnownFailure& f : KnownFailures)
        rules.push_back({QRegularExpression(QRegularExpression::escape(f.pattern), ci), LineKind::Error});
    rules.push_back({QRegularExpression("\\berror\\b|\\bfailed\\b|could not|unable to|invalid", ci), LineKind::Error});
    rules.push_back({QRegularExpression("warning|deprecated|past duration|too large|\\[.*@.*\\].*(?:mismatch|discard)", ci), LineKind::Warning});
    return rules;
}

void DiagnosticParser::addRule(const QRegularExpression& pattern, LineKind kind) {
    m_rules.insert(m_rules.begin(), DiagnosticRule{pattern, kind});
}

void DiagnosticParser::reset() {
    m_pending.clear();
    m_progress = EncoderProgress{};
    m_warnings.clear();
    m_errors.clear();
    m_tail.clear();
}

std::vector<ParsedLine> DiagnosticParser::feed(const QByteArray& chunk) {
    std::vector<ParsedLine> parsed;
    m_pending.append(chunk);

    qsizetype start = 0;
    for (qsizetype i = 0; i < m_pending.size(); ++i) {
        const char c = m_pending.at(i);
        if (c != '\n' && c != '\r') continue;

        QString line = QString::fromUtf8(m_pending.constData() + start, i - start).trimmed();
        start = i + 1;
        if (!line.isEmpty()) parsed.push_back(parseLine(line));
    }
    m_pending.remove(0, start);
    return parsed;
}

std::vector<ParsedLine> DiagnosticParser::flush() {
    std::vector<ParsedLine> parsed;
    QString line = QString::fromUtf8(m_pending).trimmed();
    m_pending.clear();
    if (!line.isEmpty()) parsed.push_back(parseLine(line));
    return parsed;
}

void DiagnosticParser::applyProgressKey(const QString& key, const QString& value) {
    bool ok = false;
    if (key == "frame") {
        int64_t f = value.toLongLong(&ok);
        if (ok) m_progress.frame = f;
    } else if (key == "fps") {
        double f = value.toDouble(&ok);
        if (ok) m_progress.fps = f;
    } else if (key == "bitrate") {
        m_progress.bitrate = value;
    } else if (key == "total_size" || key == "size") {
        // key=value form is bytes; the status line form is "1024kB"
        QString v = value;
        int64_t mult = 1;
        if (v.endsWith("kB", Qt::CaseInsensitive)) { v.chop(2); mult = 1024; }
        int64_t n = v.toLongLong(&ok);
        if (ok) m_progress.totalSizeBytes = n * mult;
    } else if (key == "out_time" || key == "time") {
        double t = TimeUtil::parseClockTime(value);
        if (t >= 0.0) m_progress.outTimeSeconds = t;
    } else if (key == "out_time_us" || key == "out_time_ms") {
        // ffmpeg reports microseconds under both keys
        int64_t us = value.toLongLong(&ok);
        if (ok) m_progress.outTimeSeconds = us / 1.0e6;
    } else if (key == "dup_frames" || key == "dup") {
        int64_t n = value.toLongLong(&ok);
        if (ok) m_progress.dupFrames = n;
    } else if (key == "drop_frames" || key == "drop") {
        int64_t n = value.toLongLong(&ok);
        if (ok) m_progress.dropFrames = n;
    } else if (key == "speed") {
        QString v = value;
        if (v.endsWith('x')) v.chop(1);
        double s = v.toDouble(&ok);
        if (ok) m_progress.speed = s;
    } else if (key == "progress") {
        m_progress.ended = (value == "end");
    }
}

bool DiagnosticParser::parseKeyValue(const QString& line) {
    static const QRegularExpression re("^([a-z_0-9]+)=(\\S*)$");
    auto m = re.match(line);
    if (!m.hasMatch() || !ProgressKeys.contains(m.captured(1))) return false;
    applyProgressKey(m.captured(1), m.captured(2));
    return true;
}

bool DiagnosticParser::parseStatusLine(const QString& line) {
    // "frame=  120 fps= 30 q=28.0 size=    1024kB time=00:00:04.00 bitrate=2097.2kbits/s speed=1.5x"
    if (!line.startsWith("frame=")) return false;
    static const QRegularExpression re("([a-z_]+)=\\s*(\\S+)");
    auto it = re.globalMatch(line);
    bool any = false;
    while (it.hasNext()) {
        auto m = it.next();
        applyProgressKey(m.captured(1), m.captured(2));
        any = true;
    }
    return any;
}

ParsedLine DiagnosticParser::parseLine(const QString& line) {
    ParsedLine parsed;
    parsed.text = line;

    if (parseKeyValue(line) || parseStatusLine(line)) {
        parsed.kind = LineKind::Progress;
        return parsed;
    }

    for (const DiagnosticRule& rule : m_rules) {
        if (rule.pattern.match(line).hasMatch()) {
            parsed.kind = rule.kind;
            break;
        }
    }

    if (parsed.kind == LineKind::Error) m_errors << line;
    else if (parsed.kind == LineKind::Warning) m_warnings << line;

    m_tail << line;
    if (m_tail.size() > MaxTailKept) m_tail.removeFirst();
    return parsed;
}

QStringList DiagnosticParser::tail(int count) const {
    if (count >= m_tail.size()) return m_tail;
    return m_tail.mid(m_tail.size() - count);
}

QString DiagnosticParser::explainFailure(const QStringList& errorLines, int exitCode) {
    for (const KnownFailure& f : KnownFailures) {
        for (const QString& line : errorLines) {
            if (line.contains(QLatin1String(f.pattern), Qt::CaseInsensitive))
                return QString("Encoder failed: %1 (%2)").arg(f.explanation, line);
        }
    }
    if (!errorLines.isEmpty())
        return QString("Encoder failed: %1").arg(errorLines.last());
    return QString("Encoder exited with code %1").arg(exitCode);
}
