#include "EncoderCapabilities.h"
#include "AppConstants.h"
#include "Logging.h"
#include <QDateTime>
#include <QFileInfo>
#include <QHash>
#include <QMutex>
#include <QProcess>
#include <QRegularExpression>
#include <QStandardPaths>

namespace {

struct CacheEntry {
    QDateTime modified;
    EncoderCapabilities caps;
};

QMutex g_cacheMutex;
QHash<QString, CacheEntry> g_cache;

bool runTool(const QString& program, const QStringList& args, int timeoutMs,
             QString* output, QString* error) {
    QProcess proc;
    proc.setProcessChannelMode(QProcess::MergedChannels);
    proc.start(program, args);
    if (!proc.waitForStarted(timeoutMs)) {
        *error = QString("Cannot start %1: %2").arg(program, proc.errorString());
        return false;
    }
    if (!proc.waitForFinished(timeoutMs)) {
        proc.kill();
        proc.waitForFinished(1000);
        *error = QString("%1 %2 timed out").arg(program, args.join(' '));
        return false;
    }
    *output = QString::fromUtf8(proc.readAllStandardOutput());
    if (proc.exitStatus() != QProcess::NormalExit || proc.exitCode() != 0) {
        *error = QString("%1 %2 exited with code %3").arg(program, args.join(' ')).arg(proc.exitCode());
        return false;
    }
    return true;
}

// Lines after the "------" / " --" separator of ffmpeg's listing output
QStringList listingBody(const QString& output) {
    const QStringList lines = output.split('\n');
    QStringList body;
    bool inBody = false;
    for (const QString& raw : lines) {
        QString line = raw.trimmed();
        if (!inBody) {
            if (line.startsWith("--")) inBody = true;
            continue;
        }
        if (!line.isEmpty()) body << raw;
    }
    return body;
}

} // namespace

QString EncoderProbe::resolveProgram(const QString& program) {
    if (program.contains('/')) {
        QFileInfo info(program);
        return info.isExecutable() ? info.absoluteFilePath() : QString();
    }
    return QStandardPaths::findExecutable(program);
}

QString EncoderProbe::parseVersion(const QString& output) {
    static const QRegularExpression re("version\\s+(\\S+)");
    auto m = re.match(output);
    return m.hasMatch() ? m.captured(1) : QString();
}

void EncoderProbe::parseEncoders(const QString& output, QStringList* video, QStringList* audio) {
    // " V....D libx264              libx264 H.264 / AVC / MPEG-4 AVC"
    static const QRegularExpression re("^\\s*([VAS])[A-Z.]{5}\\s+(\\S+)");
    for (const QString& line : listingBody(output)) {
        auto m = re.match(line);
        if (!m.hasMatch()) continue;
        const QString kind = m.captured(1);
        if (kind == "V" && video) video->append(m.captured(2));
        else if (kind == "A" && audio) audio->append(m.captured(2));
    }
}

QStringList EncoderProbe::parseMuxers(const QString& output) {
    // " E mp4             MP4 (MPEG-4 Part 14)"; -formats style "DE matroska,webm" too
    static const QRegularExpression re("^\\s*[D ]?E[ d]?\\s+(\\S+)");
    QStringList muxers;
    for (const QString& line : listingBody(output)) {
        auto m = re.match(line);
        if (!m.hasMatch()) continue;
        for (const QString& name : m.captured(1).split(',', Qt::SkipEmptyParts)) {
            if (!muxers.contains(name)) muxers << name;
        }
    }
    return muxers;
}

QStringList EncoderProbe::parseHwaccels(const QString& output) {
    QStringList methods;
    bool inList = false;
    for (const QString& raw : output.split('\n')) {
        QString line = raw.trimmed();
        if (line.startsWith("Hardware acceleration methods")) {
            inList = true;
            continue;
        }
        if (inList && !line.isEmpty()) methods << line;
    }
    return methods;
}

EncoderCapabilities EncoderProbe::probe(const QString& program, int timeoutMs) {
    EncoderCapabilities caps;
    caps.program = resolveProgram(program);
    if (caps.program.isEmpty()) {
        caps.errorMessage = QString("Encoder program '%1' not found").arg(program);
        qCWarning(lcEncoder) << caps.errorMessage;
        return caps;
    }

    QString out, err;
    if (!runTool(caps.program, {"-hide_banner", "-version"}, timeoutMs, &out, &err)) {
        caps.errorMessage = err;
        qCWarning(lcEncoder) << "Capability probe failed:" << err;
        return caps;
    }
    caps.version = parseVersion(out);

    if (runTool(caps.program, {"-hide_banner", "-encoders"}, timeoutMs, &out, &err))
        parseEncoders(out, &caps.videoEncoders, &caps.audioEncoders);
    else
        qCWarning(lcEncoder) << "Encoder listing failed:" << err;

    if (runTool(caps.program, {"-hide_banner", "-muxers"}, timeoutMs, &out, &err))
        caps.muxers = parseMuxers(out);
    else
        qCWarning(lcEncoder) << "Muxer listing failed:" << err;

    if (runTool(caps.program, {"-hide_banner", "-hwaccels"}, timeoutMs, &out, &err))
        caps.hwaccelMethods = parseHwaccels(out);

    for (const char* backend : {"nvenc", "qsv", "vaapi", "videotoolbox"}) {
        if (caps.hasVideoEncoder(QString("h264_%1").arg(QLatin1String(backend))))
            caps.hardwareEncoders << backend;
    }

    caps.available = true;
    qCInfo(lcEncoder) << "Encoder" << caps.program << "version" << caps.version << "-"
                      << caps.videoEncoders.size() << "video encoders,"
                      << caps.audioEncoders.size() << "audio encoders,"
                      << caps.muxers.size() << "muxers, hardware:" << caps.hardwareEncoders;
    return caps;
}

EncoderCapabilities EncoderProbe::cached(const QString& program) {
    const QString path = resolveProgram(program);
    const QDateTime modified = path.isEmpty() ? QDateTime() : QFileInfo(path).lastModified();
    const QString key = path.isEmpty() ? program : path;

    {
        QMutexLocker lock(&g_cacheMutex);
        auto it = g_cache.constFind(key);
        if (it != g_cache.constEnd() && it->modified == modified)
            return it->caps;
    }

    EncoderCapabilities caps = probe(program, AppConstants::ProbeTimeoutMs);

    QMutexLocker lock(&g_cacheMutex);
    g_cache.insert(key, CacheEntry{modified, caps});
    return caps;
}

void EncoderProbe::clearCache() {
    QMutexLocker lock(&g_cacheMutex);
    g_cache.clear();
}
