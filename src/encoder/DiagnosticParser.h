#pragma once

#include <QByteArray>
#include <QRegularExpression>
#include <QString>
#include <QStringList>
#include <cstdint>
#include <vector>

enum class LineKind {
    Progress,
    Warning,
    Error,
    Info
};

// Latest values reported by the encoder. -1 means "not reported yet".
struct EncoderProgress {
    int64_t frame = -1;
    double fps = 0.0;
    QString bitrate;
    int64_t totalSizeBytes = -1;
    double outTimeSeconds = -1.0;
    double speed = 0.0;
    int64_t dupFrames = 0;
    int64_t dropFrames = 0;
    bool ended = false;     // progress=end seen
};

struct DiagnosticRule {
    QRegularExpression pattern;
    LineKind kind;
};

struct ParsedLine {
    QString text;
    LineKind kind = LineKind::Info;
};

// Line-oriented scraper for the encoder's stderr. Chunks may split lines
// anywhere; text is buffered until "\n" or "\r" arrives. Progress comes
// either as "-progress" key=value lines or as classic "frame= ... speed=1.2x"
// status lines; everything else is classified by the first matching rule.
class DiagnosticParser {
public:
    DiagnosticParser();

    static std::vector<DiagnosticRule> defaultRules();
    void setRules(std::vector<DiagnosticRule> rules) { m_rules = std::move(rules); }
    // Checked before the existing rules.
    void addRule(const QRegularExpression& pattern, LineKind kind);

    std::vector<ParsedLine> feed(const QByteArray& chunk);
    // Emits a trailing line that never got its terminator.
    std::vector<ParsedLine> flush();

    ParsedLine parseLine(const QString& line);

    const EncoderProgress& progress() const { return m_progress; }
    const QStringList& warnings() const { return m_warnings; }
    const QStringList& errors() const { return m_errors; }

    // Last `count` non-progress lines, oldest first.
    QStringList tail(int count) const;

    void reset();

    // Human-readable cause of an encoder failure, from known ffmpeg messages,
    // else the last error line, else the exit code.
    static QString explainFailure(const QStringList& errorLines, int exitCode);

private:
    bool parseKeyValue(const QString& line);
    bool parseStatusLine(const QString& line);
    void applyProgressKey(const QString& key, const QString& value);

    std::vector<DiagnosticRule> m_rules;
    QByteArray m_pending;
    EncoderProgress m_progress;
    QStringList m_warnings;
    QStringList m_errors;
    QStringList m_tail;
};
