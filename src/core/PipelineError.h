#pragma once

#include <QString>
#include <QMetaType>
#include <QStringList>

// Pipeline-owned error codes; no errno or FFmpeg codes escape.
enum class ErrorCode {
    None,
    InvalidParameter,
    UnsupportedDimensions,
    RenderTargetUnavailable,
    ShaderCompilationFailed,
    MediaUnavailable,
    EncoderUnavailable,
    EncoderStartFailed,
    BrokenPipe,
    EncoderFailed,
    InvalidState
};

enum class ErrorCategory {
    None,
    Configuration,
    Resource,
    Streaming
};

const char* errorCodeToString(ErrorCode code);
const char* errorCategoryToString(ErrorCategory category);
ErrorCategory categoryOf(ErrorCode code);

struct PipelineError {
    ErrorCode code = ErrorCode::None;
    QString message;

    bool isError() const { return code != ErrorCode::None; }
    ErrorCategory category() const { return categoryOf(code); }

    static PipelineError none() { return {}; }
    static PipelineError invalidParameter(const QString& detail) {
        return {ErrorCode::InvalidParameter, detail};
    }
    static PipelineError unsupportedDimensions(int width, int height, const QString& format) {
        return {ErrorCode::UnsupportedDimensions,
                QString("%1x%2 is not valid for %3 (even width and height required)")
                    .arg(width).arg(height).arg(format)};
    }
    static PipelineError renderTargetUnavailable(const QString& detail) {
        return {ErrorCode::RenderTargetUnavailable, detail};
    }
    static PipelineError shaderCompilationFailed(const QString& log) {
        return {ErrorCode::ShaderCompilationFailed, log};
    }
    static PipelineError mediaUnavailable(const QString& detail) {
        return {ErrorCode::MediaUnavailable, detail};
    }
    static PipelineError invalidState(const QString& detail) {
        return {ErrorCode::InvalidState, detail};
    }
};

// "[Streaming] BrokenPipe: encoder closed its input" followed by the raw
// diagnostic tail, one line each.
QString formatErrorSummary(const PipelineError& error, const QStringList& diagnosticTail = {});

Q_DECLARE_METATYPE(PipelineError)
