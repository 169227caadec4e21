#include "PipelineError.h"

const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:                    return "None";
        case ErrorCode::InvalidParameter:        return "InvalidParameter";
        case ErrorCode::UnsupportedDimensions:   return "UnsupportedDimensions";
        case ErrorCode::RenderTargetUnavailable: return "RenderTargetUnavailable";
        case ErrorCode::ShaderCompilationFailed: return "ShaderCompilationFailed";
        case ErrorCode::MediaUnavailable:        return "MediaUnavailable";
        case ErrorCode::EncoderUnavailable:      return "EncoderUnavailable";
        case ErrorCode::EncoderStartFailed:      return "EncoderStartFailed";
        case ErrorCode::BrokenPipe:              return "BrokenPipe";
        case ErrorCode::EncoderFailed:           return "EncoderFailed";
        case ErrorCode::InvalidState:            return "InvalidState";
    }
    return "Unknown";
}

const char* errorCategoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None:          return "None";
        case ErrorCategory::Configuration: return "Configuration";
        case ErrorCategory::Resource:      return "Resource";
        case ErrorCategory::Streaming:     return "Streaming";
    }
    return "Unknown";
}

ErrorCategory categoryOf(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:
            return ErrorCategory::None;
        case ErrorCode::InvalidParameter:
        case ErrorCode::UnsupportedDimensions:
        case ErrorCode::InvalidState:
            return ErrorCategory::Configuration;
        case ErrorCode::RenderTargetUnavailable:
        case ErrorCode::ShaderCompilationFailed:
        case ErrorCode::MediaUnavailable:
        case ErrorCode::EncoderUnavailable:
            return ErrorCategory::Resource;
        case ErrorCode::EncoderStartFailed:
        case ErrorCode::BrokenPipe:
        case ErrorCode::EncoderFailed:
            return ErrorCategory::Streaming;
    }
    return ErrorCategory::None;
}

QString formatErrorSummary(const PipelineError& error, const QStringList& diagnosticTail) {
    QString summary = QString("[%1] %2: %3")
        .arg(errorCategoryToString(error.category()),
             errorCodeToString(error.code),
             error.message);

    if (!diagnosticTail.isEmpty()) {
        summary += "\n--- encoder output ---";
        for (const QString& line : diagnosticTail)
            summary += "\n" + line;
    }
    return summary;
}
