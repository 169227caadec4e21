#pragma once

#include <QDateTime>
#include <algorithm>
#include <QStringList>
#include "DiagnosticParser.h"
#include "EncoderSettings.h"
#include "PipelineError.h"

// Export jobs are forward-only and never enter Paused; the state exists for
// collaborators that model a shared job list.
enum class JobState {
    Pending,
    Running,
    Paused,
    Cancelled,
    Failed,
    Completed
};

inline const char* jobStateToString(JobState state) {
    switch (state) {
        case JobState::Pending:   return "Pending";
        case JobState::Running:   return "Running";
        case JobState::Paused:    return "Paused";
        case JobState::Cancelled: return "Cancelled";
        case JobState::Failed:    return "Failed";
        case JobState::Completed: return "Completed";
    }
    return "Unknown";
}

struct ExportJob {
    EncoderSettings settings;
    QString audioPath;
    int64_t totalFrames = 0;
    JobState state = JobState::Pending;
    int64_t framesWritten = 0;      // as acknowledged by the encoder; never decreases
    int64_t framesSubmitted = 0;    // handed to the encoder's stdin
    QDateTime startTime;
    QStringList errors;
    QStringList warnings;
    PipelineError error;
    EncoderProgress lastProgress;
    double etaSeconds = -1.0;
    int exitCode = -1;
    int64_t processId = -1;         // encoder pid while it runs; kept after the exit for diagnostics

    bool isTerminal() const {
        return state == JobState::Cancelled || state == JobState::Failed || state == JobState::Completed;
    }
    double fraction() const {
        return totalFrames > 0 ? std::min(1.0, double(framesWritten) / double(totalFrames)) : 0.0;
    }
};
