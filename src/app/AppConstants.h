#pragma once

#include <cstddef>

namespace AppConstants {
    inline constexpr const char* AppName = "KaraokeForge";
    inline constexpr const char* AppVersion = "0.1.0";
    inline constexpr const char* OrgName = "KaraokeForge";

    inline constexpr int DefaultCanvasWidth = 1920;
    inline constexpr int DefaultCanvasHeight = 1080;

    // Default export/preview frame rate
    inline constexpr double DefaultFps = 30.0;

    // Frames buffered between the render thread and the consumer thread
    inline constexpr int DefaultQueueCapacity = 24;

    // Encoder stdin writes are batched into chunks of this size
    inline constexpr std::size_t StreamingChunkSize = 1024 * 1024;

    // Consecutive failed writes tolerated before the job is failed
    inline constexpr int MaxConsecutiveWriteFailures = 5;

    // Graceful shutdown wait after SIGTERM, then SIGKILL
    inline constexpr int EncoderTerminateTimeoutMs = 5000;
    inline constexpr int EncoderKillTimeoutMs = 2000;

    // Capability probe timeout per ffmpeg invocation
    inline constexpr int ProbeTimeoutMs = 10000;

    // Raw encoder lines kept for the failure summary
    inline constexpr int DiagnosticTailLines = 12;

    inline constexpr const char* DefaultEncoderProgram = "ffmpeg";
}
