// Stand-in for the ffmpeg binary. Reads raw frames from stdin and reports
// progress on stderr the way "ffmpeg -progress pipe:2" does.
//
// Environment:
//   FAKE_ENCODER_STOP_AFTER=K   stop reading and exit after K frames
//   FAKE_ENCODER_EXIT_CODE=N    exit status (non-zero also prints an error)
//   FAKE_ENCODER_DELAY_MS=N     sleep per frame
//   FAKE_ENCODER_IGNORE_TERM=1  ignore SIGTERM
//   FAKE_ENCODER_HANG=1         never exit after end of input
//   FAKE_ENCODER_WARN=1         print a warning line first

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>
#include <unistd.h>

static int envInt(const char* name, int fallback) {
    const char* v = std::getenv(name);
    return v && *v ? std::atoi(v) : fallback;
}

static size_t frameBytes(const std::string& pixFmt, int w, int h) {
    const size_t pixels = static_cast<size_t>(w) * static_cast<size_t>(h);
    if (pixFmt == "rgba" || pixFmt == "bgra") return pixels * 4;
    if (pixFmt == "rgb24" || pixFmt == "bgr24" || pixFmt == "yuv444p") return pixels * 3;
    if (pixFmt == "yuv420p") return pixels + 2 * (static_cast<size_t>(w / 2) * static_cast<size_t>(h / 2));
    return pixels * 4;
}

static bool readFully(int fd, char* buf, size_t size) {
    size_t got = 0;
    while (got < size) {
        ssize_t n = ::read(fd, buf + got, size - got);
        if (n == 0) return false;
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        got += static_cast<size_t>(n);
    }
    return true;
}

static void report(long frames, bool end) {
    std::fprintf(stderr, "frame=%ld\nfps=%.1f\nbitrate=1000.0kbits/s\ntotal_size=%ld\nout_time_us=%ld\nspeed=1.00x\nprogress=%s\n",
                 frames, 25.0, frames * 1000, frames * 40000, end ? "end" : "continue");
    std::fflush(stderr);
}

static int printListing(const std::string& what) {
    if (what == "-version") {
        std::printf("ffmpeg version 6.1-fake Copyright (c) 2000-2023 the FFmpeg developers\n");
    } else if (what == "-encoders") {
        std::printf("Encoders:\n V..... = Video\n A..... = Audio\n ------\n");
        std::printf(" V....D libx264              libx264 H.264 / AVC / MPEG-4 AVC\n");
        std::printf(" V....D libx265              libx265 H.265 / HEVC\n");
        std::printf(" V....D h264_nvenc           NVIDIA NVENC H.264 encoder\n");
        std::printf(" A....D aac                  AAC (Advanced Audio Coding)\n");
    } else if (what == "-muxers") {
        std::printf("File formats:\n D. = Demuxing supported\n .E = Muxing supported\n --\n");
        std::printf("  E mp4             MP4 (MPEG-4 Part 14)\n");
        std::printf("  E matroska        Matroska\n");
        std::printf("  E mov             QuickTime / MOV\n");
    } else if (what == "-hwaccels") {
        std::printf("Hardware acceleration methods:\ncuda\nvaapi\n");
    }
    return 0;
}

int main(int argc, char* argv[]) {
    int width = 0, height = 0;
    std::string pixFmt;
    std::string output;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-version" || arg == "-encoders" || arg == "-muxers" || arg == "-hwaccels")
            return printListing(arg);
        if (arg == "-s" && i + 1 < argc) {
            std::sscanf(argv[i + 1], "%dx%d", &width, &height);
        } else if (arg == "-pix_fmt" && i + 1 < argc && pixFmt.empty()) {
            pixFmt = argv[i + 1];   // first one describes the raw input
        }
        output = arg;
    }
    if (width <= 0 || height <= 0) {
        std::fprintf(stderr, "Invalid argument: missing -s WxH\n");
        return 1;
    }

    if (envInt("FAKE_ENCODER_IGNORE_TERM", 0)) std::signal(SIGTERM, SIG_IGN);
    const int stopAfter = envInt("FAKE_ENCODER_STOP_AFTER", -1);
    const int exitCode = envInt("FAKE_ENCODER_EXIT_CODE", 0);
    const int delayMs = envInt("FAKE_ENCODER_DELAY_MS", 0);

    if (envInt("FAKE_ENCODER_WARN", 0)) {
        std::fprintf(stderr, "[swscaler @ 0x5581] Warning: deprecated pixel format used, make sure you did set range correctly\n");
        std::fflush(stderr);
    }

    std::vector<char> frame(frameBytes(pixFmt, width, height));
    long frames = 0;
    while (stopAfter < 0 || frames < stopAfter) {
        if (!readFully(STDIN_FILENO, frame.data(), frame.size())) break;
        ++frames;
        if (delayMs > 0) ::usleep(static_cast<useconds_t>(delayMs) * 1000);
        report(frames, false);
    }
    ::close(STDIN_FILENO);
    report(frames, true);

    if (envInt("FAKE_ENCODER_HANG", 0)) {
        for (;;) ::pause();
    }

    if (!output.empty() && output != "pipe:1") {
        if (FILE* f = std::fopen(output.c_str(), "w")) {
            std::fprintf(f, "frames=%ld\n", frames);
            std::fclose(f);
        }
    }

    if (exitCode != 0) {
        std::fprintf(stderr, "Error while encoding frame %ld\nConversion failed!\n", frames);
        std::fflush(stderr);
    }
    return exitCode;
}
