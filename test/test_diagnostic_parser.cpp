#include <cassert>
#include <cstdio>
#include <cmath>
#include "encoder/DiagnosticParser.h"
#include "util/TimeUtil.h"

void test_progress_key_values() {
    DiagnosticParser parser;
    auto lines = parser.feed("frame=120\nfps=29.5\nbitrate=2097.2kbits/s\ntotal_size=1048576\n"
                             "out_time_us=4000000\ndup_frames=1\ndrop_frames=2\nspeed=1.5x\nprogress=continue\n");
    assert(lines.size() == 9);
    for (const ParsedLine& l : lines) assert(l.kind == LineKind::Progress);

    const EncoderProgress& p = parser.progress();
    assert(p.frame == 120);
    assert(std::abs(p.fps - 29.5) < 1e-9);
    assert(p.bitrate == "2097.2kbits/s");
    assert(p.totalSizeBytes == 1048576);
    assert(std::abs(p.outTimeSeconds - 4.0) < 1e-9);
    assert(p.dupFrames == 1 && p.dropFrames == 2);
    assert(std::abs(p.speed - 1.5) < 1e-9);
    assert(!p.ended);

    parser.feed("progress=end\n");
    assert(parser.progress().ended);
    // Progress never lands in the diagnostic tail
    assert(parser.tail(12).isEmpty());
    printf("PASS: test_progress_key_values\n");
}

void test_status_line() {
    DiagnosticParser parser;
    auto lines = parser.feed("frame=  240 fps= 30 q=28.0 size=    1024kB time=00:00:08.00 bitrate=1048.6kbits/s speed=1.2x\r");
    assert(lines.size() == 1);
    assert(lines[0].kind == LineKind::Progress);
    const EncoderProgress& p = parser.progress();
    assert(p.frame == 240);
    assert(std::abs(p.fps - 30.0) < 1e-9);
    assert(p.totalSizeBytes == 1024 * 1024);
    assert(std::abs(p.outTimeSeconds - 8.0) < 1e-9);
    assert(std::abs(p.speed - 1.2) < 1e-9);
    printf("PASS: test_status_line\n");
}

void test_partial_lines_across_reads() {
    DiagnosticParser parser;
    assert(parser.feed("fra").empty());
    assert(parser.feed("me=1").empty());
    auto lines = parser.feed("7\n[libx264 @ 0x1] War");
    assert(lines.size() == 1);
    assert(parser.progress().frame == 17);

    lines = parser.feed("ning: something odd\nUnknown encoder 'libfoo'");
    assert(lines.size() == 1);
    assert(lines[0].kind == LineKind::Warning);
    assert(lines[0].text == "[libx264 @ 0x1] Warning: something odd");

    // Unterminated text surfaces on flush
    lines = parser.flush();
    assert(lines.size() == 1);
    assert(lines[0].kind == LineKind::Error);
    assert(parser.errors().size() == 1);
    assert(parser.warnings().size() == 1);
    printf("PASS: test_partial_lines_across_reads\n");
}

void test_classification() {
    DiagnosticParser parser;
    assert(parser.parseLine("Input #0, rawvideo, from 'pipe:0':").kind == LineKind::Info);
    assert(parser.parseLine("[mp4 @ 0x55] Non-monotonous DTS; deprecated behaviour").kind == LineKind::Warning);
    assert(parser.parseLine("/out/x.mp4: No such file or directory").kind == LineKind::Error);
    assert(parser.parseLine("Error while opening encoder for output stream #0:0").kind == LineKind::Error);
    assert(parser.parseLine("Conversion failed!").kind == LineKind::Error);
    assert(parser.parseLine("Past duration 0.999 too large").kind == LineKind::Warning);

    // Rules are pluggable; newest rule wins
    parser.addRule(QRegularExpression("^Ignored:"), LineKind::Info);
    assert(parser.parseLine("Ignored: error in metadata").kind == LineKind::Info);

    parser.setRules({});
    assert(parser.parseLine("Conversion failed!").kind == LineKind::Info);
    printf("PASS: test_classification\n");
}

void test_tail_and_reset() {
    DiagnosticParser parser;
    for (int i = 0; i < 30; ++i)
        parser.feed(QString("line %1\n").arg(i).toUtf8());
    QStringList tail = parser.tail(12);
    assert(tail.size() == 12);
    assert(tail.first() == "line 18");
    assert(tail.last() == "line 29");

    parser.reset();
    assert(parser.tail(12).isEmpty());
    assert(parser.progress().frame == -1);
    printf("PASS: test_tail_and_reset\n");
}

void test_explain_failure() {
    QString why = DiagnosticParser::explainFailure(
        {"Error opening output file", "/root/out.mp4: Permission denied"}, 1);
    assert(why.contains("permission denied"));
    assert(why.contains("/root/out.mp4"));

    why = DiagnosticParser::explainFailure({"something exploded"}, 1);
    assert(why == "Encoder failed: something exploded");

    why = DiagnosticParser::explainFailure({}, 137);
    assert(why == "Encoder exited with code 137");
    printf("PASS: test_explain_failure\n");
}

void test_clock_and_eta_text() {
    assert(std::abs(TimeUtil::parseClockTime("00:01:02.500000") - 62.5) < 1e-9);
    assert(TimeUtil::parseClockTime("12.5") < 0.0);
    assert(TimeUtil::parseClockTime("aa:00:01") < 0.0);
    assert(TimeUtil::etaText(-1.0) == "--:--");
    assert(TimeUtil::etaText(65.2) == "1:06");
    assert(TimeUtil::etaText(0.0) == "0:00");
    printf("PASS: test_clock_and_eta_text\n");
}

int main() {
    test_progress_key_values();
    test_status_line();
    test_partial_lines_across_reads();
    test_classification();
    test_tail_and_reset();
    test_explain_failure();
    test_clock_and_eta_text();
    printf("All diagnostic parser tests passed.\n");
    return 0;
}
