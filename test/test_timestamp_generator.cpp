#include <cassert>
#include <cstdio>
#include <cmath>
#include "timing/TimestampGenerator.h"

void test_frame_counts() {
    const int rates[] = {24, 25, 30, 60};
    const double durations[] = {0.0, 0.5, 1.0, 1.25, 2.5, 3.0, 10.0, 61.75};
    for (int fps : rates) {
        for (double d : durations) {
            TimestampSequence seq = TimestampSequence::create(d, double(fps));
            assert(seq.isValid());
            assert(seq.size() == static_cast<int64_t>(std::ceil(d * fps)));
        }
    }
    // 0.1 * 30 is 3.0000000000000004 in binary; still 3 frames
    assert(TimestampSequence::create(0.1, 30.0).size() == 3);
    // A partial frame at the end still gets its own timestamp
    assert(TimestampSequence::create(1.01, 30.0).size() == 31);
    printf("PASS: test_frame_counts\n");
}

void test_strictly_increasing_gap_free() {
    const int rates[] = {24, 25, 30, 60};
    for (int fps : rates) {
        TimestampSequence seq = TimestampSequence::create(20.0, double(fps));
        const double step = 1.0 / fps;
        FrameTimestamp prev = seq.at(0);
        assert(prev.timeSeconds == 0.0);
        for (int64_t i = 1; i < seq.size(); ++i) {
            FrameTimestamp ts = seq.at(i);
            assert(ts.index == i);
            assert(ts.timeSeconds > prev.timeSeconds);
            assert(std::abs((ts.timeSeconds - prev.timeSeconds) - step) < 1e-9);
            assert(std::abs(ts.timeSeconds - i * step) < 1e-9);
            prev = ts;
        }
    }
    printf("PASS: test_strictly_increasing_gap_free\n");
}

void test_iteration_matches_random_access() {
    TimestampSequence seq = TimestampSequence::create(2.0, 25.0);
    int64_t i = 0;
    for (FrameTimestamp ts : seq) {
        assert(ts.index == i);
        assert(ts.timeSeconds == seq.at(i).timeSeconds);
        ++i;
    }
    assert(i == 50);
    printf("PASS: test_iteration_matches_random_access\n");
}

void test_rational_rates() {
    FrameRate ntsc = FrameRate::fromString("29.97");
    assert(ntsc.num == 30000 && ntsc.den == 1001);
    assert(FrameRate::fromString("30000/1001") == ntsc);
    assert(FrameRate::fromString("23.976").num == 24000);
    assert(FrameRate::fromString("30").num == 30 && FrameRate::fromString("30").den == 1);
    assert(!FrameRate::fromString("abc").isValid());
    assert(!FrameRate::fromString("0/1").isValid());
    assert(ntsc.toString() == "30000/1001");

    TimestampSequence seq = TimestampSequence::create(60.0, ntsc);
    assert(seq.size() == 1799);   // ceil(60 * 29.97...) = ceil(1798.2)
    // No drift: frame 1000 is exactly 1001/30 s
    assert(std::abs(seq.at(1000).timeSeconds - 1001.0 / 30.0) < 1e-12);
    printf("PASS: test_rational_rates\n");
}

void test_audio_offset_and_index_lookup() {
    TimestampSequence seq = TimestampSequence::create(1.0, 30.0, 0.5);
    assert(seq.size() == 30);
    assert(std::abs(seq.at(0).timeSeconds - 0.5) < 1e-12);
    assert(std::abs(seq.at(3).timeSeconds - 0.6) < 1e-9);
    assert(seq.indexForTime(0.5) == 0);
    assert(seq.indexForTime(0.6) == 3);
    assert(seq.indexForTime(-5.0) == 0);
    assert(seq.indexForTime(100.0) == 29);

    TimestampSequence neg = TimestampSequence::create(1.0, 30.0, -0.25);
    assert(neg.isValid());
    assert(std::abs(neg.at(0).timeSeconds + 0.25) < 1e-12);
    printf("PASS: test_audio_offset_and_index_lookup\n");
}

void test_invalid_parameters() {
    PipelineError error;
    TimestampSequence seq = TimestampSequence::create(1.0, 0.0, 0.0, &error);
    assert(!seq.isValid());
    assert(error.code == ErrorCode::InvalidParameter);
    assert(error.category() == ErrorCategory::Configuration);

    seq = TimestampSequence::create(-1.0, 30.0, 0.0, &error);
    assert(!seq.isValid());
    assert(error.code == ErrorCode::InvalidParameter);

    seq = TimestampSequence::create(0.0, 30.0, 0.0, &error);
    assert(seq.isValid());
    assert(seq.isEmpty());
    assert(!error.isError());
    printf("PASS: test_invalid_parameters\n");
}

int main() {
    test_frame_counts();
    test_strictly_increasing_gap_free();
    test_iteration_matches_random_access();
    test_rational_rates();
    test_audio_offset_and_index_lookup();
    test_invalid_parameters();
    printf("All timestamp generator tests passed.\n");
    return 0;
}
