#pragma once

#include <cstdint>
#include <iterator>
#include "FrameTimestamp.h"
#include "PipelineError.h"

// Lazily computed, finite sequence of frame timestamps. Timestamp i is
// index * den / num (+ offset), computed independently for every index.
class TimestampSequence {
public:
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = FrameTimestamp;
        using difference_type = std::ptrdiff_t;
        using pointer = const FrameTimestamp*;
        using reference = FrameTimestamp;

        const_iterator() = default;
        const_iterator(const TimestampSequence* seq, int64_t index) : m_seq(seq), m_index(index) {}

        FrameTimestamp operator*() const { return m_seq->at(m_index); }
        const_iterator& operator++() { ++m_index; return *this; }
        const_iterator operator++(int) { const_iterator tmp = *this; ++m_index; return tmp; }
        bool operator==(const const_iterator& o) const { return m_seq == o.m_seq && m_index == o.m_index; }
        bool operator!=(const const_iterator& o) const { return !(*this == o); }

    private:
        const TimestampSequence* m_seq = nullptr;
        int64_t m_index = 0;
    };

    TimestampSequence() = default;

    // Fails with InvalidParameter when fps <= 0 or duration < 0.
    static TimestampSequence create(double durationSeconds, FrameRate rate,
                                    double audioOffsetSeconds = 0.0,
                                    PipelineError* error = nullptr);
    static TimestampSequence create(double durationSeconds, double fps,
                                    double audioOffsetSeconds = 0.0,
                                    PipelineError* error = nullptr);

    bool isValid() const { return m_valid; }
    int64_t size() const { return m_count; }
    bool isEmpty() const { return m_count == 0; }

    FrameTimestamp at(int64_t index) const;

    // Index of the frame displayed at time t (offset removed), clamped to the sequence.
    int64_t indexForTime(double seconds) const;

    FrameRate rate() const { return m_rate; }
    double duration() const { return m_duration; }
    double audioOffset() const { return m_offset; }

    const_iterator begin() const { return const_iterator(this, 0); }
    const_iterator end() const { return const_iterator(this, m_count); }

    // ceil(duration * fps) with a tolerance so 0.1 * 30 does not become 4 frames.
    static int64_t frameCount(double durationSeconds, FrameRate rate);

private:
    bool m_valid = false;
    FrameRate m_rate;
    double m_duration = 0.0;
    double m_offset = 0.0;
    int64_t m_count = 0;
};
