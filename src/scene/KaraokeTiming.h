#pragma once

#include <vector>
#include "SceneTypes.h"

namespace KaraokeTiming {

// clamp((t - start) / (end - start), 0, 1); a zero-length word counts as
// fully sung once t >= start.
double wordProgress(const WordTiming& word, double t);

// (completed words + current word's partial progress) / word count, or
// linear over the cue span when the cue has no word timings.
double lineProgress(const SubtitleCue& cue, double t);

// Splits the cue text on whitespace and spreads the words evenly over the cue.
std::vector<WordTiming> distributeWords(const SubtitleCue& cue);

// Word timings for the cue, distributing them when none were authored.
std::vector<WordTiming> effectiveWords(const SubtitleCue& cue);

CueState cueStateAt(const SubtitleCue& cue, double t);

// Cues active at t in their authored order.
std::vector<CueState> activeCuesAt(const std::vector<SubtitleCue>& cues, double t);

} // namespace KaraokeTiming
