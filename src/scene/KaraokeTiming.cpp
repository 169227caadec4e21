#include "KaraokeTiming.h"
#include <QRegularExpression>
#include <QStringList>
#include <algorithm>

namespace KaraokeTiming {

double wordProgress(const WordTiming& word, double t) {
    if (word.endSeconds <= word.startSeconds)
        return t >= word.startSeconds ? 1.0 : 0.0;

    double p = (t - word.startSeconds) / (word.endSeconds - word.startSeconds);
    return std::clamp(p, 0.0, 1.0);
}

std::vector<WordTiming> distributeWords(const SubtitleCue& cue) {
    static const QRegularExpression ws("\\s+");
    const QStringList tokens = cue.text.split(ws, Qt::SkipEmptyParts);

    std::vector<WordTiming> words;
    if (tokens.isEmpty()) return words;

    double span = std::max(0.0, cue.endSeconds - cue.startSeconds);
    double step = span / tokens.size();
    words.reserve(tokens.size());
    for (int i = 0; i < tokens.size(); ++i) {
        WordTiming w;
        w.text = tokens[i];
        w.startSeconds = cue.startSeconds + step * i;
        w.endSeconds = (i + 1 == tokens.size()) ? cue.endSeconds : cue.startSeconds + step * (i + 1);
        words.push_back(w);
    }
    return words;
}

std::vector<WordTiming> effectiveWords(const SubtitleCue& cue) {
    if (!cue.words.empty()) return cue.words;
    return distributeWords(cue);
}

double lineProgress(const SubtitleCue& cue, double t) {
    if (t <= cue.startSeconds) return 0.0;
    if (t >= cue.endSeconds) return 1.0;

    if (cue.words.empty()) {
        double span = cue.endSeconds - cue.startSeconds;
        return span > 0.0 ? (t - cue.startSeconds) / span : 1.0;
    }

    double sung = 0.0;
    for (const WordTiming& w : cue.words)
        sung += wordProgress(w, t);
    return sung / static_cast<double>(cue.words.size());
}

CueState cueStateAt(const SubtitleCue& cue, double t) {
    CueState state;
    state.startSeconds = cue.startSeconds;
    state.endSeconds = cue.endSeconds;
    state.lineProgress = lineProgress(cue, t);

    const std::vector<WordTiming> words = effectiveWords(cue);
    state.words.reserve(words.size());
    for (const WordTiming& w : words) {
        WordState ws;
        ws.text = w.text;
        ws.startSeconds = w.startSeconds;
        ws.endSeconds = w.endSeconds;
        ws.progress = wordProgress(w, t);
        state.words.push_back(ws);
    }
    return state;
}

std::vector<CueState> activeCuesAt(const std::vector<SubtitleCue>& cues, double t) {
    std::vector<CueState> active;
    for (const SubtitleCue& cue : cues) {
        if (cue.isActiveAt(t))
            active.push_back(cueStateAt(cue, t));
    }
    return active;
}

} // namespace KaraokeTiming
