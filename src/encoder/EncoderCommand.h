#pragma once

#include <QStringList>
#include "EncoderSettings.h"

namespace EncoderCommand {

// Arguments (without the program name) for an encoder that reads raw frames
// of settings.inputPixelFormat from stdin and reports progress on stderr.
// Audio is muxed when audioPath is non-empty, otherwise -an.
QStringList buildArguments(const EncoderSettings& settings, const QString& audioPath = QString());

} // namespace EncoderCommand
