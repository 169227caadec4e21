#pragma once

#include <QJsonObject>
#include <QString>
#include "StaticSceneSource.h"

// Scene file persistence (JSON, version 1).
class SceneConfig {
public:
    bool save(const QString& filePath, const SceneDescription& scene);
    bool load(const QString& filePath, SceneDescription& scene);

    static QJsonObject sceneToJson(const SceneDescription& scene);
    // Returns false with error set when a field has the wrong shape.
    static bool sceneFromJson(const QJsonObject& obj, SceneDescription& scene, QString* error);

    static QJsonObject effectToJson(const EffectDescriptor& effect);
    static bool effectFromJson(const QJsonObject& obj, EffectDescriptor& effect, QString* error);

    QString errorString() const { return m_error; }

private:
    QString m_error;
};
