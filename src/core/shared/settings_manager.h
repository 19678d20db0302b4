#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace fr {

// SettingsManager -- JSON save/load for engine settings.
//
// The default location is:
//   <GenericDataLocation>/factrank/settings.json
class SettingsManager {
public:
    // Load settings from disk. Returns nullopt if the file doesn't exist
    // or cannot be parsed.
    static std::optional<Settings> load(const QString& filePath = defaultSettingsPath());

    // Save settings to disk. Creates the directory if it doesn't exist.
    // Returns true on success.
    static bool save(const Settings& settings,
                     const QString& filePath = defaultSettingsPath());

    static QString defaultSettingsPath();

    // Convert settings to/from JSON. Missing keys keep their defaults.
    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);
};

} // namespace fr
