#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

namespace fr {

namespace {

QJsonObject tokenizerToJson(const TokenizerConfig& config)
{
    QJsonObject json;
    json.insert(QStringLiteral("minTokenLength"), config.minTokenLength);
    json.insert(QStringLiteral("maxTokenLength"), config.maxTokenLength);
    json.insert(QStringLiteral("keepUrls"), config.keepUrls);
    json.insert(QStringLiteral("keepEmails"), config.keepEmails);
    json.insert(QStringLiteral("keepHashtags"), config.keepHashtags);
    json.insert(QStringLiteral("keepMentions"), config.keepMentions);
    json.insert(QStringLiteral("stripDiacritics"), config.stripDiacritics);
    json.insert(QStringLiteral("emitBigrams"), config.emitBigrams);
    json.insert(QStringLiteral("bigramPrefix"), config.bigramPrefix);
    json.insert(QStringLiteral("unique"), config.unique);
    return json;
}

TokenizerConfig tokenizerFromJson(const QJsonObject& json)
{
    TokenizerConfig config;
    config.minTokenLength = json.value(QStringLiteral("minTokenLength")).toInt(config.minTokenLength);
    config.maxTokenLength = json.value(QStringLiteral("maxTokenLength")).toInt(config.maxTokenLength);
    config.keepUrls = json.value(QStringLiteral("keepUrls")).toBool(config.keepUrls);
    config.keepEmails = json.value(QStringLiteral("keepEmails")).toBool(config.keepEmails);
    config.keepHashtags = json.value(QStringLiteral("keepHashtags")).toBool(config.keepHashtags);
    config.keepMentions = json.value(QStringLiteral("keepMentions")).toBool(config.keepMentions);
    config.stripDiacritics = json.value(QStringLiteral("stripDiacritics"))
                                 .toBool(config.stripDiacritics);
    config.emitBigrams = json.value(QStringLiteral("emitBigrams")).toBool(config.emitBigrams);
    config.bigramPrefix = json.value(QStringLiteral("bigramPrefix")).toString(config.bigramPrefix);
    config.unique = json.value(QStringLiteral("unique")).toBool(config.unique);
    return config;
}

QJsonObject explorationToJson(const ExplorationConfig& config)
{
    QJsonObject json;
    json.insert(QStringLiteral("iterations"), config.iterations);
    json.insert(QStringLiteral("candidateGateMinTokenLen"), config.candidateGateMinTokenLen);
    json.insert(QStringLiteral("maxCandidatesPerIter"), config.maxCandidatesPerIter);
    json.insert(QStringLiteral("minScore"), config.minScore);
    json.insert(QStringLiteral("refineTerms"), config.refineTerms);
    json.insert(QStringLiteral("iterationDecay"), config.iterationDecay);
    json.insert(QStringLiteral("qualityFloor"), config.qualityFloor);
    return json;
}

ExplorationConfig explorationFromJson(const QJsonObject& json)
{
    ExplorationConfig config;
    config.iterations = json.value(QStringLiteral("iterations")).toInt(config.iterations);
    config.candidateGateMinTokenLen = json.value(QStringLiteral("candidateGateMinTokenLen"))
                                          .toInt(config.candidateGateMinTokenLen);
    config.maxCandidatesPerIter = json.value(QStringLiteral("maxCandidatesPerIter"))
                                      .toInt(config.maxCandidatesPerIter);
    config.minScore = json.value(QStringLiteral("minScore")).toDouble(config.minScore);
    config.refineTerms = json.value(QStringLiteral("refineTerms")).toInt(config.refineTerms);
    config.iterationDecay = json.value(QStringLiteral("iterationDecay"))
                                .toDouble(config.iterationDecay);
    config.qualityFloor = json.value(QStringLiteral("qualityFloor")).toDouble(config.qualityFloor);

    if (!config.isValid()) {
        LOG_WARN(frCore, "Settings: exploration values out of range, using defaults for them");
        config = config.sanitized();
    }
    return config;
}

} // namespace

std::optional<Settings> SettingsManager::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(frCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(frCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const Settings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(frCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(frCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(frCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::defaultSettingsPath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/factrank/settings.json");
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("tokenizer"), tokenizerToJson(settings.tokenizer));
    json.insert(QStringLiteral("exploration"), explorationToJson(settings.exploration));
    json.insert(QStringLiteral("cacheCapacity"), settings.cacheCapacity);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;
    settings.tokenizer = tokenizerFromJson(json.value(QStringLiteral("tokenizer")).toObject());
    settings.exploration = explorationFromJson(json.value(QStringLiteral("exploration")).toObject());
    settings.cacheCapacity = json.value(QStringLiteral("cacheCapacity"))
                                 .toInt(settings.cacheCapacity);
    return settings;
}

} // namespace fr
