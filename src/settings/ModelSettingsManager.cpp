#include "settings/ModelSettingsManager.h"
#include "settings/Settings.h"
#include <QDebug>

ModelSettingsManager& ModelSettingsManager::instance()
{
    static ModelSettingsManager instance;
    return instance;
}

ModelSettingsManager::ModelSettingsManager()
    : m_lastModel(defaultModel())
    , m_ollamaUrl(defaultOllamaUrl())
    , m_language(defaultLanguage())
{
    load();
}

QString ModelSettingsManager::defaultModel()
{
    return QString::fromLatin1(NeoCR::kDefaultModel);
}

QString ModelSettingsManager::defaultOllamaUrl()
{
    return QString::fromLatin1(NeoCR::kDefaultOllamaUrl);
}

QString ModelSettingsManager::defaultLanguage()
{
    return QString::fromLatin1(NeoCR::kDefaultLanguage);
}

QString ModelSettingsManager::lastModel() const
{
    return m_lastModel;
}

void ModelSettingsManager::setLastModel(const QString &model)
{
    const QString trimmed = model.trimmed();
    if (trimmed.isEmpty()) {
        qWarning() << "ModelSettingsManager: Ignoring empty model name";
        return;
    }
    m_lastModel = trimmed;
}

QString ModelSettingsManager::ollamaUrl() const
{
    return m_ollamaUrl;
}

void ModelSettingsManager::setOllamaUrl(const QString &url)
{
    const QString normalized = normalizedUrl(url);
    m_ollamaUrl = normalized.isEmpty() ? defaultOllamaUrl() : normalized;
}

QString ModelSettingsManager::language() const
{
    return m_language;
}

void ModelSettingsManager::setLanguage(const QString &language)
{
    const QString trimmed = language.trimmed();
    m_language = trimmed.isEmpty() ? defaultLanguage() : trimmed;
}

void ModelSettingsManager::save()
{
    auto settings = NeoCR::getSettings();
    settings.setValue(NeoCR::kSettingsKeyLastModel, m_lastModel);
    settings.setValue(NeoCR::kSettingsKeyOllamaUrl, m_ollamaUrl);
    settings.setValue(NeoCR::kSettingsKeyLanguage, m_language);
    settings.sync();

    if (settings.status() != QSettings::NoError) {
        qWarning() << "ModelSettingsManager: Failed to write settings to" << settings.fileName();
        return;
    }
    qDebug() << "ModelSettingsManager: Saved last model:" << m_lastModel;
}

void ModelSettingsManager::load()
{
    auto settings = NeoCR::getSettings();
    if (settings.status() != QSettings::NoError) {
        qWarning() << "ModelSettingsManager: Unreadable settings at" << settings.fileName()
                   << "- using defaults";
        m_lastModel = defaultModel();
        m_ollamaUrl = defaultOllamaUrl();
        m_language = defaultLanguage();
        return;
    }

    const QString model = settings.value(NeoCR::kSettingsKeyLastModel).toString().trimmed();
    m_lastModel = model.isEmpty() ? defaultModel() : model;

    setOllamaUrl(settings.value(NeoCR::kSettingsKeyOllamaUrl, defaultOllamaUrl()).toString());
    setLanguage(settings.value(NeoCR::kSettingsKeyLanguage, defaultLanguage()).toString());

    qDebug() << "ModelSettingsManager: Loaded last model:" << m_lastModel
             << "server:" << m_ollamaUrl;
}

QString ModelSettingsManager::normalizedUrl(const QString &url)
{
    QString result = url.trimmed();
    while (result.endsWith('/')) {
        result.chop(1);
    }
    return result;
}
