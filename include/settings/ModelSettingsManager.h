#ifndef MODELSETTINGSMANAGER_H
#define MODELSETTINGSMANAGER_H

#include <QString>

/**
 * @brief Singleton manager for the OCR model settings.
 *
 * Handles persistence of the last used vision model, the Ollama
 * server address and the language hint passed to the model.
 * Reads are permissive: a missing, unreadable or empty value
 * falls back to the built-in default.
 */
class ModelSettingsManager
{
public:
    static ModelSettingsManager& instance();

    // Last used model (never empty)
    QString lastModel() const;
    void setLastModel(const QString &model);

    // Ollama base URL, without trailing slash
    QString ollamaUrl() const;
    void setOllamaUrl(const QString &url);

    // Language hint for recognition
    QString language() const;
    void setLanguage(const QString &language);

    // Save to QSettings (best-effort)
    void save();

    // Load from QSettings
    void load();

    // Default values
    static QString defaultModel();
    static QString defaultOllamaUrl();
    static QString defaultLanguage();

private:
    ModelSettingsManager();
    ~ModelSettingsManager() = default;
    ModelSettingsManager(const ModelSettingsManager&) = delete;
    ModelSettingsManager& operator=(const ModelSettingsManager&) = delete;

    static QString normalizedUrl(const QString &url);

    QString m_lastModel;
    QString m_ollamaUrl;
    QString m_language;
};

#endif // MODELSETTINGSMANAGER_H
