#include "ocr/VisionModelClassifier.h"

#include <QJsonDocument>
#include <QJsonValue>

const QStringList& VisionModelClassifier::visionKeywords()
{
    static const QStringList keywords{
        QStringLiteral("vl"),
        QStringLiteral("vision"),
        QStringLiteral("llava"),
        QStringLiteral("multimodal"),
        QStringLiteral("image"),
        QStringLiteral("clip"),
        QStringLiteral("visual")
    };
    return keywords;
}

const QStringList& VisionModelClassifier::excludeKeywords()
{
    static const QStringList keywords{
        QStringLiteral("mistral"),
        QStringLiteral("phi"),
        QStringLiteral("codellama"),
        QStringLiteral("deepseek-coder"),
        QStringLiteral("starcoder"),
        QStringLiteral("wizardcoder"),
        QStringLiteral("neural-chat"),
        QStringLiteral("orca")
    };
    return keywords;
}

QStringList VisionModelClassifier::defaultVisionModels()
{
    return {
        QStringLiteral("qwen3-vl:8b"),
        QStringLiteral("qwen2-vl:7b"),
        QStringLiteral("qwen2-vl:2b"),
        QStringLiteral("llava:latest"),
        QStringLiteral("llava:13b"),
        QStringLiteral("llava:7b"),
        QStringLiteral("gemma3:4b"),
        QStringLiteral("gemma3:12b")
    };
}

bool VisionModelClassifier::containsAny(const QString& haystack, const QStringList& needles)
{
    for (const QString& needle : needles) {
        if (haystack.contains(needle)) {
            return true;
        }
    }
    return false;
}

VisionModelClassifier::NameClass VisionModelClassifier::classifyName(const QString& modelName)
{
    const QString lower = modelName.toLower();
    const bool hasVisionKeyword = containsAny(lower, visionKeywords());

    // An exclusion keyword only wins when no vision keyword is present
    if (containsAny(lower, excludeKeywords()) && !hasVisionKeyword) {
        return NameClass::Excluded;
    }

    return hasVisionKeyword ? NameClass::Vision : NameClass::NeedsDetails;
}

bool VisionModelClassifier::detailsIndicateVision(const QString& modelName, const QJsonObject& details)
{
    const QString lowerName = modelName.toLower();
    const QString modelfile = details.value(QStringLiteral("modelfile")).toString().toLower();
    const QString detailsText =
        QString::fromUtf8(QJsonDocument(details).toJson(QJsonDocument::Compact)).toLower();

    const QJsonValue parametersValue = details.value(QStringLiteral("parameters"));
    QString parameters;
    if (parametersValue.isString()) {
        parameters = parametersValue.toString();
    } else if (parametersValue.isObject()) {
        parameters = QString::fromUtf8(QJsonDocument(parametersValue.toObject()).toJson(QJsonDocument::Compact));
    } else if (parametersValue.isArray()) {
        parameters = QString::fromUtf8(QJsonDocument(parametersValue.toArray()).toJson(QJsonDocument::Compact));
    }
    parameters = parameters.toLower();

    if (containsAny(modelfile, visionKeywords()) ||
        containsAny(detailsText, visionKeywords()) ||
        containsAny(parameters, visionKeywords())) {
        return true;
    }

    // Known vision families
    return lowerName.contains(QStringLiteral("llava")) ||
           (lowerName.contains(QStringLiteral("qwen")) && lowerName.contains(QStringLiteral("vl")));
}
