#ifndef VISIONMODELCLASSIFIER_H
#define VISIONMODELCLASSIFIER_H

#include <QJsonObject>
#include <QString>
#include <QStringList>

/**
 * VisionModelClassifier - keyword heuristic for vision-capable models
 *
 * Stateless classification over fixed keyword tables. This is a guess,
 * not a guarantee: a name carrying an exclusion keyword is still accepted
 * when it also carries a vision keyword.
 */
class VisionModelClassifier {
public:
    VisionModelClassifier() = delete;

    enum class NameClass {
        Vision,        // Name alone marks it as a vision model
        Excluded,      // Known text-only family, skip without details
        NeedsDetails   // Undecided, inspect /api/show output
    };

    static const QStringList& visionKeywords();
    static const QStringList& excludeKeywords();

    // Built-in fallback list, offered when the server cannot be queried
    static QStringList defaultVisionModels();

    static NameClass classifyName(const QString& modelName);

    // details is the JSON object returned by /api/show for modelName
    static bool detailsIndicateVision(const QString& modelName, const QJsonObject& details);

private:
    static bool containsAny(const QString& haystack, const QStringList& needles);
};

#endif // VISIONMODELCLASSIFIER_H
