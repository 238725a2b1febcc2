#pragma once
#include <QString>
#include <QStringList>

#include "pipeline/operations.h"

// CrackOperation that runs an operator supplied command line against the held target.
// "{path}" and "{id}" in the command are replaced by the target's path and item id.
class ProcessCrackOperation : public CrackOperation {
public:
    explicit ProcessCrackOperation(const QString& commandTemplate);

    CrackResult crack(const TransformTarget& target, const CancellationToken& token) override;

    // Program followed by its arguments, placeholders expanded. Empty when the template is empty.
    static QStringList expandCommand(const QString& commandTemplate, const QString& path, const QString& itemId);

private:
    QString m_template;
};
