#include "transfersettings.h"

#include <QSettings>

namespace {
const char *const KeyAutoRemove = "transfers/autoRemoveCompleted";
const char *const KeyAutoRemoveDelay = "transfers/autoRemoveDelayMs";
const char *const KeyConflictAction = "transfers/defaultConflictAction";
}

TransferSettings TransferSettings::load()
{
    QSettings settings;
    return load(settings);
}

TransferSettings TransferSettings::load(QSettings &settings)
{
    TransferSettings result;
    result.autoRemoveCompleted = settings.value(KeyAutoRemove, true).toBool();

    bool ok = false;
    const int delay = settings.value(KeyAutoRemoveDelay, DefaultAutoRemoveDelayMs).toInt(&ok);
    result.autoRemoveDelayMs = (ok && delay >= 0) ? delay : DefaultAutoRemoveDelayMs;

    result.defaultConflictAction = parseConflictAction(
        settings.value(KeyConflictAction, QStringLiteral("ask")).toString());
    return result;
}

void TransferSettings::save() const
{
    QSettings settings;
    save(settings);
}

void TransferSettings::save(QSettings &settings) const
{
    settings.setValue(KeyAutoRemove, autoRemoveCompleted);
    settings.setValue(KeyAutoRemoveDelay, autoRemoveDelayMs);
    settings.setValue(KeyConflictAction, conflictActionKey(defaultConflictAction));
}

std::optional<ConflictAction> TransferSettings::parseConflictAction(const QString &text)
{
    const QString key = text.trimmed().toLower();
    if (key == QLatin1String("overwrite")) {
        return ConflictAction::Overwrite;
    }
    if (key == QLatin1String("skip")) {
        return ConflictAction::Skip;
    }
    if (key == QLatin1String("resume")) {
        return ConflictAction::Resume;
    }
    if (key == QLatin1String("keep-both") || key == QLatin1String("keepboth")) {
        return ConflictAction::KeepBoth;
    }
    return std::nullopt;
}

QString TransferSettings::conflictActionKey(std::optional<ConflictAction> action)
{
    if (!action) {
        return QStringLiteral("ask");
    }
    switch (*action) {
    case ConflictAction::Overwrite: return QStringLiteral("overwrite");
    case ConflictAction::Skip: return QStringLiteral("skip");
    case ConflictAction::Resume: return QStringLiteral("resume");
    case ConflictAction::KeepBoth: return QStringLiteral("keep-both");
    }
    return QStringLiteral("ask");
}
