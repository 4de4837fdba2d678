/**
 * @file transfersettings.h
 * @brief Persisted preferences for the transfer queue.
 */

#ifndef TRANSFERSETTINGS_H
#define TRANSFERSETTINGS_H

#include <QString>
#include <optional>

#include "conflictresolutionpolicy.h"

class QSettings;

/**
 * @brief Transfer preferences stored under the "transfers/" settings group.
 */
struct TransferSettings {
    static constexpr int DefaultAutoRemoveDelayMs = 5000;

    bool autoRemoveCompleted = true;
    int autoRemoveDelayMs = DefaultAutoRemoveDelayMs;

    /// Conflict action applied without asking; nullopt means ask every time
    std::optional<ConflictAction> defaultConflictAction;

    /// Loads from the application's default QSettings
    [[nodiscard]] static TransferSettings load();
    [[nodiscard]] static TransferSettings load(QSettings &settings);

    void save() const;
    void save(QSettings &settings) const;

    /**
     * @brief Parses "overwrite", "skip", "resume", "keep-both" (case-insensitive).
     * @return nullopt for "ask" or anything unrecognised.
     */
    [[nodiscard]] static std::optional<ConflictAction> parseConflictAction(const QString &text);

    [[nodiscard]] static QString conflictActionKey(std::optional<ConflictAction> action);
};

#endif // TRANSFERSETTINGS_H
