/**
 * @file consoleconflictprompt.h
 * @brief Interactive conflict resolver reading answers from a text stream.
 */

#ifndef CONSOLECONFLICTPROMPT_H
#define CONSOLECONFLICTPROMPT_H

#include <QCoreApplication>
#include <optional>

#include "conflictresolutionpolicy.h"

class QTextStream;

/**
 * @brief Asks the user how to handle each destination conflict.
 *
 * Answers are single keys: o(verwrite), s(kip), r(esume), k(eep both) and
 * q(uit). An uppercase key applies the choice to the rest of the batch.
 * q or end of input aborts the batch.
 *
 * The prompt reads every answer from the same stream. A QTextStream on a
 * pipe buffers ahead, so a fresh stream per question would lose answers.
 *
 * @par Example usage:
 * @code
 * QTextStream in(stdin);
 * QTextStream out(stdout);
 * ConsoleConflictPrompt prompt(in, out);
 * coordinator.uploadFiles(paths, "/srv", [&prompt](const ConflictRequest &request) {
 *     return prompt.ask(request);
 * });
 * @endcode
 */
class ConsoleConflictPrompt
{
    Q_DECLARE_TR_FUNCTIONS(ConsoleConflictPrompt)

public:
    ConsoleConflictPrompt(QTextStream &in, QTextStream &out);

    [[nodiscard]] std::optional<ConflictDecision> ask(const ConflictRequest &request);

private:
    QTextStream &in_;
    QTextStream &out_;
};

#endif // CONSOLECONFLICTPROMPT_H
