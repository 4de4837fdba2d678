#include "consoleconflictprompt.h"
#include "utils/logging.h"

#include <QTextStream>

ConsoleConflictPrompt::ConsoleConflictPrompt(QTextStream &in, QTextStream &out)
    : in_(in)
    , out_(out)
{
}

std::optional<ConflictDecision> ConsoleConflictPrompt::ask(const ConflictRequest &request)
{
    const QString destination = request.direction == TransferDirection::Upload
        ? request.remotePath
        : request.localPath;

    while (true) {
        out_ << tr("%1 already exists (%2 of %3 bytes).")
                    .arg(destination, QString::number(request.existingSize),
                         QString::number(request.totalSize))
             << Qt::endl;
        out_ << tr("[o]verwrite, [s]kip, %1[k]eep both, [q]uit (uppercase = apply to all): ")
                    .arg(request.canResume ? QStringLiteral("[r]esume, ") : QString());
        out_.flush();

        const QString line = in_.readLine();
        if (line.isNull()) {
            LOG_VERBOSE() << "ConsoleConflictPrompt: input closed, aborting batch";
            return std::nullopt;
        }

        const QString answer = line.trimmed();
        if (answer.isEmpty()) {
            continue;
        }

        const QChar key = answer.at(0);
        ConflictDecision decision;
        decision.applyToAll = key.isUpper();

        switch (key.toLower().unicode()) {
        case 'o':
            decision.action = ConflictAction::Overwrite;
            return decision;
        case 's':
            decision.action = ConflictAction::Skip;
            return decision;
        case 'r':
            decision.action = ConflictAction::Resume;
            return decision;
        case 'k':
            decision.action = ConflictAction::KeepBoth;
            return decision;
        case 'q':
            return std::nullopt;
        default:
            break;
        }
    }
}
