#ifndef DOCSHIFT_PROCESS_RUNNER_H
#define DOCSHIFT_PROCESS_RUNNER_H

#include <QProcessEnvironment>
#include <QString>
#include <QStringList>

// Outcome of one external program run; started is false when the binary could not be launched.
struct ProcessResult
{
    int exitCode = -1;
    bool started = false;
    bool timedOut = false;
    QString stdOut;
    QString stdErr;

    bool succeeded() const { return started && !timedOut && exitCode == 0; }
};

// Runs external converters (soffice) without a shell in between.
namespace ProcessRunner
{
// Blocks until the program exits or timeoutMs elapses (0 waits forever); a timed out
// program is killed. A crash is reported as exit code -1.
ProcessResult run(const QString &program, const QStringList &args, const QString &workingDir,
                  const QProcessEnvironment &env, int timeoutMs = 0);

// First of names found on PATH, else the first existing executable among absoluteCandidates.
QString findFirstExecutable(const QStringList &names, const QStringList &absoluteCandidates = QStringList());

// Last non-empty lines of a process stream, for error messages.
QString tail(const QString &text, int maxLines = 5);
} // namespace ProcessRunner

#endif // DOCSHIFT_PROCESS_RUNNER_H
