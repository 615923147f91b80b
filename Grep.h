
#ifndef GREP_H_
#define GREP_H_

#include "GrepOptions.h"
#include "regex/Regex.h"
#include <QByteArray>
#include <QString>
#include <QTextStream>
#include <memory>

class QIODevice;

/* Runs one search: compiles the pattern, then reads every input line by
   line and writes the selected lines (or counts, or matches) to 'out'.
   Diagnostics go to 'err'.  ColorMode::Auto must already be resolved by the
   caller; it is treated like ColorMode::Never here. */
class Grep {
public:
    Grep(const GrepOptions &options, QIODevice *in, QIODevice *out, QIODevice *err);

private:
    Grep(const Grep &) = delete;
    Grep &operator=(const Grep &) = delete;

public:
    // Returns the exit status: 0 if a line was selected, 1 if none, 2 on error.
    int run();

private:
    void searchPath(const QString &path);
    void searchFile(const QString &path);
    void searchDevice(QIODevice *device, const QString &name);
    void printLine(RegexMatch *match, const QByteArray &line, const QString &name, long lineNumber);
    void printMatches(RegexMatch *match, const QByteArray &line, const QString &name, long lineNumber);
    void write(const QByteArray &data);
    void error(const QString &message);
    QByteArray prefix(const QString &name, long lineNumber) const;
    QByteArray colored(const QByteArray &text, const QByteArray &sequence) const;

private:
    GrepOptions            options_;
    QIODevice *            in_;
    QIODevice *            out_;
    QTextStream            err_;
    std::unique_ptr<Regex> regex_;
    bool                   color_;
    bool                   multipleFiles_;
    bool                   found_;
    bool                   errors_;
    bool                   done_;
};

#endif
