#include "Grep.h"
#include "GrepOptions.h"
#include <QCoreApplication>
#include <QFile>
#include <QLoggingCategory>
#include <QTextStream>
#include <cstdio>
#include <unistd.h>

int main(int argc, char *argv[]) {

    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QLatin1String("ngrep"));
    QCoreApplication::setApplicationVersion(QLatin1String(NGREP_VERSION));

    qSetMessagePattern(QLatin1String("%{appname}: %{type}: %{message}"));

    QFile in;
    QFile out;
    QFile err;
    if(!in.open(stdin, QIODevice::ReadOnly) || !out.open(stdout, QIODevice::WriteOnly) || !err.open(stderr, QIODevice::WriteOnly)) {
        qWarning("unable to open the standard streams");
        return 2;
    }

    GrepOptions options;
    QString helpText;

    try {
        options = parseCommandLine(QCoreApplication::arguments(), &helpText);
    } catch(const ConfigFileException &e) {
        QTextStream(&err) << "ngrep: " << e.what() << '\n';
        return 2;
    } catch(const GrepOptionsException &e) {
        QTextStream(&err) << "ngrep: " << e.what() << '\n'
                          << "Usage: ngrep [OPTION]... PATTERN [FILE]...\n"
                          << "Try 'ngrep --help' for more information.\n";
        return 2;
    }

    if(options.showHelp) {
        QTextStream(&out) << helpText;
        return 0;
    }

    if(options.showVersion) {
        QTextStream(&out) << QCoreApplication::applicationName() << ' ' << QCoreApplication::applicationVersion() << '\n';
        return 0;
    }

    if(!options.debug) {
        QLoggingCategory::setFilterRules(QLatin1String("*.debug=false"));
    }

    if(options.color == ColorMode::Auto) {
        options.color = isatty(STDOUT_FILENO) ? ColorMode::Always : ColorMode::Never;
    }

    Grep grep(options, &in, &out, &err);
    return grep.run();
}
