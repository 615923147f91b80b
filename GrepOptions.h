
#ifndef GREP_OPTIONS_H_
#define GREP_OPTIONS_H_

#include <QString>
#include <QStringList>
#include <stdexcept>

enum class ColorMode {
    Never,
    Always,
    Auto
};

struct GrepOptions {
    GrepOptions();

    QString       pattern;
    QStringList   files;
    bool          ignoreCase;
    bool          invert;
    bool          onlyMatching;
    bool          count;
    bool          lineNumber;
    bool          quiet;
    bool          recursive;
    ColorMode     color;
    QString       colorSequence; // SGR parameters used for matched text, e.g. "01;31"
    unsigned long maxSteps;      // 0 means no limit
    bool          debug;
    bool          showHelp;
    bool          showVersion;
};

// Bad command line; the message is shown together with a usage hint.
class GrepOptionsException : public std::runtime_error {
public:
    explicit GrepOptionsException(const QString &message) : std::runtime_error(message.toLocal8Bit().toStdString()) {
    }
};

// Unreadable or malformed --config file.
class ConfigFileException : public GrepOptionsException {
public:
    explicit ConfigFileException(const QString &message) : GrepOptionsException(message) {
    }
};

bool parseColorMode(const QString &text, ColorMode *mode);
void loadConfigFile(const QString &filename, GrepOptions *options);

/**
 * @brief parseCommandLine - builds the effective options. Later sources win:
 *        defaults, the --config file, GREP_COLOR, then the command line itself.
 * @param arguments - full argument list, program name first
 * @param helpText - receives the --help text when -h was given
 * @throws GrepOptionsException, ConfigFileException
 */
GrepOptions parseCommandLine(const QStringList &arguments, QString *helpText);

#endif
