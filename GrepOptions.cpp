#include "GrepOptions.h"
#include "regex/RegexMatch.h"
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QtDebug>
#include <QtGlobal>

namespace {

const char DefaultColorSequence[] = "01;31";

bool readBool(const QJsonObject &obj, const QString &key, const QString &filename) {
    const QJsonValue value = obj[key];
    if(!value.isBool()) {
        throw ConfigFileException(QString::fromLatin1("%1: \"%2\" must be true or false").arg(filename, key));
    }

    return value.toBool();
}

}

//------------------------------------------------------------------------------
// Name: GrepOptions
//------------------------------------------------------------------------------
GrepOptions::GrepOptions() : ignoreCase(false), invert(false), onlyMatching(false), count(false), lineNumber(false), quiet(false), recursive(false), color(ColorMode::Never), colorSequence(QLatin1String(DefaultColorSequence)), maxSteps(RegexMatch::DefaultStepLimit), debug(false), showHelp(false), showVersion(false) {
}

bool parseColorMode(const QString &text, ColorMode *mode) {

    const QString when = text.toLower();

    if(when == QLatin1String("always")) {
        *mode = ColorMode::Always;
    } else if(when == QLatin1String("never")) {
        *mode = ColorMode::Never;
    } else if(when == QLatin1String("auto")) {
        *mode = ColorMode::Auto;
    } else {
        return false;
    }

    return true;
}

//------------------------------------------------------------------------------
// Name: loadConfigFile
// Desc: reads a JSON object of option defaults, e.g.
//       { "lineNumber": true, "color": "auto", "maxSteps": 500000 }
//------------------------------------------------------------------------------
void loadConfigFile(const QString &filename, GrepOptions *options) {

    QFile file(filename);
    if(!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        throw ConfigFileException(QString::fromLatin1("%1: %2").arg(filename, file.errorString()));
    }

    QJsonParseError e;
    const QJsonDocument d = QJsonDocument::fromJson(file.readAll(), &e);
    if(d.isNull()) {
        throw ConfigFileException(QString::fromLatin1("%1: %2 at offset %3").arg(filename, e.errorString()).arg(e.offset));
    }

    if(!d.isObject()) {
        throw ConfigFileException(QString::fromLatin1("%1: expected a JSON object").arg(filename));
    }

    const QJsonObject obj = d.object();

    for(QJsonObject::const_iterator it = obj.begin(); it != obj.end(); ++it) {
        const QString key = it.key();

        if(key == QLatin1String("ignoreCase")) {
            options->ignoreCase = readBool(obj, key, filename);
        } else if(key == QLatin1String("lineNumber")) {
            options->lineNumber = readBool(obj, key, filename);
        } else if(key == QLatin1String("count")) {
            options->count = readBool(obj, key, filename);
        } else if(key == QLatin1String("onlyMatching")) {
            options->onlyMatching = readBool(obj, key, filename);
        } else if(key == QLatin1String("invert")) {
            options->invert = readBool(obj, key, filename);
        } else if(key == QLatin1String("recursive")) {
            options->recursive = readBool(obj, key, filename);
        } else if(key == QLatin1String("color")) {
            if(!it.value().isString() || !parseColorMode(it.value().toString(), &options->color)) {
                throw ConfigFileException(QString::fromLatin1("%1: \"color\" must be \"always\", \"never\" or \"auto\"").arg(filename));
            }
        } else if(key == QLatin1String("maxSteps")) {
            const double steps = it.value().toDouble(-1);
            if(!it.value().isDouble() || steps < 0 || steps != static_cast<double>(static_cast<unsigned long>(steps))) {
                throw ConfigFileException(QString::fromLatin1("%1: \"maxSteps\" must be a non-negative integer").arg(filename));
            }
            options->maxSteps = static_cast<unsigned long>(steps);
        } else {
            qWarning("%s: unknown key \"%s\" ignored", qPrintable(filename), qPrintable(key));
        }
    }
}

GrepOptions parseCommandLine(const QStringList &arguments, QString *helpText) {

    QCommandLineParser parser;
    parser.setApplicationDescription(QLatin1String("Search for PATTERN in each FILE or standard input."));
    parser.setSingleDashWordOptionMode(QCommandLineParser::ParseAsCompactedShortOptions);

    // addVersionOption() would claim -v, which is --invert-match here.
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption versionOption(QLatin1String("version"), QLatin1String("Display version information."));
    const QCommandLineOption extendedOption(QStringList() << QLatin1String("E") << QLatin1String("extended-regexp"), QLatin1String("PATTERN is an extended regular expression (always the case)."));
    const QCommandLineOption regexpOption(QStringList() << QLatin1String("e") << QLatin1String("regexp"), QLatin1String("Use PATTERN for matching."), QLatin1String("PATTERN"));
    const QCommandLineOption ignoreCaseOption(QStringList() << QLatin1String("i") << QLatin1String("ignore-case"), QLatin1String("Ignore case distinctions."));
    const QCommandLineOption invertOption(QStringList() << QLatin1String("v") << QLatin1String("invert-match"), QLatin1String("Select non-matching lines."));
    const QCommandLineOption onlyMatchingOption(QStringList() << QLatin1String("o") << QLatin1String("only-matching"), QLatin1String("Show only the part of a line matching PATTERN."));
    const QCommandLineOption countOption(QStringList() << QLatin1String("c") << QLatin1String("count"), QLatin1String("Print only a count of selected lines per FILE."));
    const QCommandLineOption lineNumberOption(QStringList() << QLatin1String("n") << QLatin1String("line-number"), QLatin1String("Print line number with output lines."));
    const QCommandLineOption quietOption(QStringList() << QLatin1String("q") << QLatin1String("quiet") << QLatin1String("silent"), QLatin1String("Suppress all normal output."));
    const QCommandLineOption recursiveOption(QStringList() << QLatin1String("r") << QLatin1String("recursive"), QLatin1String("Search directories recursively."));
    const QCommandLineOption colorOption(QStringList() << QLatin1String("color") << QLatin1String("colour"), QLatin1String("Highlight matches; WHEN is 'always', 'never' or 'auto'."), QLatin1String("WHEN"));
    const QCommandLineOption maxStepsOption(QLatin1String("max-steps"), QLatin1String("Give up on a line after N matching steps (0 = unlimited)."), QLatin1String("N"));
    const QCommandLineOption configOption(QLatin1String("config"), QLatin1String("Read option defaults from a JSON file."), QLatin1String("FILE"));
    const QCommandLineOption debugOption(QLatin1String("debug"), QLatin1String("Log the compiled pattern and other diagnostics."));

    parser.addOption(versionOption);
    parser.addOption(extendedOption);
    parser.addOption(regexpOption);
    parser.addOption(ignoreCaseOption);
    parser.addOption(invertOption);
    parser.addOption(onlyMatchingOption);
    parser.addOption(countOption);
    parser.addOption(lineNumberOption);
    parser.addOption(quietOption);
    parser.addOption(recursiveOption);
    parser.addOption(colorOption);
    parser.addOption(maxStepsOption);
    parser.addOption(configOption);
    parser.addOption(debugOption);
    parser.addPositionalArgument(QLatin1String("PATTERN"), QLatin1String("Regular expression to search for."));
    parser.addPositionalArgument(QLatin1String("FILE"), QLatin1String("Files or directories to search, '-' is standard input."), QLatin1String("[FILE...]"));

    if(!parser.parse(arguments)) {
        throw GrepOptionsException(parser.errorText());
    }

    GrepOptions options;

    if(parser.isSet(helpOption)) {
        options.showHelp = true;
        if(helpText) {
            *helpText = parser.helpText();
        }
        return options;
    }

    if(parser.isSet(versionOption)) {
        options.showVersion = true;
        return options;
    }

    if(parser.isSet(configOption)) {
        loadConfigFile(parser.value(configOption), &options);
    }

    const QByteArray colorSequence = qgetenv("GREP_COLOR");
    if(!colorSequence.isEmpty()) {
        options.colorSequence = QString::fromLocal8Bit(colorSequence);
    }

    if(parser.isSet(ignoreCaseOption))   options.ignoreCase   = true;
    if(parser.isSet(invertOption))       options.invert       = true;
    if(parser.isSet(onlyMatchingOption)) options.onlyMatching = true;
    if(parser.isSet(countOption))        options.count        = true;
    if(parser.isSet(lineNumberOption))   options.lineNumber   = true;
    if(parser.isSet(quietOption))        options.quiet        = true;
    if(parser.isSet(recursiveOption))    options.recursive    = true;
    if(parser.isSet(debugOption))        options.debug        = true;

    if(parser.isSet(colorOption) && !parseColorMode(parser.value(colorOption), &options.color)) {
        throw GrepOptionsException(QString::fromLatin1("invalid argument '%1' for '--color'").arg(parser.value(colorOption)));
    }

    if(parser.isSet(maxStepsOption)) {
        bool ok;
        options.maxSteps = parser.value(maxStepsOption).toULong(&ok);
        if(!ok) {
            throw GrepOptionsException(QString::fromLatin1("invalid argument '%1' for '--max-steps'").arg(parser.value(maxStepsOption)));
        }
    }

    QStringList positional = parser.positionalArguments();

    if(parser.isSet(regexpOption)) {
        options.pattern = parser.value(regexpOption);
    } else if(!positional.isEmpty()) {
        options.pattern = positional.takeFirst();
    } else {
        throw GrepOptionsException(QLatin1String("missing PATTERN"));
    }

    options.files = positional;
    return options;
}
