/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later

    workdeck-hostctl - talk to the workspace host from the command line

    Connects to the host socket and runs one round trip:
        profiles   list the shell profiles the host offers
        terminal   spawn a shell, run a command, print its output, close it
        surface    open a web surface on --url, then close it
        external   open an external terminal application (--type, --cwd, --command)

    Usage:
        workdeck-hostctl [--socket <path>] [--timeout <ms>] <profiles|terminal|surface|external>
*/

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonObject>
#include <QTextStream>
#include <QTimer>

#include "../HostBridge.h"
#include "../LocalSocketHostBridge.h"
#include "../ShellProfile.h"

using namespace Workdeck;

static void fail(const QString &message)
{
    QTextStream err(stderr);
    err << "Error: " << message << "\n";
    QCoreApplication::exit(1);
}

static void listProfiles(HostBridge *host)
{
    host->listProfiles([](const HostReply &reply) {
        if (!reply.ok) {
            fail(reply.error);
            return;
        }

        const ProfileList list = ProfileList::fromJson(reply.result);
        QTextStream out(stdout);
        for (const ShellProfile &profile : list.profiles) {
            out << profile.id << "\t" << profile.name << "\t" << profile.path;
            if (profile.id == list.defaultId || profile.isDefault) {
                out << "\t(default)";
            }
            out << "\n";
        }
        QCoreApplication::exit(list.isEmpty() ? 2 : 0);
    });
}

static void runInTerminal(HostBridge *host, const QString &command, int waitMs)
{
    TerminalSpec spec;
    spec.name = QStringLiteral("workdeck-hostctl");
    host->createTerminal(spec, [host, command, waitMs](const HostReply &reply) {
        const TerminalDescriptor terminal = TerminalDescriptor::fromJson(reply.result);
        if (!reply.ok || !terminal.isValid()) {
            fail(reply.ok ? QStringLiteral("host returned no terminal id") : reply.error);
            return;
        }

        QTextStream(stdout) << "Created terminal " << terminal.id << "\n";
        host->writeTerminal(terminal.id, command.toUtf8() + "\r");

        QTimer::singleShot(waitMs, host, [host, terminal]() {
            host->readTerminal(terminal.id, [host, terminal](const HostReply &readReply) {
                if (readReply.ok) {
                    QTextStream(stdout) << QString::fromUtf8(HostProtocol::decodeBytes(readReply.result)) << "\n";
                } else {
                    QTextStream(stderr) << "Read failed: " << readReply.error << "\n";
                }
                host->closeTerminal(terminal.id, [readReply](const HostReply &closeReply) {
                    if (!closeReply.ok) {
                        fail(closeReply.error);
                        return;
                    }
                    QCoreApplication::exit(readReply.ok ? 0 : 1);
                });
            });
        });
    });
}

static void openSurface(HostBridge *host, const QString &url)
{
    const QString sessionId = QStringLiteral("hostctl-surface");
    SurfaceBounds bounds;
    bounds.width = 800;
    bounds.height = 600;

    host->createSurface(sessionId, url, bounds, [host, sessionId](const HostReply &reply) {
        if (!reply.ok) {
            fail(reply.error);
            return;
        }
        QTextStream(stdout) << "Surface created\n";
        host->closeSurface(sessionId, [](const HostReply &closeReply) {
            if (!closeReply.ok) {
                fail(closeReply.error);
                return;
            }
            QTextStream(stdout) << "Surface closed\n";
            QCoreApplication::exit(0);
        });
    });
}

static void launchExternal(HostBridge *host, const QString &terminalType, const QString &workingDirectory, const QString &command)
{
    host->launchExternalTerminal(terminalType, workingDirectory, command, [terminalType](const HostReply &reply) {
        if (!reply.ok) {
            fail(reply.error);
            return;
        }
        QTextStream(stdout) << "Launched " << terminalType << "\n";
        QCoreApplication::exit(0);
    });
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("workdeck-hostctl"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    const QStringList actions{QStringLiteral("profiles"), QStringLiteral("terminal"), QStringLiteral("surface"), QStringLiteral("external")};

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Round-trip check against the Workdeck host"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("action"), QStringLiteral("profiles, terminal, surface or external"));

    QCommandLineOption socketOption(QStringList() << QStringLiteral("s") << QStringLiteral("socket"),
                                    QStringLiteral("Path to the host socket"),
                                    QStringLiteral("path"),
                                    LocalSocketHostBridge::defaultSocketPath());
    parser.addOption(socketOption);

    QCommandLineOption timeoutOption(QStringList() << QStringLiteral("t") << QStringLiteral("timeout"),
                                     QStringLiteral("Connection timeout in milliseconds (default: 3000)"),
                                     QStringLiteral("ms"),
                                     QStringLiteral("3000"));
    parser.addOption(timeoutOption);

    QCommandLineOption commandOption(QStringList() << QStringLiteral("c") << QStringLiteral("command"),
                                     QStringLiteral("Command to run (terminal default: echo workdeck; external default: a shell)"),
                                     QStringLiteral("command"));
    parser.addOption(commandOption);

    QCommandLineOption urlOption(QStringList() << QStringLiteral("u") << QStringLiteral("url"),
                                 QStringLiteral("Address the surface opens"),
                                 QStringLiteral("url"),
                                 QStringLiteral("https://example.com"));
    parser.addOption(urlOption);

    QCommandLineOption typeOption(QStringList() << QStringLiteral("type"),
                                  QStringLiteral("External terminal application, e.g. alacritty (default: default)"),
                                  QStringLiteral("type"),
                                  QStringLiteral("default"));
    parser.addOption(typeOption);

    QCommandLineOption cwdOption(QStringList() << QStringLiteral("cwd"),
                                 QStringLiteral("Working directory of the external terminal (default: home)"),
                                 QStringLiteral("dir"));
    parser.addOption(cwdOption);

    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        QTextStream err(stderr);
        err << "Error: expected exactly one action (" << actions.join(QStringLiteral(", ")) << ")\n";
        return 1;
    }

    const QString action = args.first();
    if (!actions.contains(action)) {
        QTextStream err(stderr);
        err << "Error: unknown action '" << action << "'\n";
        return 1;
    }

    bool timeoutOk = false;
    const int timeout = parser.value(timeoutOption).toInt(&timeoutOk);
    if (!timeoutOk || timeout <= 0) {
        QTextStream err(stderr);
        err << "Error: --timeout must be a positive number\n";
        return 1;
    }

    LocalSocketHostBridge host;
    if (!host.connectToHost(parser.value(socketOption), timeout)) {
        QTextStream err(stderr);
        err << "Error: cannot connect to " << parser.value(socketOption) << "\n";
        return 1;
    }

    QObject::connect(&host, &HostBridge::connectionLost, &app, []() {
        fail(QStringLiteral("host closed the connection"));
    });

    if (action == QLatin1String("profiles")) {
        listProfiles(&host);
    } else if (action == QLatin1String("terminal")) {
        const QString command = parser.isSet(commandOption) ? parser.value(commandOption) : QStringLiteral("echo workdeck");
        runInTerminal(&host, command, 500);
    } else if (action == QLatin1String("surface")) {
        openSurface(&host, parser.value(urlOption));
    } else {
        launchExternal(&host, parser.value(typeOption), parser.value(cwdOption), parser.value(commandOption));
    }

    return app.exec();
}
