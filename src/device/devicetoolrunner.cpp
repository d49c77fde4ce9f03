#include "devicetoolrunner.h"

#include <QProcess>
#include <QDebug>

ToolResult ProcessToolRunner::run(const QString &program, const QStringList &arguments)
{
    ToolResult result;

    QProcess process;
    process.start(program, arguments);

    if (!process.waitForStarted(-1)) {
        result.errorString = process.errorString();
        qDebug() << "[ProcessToolRunner] Failed to start" << program << ":" << result.errorString;
        return result;
    }

    result.started = true;
    process.waitForFinished(-1);

    result.standardOutput = QString::fromUtf8(process.readAllStandardOutput());
    result.standardError = QString::fromUtf8(process.readAllStandardError());

    if (process.exitStatus() != QProcess::NormalExit) {
        result.errorString = QString("%1 crashed").arg(program);
        result.exitCode = -1;
    } else {
        result.exitCode = process.exitCode();
    }

    return result;
}
