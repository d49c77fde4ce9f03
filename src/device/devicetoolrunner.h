#ifndef DEVICETOOLRUNNER_H
#define DEVICETOOLRUNNER_H

#include <QString>
#include <QStringList>

/**
 * @brief Outcome of one external tool invocation
 */
struct ToolResult
{
    bool started = false;       ///< false if the program could not be spawned
    int exitCode = -1;
    QString standardOutput;
    QString standardError;
    QString errorString;        ///< Spawn/crash description when !started

    bool succeeded() const { return started && exitCode == 0; }
};

/**
 * @brief Runs the libimobiledevice command line tools
 *
 * DeviceWatcher never spawns processes itself; it goes through a runner
 * so the tools can be replaced (tests, alternative installs).
 */
class DeviceToolRunner
{
public:
    virtual ~DeviceToolRunner() = default;

    /**
     * @brief Run a program to completion and capture its output
     *
     * Blocks the calling thread. There is no timeout: a tool that never
     * exits blocks the caller indefinitely.
     */
    virtual ToolResult run(const QString &program, const QStringList &arguments) = 0;
};

/**
 * @brief DeviceToolRunner backed by QProcess
 */
class ProcessToolRunner : public DeviceToolRunner
{
public:
    ToolResult run(const QString &program, const QStringList &arguments) override;
};

#endif // DEVICETOOLRUNNER_H
