#include "process_utils.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>

#ifdef Q_OS_WIN
#include <windows.h>
#endif

#ifdef Q_OS_UNIX
#include <cerrno>
#include <signal.h>
#include <unistd.h>
#endif

#ifdef Q_OS_LINUX
#include <sys/prctl.h>
#endif

namespace mcphub::ProcessUtils {

void bindToParentLifetime(QProcess* process) {
#ifdef Q_OS_LINUX
    if (!process)
        return;

    const pid_t parentPid = getpid();
    process->setChildProcessModifier([parentPid] {
        prctl(PR_SET_PDEATHSIG, SIGKILL);
        // fork 与 prctl 之间父进程已退出时 getppid() 不再等于 parentPid
        if (getppid() != parentPid) {
            _exit(1);
        }
    });
#else
    Q_UNUSED(process);
#endif
}

bool isProcessAlive(qint64 pid) {
    if (pid <= 0) {
        return false;
    }
#ifdef Q_OS_WIN
    HANDLE h = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, static_cast<DWORD>(pid));
    if (!h) {
        return false;
    }
    DWORD code = 0;
    const BOOL ok = GetExitCodeProcess(h, &code);
    CloseHandle(h);
    return ok && code == STILL_ACTIVE;
#else
    if (::kill(static_cast<pid_t>(pid), 0) != 0) {
        return errno == EPERM;
    }
#ifdef Q_OS_LINUX
    // 已退出但未回收的子进程仍能通过 kill(0)，读 /proc 状态排除僵尸
    QFile stat(QString("/proc/%1/stat").arg(pid));
    if (stat.open(QIODevice::ReadOnly)) {
        const QByteArray content = stat.readAll();
        const qsizetype rparen = content.lastIndexOf(')');
        if (rparen >= 0 && rparen + 2 < content.size() && content.at(rparen + 2) == 'Z') {
            return false;
        }
    }
#endif
    return true;
#endif
}

QString executableSuffix() {
#ifdef Q_OS_WIN
    return ".exe";
#else
    return QString();
#endif
}

QString resolveProgram(const QString& program, const QString& workingDirectory,
                       const QString& searchPath) {
    if (program.isEmpty()) {
        return {};
    }

    const QFileInfo direct(program);
    if (direct.isAbsolute()) {
        return direct.isFile() && direct.isExecutable() ? direct.absoluteFilePath() : QString();
    }

    if (program.contains('/') || program.contains('\\')) {
        const QString base = workingDirectory.isEmpty() ? QDir::currentPath() : workingDirectory;
        const QFileInfo relative(QDir(base).filePath(program));
        return relative.isFile() && relative.isExecutable() ? relative.absoluteFilePath()
                                                            : QString();
    }

    if (searchPath.isEmpty()) {
        return QStandardPaths::findExecutable(program);
    }
    return QStandardPaths::findExecutable(
        program, searchPath.split(QDir::listSeparator(), Qt::SkipEmptyParts));
}

} // namespace mcphub::ProcessUtils
