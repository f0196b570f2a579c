#include "child_process.h"

#include <QCoreApplication>
#include <QLoggingCategory>

#include "mcphub/platform/process_utils.h"

namespace mcphub {

Q_LOGGING_CATEGORY(lcChild, "mcphub.child")

ChildProcess::ChildProcess(QObject* parent)
    : QObject(parent) {
    m_killTimer.setSingleShot(true);
    connect(&m_killTimer, &QTimer::timeout, this, [this]() {
        if (isRunning()) {
            qCInfo(lcChild) << "pid" << m_pid << "ignored terminate, killing";
            m_proc->kill();
        }
    });
}

ChildProcess::~ChildProcess() {
    m_killTimer.stop();
    if (m_proc) {
        m_proc->disconnect(this);
        if (m_proc->state() != QProcess::NotRunning) {
            m_proc->kill();
            m_proc->waitForFinished(1000);
        }
    }
}

bool ChildProcess::start(const LaunchSpec& spec, QString& error) {
    if (isRunning()) {
        error = "process already running: " + exitContext();
        return false;
    }

    // 按子进程自己的 PATH 查找
    const QString program = ProcessUtils::resolveProgram(spec.program, spec.workingDirectory,
                                                         spec.environment.value("PATH"));
    if (program.isEmpty()) {
        error = "executable not found: " + spec.program;
        return false;
    }

    m_spec = spec;
    m_stderrBuf.clear();
    m_stderrTail.clear();
    m_pid = 0;
    m_stopRequested = false;
    m_exitReported = false;
    m_killTimer.stop();

    m_proc = std::make_unique<QProcess>();
    m_proc->setProgram(program);
    m_proc->setArguments(spec.arguments);
    if (!spec.workingDirectory.isEmpty()) {
        m_proc->setWorkingDirectory(spec.workingDirectory);
    }
    m_proc->setProcessEnvironment(spec.environment);
    m_proc->setProcessChannelMode(QProcess::SeparateChannels);
    ProcessUtils::bindToParentLifetime(m_proc.get());

    connect(m_proc.get(), &QProcess::readyReadStandardOutput, this, [this]() {
        emit stdoutData(m_proc->readAllStandardOutput());
    });
    connect(m_proc.get(), &QProcess::readyReadStandardError, this, &ChildProcess::onStderrReady);
    connect(m_proc.get(), QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished), this,
            &ChildProcess::onFinished);

    m_proc->start();
    if (!m_proc->waitForStarted(kStartWaitMs)) {
        error = QString("failed to start %1: %2").arg(spec.program, m_proc->errorString());
        m_proc->disconnect(this);
        m_proc->kill();
        m_proc->waitForFinished(1000);
        m_proc.reset();
        return false;
    }

    m_pid = m_proc->processId();
    qCDebug(lcChild) << "started" << spec.commandLine() << "pid" << m_pid;
    error.clear();
    return true;
}

void ChildProcess::stop(int graceMs) {
    if (!isRunning()) {
        return;
    }

    const int grace = qMax(0, graceMs);
    if (!m_stopRequested) {
        m_stopRequested = true;
        m_proc->terminate();
        m_killTimer.start(grace);
    } else if (!m_killTimer.isActive() || m_killTimer.remainingTime() > grace) {
        m_killTimer.start(grace);
    }
    // kill 定时器或进程自行退出都会触发 finished → onFinished
}

void ChildProcess::kill() {
    if (!isRunning()) {
        return;
    }
    m_stopRequested = true;
    m_killTimer.stop();
    m_proc->kill();
}

bool ChildProcess::waitForExit(int timeoutMs) {
    if (!m_proc || m_proc->state() == QProcess::NotRunning) {
        return true;
    }
    // waitForFinished 同步发出 finished，exited 在返回前已送达
    return m_proc->waitForFinished(qMax(0, timeoutMs));
}

void ChildProcess::retire(std::unique_ptr<ChildProcess> child, int graceMs) {
    if (!child) {
        return;
    }
    ChildProcess* raw = child.release();
    raw->disconnect();
    if (!raw->isRunning()) {
        raw->deleteLater();
        return;
    }
    // 挂到 application 下，事件循环先于进程结束时仍由析构 kill
    raw->setParent(QCoreApplication::instance());
    connect(raw, &ChildProcess::exited, raw, &QObject::deleteLater);
    raw->stop(graceMs);
}

qint64 ChildProcess::write(const QByteArray& data) {
    if (!isRunning()) {
        return -1;
    }
    return m_proc->write(data);
}

bool ChildProcess::isRunning() const {
    return m_proc && m_proc->state() == QProcess::Running;
}

int ChildProcess::exitCode() const {
    return (m_proc && m_proc->state() == QProcess::NotRunning) ? m_proc->exitCode() : -1;
}

QProcess::ExitStatus ChildProcess::exitStatus() const {
    return m_proc ? m_proc->exitStatus() : QProcess::NormalExit;
}

QString ChildProcess::exitContext() const {
    const QString program = m_spec.program.isEmpty() ? QStringLiteral("<unknown>") : m_spec.program;
    if (!m_proc) {
        return QStringLiteral("program=%1, state=not started").arg(program);
    }
    const bool notRunning = m_proc->state() == QProcess::NotRunning;
    const int code = notRunning ? m_proc->exitCode() : -1;
    const QString status = notRunning
                               ? (m_proc->exitStatus() == QProcess::CrashExit ? "crash" : "normal")
                               : "running";
    return QStringLiteral("program=%1, pid=%2, exitCode=%3, exitStatus=%4")
        .arg(program, QString::number(m_pid), QString::number(code), status);
}

void ChildProcess::onStderrReady() {
    m_stderrBuf.append(m_proc->readAllStandardError());
    while (true) {
        const qsizetype nl = m_stderrBuf.indexOf('\n');
        if (nl < 0)
            break;
        QByteArray line = m_stderrBuf.left(nl);
        m_stderrBuf.remove(0, nl + 1);
        if (line.endsWith('\r'))
            line.chop(1);

        const QString text = QString::fromUtf8(line);
        m_stderrTail.append(text);
        while (m_stderrTail.size() > kStderrTailLines) {
            m_stderrTail.removeFirst();
        }
        emit stderrLine(text);
    }
    if (m_stderrBuf.size() > kMaxStderrBufferBytes) {
        emit stderrLine(QString::fromUtf8(m_stderrBuf));
        m_stderrBuf.clear();
    }
}

void ChildProcess::onFinished(int exitCode, QProcess::ExitStatus status) {
    if (m_exitReported) {
        return;
    }
    m_exitReported = true;
    m_killTimer.stop();

    // 排空管道尾部数据
    const QByteArray tailOut = m_proc->readAllStandardOutput();
    if (!tailOut.isEmpty()) {
        emit stdoutData(tailOut);
    }
    onStderrReady();
    if (!m_stderrBuf.isEmpty()) {
        m_stderrTail.append(QString::fromUtf8(m_stderrBuf));
        emit stderrLine(QString::fromUtf8(m_stderrBuf));
        m_stderrBuf.clear();
    }

    qCDebug(lcChild) << "exited" << exitContext();
    emit exited(exitCode, status);
}

} // namespace mcphub
