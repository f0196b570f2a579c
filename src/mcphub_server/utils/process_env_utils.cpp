#include "process_env_utils.h"

#include <QCoreApplication>
#include <QDir>

namespace mcphub_server {

void prependDirToVariable(const QString& name, const QString& dir, QProcessEnvironment& env) {
    const QString current = env.value(name);
    if (current.isEmpty()) {
        env.insert(name, dir);
        return;
    }
    const QStringList parts = current.split(QDir::listSeparator());
    if (parts.contains(dir)) {
        return;
    }
    env.insert(name, dir + QDir::listSeparator() + current);
}

QProcessEnvironment childBaseEnvironment() {
    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    if (QCoreApplication::instance()) {
        prependDirToVariable("PATH", QCoreApplication::applicationDirPath(), env);
    }
    return env;
}

} // namespace mcphub_server
