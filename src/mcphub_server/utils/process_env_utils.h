#pragma once

#include <QProcessEnvironment>
#include <QString>

namespace mcphub_server {

/// Prepend @p dir to the list variable @p name (PATH, PYTHONPATH) using the platform separator.
void prependDirToVariable(const QString& name, const QString& dir, QProcessEnvironment& env);

/// 子进程的基础环境：系统环境，并把本程序所在目录加到 PATH 前面
QProcessEnvironment childBaseEnvironment();

} // namespace mcphub_server
