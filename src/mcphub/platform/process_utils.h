#pragma once

#include <QProcess>
#include <QString>

#include "mcphub/mcphub_export.h"

namespace mcphub::ProcessUtils {

/**
 * 在 QProcess::start() 前调用，使子进程随宿主退出
 * Linux: setChildProcessModifier + prctl(PR_SET_PDEATHSIG, SIGKILL)
 * 其他平台为空操作
 */
MCPHUB_API void bindToParentLifetime(QProcess* process);

/**
 * 检查 pid 对应的进程是否仍存在（僵尸进程视为不存在）
 */
MCPHUB_API bool isProcessAlive(qint64 pid);

/**
 * 当前平台的可执行文件后缀，Windows: ".exe"，其他: ""
 */
MCPHUB_API QString executableSuffix();

/**
 * 解析启动命令为可执行文件绝对路径
 * 含路径分隔符的相对路径按 workingDirectory 解析，否则在 searchPath 中查找
 * @param searchPath PATH 格式的目录列表；为空时使用宿主进程的 PATH
 * @return 找不到时返回空字符串
 */
MCPHUB_API QString resolveProgram(const QString& program, const QString& workingDirectory = {},
                                  const QString& searchPath = {});

} // namespace mcphub::ProcessUtils
