#pragma once

#include <QJsonObject>
#include <QObject>

#include "helpers/test_utils.h"
#include "mcphub_server/manager/debug_session_manager.h"

namespace test_utils {

/// 发起启动并等到回调
inline mcphub_server::StartSessionResult startSessionAndWait(
    mcphub_server::DebugSessionManager& manager, const QString& projectId,
    int timeoutMs = 10000) {
    QObject context;
    bool done = false;
    mcphub_server::StartSessionResult result;
    manager.startSessionAsync(projectId, &context,
                              [&](const mcphub_server::StartSessionResult& r) {
                                  result = r;
                                  done = true;
                              });
    if (!waitUntil([&done]() { return done; }, timeoutMs)) {
        result.message = "start did not finish in time";
    }
    return result;
}

/// 发起调用并等到回调
inline mcphub_server::ExecuteResult executeAndWait(mcphub_server::DebugSessionManager& manager,
                                                   const QString& projectId,
                                                   const QString& toolName,
                                                   const QJsonObject& arguments,
                                                   int timeoutMs = 10000) {
    QObject context;
    bool done = false;
    mcphub_server::ExecuteResult result;
    manager.executeAsync(projectId, toolName, arguments, &context,
                         [&](const mcphub_server::ExecuteResult& r) {
                             result = r;
                             done = true;
                         });
    if (!waitUntil([&done]() { return done; }, timeoutMs)) {
        result.error = "execute did not finish in time";
    }
    return result;
}

} // namespace test_utils
