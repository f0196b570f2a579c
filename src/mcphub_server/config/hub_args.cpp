#include "hub_args.h"

#include <QDir>
#include <QFileInfo>

#include "server_args.h"

namespace mcphub_server {

namespace {

bool parseBoundedInt(const QString& raw, int min, int& out) {
    bool ok = false;
    const int v = raw.toInt(&ok);
    if (!ok || v < min) {
        return false;
    }
    out = v;
    return true;
}

} // namespace

HubArgs HubArgs::parse(const QStringList& args) {
    HubArgs result;

    for (int i = 1; i < args.size(); ++i) {
        const QString& arg = args[i];
        const int eq = arg.indexOf('=');
        const QString key = eq < 0 ? arg : arg.left(eq);
        const QString value = eq < 0 ? QString() : arg.mid(eq + 1);

        if (key == "-h" || key == "--help") {
            result.help = true;
        } else if (key == "-v" || key == "--version") {
            result.version = true;
        } else if (key == "--config" && eq >= 0) {
            if (value.isEmpty()) {
                result.error = "config cannot be empty";
                return result;
            }
            result.configPath = value;
        } else if (key == "--data-root" && eq >= 0) {
            if (value.isEmpty()) {
                result.error = "data-root cannot be empty";
                return result;
            }
            result.dataRoot = value;
        } else if (key == "--log-level" && eq >= 0) {
            if (!isValidLogLevel(value)) {
                result.error = "invalid log level: " + value;
                return result;
            }
            result.logLevel = value;
        } else if (key == "--max-retries" && eq >= 0) {
            if (!parseBoundedInt(value, -1, result.maxRetries)) {
                result.error = "invalid max-retries: " + value;
                return result;
            }
        } else if (key == "--backoff-base-ms" && eq >= 0) {
            if (!parseBoundedInt(value, 1, result.backoffBaseMs)) {
                result.error = "invalid backoff-base-ms: " + value;
                return result;
            }
        } else if (key == "--backoff-cap-ms" && eq >= 0) {
            if (!parseBoundedInt(value, 1, result.backoffCapMs)) {
                result.error = "invalid backoff-cap-ms: " + value;
                return result;
            }
        } else if (key == "--shutdown-timeout-ms" && eq >= 0) {
            if (!parseBoundedInt(value, 0, result.shutdownTimeoutMs)) {
                result.error = "invalid shutdown-timeout-ms: " + value;
                return result;
            }
        } else {
            result.error = "unknown option: " + arg;
            return result;
        }
    }

    if (result.backoffCapMs < result.backoffBaseMs) {
        result.error = "backoff-cap-ms must not be smaller than backoff-base-ms";
    }
    return result;
}

QString HubArgs::usage() {
    return QStringLiteral(
        "Usage: mcphub_hub [options]\n"
        "  --config=<file>            service table (default <data-root>/mcp_config.json)\n"
        "  --data-root=<path>         data directory (logs/, projects/)\n"
        "  --log-level=<level>        debug|info|warn|error\n"
        "  --max-retries=<n>          restart budget per service, -1 = unlimited (default 10)\n"
        "  --backoff-base-ms=<n>      first restart delay (default 1000)\n"
        "  --backoff-cap-ms=<n>       maximum restart delay (default 60000)\n"
        "  --shutdown-timeout-ms=<n>  overall shutdown deadline (default 15000)\n"
        "  -h, --help                 show this help\n"
        "  -v, --version              show version\n");
}

QString HubArgs::resolvedConfigPath() const {
    if (configPath.isEmpty()) {
        return QDir(dataRoot).absoluteFilePath("mcp_config.json");
    }
    return QFileInfo(configPath).absoluteFilePath();
}

} // namespace mcphub_server
