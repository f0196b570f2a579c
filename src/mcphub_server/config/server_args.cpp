#include "server_args.h"

namespace mcphub_server {

bool isValidLogLevel(const QString& level) {
    return level == "debug" || level == "info" || level == "warn" || level == "error";
}

namespace {

// "--name=value" → value；不匹配时返回 false
bool takeValue(const QString& arg, const QString& name, QString& value) {
    const QString prefix = "--" + name + "=";
    if (!arg.startsWith(prefix)) {
        return false;
    }
    value = arg.mid(prefix.size());
    return true;
}

} // namespace

ServerArgs ServerArgs::parse(const QStringList& args) {
    ServerArgs result;
    QString value;

    for (int i = 1; i < args.size(); ++i) {
        const QString& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            result.help = true;
        } else if (arg == "-v" || arg == "--version") {
            result.version = true;
        } else if (takeValue(arg, "data-root", value)) {
            if (value.isEmpty()) {
                result.error = "data-root cannot be empty";
                return result;
            }
            result.dataRoot = value;
        } else if (takeValue(arg, "port", value)) {
            bool ok = false;
            result.port = value.toInt(&ok);
            if (!ok || result.port < 1 || result.port > 65535) {
                result.error = "invalid port: " + value;
                return result;
            }
            result.hasPort = true;
        } else if (takeValue(arg, "host", value)) {
            if (value.isEmpty()) {
                result.error = "host cannot be empty";
                return result;
            }
            result.host = value;
            result.hasHost = true;
        } else if (takeValue(arg, "projects-dir", value)) {
            if (value.isEmpty()) {
                result.error = "projects-dir cannot be empty";
                return result;
            }
            result.projectsDir = value;
            result.hasProjectsDir = true;
        } else if (takeValue(arg, "log-level", value)) {
            if (!isValidLogLevel(value)) {
                result.error = "invalid log level: " + value;
                return result;
            }
            result.logLevel = value;
            result.hasLogLevel = true;
        } else {
            result.error = "unknown option: " + arg;
            return result;
        }
    }

    return result;
}

QString ServerArgs::usage() {
    return QStringLiteral(
        "Usage: mcphub_server [options]\n"
        "  --data-root=<path>     data directory (config.json, projects/, logs/)\n"
        "  --port=<n>             listen port (default 8080)\n"
        "  --host=<addr>          listen address (default 127.0.0.1)\n"
        "  --projects-dir=<path>  project root (default <data-root>/projects)\n"
        "  --log-level=<level>    debug|info|warn|error\n"
        "  -h, --help             show this help\n"
        "  -v, --version          show version\n");
}

} // namespace mcphub_server
