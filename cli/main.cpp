// Command line entry point: parse options, resolve the site profile and run
// one of the list/download/upload pipelines.
#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QFileInfo>
#include <QTextStream>
#include <cstdio>
#include <cstdlib>
#include "SiteStore.hpp"
#include "sftpflow/Downloader.hpp"
#include "sftpflow/Libssh2SftpClient.hpp"
#include "sftpflow/Lister.hpp"
#include "sftpflow/Log.hpp"
#include "sftpflow/PathTranslator.hpp"
#include "sftpflow/SftpUrl.hpp"
#include "sftpflow/Uploader.hpp"

namespace {

enum ExitCode { ExitOk = 0, ExitRecordFailed = 1, ExitUsage = 2 };

struct Cli {
    QCommandLineOption verbose{{"v", "verbose"}, "Verbose output."};
    QCommandLineOption debug{"debug", "Debug output."};
    QCommandLineOption site{{"s", "site"}, "Saved site to use.", "name"};
    QCommandLineOption host{{"H", "host"}, "Host to connect to.", "host"};
    QCommandLineOption port{{"p", "port"}, "SSH port (default 22).", "port"};
    QCommandLineOption user{{"u", "user"}, "User name.", "user"};
    QCommandLineOption password{"password", "Password.", "password"};
    QCommandLineOption key{{"i", "key"}, "Private key file.", "path"};
    QCommandLineOption keyPass{"key-pass", "Private key passphrase.", "passphrase"};
    QCommandLineOption knownHosts{"known-hosts", "known_hosts file.", "path"};
    QCommandLineOption khPolicy{"known-hosts-policy", "strict, accept-new or off.", "policy"};
    QCommandLineOption recursive{{"r", "recursive"}, "list: descend into directories."};
    QCommandLineOption noRecursive{"no-recursive", "download: only the first level of directories."};
    QCommandLineOption noSize{"no-size", "list: do not compute sizes."};
    QCommandLineOption includeDirs{"include-dirs", "list: emit directories too."};
    QCommandLineOption to{{"t", "to"}, "Destination; supports {{ field }} placeholders.", "path"};
    QCommandLineOption deleteOrigin{"delete-origin", "Delete the source after a successful transfer."};
    QCommandLineOption set{"set", "Template field for every record.", "key=value"};
    QCommandLineOption retries{"retries", "Connection attempts (default 3).", "n"};
    QCommandLineOption retryDelay{"retry-delay", "First retry delay in seconds (default 15).", "s"};
    QCommandLineOption retryStep{"retry-step", "Retry delay increment in seconds (default 5).", "s"};
    QCommandLineOption timeout{"timeout", "Per-operation timeout in seconds (default 15).", "s"};
    QCommandLineOption save{"save", "sites: save the connection options under this name.", "name"};
    QCommandLineOption remove{"remove", "sites: delete a saved site.", "name"};

    void addTo(QCommandLineParser& p) {
        p.addOptions({verbose, debug, site, host, port, user, password, key, keyPass,
                      knownHosts, khPolicy, recursive, noRecursive, noSize, includeDirs,
                      to, deleteOrigin, set, retries, retryDelay, retryStep, timeout,
                      save, remove});
    }
};

QTextStream& out() {
    static QTextStream s(stdout);
    return s;
}

QTextStream& errs() {
    static QTextStream s(stderr);
    return s;
}

bool parsePolicy(const QString& v, sftpflow::KnownHostsPolicy& policy) {
    if (v == "strict") policy = sftpflow::KnownHostsPolicy::Strict;
    else if (v == "accept-new") policy = sftpflow::KnownHostsPolicy::AcceptNew;
    else if (v == "off") policy = sftpflow::KnownHostsPolicy::Off;
    else return false;
    return true;
}

// Site profile first, then explicit options on top.
bool sessionOptions(const QCommandLineParser& p, const Cli& c, sftpflow::SessionOptions& opt, QString& err) {
    if (p.isSet(c.site)) {
        SiteStore store;
        auto entry = store.find(p.value(c.site));
        if (!entry) {
            err = QString("Unknown site: %1").arg(p.value(c.site));
            return false;
        }
        opt = entry->opt;
    }
    auto& id = opt.identity;
    if (p.isSet(c.host)) id.host = p.value(c.host).toStdString();
    if (p.isSet(c.port)) {
        bool ok = false;
        const uint v = p.value(c.port).toUInt(&ok);
        if (!ok || v == 0 || v > 65535) {
            err = QString("Invalid port: %1").arg(p.value(c.port));
            return false;
        }
        id.port = (std::uint16_t)v;
    }
    if (p.isSet(c.user)) id.username = p.value(c.user).toStdString();
    if (id.username.empty()) id.username = QString::fromLocal8Bit(qgetenv("USER")).toStdString();
    if (p.isSet(c.password)) id.password = p.value(c.password).toStdString();
    if (p.isSet(c.key)) id.private_key_path = p.value(c.key).toStdString();
    if (p.isSet(c.keyPass)) id.private_key_passphrase = p.value(c.keyPass).toStdString();
    if (p.isSet(c.knownHosts)) opt.known_hosts_path = p.value(c.knownHosts).toStdString();
    if (p.isSet(c.khPolicy) && !parsePolicy(p.value(c.khPolicy), opt.known_hosts_policy)) {
        err = QString("Invalid known_hosts policy: %1").arg(p.value(c.khPolicy));
        return false;
    }
    if (opt.known_hosts_policy == sftpflow::KnownHostsPolicy::AcceptNew) {
        // accept-new is an explicit opt-in on the command line
        opt.hostkey_confirm_cb = [](const std::string& host, std::uint16_t port,
                                    const std::string& alg, const std::string& fp) {
            LOGW("Accepting new host key for %s:%u (%s %s)", host.c_str(), (unsigned)port, alg.c_str(), fp.c_str());
            return true;
        };
    }
    return true;
}

bool retryPolicy(const QCommandLineParser& p, const Cli& c, sftpflow::RetryPolicy& policy, QString& err) {
    auto readInt = [&](const QCommandLineOption& o, int minValue, int& v) {
        if (!p.isSet(o)) return true;
        bool ok = false;
        v = p.value(o).toInt(&ok);
        if (!ok || v < minValue) {
            err = QString("Invalid value for --%1: %2").arg(o.names().last(), p.value(o));
            return false;
        }
        return true;
    };
    int attempts = policy.maxAttempts;
    int delay = (int)policy.initialDelay.count();
    int step = (int)policy.step.count();
    int timeout = (int)policy.operationTimeout.count();
    if (!readInt(c.retries, 1, attempts) || !readInt(c.retryDelay, 0, delay) ||
        !readInt(c.retryStep, 0, step) || !readInt(c.timeout, 1, timeout)) {
        return false;
    }
    policy.maxAttempts = attempts;
    policy.initialDelay = std::chrono::seconds(delay);
    policy.step = std::chrono::seconds(step);
    policy.operationTimeout = std::chrono::seconds(timeout);
    return true;
}

bool templateFields(const QCommandLineParser& p, const Cli& c, std::map<std::string, std::string>& fields, QString& err) {
    for (const QString& kv : p.values(c.set)) {
        const int eq = kv.indexOf('=');
        if (eq <= 0) {
            err = QString("Expected key=value for --set: %1").arg(kv);
            return false;
        }
        fields[kv.left(eq).toStdString()] = kv.mid(eq + 1).toStdString();
    }
    return true;
}

int report(const std::vector<sftpflow::TransferRecord>& records, bool useLocation) {
    int rc = ExitOk;
    for (const auto& r : records) {
        const std::string& subject = useLocation ? r.location : r.url;
        out() << sftpflow::recordStatusName(r.status) << '\t'
              << QString::fromStdString(subject);
        if (r.failed()) {
            out() << '\t' << sftpflow::errorKindName(r.errorKind) << ": " << QString::fromStdString(r.reason);
        } else if (!r.reason.empty()) {
            out() << '\t' << QString::fromStdString(r.reason);
        }
        out() << Qt::endl;
        if (r.failed()) rc = ExitRecordFailed;
    }
    return rc;
}

int runList(const QStringList& args, const QCommandLineParser& p, const Cli& c,
            sftpflow::ConnectionManager& connections, const sftpflow::SessionOptions& opt) {
    sftpflow::ListOptions lo;
    lo.recursive = p.isSet(c.recursive);
    lo.computeSize = !p.isSet(c.noSize);
    lo.filesOnly = !p.isSet(c.includeDirs);

    std::vector<std::string> roots;
    for (const QString& a : args) roots.push_back(a.toStdString());

    std::vector<sftpflow::TransferRecord> records;
    sftpflow::Error err;
    sftpflow::Lister lister(connections);
    if (!lister.list(opt.identity, roots, lo, records, err)) {
        errs() << QString::fromStdString(err.message) << Qt::endl;
        return ExitUsage;
    }
    for (const auto& r : records) {
        out() << QString::fromStdString(r.title) << '\t'
              << QString::fromStdString(r.url) << '\t'
              << (qlonglong)r.size << Qt::endl;
    }
    return ExitOk;
}

int runDownload(QStringList args, const QCommandLineParser& p, const Cli& c,
                sftpflow::ConnectionManager& connections, const sftpflow::SessionOptions& opt) {
    if (!p.isSet(c.to)) {
        errs() << "download requires --to" << Qt::endl;
        return ExitUsage;
    }
    if (args.isEmpty() || (args.size() == 1 && args.first() == "-")) {
        // One URL per line on stdin (for example the output of "list")
        args.clear();
        QTextStream in(stdin);
        QString line;
        while (in.readLineInto(&line)) {
            line = line.trimmed();
            if (line.isEmpty()) continue;
            const QStringList cols = line.split('\t');
            args << (cols.size() > 1 ? cols.at(1) : cols.at(0));
        }
    }

    std::map<std::string, std::string> fields;
    QString ferr;
    if (!templateFields(p, c, fields, ferr)) {
        errs() << ferr << Qt::endl;
        return ExitUsage;
    }

    std::vector<sftpflow::TransferRecord> records;
    for (const QString& a : args) {
        sftpflow::TransferRecord r;
        r.url = a.toStdString();
        sftpflow::url::ParsedUrl parsed;
        std::string perr;
        r.title = sftpflow::url::parse(r.url, parsed, perr) ? sftpflow::path::remoteBasename(parsed.path) : r.url;
        r.private_key_path = opt.identity.private_key_path;
        r.private_key_passphrase = opt.identity.private_key_passphrase;
        r.fields = fields;
        records.push_back(std::move(r));
    }

    sftpflow::DownloadOptions dopt;
    dopt.destination = p.value(c.to).toStdString();
    dopt.recursive = !p.isSet(c.noRecursive);
    dopt.deleteOrigin = p.isSet(c.deleteOrigin);
    dopt.defaultIdentity = opt.identity;

    sftpflow::FieldPathRenderer renderer;
    sftpflow::Downloader downloader(connections, renderer);
    const bool ok = downloader.download(records, dopt);
    const int rc = report(records, false);
    return ok ? rc : ExitUsage;
}

int runUpload(const QStringList& args, const QCommandLineParser& p, const Cli& c,
              sftpflow::ConnectionManager& connections, const sftpflow::SessionOptions& opt) {
    if (args.isEmpty()) {
        errs() << "upload requires at least one file" << Qt::endl;
        return ExitUsage;
    }
    std::map<std::string, std::string> fields;
    QString ferr;
    if (!templateFields(p, c, fields, ferr)) {
        errs() << ferr << Qt::endl;
        return ExitUsage;
    }

    std::vector<sftpflow::TransferRecord> records;
    for (const QString& a : args) {
        sftpflow::TransferRecord r;
        r.location = QDir::toNativeSeparators(QFileInfo(a).absoluteFilePath()).toStdString();
        r.title = QFileInfo(a).fileName().toStdString();
        r.fields = fields;
        records.push_back(std::move(r));
    }

    sftpflow::UploadOptions uopt;
    uopt.identity = opt.identity;
    uopt.destinationTemplate = p.value(c.to).toStdString();
    uopt.deleteOrigin = p.isSet(c.deleteOrigin);

    sftpflow::FieldPathRenderer renderer;
    sftpflow::Uploader uploader(connections, renderer);
    uploader.upload(records, uopt);
    return report(records, true);
}

int runSites(const QCommandLineParser& p, const Cli& c, const sftpflow::SessionOptions& opt) {
    SiteStore store;
    if (p.isSet(c.remove)) {
        if (!store.remove(p.value(c.remove))) {
            errs() << "Unknown site: " << p.value(c.remove) << Qt::endl;
            return ExitUsage;
        }
        return ExitOk;
    }
    if (p.isSet(c.save)) {
        if (opt.identity.host.empty()) {
            errs() << "sites --save requires --host" << Qt::endl;
            return ExitUsage;
        }
        if ((opt.identity.password || opt.identity.private_key_passphrase) &&
            !SecretStore::insecureFallbackActive()) {
            LOGW("No secret store available; the password is not saved");
        }
        store.save(SiteEntry{p.value(c.save), opt});
        return ExitOk;
    }
    for (const SiteEntry& e : store.load()) {
        out() << e.name << '\t'
              << QString::fromStdString(sftpflow::url::prefixFor(e.opt.identity)) << Qt::endl;
    }
    return ExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("sftpflow");
    QCoreApplication::setOrganizationName("sftpflow");
    QCoreApplication::setApplicationVersion(SFTPFLOW_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription("List, download and upload files over SFTP.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "list, download, upload or sites.");
    parser.addPositionalArgument("args", "Remote roots, sftp:// URLs (or - for stdin), or local files.", "[args...]");
    Cli cli;
    cli.addTo(parser);
    parser.process(app);

    if (std::getenv("SFTPFLOW_LOG") == nullptr) sftpflow::setLogLevel(sftpflow::LogLevel::Warning);
    if (parser.isSet(cli.verbose)) sftpflow::setLogLevel(sftpflow::LogLevel::Verbose);
    if (parser.isSet(cli.debug)) sftpflow::setLogLevel(sftpflow::LogLevel::Debug);

    QStringList args = parser.positionalArguments();
    if (args.isEmpty()) parser.showHelp(ExitUsage);
    const QString command = args.takeFirst();

    sftpflow::SessionOptions opt;
    sftpflow::RetryPolicy policy;
    QString err;
    if (!sessionOptions(parser, cli, opt, err) || !retryPolicy(parser, cli, policy, err)) {
        errs() << err << Qt::endl;
        return ExitUsage;
    }

    if (command == "sites") return runSites(parser, cli, opt);

    sftpflow::Libssh2SftpClient prototype;
    sftpflow::ConnectionManager connections(prototype, opt, policy);

    if (command == "download") return runDownload(args, parser, cli, connections, opt);

    if (opt.identity.host.empty()) {
        errs() << command << " requires --host or --site" << Qt::endl;
        return ExitUsage;
    }
    if (command == "list") return runList(args, parser, cli, connections, opt);
    if (command == "upload") return runUpload(args, parser, cli, connections, opt);

    errs() << "Unknown command: " << command << Qt::endl;
    return ExitUsage;
}
