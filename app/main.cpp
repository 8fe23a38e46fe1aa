// Command line front end: one transfer command per invocation against a
// bookmark or an address, plus bookmark management.
#include "AppConfig.hpp"
#include "AppLogging.hpp"
#include "BookmarksClient.hpp"
#include "RemoteAddress.hpp"
#include "TerminalPrompt.hpp"
#include "termxfer/FileTransfer.hpp"
#include "termxfer/PathUtils.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QFileInfo>
#include <QStringList>

#include <cstdint>
#include <cstdio>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using termxfer::FileTransfer;
using termxfer::FileTransferProtocol;
using termxfer::FsEntry;
using termxfer::SessionOptions;
using termxfer::TransferError;

namespace {

int fail(const QString &msg) {
    std::fprintf(stderr, "termxfer: %s\n", qPrintable(msg));
    return 1;
}

int failTransfer(const char *what, const TransferError &err) {
    return fail(QStringLiteral("%1: %2").arg(QLatin1String(what),
                                             QString::fromStdString(err.toString())));
}

std::string permString(const FsEntry &e) {
    std::string s;
    s += termxfer::isSymlink(e) ? 'l' : (termxfer::isDirectory(e) ? 'd' : '-');
    const auto pex = termxfer::entryPex(e);
    if (!pex)
        return s + "?????????";
    for (std::uint8_t bits : {pex->user, pex->group, pex->others}) {
        s += (bits & 4) ? 'r' : '-';
        s += (bits & 2) ? 'w' : '-';
        s += (bits & 1) ? 'x' : '-';
    }
    return s;
}

void printEntry(const FsEntry &e) {
    std::string owner = "-";
    std::string group = "-";
    std::uint64_t size = 0;
    std::visit(
        [&](const auto &v) {
            if (v.user)
                owner = std::to_string(*v.user);
            if (v.group)
                group = std::to_string(*v.group);
        },
        e);
    if (const auto *f = std::get_if<termxfer::FsFile>(&e))
        size = f->size;
    const QString when = QDateTime::fromSecsSinceEpoch(
                             static_cast<qint64>(termxfer::entryMtime(e)))
                             .toString(QStringLiteral("yyyy-MM-dd HH:mm"));
    std::printf("%s %6s %6s %12llu %s %s", permString(e).c_str(), owner.c_str(),
                group.c_str(), static_cast<unsigned long long>(size), qPrintable(when),
                termxfer::entryName(e).c_str());
    if (const auto link = termxfer::entrySymlink(e))
        std::printf(" -> %s", link->c_str());
    std::printf("\n");
}

termxfer::ProgressCB makeProgress(const std::string &label, bool quiet) {
    if (quiet)
        return {};
    return [label](std::uint64_t done, std::uint64_t total) {
        if (total > 0) {
            const unsigned pct = static_cast<unsigned>(done * 100 / total);
            std::fprintf(stderr, "\r%s %llu/%llu bytes (%u%%)", label.c_str(),
                         static_cast<unsigned long long>(done),
                         static_cast<unsigned long long>(total), pct);
        } else {
            std::fprintf(stderr, "\r%s %llu bytes", label.c_str(),
                         static_cast<unsigned long long>(done));
        }
        std::fflush(stderr);
    };
}

struct Target {
    FileTransferProtocol protocol = FileTransferProtocol::Sftp;
    SessionOptions opt;
    std::optional<std::string> wrkdir;
};

class Cli {
public:
    Cli(QCommandLineParser &parser, BookmarksClient &vault) : p_(parser), vault_(vault) {}

    int run(const QStringList &args);

private:
    bool resolveTarget(Target &t, QString &err);
    // Connects, trying agent/none first and prompting for a password when
    // the server asks for one.
    int withConnection(const std::function<int(FileTransfer &)> &body);

    int cmdLs(const QStringList &args);
    int cmdGet(const QStringList &args);
    int cmdPut(const QStringList &args);
    int cmdRm(const QStringList &args);
    int cmdMkdir(const QStringList &args);
    int cmdBookmarks(const QStringList &args);

    bool quiet() const { return p_.isSet(QStringLiteral("quiet")); }

    QCommandLineParser &p_;
    BookmarksClient &vault_;
};

bool Cli::resolveTarget(Target &t, QString &err) {
    const bool hasBookmark = p_.isSet(QStringLiteral("bookmark"));
    const bool hasAddress = p_.isSet(QStringLiteral("target"));
    if (hasBookmark == hasAddress) {
        err = QStringLiteral("Give exactly one of --bookmark or --target");
        return false;
    }

    if (hasBookmark) {
        const std::string name = p_.value(QStringLiteral("bookmark")).toStdString();
        VaultError verr;
        const auto args = vault_.getBookmark(name, verr);
        if (!args) {
            err = verr.msg.isEmpty()
                      ? QStringLiteral("No bookmark named %1").arg(QString::fromStdString(name))
                      : verr.toString();
            return false;
        }
        t.protocol = args->protocol;
        t.opt.host = args->address;
        t.opt.port = args->port;
        if (!args->username.empty())
            t.opt.username = args->username;
        t.opt.password = args->password;
    } else {
        RemoteAddress addr;
        std::string perr;
        if (!parseRemoteAddress(p_.value(QStringLiteral("target")).toStdString(), addr, perr)) {
            err = QString::fromStdString(perr);
            return false;
        }
        t.protocol = addr.protocol;
        t.opt.host = addr.host;
        t.opt.port = addr.port;
        t.opt.username = addr.username;
        t.wrkdir = addr.wrkdir;
    }

    if (!t.opt.username && t.protocol != FileTransferProtocol::Ftp) {
        const QString user = qEnvironmentVariable("USER");
        if (!user.isEmpty())
            t.opt.username = user.toStdString();
    }
    if (p_.isSet(QStringLiteral("identity")))
        t.opt.private_key_path = p_.value(QStringLiteral("identity")).toStdString();

    if (p_.isSet(QStringLiteral("known-hosts-policy"))) {
        bool ok = false;
        t.opt.known_hosts_policy =
            AppConfig::parsePolicy(p_.value(QStringLiteral("known-hosts-policy")), &ok);
        if (!ok) {
            err = QStringLiteral("Unknown known_hosts policy");
            return false;
        }
    } else {
        t.opt.known_hosts_policy = AppConfig::knownHostsPolicy();
    }
    t.opt.hostkey_confirm_cb = [](const std::string &host, std::uint16_t port,
                                  const std::string &alg, const std::string &fp) {
        std::fprintf(stderr, "Host %s:%u is not in known_hosts.\n%s key fingerprint %s\n",
                     host.c_str(), static_cast<unsigned>(port), alg.c_str(), fp.c_str());
        return promptYesNo("Trust this host and continue?");
    };
    t.opt.keyboard_interactive_cb = [](const std::string &, const std::string &instruction,
                                       const std::vector<std::string> &prompts,
                                       std::vector<std::string> &responses) {
        if (!instruction.empty())
            std::fprintf(stderr, "%s\n", instruction.c_str());
        responses.clear();
        for (const auto &prompt : prompts) {
            auto answer = promptSecret(prompt);
            if (!answer)
                return false;
            responses.push_back(std::move(*answer));
        }
        return true;
    };
    return true;
}

int Cli::withConnection(const std::function<int(FileTransfer &)> &body) {
    Target t;
    QString err;
    if (!resolveTarget(t, err))
        return fail(err);

    // FTP has no agent to fall back on: ask up front for named users.
    if (t.protocol == FileTransferProtocol::Ftp && t.opt.username && !t.opt.password) {
        t.opt.password = promptSecret(*t.opt.username + "@" + t.opt.host + " password: ");
    }

    qCInfo(txCli) << "Connecting with" << termxfer::protocolName(t.protocol);
    auto ft = std::make_unique<FileTransfer>(t.protocol);
    TransferError terr;
    bool connected = ft->connect(t.opt, terr);
    if (!connected && terr.kind == termxfer::TransferErrorKind::AuthenticationFailed &&
        !t.opt.password && !t.opt.private_key_path) {
        const auto pw = promptSecret(t.opt.username.value_or("") + "@" + t.opt.host +
                                     " password: ");
        if (pw) {
            t.opt.password = *pw;
            ft = std::make_unique<FileTransfer>(t.protocol);
            connected = ft->connect(t.opt, terr);
        }
    }
    if (!connected)
        return failTransfer("connect", terr);

    vault_.addRecent(t.opt.host, t.opt.port, t.protocol, t.opt.username.value_or(""));
    VaultError verr;
    if (!vault_.writeBookmarks(verr))
        qCWarning(txCli) << "Could not save recent hosts:" << verr.toString();

    int rc = 0;
    std::string cwd;
    if (t.wrkdir && !ft->changeDir(*t.wrkdir, cwd, terr)) {
        rc = failTransfer("cd", terr);
    } else {
        rc = body(*ft);
    }

    if (!ft->disconnect(terr))
        qCWarning(txCli) << "Disconnect failed:" << QString::fromStdString(terr.toString());
    return rc;
}

int Cli::cmdLs(const QStringList &args) {
    const std::string path = args.isEmpty() ? std::string(".") : args.first().toStdString();
    return withConnection([&](FileTransfer &ft) {
        std::vector<FsEntry> entries;
        TransferError err;
        if (!ft.listDir(path, entries, err))
            return failTransfer("ls", err);
        for (const auto &e : entries)
            printEntry(e);
        return 0;
    });
}

int Cli::cmdGet(const QStringList &args) {
    if (args.isEmpty() || args.size() > 2)
        return fail(QStringLiteral("usage: get REMOTE [LOCAL]"));
    const std::string remote = args.at(0).toStdString();
    std::string local = args.size() > 1 ? args.at(1).toStdString() : termxfer::baseName(remote);
    if (local.empty())
        return fail(QStringLiteral("Cannot derive a local name from %1").arg(args.at(0)));

    return withConnection([&](FileTransfer &ft) {
        std::FILE *f = std::fopen(local.c_str(), "wb");
        if (!f)
            return fail(QStringLiteral("Cannot open %1 for writing")
                            .arg(QString::fromStdString(local)));
        TransferError err;
        const bool ok = ft.receive(remote, f, err, makeProgress(remote, quiet()));
        const bool closed = std::fclose(f) == 0;
        if (!quiet())
            std::fprintf(stderr, "\n");
        if (!ok)
            return failTransfer("get", err);
        if (!closed)
            return fail(QStringLiteral("Could not finish writing %1")
                            .arg(QString::fromStdString(local)));
        return 0;
    });
}

int Cli::cmdPut(const QStringList &args) {
    if (args.isEmpty() || args.size() > 2)
        return fail(QStringLiteral("usage: put LOCAL [REMOTE]"));
    const std::string local = args.at(0).toStdString();
    const std::string remote = args.size() > 1
                                   ? args.at(1).toStdString()
                                   : QFileInfo(args.at(0)).fileName().toStdString();

    std::FILE *f = std::fopen(local.c_str(), "rb");
    if (!f)
        return fail(QStringLiteral("Cannot open %1").arg(args.at(0)));
    const int rc = withConnection([&](FileTransfer &ft) {
        TransferError err;
        const bool ok = ft.send(f, remote, err, makeProgress(local, quiet()));
        if (!quiet())
            std::fprintf(stderr, "\n");
        return ok ? 0 : failTransfer("put", err);
    });
    std::fclose(f);
    return rc;
}

int Cli::cmdRm(const QStringList &args) {
    if (args.size() != 1)
        return fail(QStringLiteral("usage: rm REMOTE"));
    const std::string remote = args.first().toStdString();
    return withConnection([&](FileTransfer &ft) {
        FsEntry entry;
        TransferError err;
        if (!ft.stat(remote, entry, err))
            return failTransfer("rm", err);
        if (!ft.remove(entry, err))
            return failTransfer("rm", err);
        return 0;
    });
}

int Cli::cmdMkdir(const QStringList &args) {
    if (args.size() != 1)
        return fail(QStringLiteral("usage: mkdir REMOTE"));
    const std::string remote = args.first().toStdString();
    return withConnection([&](FileTransfer &ft) {
        TransferError err;
        return ft.mkdir(remote, err) ? 0 : failTransfer("mkdir", err);
    });
}

int Cli::cmdBookmarks(const QStringList &args) {
    const QString sub = args.isEmpty() ? QStringLiteral("list") : args.first();
    VaultError verr;

    if (sub == QLatin1String("list")) {
        for (const auto &[name, b] : vault_.hosts().bookmarks) {
            std::printf("%-20s %s://%s%s:%u%s\n", name.c_str(),
                        termxfer::protocolName(b.protocol),
                        b.username.empty() ? "" : (b.username + "@").c_str(),
                        b.address.c_str(), static_cast<unsigned>(b.port),
                        b.password ? "  (password saved)" : "");
        }
        if (!vault_.hosts().recents.empty())
            std::printf("\nRecent:\n");
        for (auto it = vault_.hosts().recents.rbegin(); it != vault_.hosts().recents.rend(); ++it) {
            const Bookmark &b = it->second;
            std::printf("  %s  %s://%s%s:%u\n", it->first.c_str(),
                        termxfer::protocolName(b.protocol),
                        b.username.empty() ? "" : (b.username + "@").c_str(),
                        b.address.c_str(), static_cast<unsigned>(b.port));
        }
        return 0;
    }

    if (sub == QLatin1String("add")) {
        if (args.size() != 3)
            return fail(QStringLiteral("usage: bookmarks add NAME ADDRESS"));
        RemoteAddress addr;
        std::string perr;
        if (!parseRemoteAddress(args.at(2).toStdString(), addr, perr))
            return fail(QString::fromStdString(perr));
        if (addr.wrkdir)
            qCWarning(txCli) << "Bookmarks do not keep a working directory; ignoring"
                             << QString::fromStdString(*addr.wrkdir);
        std::optional<std::string> password;
        if (p_.isSet(QStringLiteral("save-password"))) {
            password = promptSecret("Password to save: ");
            if (!password)
                return fail(QStringLiteral("No password given"));
        }
        if (!vault_.addBookmark(args.at(1).toStdString(), addr.host, addr.port, addr.protocol,
                                addr.username.value_or(""), password, verr) ||
            !vault_.writeBookmarks(verr))
            return fail(verr.toString());
        return 0;
    }

    if (sub == QLatin1String("remove")) {
        if (args.size() != 2)
            return fail(QStringLiteral("usage: bookmarks remove NAME"));
        if (!vault_.delBookmark(args.at(1).toStdString()))
            return fail(QStringLiteral("No bookmark named %1").arg(args.at(1)));
        if (!vault_.writeBookmarks(verr))
            return fail(verr.toString());
        return 0;
    }

    return fail(QStringLiteral("Unknown bookmarks command %1").arg(sub));
}

int Cli::run(const QStringList &positional) {
    if (positional.isEmpty()) {
        p_.showHelp(1);
    }
    const QString cmd = positional.first();
    const QStringList rest = positional.mid(1);
    if (cmd == QLatin1String("ls"))
        return cmdLs(rest);
    if (cmd == QLatin1String("get"))
        return cmdGet(rest);
    if (cmd == QLatin1String("put"))
        return cmdPut(rest);
    if (cmd == QLatin1String("rm"))
        return cmdRm(rest);
    if (cmd == QLatin1String("mkdir"))
        return cmdMkdir(rest);
    if (cmd == QLatin1String("bookmarks"))
        return cmdBookmarks(rest);
    return fail(QStringLiteral("Unknown command %1").arg(cmd));
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("termxfer");
    QCoreApplication::setOrganizationName("termxfer");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Transfer files over SFTP, SCP or FTP.\n\n"
        "Commands:\n"
        "  ls [PATH]                  list a remote directory\n"
        "  get REMOTE [LOCAL]         download a file\n"
        "  put LOCAL [REMOTE]         upload a file\n"
        "  rm REMOTE                  remove a file or a directory tree\n"
        "  mkdir REMOTE               create a directory\n"
        "  bookmarks [list]           show bookmarks and recent hosts\n"
        "  bookmarks add NAME ADDR    save ADDR as NAME\n"
        "  bookmarks remove NAME      delete a bookmark\n\n"
        "ADDR is [protocol://][user@]host[:port][:wrkdir]"));
    parser.addHelpOption();
    parser.addOptions({
        {{"b", "bookmark"}, "Connect to the saved bookmark <name>.", "name"},
        {{"t", "target"}, "Connect to <address>.", "address"},
        {{"i", "identity"}, "Private key file for SSH authentication.", "file"},
        {"known-hosts-policy", "strict, accept-new or off.", "policy"},
        {"save-password", "bookmarks add: prompt for a password and save it encrypted."},
        {{"q", "quiet"}, "No progress output."},
    });
    parser.addPositionalArgument("command", "Command to run.");
    parser.addPositionalArgument("args", "Command arguments.", "[args...]");
    parser.process(app);

    QString err;
    if (!AppConfig::ensureConfigDir(&err))
        return fail(err);

    VaultError verr;
    auto vault = BookmarksClient::open(AppConfig::bookmarksPath(), AppConfig::keyPath(),
                                       AppConfig::recentsSize(), verr);
    if (!vault)
        return fail(QStringLiteral("Cannot open bookmarks: %1").arg(verr.toString()));

    Cli cli(parser, *vault);
    return cli.run(parser.positionalArguments());
}
