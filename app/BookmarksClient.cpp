// Vault persistence (QSettings INI arrays) and password encryption
// (OpenSSL EVP, AES-256-GCM).
#include "BookmarksClient.hpp"
#include "AppLogging.hpp"
#include <QByteArray>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSettings>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <cstring>

namespace {

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

QString opensslError(const char *what) {
    const unsigned long code = ERR_get_error();
    if (code == 0)
        return QString::fromLatin1(what);
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return QStringLiteral("%1: %2").arg(QString::fromLatin1(what), QString::fromLatin1(buf));
}

VaultError makeError(VaultErrorKind kind, const QString &msg) {
    VaultError e;
    e.kind = kind;
    e.msg = msg;
    return e;
}

bool sameHost(const Bookmark &b, const std::string &address, std::uint16_t port,
              termxfer::FileTransferProtocol protocol, const std::string &username) {
    return b.address == address && b.port == port && b.protocol == protocol &&
           b.username == username;
}

template <typename Vec>
auto findByName(Vec &vec, const std::string &name) {
    return std::find_if(vec.begin(), vec.end(),
                        [&](const auto &p) { return p.first == name; });
}

QString settingsStatusText(QSettings::Status st) {
    switch (st) {
    case QSettings::NoError:
        return QStringLiteral("no error");
    case QSettings::AccessError:
        return QStringLiteral("access error");
    case QSettings::FormatError:
        return QStringLiteral("format error");
    }
    return QStringLiteral("unknown error");
}

void writeArray(QSettings &s, const char *name,
                const std::vector<std::pair<std::string, Bookmark>> &entries) {
    s.beginWriteArray(name, static_cast<int>(entries.size()));
    for (int i = 0; i < static_cast<int>(entries.size()); ++i) {
        s.setArrayIndex(i);
        const auto &[key, b] = entries[static_cast<std::size_t>(i)];
        s.setValue("name", QString::fromStdString(key));
        s.setValue("address", QString::fromStdString(b.address));
        s.setValue("port", static_cast<int>(b.port));
        s.setValue("protocol", QString::fromLatin1(termxfer::protocolName(b.protocol)));
        s.setValue("username", QString::fromStdString(b.username));
        if (b.password)
            s.setValue("password", QString::fromStdString(*b.password));
    }
    s.endArray();
}

bool readArray(QSettings &s, const char *name,
               std::vector<std::pair<std::string, Bookmark>> &out, VaultError &err) {
    out.clear();
    const int n = s.beginReadArray(name);
    for (int i = 0; i < n; ++i) {
        s.setArrayIndex(i);
        const QString where = QStringLiteral("%1[%2]").arg(QLatin1String(name)).arg(i + 1);
        const std::string key = s.value("name").toString().trimmed().toStdString();
        if (key.empty()) {
            s.endArray();
            err = makeError(VaultErrorKind::SyntaxError, where + QStringLiteral(": missing name"));
            return false;
        }
        if (findByName(out, key) != out.end()) {
            s.endArray();
            err = makeError(VaultErrorKind::SyntaxError,
                            where + QStringLiteral(": duplicate name %1")
                                        .arg(QString::fromStdString(key)));
            return false;
        }
        Bookmark b;
        b.address = s.value("address").toString().trimmed().toStdString();
        if (b.address.empty()) {
            s.endArray();
            err = makeError(VaultErrorKind::SyntaxError, where + QStringLiteral(": missing address"));
            return false;
        }
        bool portOk = false;
        const uint port = s.value("port").toUInt(&portOk);
        if (!portOk || port == 0 || port > 65535) {
            s.endArray();
            err = makeError(VaultErrorKind::SyntaxError,
                            where + QStringLiteral(": invalid port %1")
                                        .arg(s.value("port").toString()));
            return false;
        }
        b.port = static_cast<std::uint16_t>(port);
        const QString proto = s.value("protocol").toString();
        const auto parsed = termxfer::protocolFromName(proto.toStdString());
        if (!parsed) {
            s.endArray();
            err = makeError(VaultErrorKind::SyntaxError,
                            where + QStringLiteral(": unknown protocol %1").arg(proto));
            return false;
        }
        b.protocol = *parsed;
        b.username = s.value("username").toString().toStdString();
        const QString pw = s.value("password").toString();
        if (!pw.isEmpty())
            b.password = pw.toStdString();
        out.emplace_back(key, std::move(b));
    }
    s.endArray();
    return true;
}

} // namespace

QString VaultError::toString() const {
    const char *k = "I/O error";
    switch (kind) {
    case VaultErrorKind::IoError:
        k = "I/O error";
        break;
    case VaultErrorKind::SerializationError:
        k = "Serialization error";
        break;
    case VaultErrorKind::SyntaxError:
        k = "Syntax error";
        break;
    case VaultErrorKind::CryptoError:
        k = "Crypto error";
        break;
    }
    return msg.isEmpty() ? QString::fromLatin1(k) : QStringLiteral("%1: %2").arg(QLatin1String(k), msg);
}

BookmarksClient::BookmarksClient(const QString &bookmarksFile, const QString &keyFile,
                                 int recentsSize)
    : bookmarksFile_(bookmarksFile), keyFile_(keyFile),
      recentsSize_(recentsSize > 0 ? recentsSize : 1) {}

std::unique_ptr<BookmarksClient> BookmarksClient::open(const QString &bookmarksFile,
                                                       const QString &keyFile,
                                                       int recentsSize, VaultError &err) {
    std::unique_ptr<BookmarksClient> client(
        new BookmarksClient(bookmarksFile, keyFile, recentsSize));

    if (!QFileInfo::exists(bookmarksFile)) {
        qCInfo(txVault) << "Initializing empty bookmarks file";
        if (!client->writeBookmarks(err))
            return nullptr;
    }
    if (!QFileInfo::exists(keyFile)) {
        qCInfo(txVault) << "Generating vault key";
        if (!client->generateKey(err))
            return nullptr;
    }
    if (!client->readKey(err) || !client->readBookmarks(err))
        return nullptr;
    return client;
}

bool BookmarksClient::generateKey(VaultError &err) {
    std::vector<unsigned char> key(kKeyLength);
    if (RAND_bytes(key.data(), kKeyLength) != 1) {
        err = makeError(VaultErrorKind::CryptoError, opensslError("RAND_bytes failed"));
        return false;
    }
    const QFileInfo fi(keyFile_);
    if (!QDir().mkpath(fi.absolutePath())) {
        err = makeError(VaultErrorKind::IoError,
                        QStringLiteral("Could not create %1").arg(fi.absolutePath()));
        return false;
    }
    QFile f(keyFile_);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        err = makeError(VaultErrorKind::IoError, f.errorString());
        return false;
    }
    // Restrict before any key byte hits the disk.
    if (!f.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner)) {
        err = makeError(VaultErrorKind::IoError,
                        QStringLiteral("Could not restrict key file: %1").arg(f.errorString()));
        f.close();
        f.remove();
        return false;
    }
    if (f.write(reinterpret_cast<const char *>(key.data()), kKeyLength) != kKeyLength ||
        !f.flush()) {
        err = makeError(VaultErrorKind::IoError, f.errorString());
        f.close();
        f.remove();
        return false;
    }
    f.close();
    key_ = std::move(key);
    return true;
}

bool BookmarksClient::readKey(VaultError &err) {
    QFile f(keyFile_);
    if (!f.open(QIODevice::ReadOnly)) {
        err = makeError(VaultErrorKind::IoError, f.errorString());
        return false;
    }
    const QByteArray data = f.readAll();
    if (data.size() != kKeyLength) {
        err = makeError(VaultErrorKind::SerializationError,
                        QStringLiteral("Key file holds %1 bytes, expected %2")
                            .arg(data.size())
                            .arg(kKeyLength));
        return false;
    }
    key_.assign(data.begin(), data.end());
    return true;
}

bool BookmarksClient::readBookmarks(VaultError &err) {
    const QFileInfo fi(bookmarksFile_);
    if (!fi.exists() || !fi.isReadable()) {
        err = makeError(VaultErrorKind::IoError,
                        QStringLiteral("Cannot read %1").arg(bookmarksFile_));
        return false;
    }
    QSettings s(bookmarksFile_, QSettings::IniFormat);
    switch (s.status()) {
    case QSettings::NoError:
        break;
    case QSettings::AccessError:
        err = makeError(VaultErrorKind::IoError, settingsStatusText(s.status()));
        return false;
    case QSettings::FormatError:
        err = makeError(VaultErrorKind::SyntaxError, settingsStatusText(s.status()));
        return false;
    }
    UserHosts loaded;
    if (!readArray(s, "bookmarks", loaded.bookmarks, err) ||
        !readArray(s, "recents", loaded.recents, err)) {
        qCWarning(txVault) << "Rejected bookmarks file:" << err.msg;
        return false;
    }
    hosts_ = std::move(loaded);
    qCDebug(txVault) << "Loaded" << hosts_.bookmarks.size() << "bookmarks and"
                     << hosts_.recents.size() << "recents";
    return true;
}

bool BookmarksClient::writeBookmarks(VaultError &err) const {
    const QFileInfo fi(bookmarksFile_);
    if (!QDir().mkpath(fi.absolutePath())) {
        err = makeError(VaultErrorKind::IoError,
                        QStringLiteral("Could not create %1").arg(fi.absolutePath()));
        return false;
    }
    {
        QSettings s(bookmarksFile_, QSettings::IniFormat);
        s.clear();
        s.setValue("Vault/version", 1);
        writeArray(s, "bookmarks", hosts_.bookmarks);
        writeArray(s, "recents", hosts_.recents);
        s.sync();
        if (s.status() != QSettings::NoError) {
            err = makeError(VaultErrorKind::IoError,
                            QStringLiteral("Could not write %1 (%2)")
                                .arg(bookmarksFile_, settingsStatusText(s.status())));
            return false;
        }
    }
    if (!QFile::setPermissions(bookmarksFile_, QFileDevice::ReadOwner | QFileDevice::WriteOwner))
        qCWarning(txVault) << "Could not restrict permissions of the bookmarks file";
    return true;
}

bool BookmarksClient::encryptPassword(const std::string &plain, std::string &out,
                                      VaultError &err) const {
    unsigned char iv[kIvLength];
    if (RAND_bytes(iv, kIvLength) != 1) {
        err = makeError(VaultErrorKind::CryptoError, opensslError("RAND_bytes failed"));
        return false;
    }
    CipherCtx ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx ||
        EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key_.data(), iv) != 1) {
        err = makeError(VaultErrorKind::CryptoError, opensslError("Encryption init failed"));
        return false;
    }
    std::vector<unsigned char> ct(plain.size() + EVP_MAX_BLOCK_LENGTH);
    int len = 0;
    int total = 0;
    if (EVP_EncryptUpdate(ctx.get(), ct.data(), &len,
                          reinterpret_cast<const unsigned char *>(plain.data()),
                          static_cast<int>(plain.size())) != 1) {
        err = makeError(VaultErrorKind::CryptoError, opensslError("Encryption failed"));
        return false;
    }
    total = len;
    if (EVP_EncryptFinal_ex(ctx.get(), ct.data() + total, &len) != 1) {
        err = makeError(VaultErrorKind::CryptoError, opensslError("Encryption failed"));
        return false;
    }
    total += len;
    unsigned char tag[kTagLength];
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, kTagLength, tag) != 1) {
        err = makeError(VaultErrorKind::CryptoError, opensslError("Could not read GCM tag"));
        return false;
    }

    QByteArray blob;
    blob.append(reinterpret_cast<const char *>(iv), kIvLength);
    blob.append(reinterpret_cast<const char *>(ct.data()), total);
    blob.append(reinterpret_cast<const char *>(tag), kTagLength);
    out = blob.toBase64().toStdString();
    return true;
}

bool BookmarksClient::decryptPassword(const std::string &encoded, std::string &out,
                                      VaultError &err) const {
    const auto decoded = QByteArray::fromBase64Encoding(
        QByteArray::fromStdString(encoded), QByteArray::AbortOnBase64DecodingErrors);
    if (!decoded) {
        err = makeError(VaultErrorKind::SerializationError,
                        QStringLiteral("Saved password is not valid base64"));
        return false;
    }
    const QByteArray &blob = decoded.decoded;
    if (blob.size() < kIvLength + kTagLength) {
        err = makeError(VaultErrorKind::SerializationError,
                        QStringLiteral("Saved password is truncated"));
        return false;
    }
    const auto *raw = reinterpret_cast<const unsigned char *>(blob.constData());
    const int ctLen = static_cast<int>(blob.size()) - kIvLength - kTagLength;

    CipherCtx ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx ||
        EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key_.data(), raw) != 1) {
        err = makeError(VaultErrorKind::CryptoError, opensslError("Decryption init failed"));
        return false;
    }
    std::vector<unsigned char> pt(static_cast<std::size_t>(ctLen) + EVP_MAX_BLOCK_LENGTH);
    int len = 0;
    int total = 0;
    if (EVP_DecryptUpdate(ctx.get(), pt.data(), &len, raw + kIvLength, ctLen) != 1) {
        err = makeError(VaultErrorKind::CryptoError, opensslError("Decryption failed"));
        return false;
    }
    total = len;
    unsigned char tag[kTagLength];
    std::memcpy(tag, raw + kIvLength + ctLen, kTagLength);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, kTagLength, tag) != 1) {
        err = makeError(VaultErrorKind::CryptoError, opensslError("Could not set GCM tag"));
        return false;
    }
    if (EVP_DecryptFinal_ex(ctx.get(), pt.data() + total, &len) != 1) {
        err = makeError(VaultErrorKind::CryptoError,
                        QStringLiteral("Saved password failed authentication (wrong key?)"));
        return false;
    }
    total += len;
    out.assign(reinterpret_cast<const char *>(pt.data()), static_cast<std::size_t>(total));
    return true;
}

bool BookmarksClient::makeBookmark(const std::string &address, std::uint16_t port,
                                   termxfer::FileTransferProtocol protocol,
                                   const std::string &username,
                                   const std::optional<std::string> &password, Bookmark &out,
                                   VaultError &err) const {
    Bookmark b;
    b.address = address;
    b.port = port;
    b.protocol = protocol;
    b.username = username;
    if (password) {
        std::string enc;
        if (!encryptPassword(*password, enc, err))
            return false;
        b.password = std::move(enc);
    }
    out = std::move(b);
    return true;
}

bool BookmarksClient::addBookmark(const std::string &name, const std::string &address,
                                  std::uint16_t port, termxfer::FileTransferProtocol protocol,
                                  const std::string &username,
                                  const std::optional<std::string> &password,
                                  VaultError &err) {
    if (name.empty()) {
        err = makeError(VaultErrorKind::SyntaxError, QStringLiteral("Bookmark name is empty"));
        return false;
    }
    Bookmark b;
    if (!makeBookmark(address, port, protocol, username, password, b, err))
        return false;
    auto it = findByName(hosts_.bookmarks, name);
    if (it != hosts_.bookmarks.end())
        it->second = std::move(b);
    else
        hosts_.bookmarks.emplace_back(name, std::move(b));
    return true;
}

bool BookmarksClient::delBookmark(const std::string &name) {
    auto it = findByName(hosts_.bookmarks, name);
    if (it == hosts_.bookmarks.end())
        return false;
    hosts_.bookmarks.erase(it);
    return true;
}

std::optional<HostArgs> BookmarksClient::getBookmark(const std::string &name,
                                                     VaultError &err) const {
    auto it = findByName(hosts_.bookmarks, name);
    if (it == hosts_.bookmarks.end())
        return std::nullopt;
    const Bookmark &b = it->second;
    HostArgs args{b.address, b.port, b.protocol, b.username, std::nullopt};
    if (b.password) {
        std::string plain;
        if (!decryptPassword(*b.password, plain, err))
            return std::nullopt;
        args.password = std::move(plain);
    }
    return args;
}

std::vector<std::string> BookmarksClient::bookmarkNames() const {
    std::vector<std::string> names;
    names.reserve(hosts_.bookmarks.size());
    for (const auto &p : hosts_.bookmarks)
        names.push_back(p.first);
    return names;
}

void BookmarksClient::addRecent(const std::string &address, std::uint16_t port,
                                termxfer::FileTransferProtocol protocol,
                                const std::string &username) {
    auto &recents = hosts_.recents;
    recents.erase(std::remove_if(recents.begin(), recents.end(),
                                 [&](const auto &p) {
                                     return sameHost(p.second, address, port, protocol,
                                                     username);
                                 }),
                  recents.end());

    // Keyed by UTC timestamp; same-millisecond keys get a counter.
    const std::string stamp = QDateTime::currentDateTimeUtc()
                                  .toString(QStringLiteral("yyyyMMdd'T'HHmmss.zzz"))
                                  .toStdString();
    std::string key = stamp;
    for (int n = 1; findByName(recents, key) != recents.end(); ++n)
        key = stamp + "-" + std::to_string(n);

    Bookmark b;
    b.address = address;
    b.port = port;
    b.protocol = protocol;
    b.username = username;
    recents.emplace_back(key, std::move(b));
    while (static_cast<int>(recents.size()) > recentsSize_)
        recents.erase(recents.begin());
}

bool BookmarksClient::delRecent(const std::string &name) {
    auto it = findByName(hosts_.recents, name);
    if (it == hosts_.recents.end())
        return false;
    hosts_.recents.erase(it);
    return true;
}

std::optional<HostArgs> BookmarksClient::getRecent(const std::string &name) const {
    auto it = findByName(hosts_.recents, name);
    if (it == hosts_.recents.end())
        return std::nullopt;
    const Bookmark &b = it->second;
    return HostArgs{b.address, b.port, b.protocol, b.username, std::nullopt};
}

std::vector<std::string> BookmarksClient::recentNames() const {
    std::vector<std::string> names;
    names.reserve(hosts_.recents.size());
    for (const auto &p : hosts_.recents)
        names.push_back(p.first);
    return names;
}
