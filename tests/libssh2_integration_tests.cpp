// Integration tests for the libssh2 transports against a test SSH server.
// The test is skipped (exit code 77) unless required TERMXFER_IT_* env vars
// exist. TERMXFER_IT_PROTOCOL selects "sftp" (default) or "scp".
#include "termxfer/FileTransfer.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr int kSkipExitCode = 77;

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

std::optional<std::string> envValue(const char *key) {
    const char *raw = std::getenv(key);
    if (!raw || !*raw)
        return std::nullopt;
    return std::string(raw);
}

std::string uniqueToken() {
    const auto now =
        std::chrono::steady_clock::now().time_since_epoch().count();
    return std::to_string(static_cast<long long>(now));
}

std::string joinRemotePath(const std::string &base, const std::string &name) {
    if (base.empty())
        return std::string("/") + name;
    if (base.back() == '/')
        return base + name;
    return base + "/" + name;
}

bool readFile(const fs::path &p, std::string &out) {
    std::ifstream in(p, std::ios::binary);
    if (!in.is_open())
        return false;
    out.assign(std::istreambuf_iterator<char>(in),
               std::istreambuf_iterator<char>());
    return true;
}

bool parsePort(const std::optional<std::string> &raw, std::uint16_t &out) {
    if (!raw.has_value()) {
        out = 22;
        return true;
    }
    try {
        const int n = std::stoi(*raw);
        if (n < 1 || n > 65535)
            return false;
        out = static_cast<std::uint16_t>(n);
        return true;
    } catch (const std::exception &) {
        return false;
    }
}

bool listContainsName(const std::vector<termxfer::FsEntry> &entries,
                      const std::string &name) {
    return std::any_of(entries.begin(), entries.end(),
                       [&name](const termxfer::FsEntry &e) {
                           return termxfer::entryName(e) == name;
                       });
}

// Runs without a server: nothing listens on port 1 of the loopback.
void test_unreachable_host(TestContext &t) {
    termxfer::FileTransfer ft(termxfer::FileTransferProtocol::Sftp);
    termxfer::SessionOptions opt;
    opt.host = "127.0.0.1";
    opt.port = 1;
    opt.username = "nobody";
    termxfer::TransferError err;
    t.check(!ft.connect(opt, err), "connect to a closed port should fail");
    t.check(err.kind == termxfer::TransferErrorKind::BadAddress,
            "closed port should report BadAddress: " + err.toString());
    t.check(!ft.isConnected(), "failed connect should leave the client disconnected");
}

} // namespace

int main() {
    TestContext t;
    test_unreachable_host(t);

    const auto host = envValue("TERMXFER_IT_SFTP_HOST");
    const auto user = envValue("TERMXFER_IT_SFTP_USER");
    const auto pass = envValue("TERMXFER_IT_SFTP_PASS");
    const auto keyPath = envValue("TERMXFER_IT_SFTP_KEY");
    const auto keyPassphrase = envValue("TERMXFER_IT_SFTP_KEY_PASSPHRASE");
    const std::string remoteBase =
        envValue("TERMXFER_IT_REMOTE_BASE").value_or("/tmp");

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    if (!host.has_value() || !user.has_value() ||
        (!pass.has_value() && !keyPath.has_value())) {
        std::cout << "[SKIP] termxfer_sftp_integration_tests requires env vars: "
                  << "TERMXFER_IT_SFTP_HOST, TERMXFER_IT_SFTP_USER and one "
                     "auth method "
                  << "(TERMXFER_IT_SFTP_PASS or TERMXFER_IT_SFTP_KEY)\n";
        return kSkipExitCode;
    }
    if (keyPath.has_value() && !fs::exists(*keyPath)) {
        std::cerr << "[FAIL] TERMXFER_IT_SFTP_KEY does not exist: " << *keyPath
                  << "\n";
        return EXIT_FAILURE;
    }

    std::uint16_t port = 22;
    if (!parsePort(envValue("TERMXFER_IT_SFTP_PORT"), port)) {
        std::cerr << "[FAIL] TERMXFER_IT_SFTP_PORT is invalid\n";
        return EXIT_FAILURE;
    }
    const auto protocol = termxfer::protocolFromName(
        envValue("TERMXFER_IT_PROTOCOL").value_or("sftp"));
    if (!protocol || *protocol == termxfer::FileTransferProtocol::Ftp) {
        std::cerr << "[FAIL] TERMXFER_IT_PROTOCOL must be sftp or scp\n";
        return EXIT_FAILURE;
    }

    termxfer::SessionOptions opt;
    opt.host = *host;
    opt.port = port;
    opt.username = *user;
    if (pass.has_value())
        opt.password = *pass;
    if (keyPath.has_value()) {
        opt.private_key_path = *keyPath;
        if (keyPassphrase.has_value())
            opt.private_key_passphrase = *keyPassphrase;
    }
    opt.known_hosts_policy = termxfer::KnownHostsPolicy::Off;

    const std::string token = uniqueToken();
    const std::string remoteSuiteDir =
        joinRemotePath(remoteBase, "termxfer-it-" + token);
    const std::string remoteSrc = joinRemotePath(remoteSuiteDir, "payload.txt");

    const fs::path localTmpRoot =
        fs::temp_directory_path() / ("termxfer-it-" + token);
    std::error_code ec;
    fs::create_directories(localTmpRoot, ec);
    if (ec) {
        std::cerr << "[FAIL] could not create temp dir: " << ec.message()
                  << "\n";
        return EXIT_FAILURE;
    }

    const fs::path localSrc = localTmpRoot / "payload.txt";
    const fs::path localDst = localTmpRoot / "payload-downloaded.txt";
    const std::string payload = "termxfer integration payload\nline-2\n";
    {
        std::ofstream out(localSrc, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            std::cerr << "[FAIL] could not create source file\n";
            fs::remove_all(localTmpRoot, ec);
            return EXIT_FAILURE;
        }
        out << payload;
    }

    termxfer::FileTransfer client(*protocol);
    termxfer::TransferError err;

    const bool connected = client.connect(opt, err);
    t.check(connected, "connect should succeed: " + err.toString());
    if (t.failures == 0) {
        std::string wd;
        t.check(client.pwd(wd, err) && !wd.empty() && wd.front() == '/',
                "working directory should be absolute after connect");
    }
    if (t.failures == 0) {
        t.check(client.mkdir(remoteSuiteDir, err),
                "mkdir remoteSuiteDir should succeed: " + err.toString());
    }
    if (t.failures == 0) {
        std::FILE *src = std::fopen(localSrc.string().c_str(), "rb");
        t.check(src != nullptr, "source file should open");
        if (src) {
            std::uint64_t last = 0;
            t.check(client.send(src, remoteSrc, err,
                                [&last](std::uint64_t done, std::uint64_t) { last = done; }),
                    "send should succeed: " + err.toString());
            t.check(last == payload.size(), "progress should reach the payload size");
            std::fclose(src);
        }
    }
    if (t.failures == 0) {
        termxfer::FsEntry st;
        t.check(client.stat(remoteSrc, st, err),
                "stat(remoteSrc) should succeed: " + err.toString());
        const auto *file = std::get_if<termxfer::FsFile>(&st);
        t.check(file != nullptr, "stat(remoteSrc) should report a file");
        t.check(file && file->size == payload.size(),
                "remote file size should match payload size");
    }
    if (t.failures == 0) {
        std::vector<termxfer::FsEntry> entries;
        t.check(client.listDir(remoteSuiteDir, entries, err),
                "listDir(remoteSuiteDir) should succeed: " + err.toString());
        t.check(listContainsName(entries, "payload.txt"),
                "listing should include payload.txt");
    }
    if (t.failures == 0) {
        std::FILE *dst = std::fopen(localDst.string().c_str(), "wb");
        t.check(dst != nullptr, "destination file should open");
        if (dst) {
            t.check(client.receive(remoteSrc, dst, err),
                    "receive should succeed: " + err.toString());
            std::fclose(dst);
        }
        std::string downloaded;
        t.check(readFile(localDst, downloaded),
                "downloaded file should be readable");
        t.check(downloaded == payload,
                "downloaded content should match uploaded payload");
    }
    if (t.failures == 0) {
        termxfer::FsEntry dir;
        t.check(client.stat(remoteSuiteDir, dir, err) && termxfer::isDirectory(dir),
                "stat(remoteSuiteDir) should report a directory");
        t.check(client.remove(dir, err),
                "recursive remove should succeed: " + err.toString());
        std::vector<termxfer::FsEntry> entries;
        t.check(!client.listDir(remoteSuiteDir, entries, err),
                "removed directory should not be listable");
    }

    // Best-effort cleanup regardless of test result.
    if (client.isConnected()) {
        termxfer::FsEntry leftover;
        termxfer::TransferError cleanupErr;
        if (client.stat(remoteSuiteDir, leftover, cleanupErr) &&
            !client.remove(leftover, cleanupErr))
            std::cerr << "[WARN] cleanup failed: " << cleanupErr.toString() << "\n";
        t.check(client.disconnect(err), "disconnect should succeed: " + err.toString());
    }
    fs::remove_all(localTmpRoot, ec);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] termxfer_sftp_integration_tests\n";
    return EXIT_SUCCESS;
}
