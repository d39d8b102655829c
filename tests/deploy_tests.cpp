// Deploy engine tests against the in-memory backend (run via CTest).
#include "DeployConfig.hpp"
#include "Deployer.hpp"
#include "Exclusions.hpp"
#include "LocalScanner.hpp"
#include "RemoteReconciler.hpp"
#include "ResilientSession.hpp"
#include "sitepush/MockRemoteClient.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMap>
#include <QProcessEnvironment>
#include <QTemporaryDir>

#include <cstdlib>
#include <iostream>
#include <string>

using namespace sitepush;

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

class BuildDir {
public:
    bool isValid() const { return dir_.isValid(); }
    QString path() const { return dir_.path(); }

    void write(const QString &rel, const QByteArray &content = "x") {
        const QString abs = dir_.filePath(rel);
        QDir().mkpath(QFileInfo(abs).absolutePath());
        QFile f(abs);
        if (f.open(QIODevice::WriteOnly | QIODevice::Truncate))
            f.write(content);
    }

private:
    QTemporaryDir dir_;
};

// Scripted local tree that records every directory it is asked to list.
class CountingFs : public LocalFileSystem {
public:
    QMap<QString, QVector<LocalDirEntry>> tree;
    QStringList listed;

    bool listDir(const QString &absPath, QVector<LocalDirEntry> &out,
                 QString &err) override {
        listed << absPath;
        auto it = tree.constFind(absPath);
        if (it == tree.constEnd()) {
            err = QStringLiteral("cannot list ") + absPath;
            return false;
        }
        out = *it;
        return true;
    }
    bool isDir(const QString &absPath) const override {
        return tree.contains(absPath);
    }
    bool isFile(const QString &) const override { return true; }
};

LocalDirEntry fileEntry(const char *name) {
    return {QString::fromLatin1(name), LocalDirEntry::Kind::File};
}

LocalDirEntry dirEntry(const char *name) {
    return {QString::fromLatin1(name), LocalDirEntry::Kind::Dir};
}

DeployConfig baseConfig(const QString &buildDir) {
    DeployConfig cfg;
    cfg.host = QStringLiteral("example.test");
    cfg.port = 21;
    cfg.username = QStringLiteral("alice");
    cfg.password = QStringLiteral("secret");
    cfg.remoteDir = QStringLiteral("/site");
    cfg.buildDir = buildDir;
    return cfg;
}

RetryPolicy fastPolicy() {
    RetryPolicy p;
    p.backoffMs = 0;
    p.keepaliveIntervalMs = 3600 * 1000;
    return p;
}

SessionOptions mockOptions() {
    SessionOptions opt;
    opt.host = "example.test";
    opt.username = "alice";
    return opt;
}

std::unique_ptr<Deployer> makeDeployer(const DeployConfig &cfg,
                                       const std::shared_ptr<MockRemoteFs> &fs) {
    auto d = std::make_unique<Deployer>(cfg, std::make_unique<MockRemoteClient>(fs));
    d->setRetryPolicy(fastPolicy());
    return d;
}

int countOps(const MockRemoteFs &fs, MockOp::Type type, const std::string &path,
             bool okOnly = false) {
    int n = 0;
    for (const MockOp &op : fs.ops()) {
        if (op.type == type && op.path == path && (op.ok || !okOnly))
            ++n;
    }
    return n;
}

bool hasFailure(const DeployReport &r, const QString &path) {
    for (const ItemFailure &f : r.failures) {
        if (f.path == path)
            return true;
    }
    return false;
}

// ---- exclusions ----

void test_parse_exclusions(TestContext &t) {
    const QStringList rules = parseExclusions(QStringLiteral(" .htaccess , ,uploads/media,"));
    t.check(rules.size() == 2 && rules.at(0) == QLatin1String(".htaccess") &&
                rules.at(1) == QLatin1String("uploads/media"),
            "parseExclusions trims and drops empty segments");
    t.check(parseExclusions(QString()).isEmpty(), "empty input yields no rules");
}

void test_is_excluded(TestContext &t) {
    const QStringList rules = {QStringLiteral("uploads"), QStringLiteral("*.txt")};
    t.check(isExcluded(QStringLiteral("uploads"), rules), "exact match");
    t.check(isExcluded(QStringLiteral("uploads/a/b.png"), rules), "directory prefix match");
    t.check(!isExcluded(QStringLiteral("uploads2"), rules),
            "prefix without separator does not match");
    t.check(!isExcluded(QStringLiteral("Uploads"), rules), "matching is case-sensitive");
    t.check(!isExcluded(QStringLiteral("a.txt"), rules), "no glob expansion");
    t.check(isExcluded(QStringLiteral("*.txt"), rules), "glob characters are literal");
    t.check(!isExcluded(QStringLiteral("anything"), QStringList()), "no rules, no match");
}

// ---- scanner ----

void test_scanner_prunes_excluded_dirs(TestContext &t) {
    CountingFs fs;
    fs.tree[QStringLiteral("/r")] = {fileEntry("a.txt"), dirEntry("sub"), dirEntry("uploads"),
                                     {QStringLiteral("fifo"), LocalDirEntry::Kind::Other}};
    fs.tree[QStringLiteral("/r/sub")] = {fileEntry("b.txt"), dirEntry("deeper")};
    fs.tree[QStringLiteral("/r/sub/deeper")] = {fileEntry("c.txt")};
    fs.tree[QStringLiteral("/r/uploads")] = {fileEntry("photo.jpg")};

    QStringList out;
    QString err;
    t.check(scanLocalTree(fs, QStringLiteral("/r/"), {QStringLiteral("uploads")}, out, err),
            "scan succeeds");
    t.check(out == QStringList({QStringLiteral("a.txt"), QStringLiteral("sub/b.txt"),
                                QStringLiteral("sub/deeper/c.txt")}),
            "scan yields relative posix paths of regular files");
    t.check(!fs.listed.contains(QStringLiteral("/r/uploads")),
            "excluded directory is never listed");
    t.check(fs.listed.size() == 3, "every other directory is listed exactly once");
}

void test_scanner_fails_on_unreadable_dir(TestContext &t) {
    CountingFs fs;
    fs.tree[QStringLiteral("/r")] = {dirEntry("locked")};
    QStringList out;
    QString err;
    t.check(!scanLocalTree(fs, QStringLiteral("/r"), {}, out, err),
            "unlistable subdirectory fails the scan");
    t.check(err.contains(QLatin1String("/r/locked")), "error names the directory");
    t.check(!scanLocalTree(fs, QStringLiteral("/missing"), {}, out, err),
            "missing root fails the scan");
}

void test_qt_scanner_on_disk(TestContext &t) {
    BuildDir site;
    t.check(site.isValid(), "temporary build dir");
    site.write(QStringLiteral("b.txt"));
    site.write(QStringLiteral("a/.hidden"));
    site.write(QStringLiteral("skip/me.txt"));
    QtLocalFileSystem fs;
    QStringList out;
    QString err;
    t.check(scanLocalTree(fs, site.path(), {QStringLiteral("skip")}, out, err), "scan real tree");
    t.check(out == QStringList({QStringLiteral("a/.hidden"), QStringLiteral("b.txt")}),
            "hidden files are included and entries are ordered by name");
}

// ---- reconciler ----

void test_reconciler_preserves_exclusions(TestContext &t) {
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addFile("/site/old.txt", "old");
    fs->addFile("/site/.htaccess", "rules");
    fs->addFile("/site/assets/app.js", "js");
    ResilientSession session(std::make_unique<MockRemoteClient>(fs), mockOptions(), "/site",
                             fastPolicy());
    RemoteError err;
    t.check(session.connect(err), "connect");

    const ReconcileReport r =
        cleanupRemoteDirectory(session, QStringLiteral("/site"), {QStringLiteral(".htaccess")});
    t.check(r.ok, "cleanup succeeds");
    t.check(fs->hasFile("/site/.htaccess") && fs->content("/site/.htaccess") == "rules",
            "excluded file survives untouched");
    t.check(!fs->hasFile("/site/old.txt") && !fs->hasDir("/site/assets"),
            "everything else is removed, directories recursively");
    t.check(r.deleted.size() == 2 && r.preserved == QStringList({QStringLiteral(".htaccess")}),
            "report lists deleted and preserved entries");
}

void test_reconciler_listing_failure_is_fatal(TestContext &t) {
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addDir("/site");
    fs->failNext(MockOp::Type::List, "/site",
                 makeRemoteError(RemoteErrorKind::Protocol, "450 busy", 450));
    ResilientSession session(std::make_unique<MockRemoteClient>(fs), mockOptions(), "/site");
    RemoteError err;
    t.check(session.connect(err), "connect");
    const ReconcileReport r = cleanupRemoteDirectory(session, QStringLiteral("/site"), {});
    t.check(!r.ok && r.error.contains(QLatin1String("450")), "listing failure is reported");
}

// ---- resilient session ----

void test_session_reconnects_and_restores_root(TestContext &t) {
    BuildDir site;
    site.write(QStringLiteral("a.txt"), "A");
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addDir("/site");
    ResilientSession session(std::make_unique<MockRemoteClient>(fs), mockOptions(), "/site",
                             fastPolicy());
    RemoteError err;
    t.check(session.connect(err), "connect");
    fs->failNext(MockOp::Type::Put, "/site/a.txt",
                 makeRemoteError(RemoteErrorKind::Connection, "421 closing", 421));

    const std::string local = (site.path() + QStringLiteral("/a.txt")).toStdString();
    t.check(session.upload(local, "/site/a.txt", err), "upload succeeds after reconnect");
    t.check(fs->content("/site/a.txt") == "A", "file content uploaded");
    t.check(session.reconnectCount() == 1, "exactly one reconnect");
    t.check(countOps(*fs, MockOp::Type::ChangeDir, "/site", true) == 1,
            "working directory restored to the remote root");
    t.check(session.isConnected(), "session is connected after recovery");
    session.close();
    t.check(!session.isConnected(), "close releases the connection");
}

void test_session_no_retry_on_protocol_error(TestContext &t) {
    BuildDir site;
    site.write(QStringLiteral("a.txt"));
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addDir("/site");
    ResilientSession session(std::make_unique<MockRemoteClient>(fs), mockOptions(), "/site",
                             fastPolicy());
    RemoteError err;
    t.check(session.connect(err), "connect");
    fs->failNext(MockOp::Type::Put, "/site/a.txt",
                 makeRemoteError(RemoteErrorKind::Protocol, "553 denied", 553));
    const std::string local = (site.path() + QStringLiteral("/a.txt")).toStdString();
    t.check(!session.upload(local, "/site/a.txt", err), "protocol failure propagates");
    t.check(err.code == 553, "original error is returned");
    t.check(countOps(*fs, MockOp::Type::Put, "/site/a.txt") == 1, "no retry");
    t.check(session.reconnectCount() == 0, "no reconnect");
}

// ---- deployer scenarios ----

void test_basic_deploy_orders_entry_last(TestContext &t) {
    BuildDir site;
    site.write(QStringLiteral("a.txt"), "A");
    site.write(QStringLiteral("sub/b.txt"), "B");
    site.write(QStringLiteral("index.html"), "<html>");
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addDir("/site");

    auto d = makeDeployer(baseConfig(site.path()), fs);
    QStringList phases;
    QObject::connect(d.get(), &Deployer::phaseStarted,
                     [&phases](const QString &p) { phases << p; });
    const DeployReport r = d->run();

    t.check(r.ok && r.state == DeployState::Done, "deployment succeeds");
    t.check(d->state() == DeployState::Done, "deployer ends in Done");
    const auto ups = fs->uploads();
    t.check(ups.size() == 3 && ups.back() == "/site/index.html",
            "entry document is the last upload");
    t.check(fs->content("/site/a.txt") == "A" && fs->content("/site/sub/b.txt") == "B" &&
                fs->content("/site/index.html") == "<html>",
            "remote tree mirrors the build");
    t.check(r.uploaded == 3 && r.failures.isEmpty(), "report counts uploads");
    t.check(phases == QStringList({QStringLiteral("connect"), QStringLiteral("ensure-root"),
                                   QStringLiteral("cleanup"), QStringLiteral("upload"),
                                   QStringLiteral("entry-document")}),
            "phases are announced in order");
}

void test_htaccess_is_preserved(TestContext &t) {
    BuildDir site;
    site.write(QStringLiteral("index.html"));
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addFile("/site/old.txt", "old");
    fs->addFile("/site/.htaccess", "rules");
    DeployConfig cfg = baseConfig(site.path());
    cfg.exclusions = {QStringLiteral(".htaccess")};

    auto d = makeDeployer(cfg, fs);
    QStringList deleted;
    QObject::connect(d.get(), &Deployer::itemDeleted,
                     [&deleted](const QString &p) { deleted << p; });
    const DeployReport r = d->run();
    t.check(r.ok, "deployment succeeds");
    t.check(!fs->hasFile("/site/old.txt"), "stale file deleted");
    t.check(fs->content("/site/.htaccess") == "rules", ".htaccess untouched");
    t.check(r.deleted == 1 && r.preserved == 1, "report counts deletions and preserved entries");
    t.check(deleted == QStringList({QStringLiteral("/site/old.txt")}), "itemDeleted emitted");
}

void test_excluded_uploads_dir(TestContext &t) {
    BuildDir site;
    site.write(QStringLiteral("index.html"));
    site.write(QStringLiteral("uploads/local.jpg"));
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addFile("/site/uploads/photo.jpg", "jpg");
    fs->addFile("/site/stale.txt");
    DeployConfig cfg = baseConfig(site.path());
    cfg.exclusions = {QStringLiteral("uploads")};

    const DeployReport r = makeDeployer(cfg, fs)->run();
    t.check(r.ok, "deployment succeeds");
    t.check(fs->content("/site/uploads/photo.jpg") == "jpg", "remote uploads/ content kept");
    t.check(!fs->hasFile("/site/stale.txt"), "stale file deleted");
    t.check(!fs->hasFile("/site/uploads/local.jpg"), "excluded local files are not uploaded");
}

void test_no_entry_document(TestContext &t) {
    BuildDir site;
    site.write(QStringLiteral("a.txt"));
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addDir("/site");
    const DeployReport r = makeDeployer(baseConfig(site.path()), fs)->run();
    t.check(r.ok && r.state == DeployState::Done, "run without entry document succeeds");
    t.check(fs->uploads() == std::vector<std::string>({"/site/a.txt"}),
            "only the regular file is uploaded");
}

void test_nested_index_is_regular(TestContext &t) {
    BuildDir site;
    site.write(QStringLiteral("docs/index.html"), "nested");
    site.write(QStringLiteral("index.html"), "root");
    site.write(QStringLiteral("z.txt"));
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addDir("/site");
    const DeployReport r = makeDeployer(baseConfig(site.path()), fs)->run();
    const auto ups = fs->uploads();
    t.check(r.ok && ups.size() == 3, "all files uploaded");
    t.check(ups.front() == "/site/docs/index.html" && ups.back() == "/site/index.html",
            "nested index.html goes with the bulk upload, root one last");
}

void test_custom_entry_document(TestContext &t) {
    BuildDir site;
    site.write(QStringLiteral("home.htm"));
    site.write(QStringLiteral("index.html"));
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addDir("/site");
    DeployConfig cfg = baseConfig(site.path());
    cfg.entryDocument = QStringLiteral("home.htm");
    const DeployReport r = makeDeployer(cfg, fs)->run();
    t.check(r.ok && fs->uploads().back() == "/site/home.htm",
            "configured entry document is published last");
}

void test_connection_loss_recovers(TestContext &t) {
    BuildDir site;
    site.write(QStringLiteral("a.txt"), "A");
    site.write(QStringLiteral("index.html"));
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addDir("/site");
    fs->failNext(MockOp::Type::Put, "/site/a.txt",
                 makeRemoteError(RemoteErrorKind::Connection, "connection reset"));

    const DeployReport r = makeDeployer(baseConfig(site.path()), fs)->run();
    t.check(r.ok, "run succeeds after one reconnect");
    t.check(r.reconnects == 1 && fs->count(MockOp::Type::Connect) == 2,
            "exactly one reconnect");
    t.check(fs->content("/site/a.txt") == "A", "interrupted file is uploaded");
    t.check(fs->uploads().back() == "/site/index.html", "entry document still last");
}

void test_failed_reconnect_consumes_attempt(TestContext &t) {
    BuildDir site;
    site.write(QStringLiteral("a.txt"));
    site.write(QStringLiteral("index.html"));
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addDir("/site");
    fs->failNext(MockOp::Type::Put, "/site/a.txt",
                 makeRemoteError(RemoteErrorKind::Connection, "reset"));

    auto d = makeDeployer(baseConfig(site.path()), fs);
    QObject::connect(d.get(), &Deployer::phaseStarted, [fs](const QString &p) {
        if (p == QLatin1String("upload"))
            fs->failNext(MockOp::Type::Connect, "",
                         makeRemoteError(RemoteErrorKind::Connection, "refused"));
    });
    const DeployReport r = d->run();
    t.check(r.ok, "third attempt succeeds");
    t.check(countOps(*fs, MockOp::Type::Put, "/site/a.txt") == 2,
            "put tried on attempts one and three only");
    t.check(fs->count(MockOp::Type::Connect, false) == 3 && fs->count(MockOp::Type::Connect) == 2,
            "failed reconnect is followed by a successful one");
}

void test_retries_exhausted_on_entry_is_fatal(TestContext &t) {
    BuildDir site;
    site.write(QStringLiteral("a.txt"));
    site.write(QStringLiteral("index.html"));
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addDir("/site");
    fs->failNext(MockOp::Type::Put, "/site/index.html",
                 makeRemoteError(RemoteErrorKind::Connection, "timeout"), 3);

    const DeployReport r = makeDeployer(baseConfig(site.path()), fs)->run();
    t.check(!r.ok && r.state == DeployState::Failed, "run fails");
    t.check(r.failedIn == DeployState::BulkUploaded, "failure happens after the bulk upload");
    t.check(countOps(*fs, MockOp::Type::Put, "/site/index.html") == 3, "three attempts");
    t.check(r.reconnects == 2, "two reconnects between attempts");
    t.check(fs->hasFile("/site/a.txt"), "bulk files were uploaded before the failure");
}

void test_retries_exhausted_on_regular_file_is_not_fatal(TestContext &t) {
    BuildDir site;
    site.write(QStringLiteral("a.txt"));
    site.write(QStringLiteral("b.txt"), "B");
    site.write(QStringLiteral("index.html"));
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addDir("/site");
    fs->failNext(MockOp::Type::Put, "/site/a.txt",
                 makeRemoteError(RemoteErrorKind::Connection, "timeout"), 3);

    const DeployReport r = makeDeployer(baseConfig(site.path()), fs)->run();
    t.check(r.ok && r.state == DeployState::Done, "run still succeeds");
    t.check(hasFailure(r, QStringLiteral("/site/a.txt")) && r.failures.size() == 1,
            "exhausted file recorded as an item failure");
    t.check(countOps(*fs, MockOp::Type::Put, "/site/a.txt") == 3, "three attempts");
    // Two reconnects for a.txt, one more when b.txt finds the link down.
    t.check(r.reconnects == 3, "next upload reconnects the dropped session");
    t.check(fs->content("/site/b.txt") == "B", "following file uploaded");
    t.check(!fs->uploads().empty() && fs->uploads().back() == "/site/index.html",
            "entry document uploaded last");
}

void test_protocol_error_on_regular_file_is_not_fatal(TestContext &t) {
    BuildDir site;
    site.write(QStringLiteral("a.txt"));
    site.write(QStringLiteral("b.txt"));
    site.write(QStringLiteral("index.html"));
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addDir("/site");
    fs->failNext(MockOp::Type::Put, "/site/a.txt",
                 makeRemoteError(RemoteErrorKind::Protocol, "552 quota", 552));

    auto d = makeDeployer(baseConfig(site.path()), fs);
    QStringList failed;
    QObject::connect(d.get(), &Deployer::itemFailed,
                     [&failed](const QString &p, const QString &) { failed << p; });
    const DeployReport r = d->run();
    t.check(r.ok, "run still succeeds");
    t.check(hasFailure(r, QStringLiteral("/site/a.txt")), "failure recorded in the report");
    t.check(failed == QStringList({QStringLiteral("/site/a.txt")}), "itemFailed emitted");
    t.check(countOps(*fs, MockOp::Type::Put, "/site/a.txt") == 1, "no retry");
    t.check(fs->hasFile("/site/b.txt") && fs->hasFile("/site/index.html"),
            "remaining files uploaded");
}

void test_protocol_error_on_entry_is_fatal(TestContext &t) {
    BuildDir site;
    site.write(QStringLiteral("index.html"));
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addDir("/site");
    fs->failNext(MockOp::Type::Put, "/site/index.html",
                 makeRemoteError(RemoteErrorKind::Protocol, "553 denied", 553));
    const DeployReport r = makeDeployer(baseConfig(site.path()), fs)->run();
    t.check(!r.ok && r.error.contains(QLatin1String("553")), "entry failure is fatal");
    t.check(countOps(*fs, MockOp::Type::Put, "/site/index.html") == 1, "no retry");
    t.check(fs->count(MockOp::Type::Connect) == 1, "no reconnect");
}

void test_keepalive_every_tenth_upload(TestContext &t) {
    BuildDir site;
    for (int i = 0; i < 25; ++i)
        site.write(QStringLiteral("f%1.txt").arg(i, 2, 10, QLatin1Char('0')));
    site.write(QStringLiteral("index.html"));
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addDir("/site");
    const DeployReport r = makeDeployer(baseConfig(site.path()), fs)->run();
    t.check(r.ok && r.uploaded == 26, "all files uploaded");
    t.check(fs->count(MockOp::Type::Keepalive) == 2, "keepalive after the 10th and 20th upload");
}

void test_keepalive_after_idle_interval(TestContext &t) {
    BuildDir site;
    site.write(QStringLiteral("a.txt"));
    site.write(QStringLiteral("b.txt"));
    site.write(QStringLiteral("c.txt"));
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addDir("/site");
    RetryPolicy p = fastPolicy();
    p.keepaliveIntervalMs = -1; // every upload counts as idle
    auto d = makeDeployer(baseConfig(site.path()), fs);
    d->setRetryPolicy(p);

    const DeployReport r = d->run();
    t.check(r.ok && r.uploaded == 3, "all files uploaded");
    t.check(fs->count(MockOp::Type::Keepalive) == 3, "one keepalive per upload");
    const std::vector<MockOp> &ops = fs->ops();
    bool preceded = true;
    for (size_t i = 0; i < ops.size(); ++i) {
        if (ops[i].type == MockOp::Type::Put &&
            (i == 0 || ops[i - 1].type != MockOp::Type::Keepalive))
            preceded = false;
    }
    t.check(preceded, "each upload directly follows a keepalive");
}

void test_keepalive_failure_is_swallowed(TestContext &t) {
    BuildDir site;
    for (int i = 0; i < 10; ++i)
        site.write(QStringLiteral("f%1.txt").arg(i));
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addDir("/site");
    fs->failNext(MockOp::Type::Keepalive, "",
                 makeRemoteError(RemoteErrorKind::Protocol, "500 unknown", 500));
    const DeployReport r = makeDeployer(baseConfig(site.path()), fs)->run();
    t.check(r.ok && r.failures.isEmpty(), "keepalive failure does not affect the run");
}

void test_delete_failure_is_not_fatal(TestContext &t) {
    BuildDir site;
    site.write(QStringLiteral("index.html"));
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addFile("/site/locked.txt");
    fs->addFile("/site/old.txt");
    fs->failNext(MockOp::Type::RemoveFile, "/site/locked.txt",
                 makeRemoteError(RemoteErrorKind::Protocol, "550 permission denied", 550));
    const DeployReport r = makeDeployer(baseConfig(site.path()), fs)->run();
    t.check(r.ok, "run succeeds");
    t.check(hasFailure(r, QStringLiteral("/site/locked.txt")), "delete failure recorded");
    t.check(!fs->hasFile("/site/old.txt"), "other deletions continue");
    t.check(fs->hasFile("/site/index.html"), "upload proceeds");
}

void test_remote_root_is_created(TestContext &t) {
    BuildDir site;
    site.write(QStringLiteral("index.html"));
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addDir("/www");
    DeployConfig cfg = baseConfig(site.path());
    cfg.remoteDir = QStringLiteral("/www/site/current");
    const DeployReport r = makeDeployer(cfg, fs)->run();
    t.check(r.ok, "run succeeds");
    t.check(fs->hasDir("/www/site/current"), "missing remote root components are created");
    t.check(countOps(*fs, MockOp::Type::Mkdir, "/www") == 0, "existing components are entered");
    t.check(fs->hasFile("/www/site/current/index.html"), "files land under the new root");
}

void test_remote_root_failure_is_fatal(TestContext &t) {
    BuildDir site;
    site.write(QStringLiteral("index.html"));
    auto fs = std::make_shared<MockRemoteFs>();
    fs->failNext(MockOp::Type::Mkdir, "/site",
                 makeRemoteError(RemoteErrorKind::Protocol, "550 denied", 550));
    const DeployReport r = makeDeployer(baseConfig(site.path()), fs)->run();
    t.check(!r.ok && r.failedIn == DeployState::Connected,
            "root that cannot be created fails the run");
    t.check(fs->uploads().empty(), "nothing uploaded");
}

void test_parent_dirs_created_once(TestContext &t) {
    BuildDir site;
    site.write(QStringLiteral("sub/a.txt"));
    site.write(QStringLiteral("sub/b.txt"));
    site.write(QStringLiteral("sub/deep/c.txt"));
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addDir("/site");
    const DeployReport r = makeDeployer(baseConfig(site.path()), fs)->run();
    t.check(r.ok && r.uploaded == 3, "run succeeds");
    t.check(countOps(*fs, MockOp::Type::Mkdir, "/site/sub") == 1, "shared prefix created once");
    t.check(countOps(*fs, MockOp::Type::Mkdir, "/site/sub/deep") == 1, "nested prefix created");
}

void test_sibling_dirs_share_parent_creation(TestContext &t) {
    BuildDir site;
    site.write(QStringLiteral("a/x/1.txt"));
    site.write(QStringLiteral("a/y/2.txt"));
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addDir("/site");
    const DeployReport r = makeDeployer(baseConfig(site.path()), fs)->run();
    t.check(r.ok && r.uploaded == 2, "run succeeds");
    t.check(countOps(*fs, MockOp::Type::Mkdir, "/site/a") == 1, "common parent created once");
    t.check(countOps(*fs, MockOp::Type::Mkdir, "/site") == 0, "remote root not recreated");
    t.check(fs->hasFile("/site/a/x/1.txt") && fs->hasFile("/site/a/y/2.txt"),
            "both siblings populated");
}

void test_surviving_remote_dir_is_reused(TestContext &t) {
    BuildDir site;
    site.write(QStringLiteral("sub/new.txt"), "N");
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addFile("/site/sub/locked.txt");
    fs->failNext(MockOp::Type::RemoveFile, "/site/sub/locked.txt",
                 makeRemoteError(RemoteErrorKind::Protocol, "550 permission denied", 550));
    const DeployReport r = makeDeployer(baseConfig(site.path()), fs)->run();
    t.check(r.ok, "run succeeds");
    t.check(countOps(*fs, MockOp::Type::Mkdir, "/site/sub", true) == 0,
            "existing directory is not created again");
    t.check(fs->content("/site/sub/new.txt") == "N", "upload into the surviving directory works");
    t.check(r.failures.size() == 1 && hasFailure(r, QStringLiteral("/site/sub/locked.txt")),
            "only the delete failure is reported");
}

void test_vanished_file_is_skipped(TestContext &t) {
    BuildDir site;
    site.write(QStringLiteral("a.txt"));
    site.write(QStringLiteral("b.txt"));
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addDir("/site");
    auto d = makeDeployer(baseConfig(site.path()), fs);
    const QString victim = site.path() + QStringLiteral("/b.txt");
    QStringList skipped;
    QObject::connect(d.get(), &Deployer::itemUploaded, [victim](const QString &p) {
        if (p.endsWith(QLatin1String("/a.txt")))
            QFile::remove(victim);
    });
    QObject::connect(d.get(), &Deployer::itemSkipped,
                     [&skipped](const QString &p, const QString &) { skipped << p; });
    const DeployReport r = d->run();
    t.check(r.ok && r.skipped == 1, "vanished file is skipped, run succeeds");
    t.check(skipped == QStringList({QStringLiteral("b.txt")}), "itemSkipped emitted");
}

void test_missing_local_root_fails_before_connecting(TestContext &t) {
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addFile("/site/keep.txt");
    const DeployReport r =
        makeDeployer(baseConfig(QStringLiteral("/nonexistent/sitepush/build")), fs)->run();
    t.check(!r.ok && r.failedIn == DeployState::Disconnected, "run fails in Disconnected");
    t.check(fs->ops().empty(), "server is never contacted");
    t.check(fs->hasFile("/site/keep.txt"), "remote content untouched");
}

void test_connect_failure_is_fatal(TestContext &t) {
    BuildDir site;
    site.write(QStringLiteral("index.html"));
    auto fs = std::make_shared<MockRemoteFs>();
    fs->failNext(MockOp::Type::Connect, "",
                 makeRemoteError(RemoteErrorKind::Auth, "530 Login incorrect", 530));
    const DeployReport r = makeDeployer(baseConfig(site.path()), fs)->run();
    t.check(!r.ok && r.failedIn == DeployState::Disconnected, "auth failure is fatal");
    t.check(fs->count(MockOp::Type::Connect, false) == 1, "initial connect is not retried");
}

void test_cleanup_listing_failure_is_fatal(TestContext &t) {
    BuildDir site;
    site.write(QStringLiteral("index.html"));
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addDir("/site");
    fs->failNext(MockOp::Type::List, "/site",
                 makeRemoteError(RemoteErrorKind::Protocol, "425 no data connection", 425));
    const DeployReport r = makeDeployer(baseConfig(site.path()), fs)->run();
    t.check(!r.ok && r.failedIn == DeployState::RootEnsured, "listing failure is fatal");
    t.check(fs->uploads().empty(), "nothing uploaded");
}

// ---- configuration ----

void test_config_precedence(TestContext &t) {
    QTemporaryDir dir;
    const QString ini = dir.filePath(QStringLiteral("sitepush.ini"));
    {
        QFile f(ini);
        t.check(f.open(QIODevice::WriteOnly), "write ini");
        f.write("[server]\n"
                "host=ini.test\n"
                "port=2121\n"
                "username=ini-user\n"
                "[deploy]\n"
                "remote_dir=/from-ini/\n"
                "build_dir=/tmp/build\n"
                "exclusions=.htaccess, uploads\n");
    }
    QProcessEnvironment env;
    env.insert(QStringLiteral("SITEPUSH_HOST"), QStringLiteral("env.test"));
    env.insert(QStringLiteral("SITEPUSH_USERNAME"), QStringLiteral("env-user"));
    env.insert(QStringLiteral("SITEPUSH_PASSWORD"), QStringLiteral("pw"));

    QCommandLineParser parser;
    addCommandLineOptions(parser);
    t.check(parser.parse({QStringLiteral("sitepush"), QStringLiteral("--config"), ini,
                          QStringLiteral("--username"), QStringLiteral("cli-user"),
                          QStringLiteral("-v")}),
            "command line parses");

    DeployConfig cfg;
    QString err;
    t.check(loadDeployConfig(parser, env, cfg, err), "configuration loads");
    t.check(cfg.host == QLatin1String("env.test"), "environment overrides the INI file");
    t.check(cfg.username == QLatin1String("cli-user"), "command line overrides the environment");
    t.check(cfg.port == 2121, "INI value kept when nothing overrides it");
    t.check(cfg.password == QLatin1String("pw"), "password from the environment");
    t.check(cfg.remoteDir == QLatin1String("/from-ini"), "remote dir normalized");
    t.check(cfg.exclusions == QStringList({QStringLiteral(".htaccess"), QStringLiteral("uploads")}),
            "comma separated exclusions survive INI parsing");
    t.check(cfg.verbose, "verbose flag");
    t.check(cfg.entryDocument == QLatin1String("index.html") && cfg.timeoutSec == 60,
            "defaults fill the rest");
}

void test_config_defaults_and_validation(TestContext &t) {
    DeployConfig cfg = baseConfig(QStringLiteral("/tmp/build"));
    QString err;

    cfg.port = 0;
    t.check(validateConfig(cfg, err) && cfg.port == 21, "ftp defaults to port 21");
    cfg.port = 0;
    cfg.protocol = Protocol::Sftp;
    t.check(validateConfig(cfg, err) && cfg.port == 22, "sftp defaults to port 22");

    DeployConfig bad = baseConfig(QStringLiteral("/tmp/build"));
    bad.host.clear();
    t.check(!validateConfig(bad, err) && err.contains(QLatin1String("host")),
            "missing host is reported");

    bad = baseConfig(QStringLiteral("/tmp/build"));
    bad.port = 70000;
    t.check(!validateConfig(bad, err), "port above 65535 rejected");

    bad = baseConfig(QStringLiteral("/tmp/build"));
    bad.timeoutSec = 0;
    t.check(!validateConfig(bad, err), "non-positive timeout rejected");

    bad = baseConfig(QString());
    t.check(!validateConfig(bad, err) && err.contains(QLatin1String("build_dir")),
            "missing build dir is reported");

    DeployConfig envCfg;
    QProcessEnvironment env;
    env.insert(QStringLiteral("SITEPUSH_PROTOCOL"), QStringLiteral("gopher"));
    t.check(!applyEnvironment(env, envCfg, err) && err.contains(QLatin1String("SITEPUSH_PROTOCOL")),
            "unknown protocol names its source");
    env.clear();
    env.insert(QStringLiteral("SITEPUSH_SECURE"), QStringLiteral("maybe"));
    t.check(!applyEnvironment(env, envCfg, err), "invalid boolean rejected");
    env.clear();
    env.insert(QStringLiteral("SITEPUSH_PORT"), QStringLiteral("ftp"));
    t.check(!applyEnvironment(env, envCfg, err), "non-numeric port rejected");

    const SessionOptions opt = cfg.toSessionOptions();
    t.check(opt.protocol == Protocol::Sftp && opt.port == 22 && opt.host == "example.test" &&
                opt.password && *opt.password == "secret" && opt.timeout_sec == 60,
            "session options mirror the configuration");
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    TestContext t;

    test_parse_exclusions(t);
    test_is_excluded(t);
    test_scanner_prunes_excluded_dirs(t);
    test_scanner_fails_on_unreadable_dir(t);
    test_qt_scanner_on_disk(t);
    test_reconciler_preserves_exclusions(t);
    test_reconciler_listing_failure_is_fatal(t);
    test_session_reconnects_and_restores_root(t);
    test_session_no_retry_on_protocol_error(t);
    test_basic_deploy_orders_entry_last(t);
    test_htaccess_is_preserved(t);
    test_excluded_uploads_dir(t);
    test_no_entry_document(t);
    test_nested_index_is_regular(t);
    test_custom_entry_document(t);
    test_connection_loss_recovers(t);
    test_failed_reconnect_consumes_attempt(t);
    test_retries_exhausted_on_entry_is_fatal(t);
    test_retries_exhausted_on_regular_file_is_not_fatal(t);
    test_protocol_error_on_regular_file_is_not_fatal(t);
    test_protocol_error_on_entry_is_fatal(t);
    test_keepalive_every_tenth_upload(t);
    test_keepalive_after_idle_interval(t);
    test_keepalive_failure_is_swallowed(t);
    test_delete_failure_is_not_fatal(t);
    test_remote_root_is_created(t);
    test_remote_root_failure_is_fatal(t);
    test_parent_dirs_created_once(t);
    test_sibling_dirs_share_parent_creation(t);
    test_surviving_remote_dir_is_reused(t);
    test_vanished_file_is_skipped(t);
    test_missing_local_root_fails_before_connecting(t);
    test_connect_failure_is_fatal(t);
    test_cleanup_listing_failure_is_fatal(t);
    test_config_precedence(t);
    test_config_defaults_and_validation(t);

    if (t.failures > 0) {
        std::cerr << t.failures << " test(s) failed\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] sitepush_deploy_tests\n";
    return EXIT_SUCCESS;
}
