#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include <nlohmann/json.hpp>

#include "common/config.hpp"

using tfscope::ScopeConfig;

class ConfigTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void cleanup();
    void testDefaults();
    void testFromJson();
    void testInvalidValuesFallBack();
    void testLoadFromFile();
    void testMissingOrBrokenFile();
    void testEnvironmentOverrides();

private:
    QString writeConfig(const QByteArray &contents);

    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void ConfigTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void ConfigTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void ConfigTests::cleanup()
{
    qunsetenv("TFSCOPE_POLL_INTERVAL_MS");
    qunsetenv("TFSCOPE_WORKER_THREADS");
    qunsetenv("TFSCOPE_TRACE");
}

QString ConfigTests::writeConfig(const QByteArray &contents)
{
    const QString path = m_tempDir.filePath(QStringLiteral("config.json"));
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return QString();
    }
    file.write(contents);
    return path;
}

void ConfigTests::testDefaults()
{
    const ScopeConfig config;
    QCOMPARE(config.pollIntervalMs, 2500);
    QCOMPARE(config.interactivePreload, false);
    QCOMPARE(config.workerThreads, 0);
    QCOMPARE(config.recordCacheSize, 32);
    QCOMPARE(config.progressEvery, 10);
    QCOMPARE(config.maxCorruptRetries, 3);
    QVERIFY(tfscope::defaultConfigPath().endsWith(QStringLiteral("/.config/tfscope/config.json")));
}

void ConfigTests::testFromJson()
{
    const ScopeConfig config = tfscope::configFromJson(nlohmann::json{
        {"pollIntervalMs", 500},
        {"interactivePreload", true},
        {"workerThreads", 4},
        {"maxCorruptRetries", 0},
        {"unknownKey", "ignored"},
    });
    QCOMPARE(config.pollIntervalMs, 500);
    QCOMPARE(config.interactivePreload, true);
    QCOMPARE(config.workerThreads, 4);
    QCOMPARE(config.maxCorruptRetries, 0);
    QCOMPARE(config.recordCacheSize, 32);

    const nlohmann::json dumped = tfscope::configToJson(config);
    QCOMPARE(dumped.value("pollIntervalMs", 0), 500);
    QCOMPARE(dumped.value("interactivePreload", false), true);
}

void ConfigTests::testInvalidValuesFallBack()
{
    const ScopeConfig config = tfscope::configFromJson(nlohmann::json{
        {"pollIntervalMs", -5},
        {"workerThreads", -1},
        {"recordCacheSize", 0},
        {"progressEvery", "often"},
        {"maxCorruptRetries", -2},
    });
    const ScopeConfig defaults;
    QCOMPARE(config.pollIntervalMs, defaults.pollIntervalMs);
    QCOMPARE(config.workerThreads, defaults.workerThreads);
    QCOMPARE(config.recordCacheSize, defaults.recordCacheSize);
    QCOMPARE(config.progressEvery, defaults.progressEvery);
    QCOMPARE(config.maxCorruptRetries, defaults.maxCorruptRetries);

    QCOMPARE(tfscope::configFromJson(nlohmann::json::array()).pollIntervalMs, defaults.pollIntervalMs);
}

void ConfigTests::testLoadFromFile()
{
    const QString path = writeConfig(R"({"pollIntervalMs": 750, "progressEvery": 3})");
    QVERIFY(!path.isEmpty());

    const ScopeConfig config = tfscope::loadConfig(path);
    QCOMPARE(config.pollIntervalMs, 750);
    QCOMPARE(config.progressEvery, 3);
}

void ConfigTests::testMissingOrBrokenFile()
{
    const ScopeConfig defaults;
    QCOMPARE(tfscope::loadConfig(m_tempDir.filePath(QStringLiteral("absent.json"))).pollIntervalMs,
             defaults.pollIntervalMs);

    const QString path = writeConfig("{ not json");
    QVERIFY(!path.isEmpty());
    QCOMPARE(tfscope::loadConfig(path).pollIntervalMs, defaults.pollIntervalMs);
}

void ConfigTests::testEnvironmentOverrides()
{
    const QString path = writeConfig(R"({"pollIntervalMs": 750, "workerThreads": 2})");
    QVERIFY(!path.isEmpty());

    qputenv("TFSCOPE_POLL_INTERVAL_MS", "100");
    qputenv("TFSCOPE_WORKER_THREADS", "6");
    qputenv("TFSCOPE_TRACE", "1");
    const ScopeConfig config = tfscope::loadConfig(path);
    QCOMPARE(config.pollIntervalMs, 100);
    QCOMPARE(config.workerThreads, 6);
    QVERIFY(config.traceLogging);

    qputenv("TFSCOPE_POLL_INTERVAL_MS", "soon");
    qputenv("TFSCOPE_TRACE", "0");
    const ScopeConfig ignored = tfscope::loadConfig(path);
    QCOMPARE(ignored.pollIntervalMs, 750);
    QVERIFY(!ignored.traceLogging);
}

QTEST_GUILESS_MAIN(ConfigTests)
#include "test_config.moc"
