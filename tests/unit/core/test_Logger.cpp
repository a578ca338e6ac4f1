#include <QtTest>
#include "core/Logger.hpp"

class TestLogger : public QObject {
    Q_OBJECT

private slots:
    void initTestCase() {
        // Ensure clean state
        cal::Logger::shutdown();
    }

    void testInitialization() {
        cal::Logger::init("cal_test", true);
        QVERIFY(cal::Logger::get() != nullptr);
        QCOMPARE(cal::Logger::get()->level(), spdlog::level::debug);

        LOG_INFO("Test info message");
        LOG_WARN("Test warn message");
        LOG_ERROR("Test error message");

        cal::Logger::shutdown();
    }

    void testDoubleInit() {
        cal::Logger::init("cal_test", true);
        cal::Logger::init("cal_test", false);
        QVERIFY(cal::Logger::get() != nullptr);
        QCOMPARE(cal::Logger::get()->level(), spdlog::level::info);
        cal::Logger::shutdown();
    }

    void testWithoutConsole() {
        cal::Logger::init("cal_test", false, false);
        QVERIFY(cal::Logger::get() != nullptr);
        LOG_INFO("File only");
        cal::Logger::shutdown();
    }

    void testLazyInit() {
        cal::Logger::shutdown();
        QVERIFY(cal::Logger::get() != nullptr);
        cal::Logger::shutdown();
    }
};

int runTestLogger(int argc, char** argv) {
    TestLogger tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_Logger.moc"
