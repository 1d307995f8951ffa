#include <QtTest>
#include <QSignalSpy>
#include "core/airplay/ProcessCapturePipeline.hpp"

using adk::airplay::PipelineSettings;
using adk::airplay::ProcessCapturePipeline;

static PipelineSettings shell(const QString& script, int graceMs = 50)
{
    PipelineSettings s;
    s.program = "/bin/sh";
    s.arguments = {"-c", script};
    s.readyGraceMs = graceMs;
    return s;
}

class TestProcessCapturePipeline : public QObject {
    Q_OBJECT

private slots:
    void expandsPlaceholders()
    {
        PipelineSettings s;
        s.arguments = {"host={address}", "port={port}", "video/x-raw,width={width},height={height}",
                       "framerate={fps}/1"};
        s.width = 1280;
        s.height = 800;
        s.fps = 60;
        ProcessCapturePipeline pipeline(s);

        QCOMPARE(pipeline.expandedArguments("10.0.0.5", 7000),
                 (QStringList{"host=10.0.0.5", "port=7000", "video/x-raw,width=1280,height=800",
                              "framerate=60/1"}));
    }

    void readyAfterGraceThenGracefulStop()
    {
        ProcessCapturePipeline pipeline(shell("sleep 10"));
        QSignalSpy ready(&pipeline, &ProcessCapturePipeline::ready);
        QSignalSpy stopped(&pipeline, &ProcessCapturePipeline::stopped);
        QSignalSpy failed(&pipeline, &ProcessCapturePipeline::failed);

        pipeline.start("10.0.0.5", 7000);
        QTRY_COMPARE(ready.count(), 1);
        QVERIFY(pipeline.isHealthy());

        pipeline.requestStop();
        QTRY_COMPARE_WITH_TIMEOUT(stopped.count(), 1, 3000);
        QVERIFY(!pipeline.isHealthy());
        QCOMPARE(failed.count(), 0);
    }

    void zeroGraceStillReportsReady()
    {
        ProcessCapturePipeline pipeline(shell("sleep 10", 0));
        QSignalSpy ready(&pipeline, &ProcessCapturePipeline::ready);

        pipeline.start("10.0.0.5", 7000);
        QTRY_COMPARE(ready.count(), 1);
        QVERIFY(pipeline.isHealthy());
        pipeline.kill();
    }

    void earlyExitIsFailureWithStderr()
    {
        ProcessCapturePipeline pipeline(shell("echo 'no such element ximagesrc' >&2; exit 3", 2000));
        QSignalSpy ready(&pipeline, &ProcessCapturePipeline::ready);
        QSignalSpy failed(&pipeline, &ProcessCapturePipeline::failed);

        pipeline.start("10.0.0.5", 7000);
        QTRY_COMPARE(failed.count(), 1);
        const QString diag = failed.first().first().toString();
        QVERIFY2(diag.contains("code 3"), qPrintable(diag));
        QVERIFY2(diag.contains("ximagesrc"), qPrintable(diag));
        QCOMPARE(ready.count(), 0);
    }

    void missingProgramFails()
    {
        PipelineSettings s;
        s.program = "/nonexistent/airdecky-capture";
        ProcessCapturePipeline pipeline(s);
        QSignalSpy failed(&pipeline, &ProcessCapturePipeline::failed);

        pipeline.start("10.0.0.5", 7000);
        QTRY_COMPARE(failed.count(), 1);
        QVERIFY(failed.first().first().toString().contains("Could not launch"));
    }

    void exitAfterReadyIsCrash()
    {
        ProcessCapturePipeline pipeline(shell("sleep 0.3; exit 1"));
        QSignalSpy ready(&pipeline, &ProcessCapturePipeline::ready);
        QSignalSpy exited(&pipeline, &ProcessCapturePipeline::exited);

        pipeline.start("10.0.0.5", 7000);
        QTRY_COMPARE(ready.count(), 1);
        QTRY_COMPARE_WITH_TIMEOUT(exited.count(), 1, 3000);
        QVERIFY(exited.first().first().toString().contains("code 1"));
    }

    void killEndsStubbornProcess()
    {
        ProcessCapturePipeline pipeline(shell("trap '' TERM; while true; do sleep 1; done"));
        QSignalSpy ready(&pipeline, &ProcessCapturePipeline::ready);
        QSignalSpy stopped(&pipeline, &ProcessCapturePipeline::stopped);

        pipeline.start("10.0.0.5", 7000);
        QTRY_COMPARE(ready.count(), 1);

        pipeline.requestStop();
        QTest::qWait(200);
        QCOMPARE(stopped.count(), 0);
        QVERIFY(pipeline.isHealthy());

        pipeline.kill();
        QTRY_COMPARE_WITH_TIMEOUT(stopped.count(), 1, 3000);
    }
};

QTEST_MAIN(TestProcessCapturePipeline)
#include "test_process_capture_pipeline.moc"
