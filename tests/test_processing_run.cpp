#include <gtest/gtest.h>
#include "fakes.h"
#include "processing_run.h"

#include <thread>

namespace {

VideoInfo test_video() {
    VideoInfo info;
    info.width = 1280;
    info.height = 720;
    info.fps = 10.0;
    info.total_frames = 10;
    return info;
}

struct RunParts {
    FakeFrameSource *source = nullptr;
    MemoryRecordSink *csv = nullptr;
    CountingFrameSink *video = nullptr;
    ProcessingRun::Resources resources;
};

RunParts make_parts() {
    RunParts p;
    auto source = std::make_unique<FakeFrameSource>(test_video(), 10);
    auto csv = std::make_unique<MemoryRecordSink>();
    auto video = std::make_unique<CountingFrameSink>();
    p.source = source.get();
    p.csv = csv.get();
    p.video = video.get();
    p.resources.source = std::move(source);
    p.resources.record_sink = std::move(csv);
    p.resources.video_sink = std::move(video);
    p.resources.detector = std::make_unique<ScriptedDetector>([](int frame) {
        const float y = 100.0f + 20.0f * (frame - 1);
        return std::vector<Detection>{make_vehicle({100.0f, y})};
    });
    p.resources.recognizer = std::make_unique<FakeRecognizer>();
    return p;
}

AppConfig quiet_config() {
    AppConfig cfg;
    cfg.logging.pipeline_level_logger = false;
    return cfg;
}

} // namespace

TEST(ProcessingRun, InitialStatusBeforeStart) {
    RunParts p = make_parts();
    ProcessingRun run("idle", quiet_config(), std::move(p.resources));
    const ProgressStatus st = run.progress();
    EXPECT_DOUBLE_EQ(st.percentage, 0.0);
    EXPECT_EQ(st.message, "Starting...");
    EXPECT_FALSE(run.finished());
}

TEST(ProcessingRun, CompletesAndReportsRecordCount) {
    RunParts p = make_parts();
    ProcessingRun run("ok", quiet_config(), std::move(p.resources));
    run.start();
    run.wait();

    ASSERT_TRUE(run.finished());
    const ProgressStatus st = run.progress();
    EXPECT_DOUBLE_EQ(st.percentage, 100.0);
    EXPECT_EQ(st.message, "Completed! Found 8 vehicle detections.");
    EXPECT_EQ(run.detection_count(), 8u);
    EXPECT_EQ(p.csv->rows.size(), 8u);
    EXPECT_EQ(p.csv->flushes, 1);
    EXPECT_TRUE(p.csv->closed);
    EXPECT_TRUE(p.video->closed);
    EXPECT_EQ(p.video->frames, 10);
    EXPECT_EQ(p.video->opened_with.width, 1280);
    EXPECT_TRUE(p.source->closed);
}

TEST(ProcessingRun, SourceOpenFailureIsTerminal) {
    RunParts p = make_parts();
    p.source->fail_open = true;
    ProcessingRun run("bad-source", quiet_config(), std::move(p.resources));
    run.run();

    ASSERT_TRUE(run.finished());
    const ProgressStatus st = run.progress();
    EXPECT_TRUE(st.failed());
    EXPECT_DOUBLE_EQ(st.percentage, -1.0);
    EXPECT_EQ(st.message, "Error: cannot open fake source");
    EXPECT_TRUE(p.csv->rows.empty());
    EXPECT_TRUE(p.source->closed);
}

TEST(ProcessingRun, RecordSinkOpenFailureIsTerminal) {
    RunParts p = make_parts();
    p.csv->fail_open = true;
    ProcessingRun run("bad-csv", quiet_config(), std::move(p.resources));
    run.start();
    run.wait();

    const ProgressStatus st = run.progress();
    EXPECT_TRUE(st.failed());
    EXPECT_EQ(st.message, "Error: cannot open fake csv");
    EXPECT_EQ(p.video->frames, 0);
}

TEST(ProcessingRun, MissingCollaboratorFails) {
    RunParts p = make_parts();
    p.resources.detector.reset();
    ProcessingRun run("no-detector", quiet_config(), std::move(p.resources));
    run.run();
    EXPECT_TRUE(run.progress().failed());
}

TEST(ProcessingRun, StartTwiceRunsOnce) {
    RunParts p = make_parts();
    ProcessingRun run("twice", quiet_config(), std::move(p.resources));
    run.start();
    run.start();
    run.wait();
    EXPECT_EQ(p.csv->rows.size(), 8u);
}

TEST(ProcessingRun, NonStandardExceptionIsTerminal) {
    RunParts p = make_parts();
    p.resources.detector = std::make_unique<ScriptedDetector>([](int frame) -> std::vector<Detection> {
        if (frame == 3) throw 42;
        return {};
    });
    ProcessingRun run("odd-throw", quiet_config(), std::move(p.resources));
    run.start();
    run.wait();

    ASSERT_TRUE(run.finished());
    const ProgressStatus st = run.progress();
    EXPECT_TRUE(st.failed());
    EXPECT_EQ(st.message, "Error: unknown error");
    EXPECT_TRUE(p.csv->closed);
    EXPECT_TRUE(p.video->closed);
    EXPECT_TRUE(p.source->closed);
}

TEST(ProcessingRun, WaitFromOtherThreadsWhileStarting) {
    RunParts p = make_parts();
    ProcessingRun run("shared", quiet_config(), std::move(p.resources));

    std::thread starter([&run] { run.start(); });
    std::thread waiter([&run] {
        while (!run.finished()) {
            run.wait();
            std::this_thread::yield();
        }
    });
    starter.join();
    waiter.join();
    run.wait();

    EXPECT_TRUE(run.finished());
    EXPECT_DOUBLE_EQ(run.progress().percentage, 100.0);
    EXPECT_EQ(p.csv->rows.size(), 8u);
}
