#include <gtest/gtest.h>
#include "fakes.h"
#include "record_emitter.h"

TEST(RecordEmitter, MakeRecordFillsAllFields) {
    Detection det;
    det.bbox = cv::Rect2f(10.7f, 20.2f, 100.0f, 50.0f);
    det.class_id = 7;
    det.confidence = 0.75f;
    PlateRead plate;
    plate.text = "ABC123";
    plate.confidence = 0.66;

    const DetectionRecord r = RecordEmitter::make_record(15, 30.0, 4, det, 91.5, true, plate);
    EXPECT_EQ(r.frame_number, 15);
    EXPECT_EQ(r.vehicle_id, 4);
    EXPECT_DOUBLE_EQ(r.speed, 91.5);
    EXPECT_EQ(r.license_plate, "ABC123");
    EXPECT_DOUBLE_EQ(r.license_plate_confidence, 0.66);
    EXPECT_TRUE(r.is_overspeed);
    EXPECT_EQ(r.x1, 10);
    EXPECT_EQ(r.y1, 20);
    EXPECT_EQ(r.x2, 110);
    EXPECT_EQ(r.y2, 70);
    EXPECT_FLOAT_EQ(r.confidence, 0.75f);
    EXPECT_EQ(r.vehicle_class, "truck");
    EXPECT_DOUBLE_EQ(r.timestamp, 0.5);
}

TEST(RecordEmitter, MissingPlateIsUnknown) {
    const DetectionRecord r = RecordEmitter::make_record(1, 30.0, 1, make_vehicle({50, 50}), 10.0, false,
                                                         std::nullopt);
    EXPECT_EQ(r.license_plate, "unknown");
    EXPECT_DOUBLE_EQ(r.license_plate_confidence, 0.0);
}

TEST(RecordEmitter, OnlyPositiveSpeedIsEmitted) {
    MemoryRecordSink sink;
    RecordEmitter emitter(&sink, nullptr);
    DetectionRecord r;
    r.speed = 0.0;
    EXPECT_FALSE(emitter.emit(r));
    r.speed = 12.0;
    EXPECT_TRUE(emitter.emit(r));
    EXPECT_EQ(emitter.count(), 1u);
    ASSERT_EQ(sink.rows.size(), 1u);
    EXPECT_DOUBLE_EQ(sink.rows[0].speed, 12.0);
}

TEST(RecordEmitter, ReportsFrameProgress) {
    double pct = -5.0;
    std::string msg;
    RecordEmitter emitter(nullptr, [&](double p, const std::string &m) {
        pct = p;
        msg = m;
    });
    emitter.report_progress(25, 100);
    EXPECT_DOUBLE_EQ(pct, 25.0);
    EXPECT_EQ(msg, "Processing frame 25/100");

    emitter.report_progress(3, 0);
    EXPECT_DOUBLE_EQ(pct, 0.0);
    EXPECT_EQ(msg, "Processing frame 3/0");
}
