#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include "io/csv_record_sink.h"

namespace {

DetectionRecord sample_record() {
    DetectionRecord r;
    r.frame_number = 12;
    r.vehicle_id = 3;
    r.speed = 85.456;
    r.license_plate = "AB123CD";
    r.license_plate_confidence = 0.8765;
    r.is_overspeed = true;
    r.x1 = 10;
    r.y1 = 20;
    r.x2 = 110;
    r.y2 = 80;
    r.confidence = 0.9f;
    r.vehicle_class = "car";
    r.timestamp = 0.4;
    return r;
}

} // namespace

TEST(CsvRecordSink, HeaderColumns) {
    EXPECT_EQ(CsvRecordSink::header(','),
              "frame_number,vehicle_id,speed,license_plate,license_plate_confidence,is_overspeed,"
              "x1,y1,x2,y2,confidence,vehicle_class,timestamp");
}

TEST(CsvRecordSink, RowFormatting) {
    EXPECT_EQ(CsvRecordSink::format_row(sample_record(), ','),
              "12,3,85.46,AB123CD,0.88,True,10,20,110,80,0.90,car,0.4000");
}

TEST(CsvRecordSink, FieldsWithSeparatorAreQuoted) {
    DetectionRecord r = sample_record();
    r.license_plate = "A,B";
    r.is_overspeed = false;
    const std::string row = CsvRecordSink::format_row(r, ',');
    EXPECT_NE(row.find(",\"A,B\","), std::string::npos);
    EXPECT_NE(row.find(",False,"), std::string::npos);
}

TEST(CsvRecordSink, WritesFile) {
    const std::string path = ::testing::TempDir() + "speed_tracker_records.csv";
    {
        CsvRecordSink sink(path);
        sink.open();
        sink.write(sample_record());
        sink.write(sample_record());
        sink.flush();
        sink.close();
    }
    std::ifstream in(path);
    ASSERT_TRUE(in.is_open());
    std::string line;
    int lines = 0;
    while (std::getline(in, line)) ++lines;
    EXPECT_EQ(lines, 3);
    std::remove(path.c_str());
}

TEST(CsvRecordSink, OpenFailureThrows) {
    CsvRecordSink sink("/nonexistent-dir/records.csv");
    EXPECT_THROW(sink.open(), std::runtime_error);
}

TEST(CsvRecordSink, WriteBeforeOpenThrows) {
    CsvRecordSink sink(::testing::TempDir() + "never_opened.csv");
    EXPECT_THROW(sink.write(sample_record()), std::runtime_error);
}
