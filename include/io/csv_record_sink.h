#pragma once
#include <fstream>
#include <string>
#include "detection_record.h"

// CSV: заголовок + одна строка на запись.
// frame_number,vehicle_id,speed,license_plate,license_plate_confidence,is_overspeed,
// x1,y1,x2,y2,confidence,vehicle_class,timestamp
class CsvRecordSink : public RecordSink {
public:
    explicit CsvRecordSink(std::string path, char separator = ',');
    ~CsvRecordSink() override;

    void open() override;
    void write(const DetectionRecord &record) override;
    void flush() override;
    void close() override;

    // Строка CSV без перевода строки.
    static std::string format_row(const DetectionRecord &record, char separator);
    static std::string header(char separator);

private:
    std::string path_;
    char sep_ = ',';
    std::ofstream out_;
    std::size_t rows_ = 0;
};
