#include <gtest/gtest.h>
#include "fakes.h"
#include "plate_fusion.h"
#include <opencv2/imgproc.hpp>

namespace {

cv::Mat vehicle_crop() {
    cv::Mat crop(60, 120, CV_8UC3, cv::Scalar(200, 200, 200));
    cv::rectangle(crop, cv::Rect(20, 20, 80, 20), cv::Scalar(10, 10, 10), cv::FILLED);
    return crop;
}

Track track_with_id(int id) {
    Track t;
    t.id = id;
    return t;
}

} // namespace

TEST(PlateFusion, CadenceDependsOnSpeed) {
    FakeRecognizer ocr;
    PlateFusion fusion(ocr, PlateConfig{});
    EXPECT_EQ(fusion.cadence_for(0.0), 5);
    EXPECT_EQ(fusion.cadence_for(39.9), 5);
    EXPECT_EQ(fusion.cadence_for(40.0), 10);
    EXPECT_TRUE(fusion.should_recognize(20.0, 15));
    EXPECT_FALSE(fusion.should_recognize(60.0, 15));
    EXPECT_TRUE(fusion.should_recognize(60.0, 20));
}

TEST(PlateFusion, NormalizeKeepsAsciiAlnum) {
    EXPECT_EQ(PlateFusion::normalize_text(" AB-12 3\xD0\x96x "), "AB123x");
}

TEST(PlateFusion, RejectsImplausibleTextEvenWithHighConfidence) {
    FakeRecognizer ocr;
    PlateFusion fusion(ocr, PlateConfig{});
    EXPECT_FALSE(fusion.select_best({make_candidate("AB1", 0.99)}));
    EXPECT_FALSE(fusion.select_best({make_candidate("ABCDEF", 0.99)}));
    EXPECT_FALSE(fusion.select_best({make_candidate("123456", 0.99)}));
    EXPECT_FALSE(fusion.select_best({make_candidate("AB-1", 0.99)}));
    EXPECT_TRUE(fusion.select_best({make_candidate("AB12", 0.99)}));
}

TEST(PlateFusion, RejectsLowConfidenceAndPicksHighest) {
    FakeRecognizer ocr;
    PlateFusion fusion(ocr, PlateConfig{});
    EXPECT_FALSE(fusion.select_best({make_candidate("XYZ789", 0.4)}));

    const auto best = fusion.select_best({
            make_candidate("ABC123", 0.6),
            make_candidate("ABC 128", 0.8),
            make_candidate("ZZZ", 0.95),
    });
    ASSERT_TRUE(best);
    EXPECT_EQ(best->text, "ABC128");
    EXPECT_DOUBLE_EQ(best->confidence, 0.8);
}

TEST(PlateFusion, VariantsAreUpscaledGrayAndBinary) {
    FakeRecognizer ocr;
    PlateFusion fusion(ocr, PlateConfig{});
    const PlateFusion::Variants v = fusion.make_variants(vehicle_crop());
    EXPECT_NEAR(v.scale, 100.0 / 60.0, 1e-9);
    EXPECT_EQ(v.enhanced.type(), CV_8UC1);
    EXPECT_EQ(v.binary.type(), CV_8UC1);
    EXPECT_EQ(v.enhanced.size(), v.binary.size());
    EXPECT_GE(v.enhanced.rows, 100);
}

TEST(PlateFusion, QuadIsMappedBackToCropCoordinates) {
    FakeRecognizer ocr;
    ocr.candidates = {make_candidate("ABC123", 0.9)};
    PlateFusion fusion(ocr, PlateConfig{});
    const RecognitionResult r = fusion.recognize(vehicle_crop());
    ASSERT_EQ(r.status, RecognitionStatus::Ok);
    ASSERT_EQ(r.candidates.size(), 2u);  // enhanced + binary
    EXPECT_EQ(ocr.calls, 2);
    EXPECT_NEAR(r.candidates[0].quad[1].x, 90.0 * 60.0 / 100.0, 1e-3);
}

TEST(PlateFusion, OffCadenceFramesReturnCache) {
    FakeRecognizer ocr;
    ocr.candidates = {make_candidate("ABC123", 0.9)};
    PlateFusion fusion(ocr, PlateConfig{});
    Track t = track_with_id(1);

    const PlateFusion::Outcome miss = fusion.resolve(t, 20.0, 4, vehicle_crop());
    EXPECT_FALSE(miss.invoked);
    EXPECT_FALSE(miss.plate);

    const PlateFusion::Outcome hit = fusion.resolve(t, 20.0, 5, vehicle_crop());
    EXPECT_TRUE(hit.invoked);
    EXPECT_TRUE(hit.fresh);
    ASSERT_TRUE(hit.plate);
    EXPECT_EQ(hit.plate->text, "ABC123");

    ocr.calls = 0;
    const PlateFusion::Outcome cached = fusion.resolve(t, 20.0, 6, vehicle_crop());
    EXPECT_EQ(ocr.calls, 0);
    EXPECT_FALSE(cached.fresh);
    ASSERT_TRUE(cached.plate);
    EXPECT_EQ(cached.plate->text, "ABC123");
}

TEST(PlateFusion, EngineFailureYieldsNoPlateOnThatFrame) {
    FakeRecognizer ocr;
    ocr.candidates = {make_candidate("ABC123", 0.9)};
    PlateFusion fusion(ocr, PlateConfig{});
    Track t = track_with_id(1);
    fusion.resolve(t, 20.0, 5, vehicle_crop());

    ocr.fail = true;
    const PlateFusion::Outcome failed = fusion.resolve(t, 20.0, 10, vehicle_crop());
    EXPECT_TRUE(failed.invoked);
    EXPECT_EQ(failed.status, RecognitionStatus::EngineFailure);
    EXPECT_FALSE(failed.plate);

    ocr.fail = false;
    ocr.throw_error = true;
    const PlateFusion::Outcome thrown = fusion.resolve(t, 20.0, 15, vehicle_crop());
    EXPECT_EQ(thrown.status, RecognitionStatus::EngineFailure);
    EXPECT_FALSE(thrown.plate);

    // кеш не тронут и снова отдаётся на кадре без OCR
    const PlateFusion::Outcome skipped = fusion.resolve(t, 20.0, 16, vehicle_crop());
    EXPECT_FALSE(skipped.invoked);
    ASSERT_TRUE(skipped.plate);
    EXPECT_EQ(skipped.plate->text, "ABC123");
}

TEST(PlateFusion, NoCandidateYieldsNoPlateOnThatFrame) {
    FakeRecognizer ocr;
    ocr.candidates = {make_candidate("ABC123", 0.9)};
    PlateFusion fusion(ocr, PlateConfig{});
    Track t = track_with_id(1);
    fusion.resolve(t, 20.0, 5, vehicle_crop());

    ocr.candidates.clear();
    const PlateFusion::Outcome out = fusion.resolve(t, 20.0, 10, vehicle_crop());
    EXPECT_EQ(out.status, RecognitionStatus::NoCandidate);
    EXPECT_FALSE(out.plate);

    ocr.candidates = {make_candidate("AB1", 0.99)};
    const PlateFusion::Outcome rejected = fusion.resolve(t, 20.0, 15, vehicle_crop());
    EXPECT_TRUE(rejected.invoked);
    EXPECT_FALSE(rejected.plate);

    const PlateFusion::Outcome skipped = fusion.resolve(t, 20.0, 17, vehicle_crop());
    ASSERT_TRUE(skipped.plate);
    EXPECT_EQ(skipped.plate->text, "ABC123");
}

TEST(PlateFusion, CachedPlateExpiresWithItsHistorySample) {
    FakeRecognizer ocr;
    ocr.candidates = {make_candidate("ABC123", 0.9)};
    PlateFusion fusion(ocr, PlateConfig{});
    Track t = track_with_id(1);

    auto push = [&t](int frame) {
        PositionSample s;
        s.frame_index = frame;
        s.timestamp = frame / 30.0;
        t.history.push_back(s);
    };

    push(5);
    const PlateFusion::Outcome hit = fusion.resolve(t, 20.0, 5, vehicle_crop());
    ASSERT_TRUE(hit.plate);
    EXPECT_EQ(hit.plate->frame_index, 5);

    // ещё 14 сэмплов: кадр 5 остаётся самым старым в истории
    for (int f = 6; f <= 19; ++f) {
        push(f);
    }
    EXPECT_EQ(t.history.front().frame_index, 5);
    const PlateFusion::Outcome kept = fusion.resolve(t, 20.0, 19, vehicle_crop());
    ASSERT_TRUE(kept.plate);
    EXPECT_EQ(kept.plate->text, "ABC123");

    push(21);
    EXPECT_EQ(t.history.front().frame_index, 6);
    const PlateFusion::Outcome expired = fusion.resolve(t, 20.0, 21, vehicle_crop());
    EXPECT_FALSE(expired.invoked);
    EXPECT_FALSE(expired.plate);
    EXPECT_FALSE(t.plate);
}

TEST(PlateFusion, LaterAcceptedReadReplacesHigherConfidenceCache) {
    FakeRecognizer ocr;
    ocr.candidates = {make_candidate("ABC123", 0.95)};
    PlateFusion fusion(ocr, PlateConfig{});
    Track t = track_with_id(1);
    fusion.resolve(t, 20.0, 5, vehicle_crop());

    ocr.candidates = {make_candidate("ABC128", 0.5)};
    const PlateFusion::Outcome out = fusion.resolve(t, 20.0, 10, vehicle_crop());
    ASSERT_TRUE(out.plate);
    EXPECT_EQ(out.plate->text, "ABC128");
    EXPECT_DOUBLE_EQ(out.plate->confidence, 0.5);
}

TEST(PlateFusion, EmptyCropSkipsEngine) {
    FakeRecognizer ocr;
    PlateFusion fusion(ocr, PlateConfig{});
    Track t = track_with_id(1);
    const PlateFusion::Outcome out = fusion.resolve(t, 20.0, 5, cv::Mat());
    EXPECT_FALSE(out.invoked);
    EXPECT_EQ(ocr.calls, 0);
}
