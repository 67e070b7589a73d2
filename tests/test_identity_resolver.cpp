#include <gtest/gtest.h>
#include "identity_resolver.h"

namespace {

// Резолвер + запись позиции в историю, как это делает оценщик скорости.
int observe(IdentityResolver &resolver, TrackStore &store, cv::Point2f c, int frame) {
    const int id = resolver.resolve(c, frame);
    PositionSample s;
    s.position = c;
    s.frame_index = frame;
    s.timestamp = frame / 30.0;
    store.find(id)->history.push_back(s);
    return id;
}

} // namespace

TEST(IdentityResolver, SubGateMotionKeepsIdentity) {
    TrackerConfig cfg;
    TrackStore store(cfg);
    IdentityResolver resolver(store, cfg);

    const int id = observe(resolver, store, {100, 100}, 1);
    for (int f = 2; f <= 10; ++f) {
        store.age_out(f);
        EXPECT_EQ(observe(resolver, store, {100.0f, 100.0f + 20.0f * (f - 1)}, f), id);
    }
    EXPECT_EQ(store.active().size(), 1u);
}

TEST(IdentityResolver, DistanceAtGateCreatesNewTrack) {
    TrackerConfig cfg;
    TrackStore store(cfg);
    IdentityResolver resolver(store, cfg);

    const int a = observe(resolver, store, {100, 100}, 1);
    const IdentityResolver::Binding b = resolver.bind({150, 100}, 2);
    EXPECT_NE(b.id, a);
    EXPECT_EQ(b.kind, IdentityResolver::Binding::Kind::Created);
}

TEST(IdentityResolver, NearestActiveTrackWins) {
    TrackerConfig cfg;
    TrackStore store(cfg);
    IdentityResolver resolver(store, cfg);

    const int a = observe(resolver, store, {100, 100}, 1);
    const int b = observe(resolver, store, {160, 100}, 1);
    ASSERT_NE(a, b);
    const IdentityResolver::Binding m = resolver.bind({140, 100}, 2);
    EXPECT_EQ(m.id, b);
    EXPECT_EQ(m.kind, IdentityResolver::Binding::Kind::Matched);
    EXPECT_FLOAT_EQ(m.distance_px, 20.0f);
}

TEST(IdentityResolver, DormantTrackRevivedInsideGate) {
    TrackerConfig cfg;
    TrackStore store(cfg);
    IdentityResolver resolver(store, cfg);

    const int id = observe(resolver, store, {300, 200}, 1);
    store.age_out(40);
    ASSERT_TRUE(store.is_dormant(id));

    const IdentityResolver::Binding b = resolver.bind({320, 210}, 40);
    EXPECT_EQ(b.id, id);
    EXPECT_EQ(b.kind, IdentityResolver::Binding::Kind::Revived);
    EXPECT_TRUE(store.is_active(id));
    EXPECT_TRUE(store.find(id)->history.empty());
}

TEST(IdentityResolver, DormantTrackOutsideGateGetsNewId) {
    TrackerConfig cfg;
    TrackStore store(cfg);
    IdentityResolver resolver(store, cfg);

    const int id = observe(resolver, store, {300, 200}, 1);
    store.age_out(40);

    const int other = resolver.resolve({400, 200}, 40);
    EXPECT_NE(other, id);
    EXPECT_TRUE(store.is_dormant(id));
}

TEST(IdentityResolver, CloseDetectionsBindToSameTrack) {
    TrackerConfig cfg;
    TrackStore store(cfg);
    IdentityResolver resolver(store, cfg);

    observe(resolver, store, {100, 100}, 1);
    const int a = observe(resolver, store, {100, 110}, 2);
    const int b = observe(resolver, store, {105, 110}, 2);
    EXPECT_EQ(a, b);
    EXPECT_EQ(store.active().size(), 1u);
}
