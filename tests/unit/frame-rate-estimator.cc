#include "common/Common.hh"
#include "overlay/FrameRateEstimator.hh"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <tests.hh>

namespace FrameRateEstimatorTests {
    using namespace testing;

    // Powers of two keep the window sums exact
    const float Frame64Hz = 1.0f / 64.0f;
    const float Frame32Hz = 1.0f / 32.0f;

    void TestSteadyFrameRate() {
        hud::FrameRateEstimator estimator(4, 0.5f, true, 1.0f / 60.0f, 0.0f);
        AssertEqual(estimator.Capacity(), 4u, "Unexpected window capacity");
        AssertNear(*estimator.CurrentFps(), 60.0, 0.001, "Seeded window should read 60 fps");

        double sumBefore = estimator.WindowSum();
        for (int i = 0; i < 10; i++) {
            AssertTrue(estimator.Sample(1.0f / 60.0f), "Valid sample was rejected");
            AssertEqual(estimator.WindowSum(), sumBefore, "Identical samples should leave the window sum unchanged");
        }
        AssertNear(*estimator.CurrentFps(), 60.0, 0.001, "Steady 60 fps samples should read 60 fps");
    }

    void TestOneSlowFrameAt60Hz() {
        hud::FrameRateEstimator estimator(4, 0.5f, true, 1.0f / 60.0f, 0.0f);
        estimator.Sample(1.0f / 30.0f);
        AssertNear(*estimator.CurrentFps(), 48.0, 0.001, "One 30 fps frame in a 60 fps window should read 48 fps");
    }

    void TestSlowFrameLowersAverage() {
        hud::FrameRateEstimator estimator(4, 0.5f, true, Frame64Hz, 0.0f);
        AssertEqual(*estimator.CurrentFps(), 64.0f, "Seeded window should read 64 fps");

        estimator.Sample(Frame32Hz);
        AssertEqual(estimator.WindowSum(), 5.0 / 64.0, "Window sum should include the slow frame");
        AssertNear(*estimator.CurrentFps(), 51.2, 0.0001, "One slow frame should pull the average down");

        for (int i = 0; i < 3; i++) {
            estimator.Sample(Frame32Hz);
        }
        AssertEqual(*estimator.CurrentFps(), 32.0f, "Window full of slow frames should read 32 fps");

        estimator.Sample(Frame64Hz);
        AssertNear(*estimator.CurrentFps(), 4.0 / (3.0 / 32.0 + 1.0 / 64.0), 0.0001, "Oldest slow frame evicted");
    }

    void TestWindowSumMatchesContents() {
        hud::FrameRateEstimator estimator(5, 0.5f, false, 0.02f, 0.0f);
        float durations[] = {0.01f, 0.033f, 0.016f, 0.1f, 0.008f, 0.05f, 0.02f, 0.04f};
        for (auto duration : durations) {
            estimator.Sample(duration);

            double expected = 0.0;
            for (auto sample : estimator.Window()) {
                expected += sample;
            }
            AssertNear(estimator.WindowSum(), expected, 1e-9, "Window sum drifted from the window contents");
        }
        AssertEqual(estimator.Window().size(), 5u, "Window size should never change");
    }

    void TestInvalidSamplesIgnored() {
        hud::FrameRateEstimator estimator(4, 0.5f, true, Frame64Hz, 0.0f);
        auto sum = estimator.WindowSum();

        AssertTrue(!estimator.Sample(-0.1f), "Negative sample should be rejected");
        AssertTrue(!estimator.Sample(std::numeric_limits<float>::quiet_NaN()), "NaN sample should be rejected");
        AssertTrue(!estimator.Sample(std::numeric_limits<float>::infinity()), "Infinite sample should be rejected");
        AssertEqual(estimator.WindowSum(), sum, "Rejected samples should not change the window");

        AssertTrue(estimator.Sample(0.0f), "Zero sample should be accepted");
        AssertEqual(estimator.WindowSum(), 3.0 / 64.0, "Zero sample should replace the oldest entry");
    }

    void TestInvalidConstruction() {
        AssertThrows<std::invalid_argument>(
            [] {
                hud::FrameRateEstimator estimator(0, 0.5f, true, Frame64Hz, 0.0f);
            },
            "Zero capacity should throw");
        AssertThrows<std::invalid_argument>(
            [] {
                hud::FrameRateEstimator estimator(-1, 0.5f, true, Frame64Hz, 0.0f);
            },
            "Negative capacity should throw");
        AssertThrows<std::invalid_argument>(
            [] {
                hud::FrameRateEstimator estimator(4, -0.1f, true, Frame64Hz, 0.0f);
            },
            "Negative publish interval should throw");

        hud::FrameRateEstimator estimator(1, 0.0f, true, Frame64Hz, 0.0f);
        AssertEqual(estimator.Capacity(), 1u, "Capacity of 1 should be allowed");
    }

    void TestZeroSumHasNoFrameRate() {
        hud::FrameRateEstimator estimator(4, 0.5f, true, 0.0f, 0.0f);
        AssertTrue(!estimator.CurrentFps(), "Empty window should not have a frame rate");

        auto published = estimator.MaybePublish(0.5f);
        AssertTrue(published.has_value(), "Publish interval elapsed");
        AssertEqual(*published, std::string(hud::FpsPlaceholderText), "Expected placeholder text");

        estimator.Sample(Frame64Hz);
        AssertEqual(*estimator.CurrentFps(), 256.0f, "One frame in an otherwise empty window");
    }

    void TestPublishInterval() {
        hud::FrameRateEstimator estimator(4, 0.5f, true, Frame64Hz, 0.0f);

        AssertTrue(!estimator.MaybePublish(0.2f), "Should not publish before the interval");
        auto published = estimator.MaybePublish(0.5f);
        AssertTrue(published.has_value(), "Should publish once the interval elapsed");
        AssertEqual(*published, "<b>FPS:</b> <color=#00ff00>64</color>", "Unexpected published text");
        AssertEqual(estimator.LastPublishTime(), 0.5f, "Publish time not recorded");

        AssertTrue(!estimator.MaybePublish(0.7f), "Should not publish twice within the interval");
        AssertEqual(estimator.LastPublishTime(), 0.5f, "Publish time should only move on publish");

        estimator.Sample(Frame32Hz);
        AssertTrue(!estimator.MaybePublish(0.9f), "New samples should not force a publish");

        published = estimator.MaybePublish(1.0f);
        AssertTrue(published.has_value(), "Should publish again after another interval");
        AssertEqual(*published, "<b>FPS:</b> <color=#ffff00>51</color>", "Published text should follow the window");
    }

    void TestRepublishUnchangedFps() {
        hud::FrameRateEstimator estimator(4, 0.5f, false, Frame64Hz, 0.0f);

        auto first = estimator.MaybePublish(0.5f);
        AssertTrue(first.has_value(), "Should publish once the interval elapsed");
        AssertTrue(!estimator.MaybePublish(0.75f), "Should not publish within the interval");

        auto second = estimator.MaybePublish(1.0f);
        AssertTrue(second.has_value(), "Should publish again even though the frame rate is unchanged");
        AssertEqual(*second, *first, "Unchanged frame rate should publish the same text");
        AssertEqual(*second, "<b>FPS:</b> 64", "Unexpected republished text");
        AssertEqual(estimator.LastPublishTime(), 1.0f, "Publish time not recorded");
    }

    void TestZeroPublishInterval() {
        hud::FrameRateEstimator estimator(2, 0.0f, false, Frame64Hz, 1.0f);
        for (int i = 0; i < 3; i++) {
            auto published = estimator.MaybePublish(1.0f);
            AssertTrue(published.has_value(), "Zero interval should publish on every call");
            AssertEqual(*published, "<b>FPS:</b> 64", "Unexpected uncolored text");
        }
    }

    Test test1(&TestSteadyFrameRate);
    Test test2(&TestSlowFrameLowersAverage);
    Test test3(&TestWindowSumMatchesContents);
    Test test4(&TestInvalidSamplesIgnored);
    Test test5(&TestInvalidConstruction);
    Test test6(&TestZeroSumHasNoFrameRate);
    Test test7(&TestPublishInterval);
    Test test8(&TestZeroPublishInterval);
    Test test9(&TestOneSlowFrameAt60Hz);
    Test test10(&TestRepublishUnchangedFps);
} // namespace FrameRateEstimatorTests
