#include "common/Common.hh"
#include "overlay/FrameRateEstimator.hh"

#include <limits>
#include <tests.hh>

namespace FpsFormatTests {
    using namespace testing;

    void TestColorThresholds() {
        AssertEqual(std::string(hud::FpsColor(0.0f)), "#ff0000", "0 fps should be red");
        AssertEqual(std::string(hud::FpsColor(29.99f)), "#ff0000", "29.99 fps should be red");
        AssertEqual(std::string(hud::FpsColor(30.0f)), "#ffff00", "30 fps should be yellow");
        AssertEqual(std::string(hud::FpsColor(59.9f)), "#ffff00", "59.9 fps should be yellow");
        AssertEqual(std::string(hud::FpsColor(60.0f)), "#00ff00", "60 fps should be green");
        AssertEqual(std::string(hud::FpsColor(119.0f)), "#00ff00", "119 fps should be green");
        AssertEqual(std::string(hud::FpsColor(120.0f)), "#00ffff", "120 fps should be cyan");
        AssertEqual(std::string(hud::FpsColor(240.0f)), "#ff00ff", "240 fps should be magenta");
        AssertEqual(std::string(hud::FpsColor(1000.0f)), "#ff00ff", "1000 fps should be magenta");
    }

    void TestFormatColored() {
        AssertEqual(hud::FormatFps(59.9f, true), "<b>FPS:</b> <color=#ffff00>59</color>", "Unexpected 59.9 text");
        AssertEqual(hud::FormatFps(60.0f, true), "<b>FPS:</b> <color=#00ff00>60</color>", "Unexpected 60 text");
        AssertEqual(hud::FormatFps(29.99f, true), "<b>FPS:</b> <color=#ff0000>29</color>", "Unexpected 29.99 text");
        AssertEqual(hud::FormatFps(144.0f, true), "<b>FPS:</b> <color=#00ffff>144</color>", "Unexpected 144 text");
        AssertEqual(hud::FormatFps(300.5f, true), "<b>FPS:</b> <color=#ff00ff>300</color>", "Unexpected 300 text");
    }

    void TestFormatUncolored() {
        auto text = hud::FormatFps(59.9f, false);
        AssertEqual(text, "<b>FPS:</b> 59", "Frame rate should be truncated, not rounded");
        AssertTrue(text.find("<color") == std::string::npos, "Uncolored text should not contain a color tag");
        AssertEqual(hud::FormatFps(0.4f, false), "<b>FPS:</b> 0", "Unexpected sub-1 fps text");
    }

    void TestFormatNonFinite() {
        AssertEqual(hud::FormatFps(std::numeric_limits<float>::quiet_NaN(), true),
            std::string(hud::FpsPlaceholderText),
            "NaN should format as the placeholder");
        AssertEqual(hud::FormatFps(std::numeric_limits<float>::infinity(), false),
            std::string(hud::FpsPlaceholderText),
            "Infinity should format as the placeholder");
    }

    Test test1(&TestColorThresholds);
    Test test2(&TestFormatColored);
    Test test3(&TestFormatUncolored);
    Test test4(&TestFormatNonFinite);
} // namespace FpsFormatTests
