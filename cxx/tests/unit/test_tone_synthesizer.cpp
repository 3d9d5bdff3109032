#include <gtest/gtest.h>
#include "TestHelper.hpp"
#include "synth/AudioOutput.hpp"
#include "synth/ToneSynthesizer.hpp"
#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace fretboard;

namespace {

/**
 * Driver that never touches hardware; the test pulls blocks through the
 * captured callback.
 */
class FakeDriver : public hal::AudioDriver {
public:
    explicit FakeDriver(bool start_succeeds) : start_succeeds_(start_succeeds) {}

    bool start() override { started = start_succeeds_; return start_succeeds_; }
    void stop() override { started = false; }
    void set_callback(AudioCallback cb) override { callback = std::move(cb); }
    int sample_rate() const override { return 44100; }
    std::string description() const override { return "fake"; }

    bool started = false;
    AudioCallback callback;

private:
    bool start_succeeds_;
};

int count_warnings(const std::string& tag) {
    int warnings = 0;
    while (auto entry = Logger::instance().pop_entry()) {
        if (entry->type == LogEntry::Type::Message && entry->level == LogEntry::Level::Warning &&
            tag == entry->tag) {
            ++warnings;
        }
    }
    return warnings;
}

} // namespace

class ToneSynthesizerTest : public ::testing::Test {
protected:
    void SetUp() override { test::drain_log(); }

    ToneSettings settings;
};

TEST_F(ToneSynthesizerTest, DeviceAcquiredLazilyOnce) {
    auto output = std::make_unique<test::RecordingAudioOutput>();
    auto* out = output.get();
    ToneSynthesizer synth(std::move(output), settings, 7);

    EXPECT_EQ(out->open_calls, 0);
    EXPECT_EQ(synth.device_state(), ToneSynthesizer::DeviceState::Unacquired);
    EXPECT_TRUE(synth.audio_available());

    synth.play(110.0);
    EXPECT_EQ(out->open_calls, 1);
    EXPECT_EQ(synth.device_state(), ToneSynthesizer::DeviceState::Ready);

    out->frame = 4800;
    synth.play(220.0);
    EXPECT_EQ(out->open_calls, 1);

    ASSERT_EQ(out->scheduled.size(), 2u);
    EXPECT_EQ(out->scheduled[0].start_frame, 0u);
    EXPECT_EQ(out->scheduled[1].start_frame, 4800u);
    EXPECT_DOUBLE_EQ(out->scheduled[0].tone->frequency(), 110.0);
    EXPECT_DOUBLE_EQ(out->scheduled[1].tone->frequency(), 220.0);
    EXPECT_NE(out->scheduled[0].tone, out->scheduled[1].tone);
    EXPECT_EQ(synth.tones_started(), 2u);
}

TEST_F(ToneSynthesizerTest, UnavailableDeviceDegradesSilently) {
    auto output = std::make_unique<test::RecordingAudioOutput>(false);
    auto* out = output.get();
    ToneSynthesizer synth(std::move(output), settings, 7);

    EXPECT_NO_THROW(synth.play(110.0));
    EXPECT_FALSE(synth.audio_available());
    EXPECT_EQ(synth.device_state(), ToneSynthesizer::DeviceState::Unavailable);

    EXPECT_NO_THROW(synth.play(220.0));
    EXPECT_NO_THROW(synth.play(330.0));

    // No retry, nothing scheduled, one warning
    EXPECT_EQ(out->open_calls, 1);
    EXPECT_TRUE(out->scheduled.empty());
    EXPECT_EQ(synth.tones_started(), 0u);
    EXPECT_EQ(count_warnings("Synth"), 1);
}

TEST_F(ToneSynthesizerTest, RejectsInvalidFrequency) {
    auto output = std::make_unique<test::RecordingAudioOutput>();
    auto* out = output.get();
    ToneSynthesizer synth(std::move(output), settings, 7);

    EXPECT_THROW(synth.play(0.0), std::invalid_argument);
    EXPECT_THROW(synth.play(-82.41), std::invalid_argument);
    EXPECT_THROW(synth.play(std::numeric_limits<double>::quiet_NaN()), std::invalid_argument);
    EXPECT_THROW(synth.play(std::numeric_limits<double>::infinity()), std::invalid_argument);
    EXPECT_EQ(out->open_calls, 0);
    EXPECT_TRUE(out->scheduled.empty());
}

TEST_F(ToneSynthesizerTest, DetuneStaysWithinSpread) {
    ToneSynthesizer synth(std::make_unique<test::RecordingAudioOutput>(), settings, 42);
    const double half = settings.detune_spread_cents / 2.0;

    bool varied = false;
    double first = 0.0;
    for (int i = 0; i < 500; ++i) {
        const auto cents = synth.draw_detune();
        for (double c : cents) {
            ASSERT_GE(c, -half);
            ASSERT_LE(c, half);
        }
        if (i == 0) first = cents[0];
        else if (cents[0] != first) varied = true;
    }
    EXPECT_TRUE(varied);
}

TEST_F(ToneSynthesizerTest, ZeroSpreadMeansNoDetune) {
    settings.detune_spread_cents = 0.0;
    auto output = std::make_unique<test::RecordingAudioOutput>();
    auto* out = output.get();
    ToneSynthesizer synth(std::move(output), settings, 42);

    synth.play(440.0);
    ASSERT_EQ(out->scheduled.size(), 1u);
    for (int i = 0; i < ToneSettings::NUM_PARTIALS; ++i) {
        EXPECT_EQ(out->scheduled[0].tone->partial_oscillator(i).get_detune_cents(), 0.0);
    }
}

TEST_F(ToneSynthesizerTest, ToneUsesOutputSampleRate) {
    auto output = std::make_unique<test::RecordingAudioOutput>(true, 44100);
    auto* out = output.get();
    ToneSynthesizer synth(std::move(output), settings, 1);
    synth.play(110.0);
    ASSERT_EQ(out->scheduled.size(), 1u);
    EXPECT_EQ(out->scheduled[0].tone->length_samples(), std::lround(1.5 * 44100));
}

TEST(NullAudioOutputTest, AcceptsAndDiscards) {
    ToneSynthesizer synth(std::make_unique<NullAudioOutput>(), ToneSettings{}, 3);
    EXPECT_NO_THROW(synth.play(110.0));
    EXPECT_TRUE(synth.audio_available());
    EXPECT_EQ(synth.tones_started(), 1u);
}

TEST(DriverAudioOutputTest, OpenStartsDriverAndAdvancesClock) {
    FakeDriver* driver = nullptr;
    DriverAudioOutput output([&driver]() {
        auto d = std::make_unique<FakeDriver>(true);
        driver = d.get();
        return std::unique_ptr<hal::AudioDriver>(std::move(d));
    });

    EXPECT_EQ(driver, nullptr);
    ASSERT_TRUE(output.open());
    ASSERT_NE(driver, nullptr);
    EXPECT_TRUE(driver->started);
    EXPECT_EQ(output.sample_rate(), 44100);
    EXPECT_EQ(output.current_frame(), 0u);

    // A second open reuses the running driver
    FakeDriver* first = driver;
    EXPECT_TRUE(output.open());
    EXPECT_EQ(driver, first);

    std::array<double, ToneSettings::NUM_PARTIALS> no_detune{};
    output.schedule(std::make_shared<PluckTone>(44100, 220.0, ToneSettings{}, no_detune), 0);

    std::vector<float> block(256);
    driver->callback(std::span<float>(block));
    EXPECT_EQ(output.current_frame(), 256u);
    EXPECT_GT(test::peak_of(block), 0.0f);
    EXPECT_EQ(output.active_tones(), 1u);
}

TEST(DriverAudioOutputTest, FailedStartReportsUnavailable) {
    DriverAudioOutput output([]() {
        return std::unique_ptr<hal::AudioDriver>(std::make_unique<FakeDriver>(false));
    });
    EXPECT_FALSE(output.open());
    EXPECT_EQ(output.sample_rate(), 0);

    DriverAudioOutput no_driver([]() { return std::unique_ptr<hal::AudioDriver>(); });
    EXPECT_FALSE(no_driver.open());

    ToneSynthesizer synth(std::make_unique<DriverAudioOutput>([]() {
        return std::unique_ptr<hal::AudioDriver>(std::make_unique<FakeDriver>(false));
    }), ToneSettings{}, 5);
    synth.play(110.0);
    EXPECT_FALSE(synth.audio_available());
}
