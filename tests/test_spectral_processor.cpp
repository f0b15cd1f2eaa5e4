#include "bandscope/spectral_processor.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <numbers>
#include <random>
#include <utility>
#include <vector>

namespace bandscope {
namespace {

class SpectralProcessorTest : public ::testing::Test {
protected:
    static constexpr std::size_t kFrameSize = 2048;
    static constexpr float kEpsilon = 0.01f;

    static std::vector<float> generate_sine(double frequency, double sample_rate,
                                            double amplitude = 1.0) {
        std::vector<float> samples(kFrameSize);
        const double omega = 2.0 * std::numbers::pi * frequency / sample_rate;
        for (std::size_t i = 0; i < kFrameSize; ++i) {
            samples[i] = static_cast<float>(amplitude * std::sin(omega * static_cast<double>(i)));
        }
        return samples;
    }

    /// A frame whose Hann-windowed form is a sine centred exactly on FFT bin
    /// `bin`, so nearly all energy lands in that single bin.
    static std::vector<float> windowed_tone_on_bin(std::size_t bin) {
        std::vector<float> samples(kFrameSize, 0.0f);
        const double n = static_cast<double>(kFrameSize);
        for (std::size_t i = 1; i + 1 < kFrameSize; ++i) {
            const double x = static_cast<double>(i);
            const double w = 0.5 - 0.5 * std::cos(2.0 * std::numbers::pi * x / (n - 1.0));
            samples[i] = static_cast<float>(
                std::sin(2.0 * std::numbers::pi * static_cast<double>(bin) * x / n) / w);
        }
        return samples;
    }

    static void expect_in_range(const AnalysisFrame& frame) {
        for (const float level : {frame.levels.bass, frame.levels.mid, frame.levels.treble}) {
            EXPECT_FALSE(std::isnan(level));
            EXPECT_GE(level, 0.0f);
            EXPECT_LE(level, kMaxBandLevel);
        }
        for (const float value : frame.spectrum) {
            EXPECT_FALSE(std::isnan(value));
            EXPECT_GE(value, 0.0f);
            EXPECT_LE(value, kMaxSpectrumLevel);
        }
    }
};

TEST_F(SpectralProcessorTest, RejectsInvalidParameters) {
    EXPECT_THROW(SpectralProcessor(1, 44100.0), std::invalid_argument);
    EXPECT_THROW(SpectralProcessor(kFrameSize, 0.0), std::invalid_argument);
    EXPECT_THROW(SpectralProcessor(kFrameSize, -48000.0), std::invalid_argument);
}

TEST_F(SpectralProcessorTest, A440IsMidOnly) {
    SpectralProcessor proc{kFrameSize, 44100.0};

    const auto frame = proc.process(generate_sine(440.0, 44100.0));

    EXPECT_GT(frame.levels.mid, 0.0f);
    EXPECT_LT(frame.levels.bass, kEpsilon);
    EXPECT_LT(frame.levels.treble, kEpsilon);
    expect_in_range(frame);
}

TEST_F(SpectralProcessorTest, OneKilohertzIsIsolatedToMid) {
    SpectralProcessor proc{kFrameSize, 48000.0};

    const auto frame = proc.process(generate_sine(1000.0, 48000.0));

    EXPECT_GT(frame.levels.mid, 0.1f);
    EXPECT_LT(frame.levels.bass, kEpsilon);
    EXPECT_LT(frame.levels.treble, kEpsilon);
}

TEST_F(SpectralProcessorTest, LowAndHighTonesLandInOuterBands) {
    SpectralProcessor proc{kFrameSize, 44100.0};

    const auto low = proc.process(generate_sine(100.0, 44100.0));
    EXPECT_GT(low.levels.bass, 1.0f);
    EXPECT_LT(low.levels.mid, kEpsilon);

    const auto high = proc.process(generate_sine(8000.0, 44100.0));
    EXPECT_GT(high.levels.treble, 0.1f);
    EXPECT_LT(high.levels.bass, kEpsilon);
    EXPECT_LT(high.levels.mid, kEpsilon);
}

TEST_F(SpectralProcessorTest, SilenceProducesZeros) {
    SpectralProcessor proc{kFrameSize, 44100.0};

    const auto frame = proc.process(std::vector<float>(kFrameSize, 0.0f));

    EXPECT_EQ(frame.levels, BandLevels{});
    for (const float value : frame.spectrum) {
        EXPECT_FLOAT_EQ(value, 0.0f);
    }
}

TEST_F(SpectralProcessorTest, LoudInputIsClamped) {
    SpectralProcessor proc{kFrameSize, 44100.0};

    std::mt19937 rng{1234};
    std::uniform_real_distribution<float> dist{-100.0f, 100.0f};
    std::vector<float> noise(kFrameSize);
    for (auto& s : noise) {
        s = dist(rng);
    }

    const auto frame = proc.process(noise);

    EXPECT_FLOAT_EQ(frame.levels.bass, kMaxBandLevel);
    EXPECT_FLOAT_EQ(frame.levels.mid, kMaxBandLevel);
    EXPECT_FLOAT_EQ(frame.levels.treble, kMaxBandLevel);
    expect_in_range(frame);
}

// 32 kHz / 2048 puts FFT bins exactly on 250, 4000 and 16000 Hz.
TEST_F(SpectralProcessorTest, BandEdgesAreHalfOpen) {
    SpectralProcessor proc{kFrameSize, 32000.0};
    const auto& bands = proc.band_bins();

    ASSERT_DOUBLE_EQ(proc.bin_frequency(16), 250.0);
    ASSERT_DOUBLE_EQ(proc.bin_frequency(256), 4000.0);
    ASSERT_DOUBLE_EQ(proc.bin_frequency(1024), 16000.0);

    EXPECT_EQ(bands[0].end, 16u);     // bass stops below 250 Hz
    EXPECT_EQ(bands[1].begin, 16u);   // 250 Hz opens mid
    EXPECT_EQ(bands[1].end, 256u);
    EXPECT_EQ(bands[2].begin, 256u);  // 4000 Hz opens treble
    EXPECT_EQ(bands[2].end, 1024u);   // 16000 Hz itself is excluded
}

TEST_F(SpectralProcessorTest, BassLowerEdgeIsInclusive) {
    // 40960 / 2048 = 20 Hz per bin, so bin 1 sits on 20 Hz.
    SpectralProcessor proc{kFrameSize, 40960.0};

    EXPECT_EQ(proc.band_bins()[0].begin, 1u);
    EXPECT_EQ(proc.spectrum_bins().front().begin, 1u);
    EXPECT_EQ(proc.spectrum_bins().back().end, 800u);  // 16000 Hz excluded
}

TEST_F(SpectralProcessorTest, ToneOnBandEdgeCountsAsUpperBand) {
    SpectralProcessor proc{kFrameSize, 32000.0};

    const auto at_250 = proc.process(windowed_tone_on_bin(16));
    EXPECT_LT(at_250.levels.bass, kEpsilon);
    EXPECT_GT(at_250.levels.mid, 0.3f);

    const auto below_250 = proc.process(windowed_tone_on_bin(15));
    EXPECT_GT(below_250.levels.bass, 1.0f);
    EXPECT_LT(below_250.levels.mid, kEpsilon);

    const auto at_4000 = proc.process(windowed_tone_on_bin(256));
    EXPECT_GT(at_4000.levels.treble, 0.5f);
    EXPECT_LT(at_4000.levels.mid, 0.1f);

    const auto below_4000 = proc.process(windowed_tone_on_bin(255));
    EXPECT_GT(below_4000.levels.mid, 0.4f);
    EXPECT_LT(below_4000.levels.treble, 0.3f);
}

TEST_F(SpectralProcessorTest, SpectrumEdgesAreGeometric) {
    const auto edges = SpectralProcessor::spectrum_edges();

    EXPECT_DOUBLE_EQ(edges.front(), 20.0);
    EXPECT_DOUBLE_EQ(edges.back(), 16000.0);
    for (std::size_t i = 0; i < kSpectrumBins; ++i) {
        const double expected = 20.0 * std::pow(800.0, static_cast<double>(i) / 64.0);
        EXPECT_NEAR(edges[i], expected, 1e-9 * expected);
        EXPECT_LT(edges[i], edges[i + 1]);
    }
}

TEST_F(SpectralProcessorTest, SpectrumBinsPartitionFftBins) {
    SpectralProcessor proc{kFrameSize, 44100.0};
    const auto edges = SpectralProcessor::spectrum_edges();
    const auto& ranges = proc.spectrum_bins();

    for (std::size_t i = 0; i + 1 < kSpectrumBins; ++i) {
        // Adjacent bins share an edge: where one ends, the next begins.
        EXPECT_EQ(ranges[i].end, ranges[i + 1].begin) << "bin " << i;
    }

    for (std::size_t i = 0; i < kSpectrumBins; ++i) {
        for (std::size_t k = ranges[i].begin; k < ranges[i].end; ++k) {
            const double f = proc.bin_frequency(k);
            EXPECT_GE(f, edges[i]);
            EXPECT_LT(f, edges[i + 1]);
        }
    }
}

TEST_F(SpectralProcessorTest, EmptySpectrumBinsStayZero) {
    SpectralProcessor proc{kFrameSize, 44100.0};
    const auto frame = proc.process(generate_sine(25.0, 44100.0, 10.0));

    std::size_t empty = 0;
    for (std::size_t i = 0; i < kSpectrumBins; ++i) {
        if (proc.spectrum_bins()[i].empty()) {
            ++empty;
            EXPECT_FLOAT_EQ(frame.spectrum[i], 0.0f) << "bin " << i;
        }
    }
    EXPECT_GT(empty, 0u);  // 21.5 Hz resolution cannot fill the lowest bins
}

TEST_F(SpectralProcessorTest, SpectrumReferenceIsLinear) {
    EXPECT_FLOAT_EQ(SpectralProcessor::spectrum_reference(0), 40.0f);
    EXPECT_FLOAT_EQ(SpectralProcessor::spectrum_reference(kSpectrumBins - 1), 3.0f);
    EXPECT_NEAR(SpectralProcessor::spectrum_reference(21), 40.0f - 37.0f * 21.0f / 63.0f, 1e-5f);
}

TEST_F(SpectralProcessorTest, SpectrumPeakFollowsTone) {
    SpectralProcessor proc{kFrameSize, 44100.0};
    const auto frame = proc.process(generate_sine(1000.0, 44100.0));
    const auto edges = SpectralProcessor::spectrum_edges();

    std::size_t peak = 0;
    for (std::size_t i = 1; i < kSpectrumBins; ++i) {
        if (frame.spectrum[i] > frame.spectrum[peak]) {
            peak = i;
        }
    }
    // Neighbouring bins can saturate too, so allow one bin either side.
    EXPECT_LE(edges[peak == 0 ? 0 : peak - 1], 1000.0);
    EXPECT_GT(edges[std::min(peak + 2, kSpectrumBins)], 1000.0);
}

TEST_F(SpectralProcessorTest, ValidateFlagsAnomalies) {
    SpectralProcessor proc{kFrameSize, 44100.0};

    EXPECT_FALSE(proc.validate(std::vector<float>(kFrameSize, 0.0f)).has_value());
    EXPECT_EQ(proc.validate(std::vector<float>(kFrameSize - 1, 0.0f)),
              ProcessingAnomaly::UnexpectedFrameLength);

    std::vector<float> bad(kFrameSize, 0.0f);
    bad[100] = std::numeric_limits<float>::quiet_NaN();
    EXPECT_EQ(proc.validate(bad), ProcessingAnomaly::NonFiniteSamples);
    bad[100] = std::numeric_limits<float>::infinity();
    EXPECT_EQ(proc.validate(bad), ProcessingAnomaly::NonFiniteSamples);
}

// Samples near the float limit are finite but can overflow inside the FFT.
// Whatever comes out is either within the caps or flagged as non-finite.
TEST_F(SpectralProcessorTest, HugeFiniteSamplesAreCappedOrFlagged) {
    SpectralProcessor proc{kFrameSize, 44100.0};

    std::vector<std::vector<float>> frames;
    frames.emplace_back(kFrameSize, 1e37f);
    frames.push_back(generate_sine(440.0, 44100.0, 1e37));
    std::vector<float> alternating(kFrameSize);
    for (std::size_t i = 0; i < kFrameSize; ++i) {
        alternating[i] = (i % 2 == 0) ? 3e38f : -3e38f;
    }
    frames.push_back(std::move(alternating));

    for (const auto& samples : frames) {
        ASSERT_FALSE(proc.validate(samples).has_value());
        const auto frame = proc.process(samples);
        if (!is_finite(frame)) {
            continue;
        }
        expect_in_range(frame);
    }
}

TEST(AnalysisFrameTest, IsFiniteDetectsNaNAndInfinity) {
    AnalysisFrame frame;
    EXPECT_TRUE(is_finite(frame));

    frame.levels.treble = std::numeric_limits<float>::quiet_NaN();
    EXPECT_FALSE(is_finite(frame));

    frame.levels.treble = 0.0f;
    frame.spectrum[kSpectrumBins - 1] = -std::numeric_limits<float>::infinity();
    EXPECT_FALSE(is_finite(frame));
}

TEST(DownmixTest, AveragesChannels) {
    const std::vector<float> stereo = {1.0f, 3.0f, -2.0f, 2.0f, 0.5f, 0.5f};
    std::vector<float> mono(3);

    downmix(stereo, 2, mono);

    EXPECT_FLOAT_EQ(mono[0], 2.0f);
    EXPECT_FLOAT_EQ(mono[1], 0.0f);
    EXPECT_FLOAT_EQ(mono[2], 0.5f);
}

TEST(DownmixTest, MonoIsCopied) {
    const std::vector<float> input = {0.25f, -0.5f, 1.0f};
    std::vector<float> mono(3);

    downmix(input, 1, mono);

    EXPECT_EQ(mono, input);
}

TEST(DownmixTest, SixChannels) {
    std::vector<float> surround(12);
    for (std::size_t i = 0; i < surround.size(); ++i) {
        surround[i] = static_cast<float>(i % 6);  // 0..5 per frame
    }
    std::vector<float> mono(2);

    downmix(surround, 6, mono);

    EXPECT_FLOAT_EQ(mono[0], 2.5f);
    EXPECT_FLOAT_EQ(mono[1], 2.5f);
}

}  // namespace
}  // namespace bandscope
