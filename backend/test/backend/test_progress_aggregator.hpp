#pragma once

#include "scripted_output.hpp"

#include <backend/transfer/progress_aggregator.hpp>

#include <gtest/gtest.h>

#include <numeric>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace Test
{
    class ProgressAggregatorTests : public ::testing::Test
    {
      protected:
        std::vector<std::string> makeLines(std::size_t count) const
        {
            std::vector<std::string> lines{};
            for (std::size_t i = 0; i != count; ++i)
                lines.push_back("cp s3://bucket/file" + std::to_string(i) + " /tmp/file" + std::to_string(i));
            return lines;
        }

        std::vector<SharedData::ProgressSample> collect(ProgressAggregator& aggregator)
        {
            std::vector<SharedData::ProgressSample> samples{};
            const auto exitCode = aggregator.run([&samples](SharedData::ProgressSample const& sample) {
                samples.push_back(sample);
            });
            EXPECT_TRUE(exitCode.has_value());
            return samples;
        }

        static std::uint64_t sumOfLines(std::vector<SharedData::ProgressSample> const& samples)
        {
            return std::accumulate(
                samples.begin(), samples.end(), std::uint64_t{0}, [](std::uint64_t sum, auto const& sample) {
                    return sum + sample.lines;
                });
        }

      protected:
        ::testing::NiceMock<ProcessOutputMock> output_{};
    };

    TEST_F(ProgressAggregatorTests, SamplesAddUpToTheNumberOfLines)
    {
        scriptOutput(output_, makeLines(1000));
        ProgressAggregator aggregator{
            output_, ProgressAggregator::Options{.reportInterval = 1s, .clock = SteppingClock{10ms}.function()}};

        const auto samples = collect(aggregator);

        ASSERT_FALSE(samples.empty());
        EXPECT_EQ(sumOfLines(samples), 1000);
        EXPECT_EQ(aggregator.observedLines(), 1000);
        EXPECT_TRUE(samples.back().isFinal);
        EXPECT_EQ(samples.back().cumulative, 1000);
        for (std::size_t i = 1; i < samples.size(); ++i)
            EXPECT_LE(samples[i - 1].timestamp, samples[i].timestamp);
    }

    TEST_F(ProgressAggregatorTests, ReportingIsThrottled)
    {
        scriptOutput(output_, makeLines(1000));
        ProgressAggregator aggregator{
            output_, ProgressAggregator::Options{.reportInterval = 1s, .clock = SteppingClock{10ms}.function()}};

        const auto samples = collect(aggregator);

        // 1000 reads at 10ms each span 10 seconds.
        EXPECT_LE(samples.size(), 12);
        EXPECT_GE(samples.size(), 10);
    }

    TEST_F(ProgressAggregatorTests, ExitIsReportedOnceAndTheRestIsFlushed)
    {
        scriptOutput(output_, makeLines(500));
        ON_CALL(output_, hasExited()).WillByDefault(::testing::Return(true));
        EXPECT_CALL(output_, hasExited()).Times(1);
        ProgressAggregator aggregator{
            output_, ProgressAggregator::Options{.reportInterval = 1h, .clock = SteppingClock{0ms}.function()}};

        const auto samples = collect(aggregator);

        ASSERT_EQ(samples.size(), 2);
        EXPECT_EQ(samples[0].lines, 1);
        EXPECT_FALSE(samples[0].isFinal);
        EXPECT_EQ(samples[1].lines, 499);
        EXPECT_TRUE(samples[1].isFinal);
        EXPECT_EQ(sumOfLines(samples), 500);
    }

    TEST_F(ProgressAggregatorTests, ShortRunReportsTheExpectedTotal)
    {
        scriptOutput(output_, makeLines(3));
        ProgressAggregator aggregator{
            output_,
            ProgressAggregator::Options{
                .expectedTotal = 5, .reportInterval = 5s, .clock = SteppingClock{0ms}.function()}};

        const auto samples = collect(aggregator);

        ASSERT_EQ(samples.size(), 1);
        EXPECT_EQ(samples[0].lines, 3);
        EXPECT_EQ(samples[0].cumulative, 5);
        EXPECT_EQ(samples[0].total, std::optional<std::uint64_t>{5});
        EXPECT_TRUE(samples[0].isFinal);
    }

    TEST_F(ProgressAggregatorTests, ShortRunNeverUndercounts)
    {
        scriptOutput(output_, makeLines(7));
        ProgressAggregator aggregator{
            output_,
            ProgressAggregator::Options{
                .expectedTotal = 5, .reportInterval = 5s, .clock = SteppingClock{0ms}.function()}};

        const auto samples = collect(aggregator);

        ASSERT_EQ(samples.size(), 1);
        EXPECT_EQ(samples[0].cumulative, 7);
    }

    TEST_F(ProgressAggregatorTests, LongRunReportsWhatWasObserved)
    {
        scriptOutput(output_, makeLines(3));
        ProgressAggregator aggregator{
            output_,
            ProgressAggregator::Options{
                .expectedTotal = 5, .reportInterval = 1s, .clock = SteppingClock{2s}.function()}};

        const auto samples = collect(aggregator);

        ASSERT_FALSE(samples.empty());
        EXPECT_EQ(sumOfLines(samples), 3);
        EXPECT_EQ(samples.back().cumulative, 3);
    }

    TEST_F(ProgressAggregatorTests, ExitCodeIsReturned)
    {
        scriptOutput(output_, makeLines(2), 3);
        EXPECT_CALL(output_, wait()).Times(1);
        ProgressAggregator aggregator{output_, ProgressAggregator::Options{}};

        const auto exitCode = aggregator.run({});

        ASSERT_TRUE(exitCode.has_value());
        EXPECT_EQ(*exitCode, 3);
        EXPECT_EQ(aggregator.exitCode(), std::optional<int>{3});
    }

    TEST_F(ProgressAggregatorTests, EmptyStreamYieldsOneFinalSample)
    {
        scriptOutput(output_, {});
        ProgressAggregator aggregator{output_, ProgressAggregator::Options{.clock = SteppingClock{0ms}.function()}};

        auto first = aggregator.next();
        ASSERT_TRUE(first.has_value());
        ASSERT_TRUE(first->has_value());
        EXPECT_EQ((*first)->lines, 0);
        EXPECT_TRUE((*first)->isFinal);

        auto second = aggregator.next();
        ASSERT_TRUE(second.has_value());
        EXPECT_FALSE(second->has_value());
    }

    TEST_F(ProgressAggregatorTests, ReadErrorTerminatesAggregation)
    {
        int reads = 0;
        ON_CALL(output_, readLine())
            .WillByDefault([&reads]() -> std::expected<std::optional<std::string>, SharedData::TransferError> {
                if (++reads <= 2)
                    return std::string{"line"};
                return std::unexpected(SharedData::TransferError{
                    .type = SharedData::TransferErrorType::StreamReadError,
                });
            });
        ON_CALL(output_, wait()).WillByDefault(::testing::Return(0));
        EXPECT_CALL(output_, wait()).Times(1);

        ProgressAggregator aggregator{output_, ProgressAggregator::Options{.clock = SteppingClock{0ms}.function()}};
        const auto exitCode = aggregator.run({});

        ASSERT_FALSE(exitCode.has_value());
        EXPECT_EQ(exitCode.error().type, SharedData::TransferErrorType::StreamReadError);
        EXPECT_EQ(aggregator.observedLines(), 2);

        auto afterError = aggregator.next();
        ASSERT_TRUE(afterError.has_value());
        EXPECT_FALSE(afterError->has_value());
    }
}
