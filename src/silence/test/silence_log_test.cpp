// SPDX-License-Identifier: Apache-2.0
#include <gtest/gtest.h>

#include "cuecraft/silence/silence_log.hpp"

using namespace cuecraft::silence;

TEST(SilenceLogTest, Parse) {
    const std::string log = R"(
Input #0, mov,mp4,m4a,3gp,3g2,mj2, from 'talk.mp4':
[silencedetect @ 0x7f8] silence_start: 2.5
[silencedetect @ 0x7f8] silence_end: 4.25 | silence_duration: 1.75
size=N/A time=00:00:10.00 bitrate=N/A speed= 400x
[silencedetect @ 0x7f8] silence_start: 7
[silencedetect @ 0x7f8] silence_end: 8.5 | silence_duration: 1.5
[silencedetect @ 0x7f8] silence_start: 9.75
)";

    auto result = parse_silencedetect_log(log);
    ASSERT_EQ(result.size(), size_t(2)) << "Trailing start without end is ignored";
    EXPECT_EQ(result[0], TimeInterval(2.5, 4.25));
    EXPECT_EQ(result[1], TimeInterval(7.0, 8.5));
    EXPECT_DOUBLE_EQ(result[0].duration(), 1.75);

    EXPECT_TRUE(parse_silencedetect_log("").empty());
    EXPECT_TRUE(parse_silencedetect_log("no detector output here").empty());
}

TEST(SilenceLogTest, Filter) {
    EXPECT_EQ(silencedetect_filter(), "silencedetect=noise=-30dB:d=1");
    EXPECT_EQ(silencedetect_filter("-40dB", 0.5), "silencedetect=noise=-40dB:d=0.5");
}
