#include <gtest/gtest.h>
#include "sortid/types.h"
#include "sortid/errors.h"
#include "test_utils.h"

#ifdef _WIN32
#include <windows.h>
#endif

using namespace sortid;
using namespace sortid::test_utils;

// Windows에서 콘솔 출력 인코딩을 UTF-8로 설정
namespace {
    struct ConsoleEncodingSetter {
        ConsoleEncodingSetter() {
#ifdef _WIN32
            SetConsoleOutputCP(65001);
            SetConsoleCP(65001);
#endif
        }
    };
    ConsoleEncodingSetter g_console_encoding_setter;
}

TEST(GeneratorInfoTest, Serialization) {
    GeneratorInfo info;
    info.SetAlphabet("0123456789");
    info.SetTotalLength(20);
    info.SetTimestampLength(10);
    info.SetChronoLength(1);
    info.SetSuffixLength(9);
    info.SetTimestampLevel(TimeLevel::SECOND);
    info.SetMaxSortableRate(SortableRate::SECOND_1);
    info.SetStartDate(InstantFromSeconds(kEpoch2000));
    info.SetEndDate(InstantFromSeconds(kEpoch2024) + std::chrono::nanoseconds(123));
    info.SetRandomDegraded(true);

    // 직렬화
    std::string json = info.toJson();
    EXPECT_FALSE(json.empty());

    // 역직렬화
    GeneratorInfo loaded;
    loaded.fromJson(json);

    EXPECT_EQ(loaded.GetAlphabet(), info.GetAlphabet());
    EXPECT_EQ(loaded.GetTotalLength(), info.GetTotalLength());
    EXPECT_EQ(loaded.GetTimestampLength(), info.GetTimestampLength());
    EXPECT_EQ(loaded.GetChronoLength(), info.GetChronoLength());
    EXPECT_EQ(loaded.GetSuffixLength(), info.GetSuffixLength());
    EXPECT_EQ(loaded.GetTimestampLevel(), info.GetTimestampLevel());
    EXPECT_EQ(loaded.GetMaxSortableRate(), info.GetMaxSortableRate());
    EXPECT_EQ(loaded.GetStartDate(), info.GetStartDate());
    EXPECT_EQ(loaded.GetEndDate(), info.GetEndDate());
    EXPECT_TRUE(loaded.IsRandomDegraded());
}

TEST(GeneratorInfoTest, UnknownLevelNameIsSerializationError) {
    GeneratorInfo info;
    info.SetAlphabet("01");
    info.SetTimestampLevel(TimeLevel::SECOND);
    info.SetMaxSortableRate(SortableRate::SECOND_1);
    info.SetStartDate(InstantFromSeconds(kEpoch2024));
    info.SetEndDate(InstantFromSeconds(kEpoch2024));

    std::string json = info.toJson();
    const std::string level = "\"second\"";
    size_t pos = json.find(level);
    ASSERT_NE(pos, std::string::npos);
    json.replace(pos, level.size(), "\"fortnight\"");

    GeneratorInfo loaded;
    EXPECT_THROW(loaded.fromJson(json), SerializationException);
}

TEST(TimeLevelTest, StringRoundTrip) {
    const TimeLevel levels[] = {
        TimeLevel::NANOSECOND, TimeLevel::MICROSECOND, TimeLevel::MILLISECOND,
        TimeLevel::SECOND, TimeLevel::MINUTE, TimeLevel::HOUR,
        TimeLevel::DAY, TimeLevel::MONTH, TimeLevel::YEAR
    };
    for (TimeLevel level : levels) {
        TimeLevel parsed = TimeLevel::NANOSECOND;
        ASSERT_TRUE(ParseTimeLevel(TimeLevelToString(level), parsed));
        EXPECT_EQ(parsed, level);
    }

    EXPECT_TRUE(IsKnownTimeLevel(TimeLevel::YEAR));
    EXPECT_FALSE(IsKnownTimeLevel(static_cast<TimeLevel>(42)));

    TimeLevel unchanged = TimeLevel::HOUR;
    EXPECT_FALSE(ParseTimeLevel("fortnight", unchanged));
    EXPECT_EQ(unchanged, TimeLevel::HOUR);
}

TEST(TimeLevelTest, NanosecondTable) {
    EXPECT_EQ(TimeLevelToNanoseconds(TimeLevel::NANOSECOND), 1u);
    EXPECT_EQ(TimeLevelToNanoseconds(TimeLevel::MICROSECOND), 1000u);
    EXPECT_EQ(TimeLevelToNanoseconds(TimeLevel::MILLISECOND), 1000000u);
    EXPECT_EQ(TimeLevelToNanoseconds(TimeLevel::SECOND), 1000000000u);
    EXPECT_EQ(TimeLevelToNanoseconds(TimeLevel::MINUTE), 60000000000u);
    EXPECT_EQ(TimeLevelToNanoseconds(TimeLevel::HOUR), 3600000000000u);
    EXPECT_EQ(TimeLevelToNanoseconds(TimeLevel::DAY), 86400000000000u);
    EXPECT_EQ(TimeLevelToNanoseconds(TimeLevel::MONTH), 30u * 86400000000000u);
    EXPECT_EQ(TimeLevelToNanoseconds(TimeLevel::YEAR), 365u * 86400000000000u);
}

TEST(SortableRateTest, StringRoundTripAndTable) {
    struct Row {
        SortableRate rate;
        const char* name;
        uint64_t per_second;
    };
    const Row rows[] = {
        {SortableRate::NANO_10, "10_per_nanosecond", 10000000000ULL},
        {SortableRate::MICRO_100, "100_per_microsecond", 100000000ULL},
        {SortableRate::MICRO_1, "1_per_microsecond", 1000000ULL},
        {SortableRate::MILLI_10, "10_per_millisecond", 10000ULL},
        {SortableRate::SECOND_100, "100_per_second", 100ULL},
        {SortableRate::SECOND_1, "1_per_second", 1ULL},
    };

    for (const Row& row : rows) {
        EXPECT_EQ(SortableRateToString(row.rate), row.name);
        EXPECT_EQ(SortableRateToPerSecond(row.rate), row.per_second);

        SortableRate parsed = SortableRate::SECOND_1;
        ASSERT_TRUE(ParseSortableRate(row.name, parsed));
        EXPECT_EQ(parsed, row.rate);
    }

    EXPECT_FALSE(IsKnownSortableRate(static_cast<SortableRate>(42)));

    SortableRate unchanged = SortableRate::MILLI_10;
    EXPECT_FALSE(ParseSortableRate("1000_per_second", unchanged));
    EXPECT_EQ(unchanged, SortableRate::MILLI_10);
}

TEST(FormatInstantTest, Utc) {
    EXPECT_EQ(FormatInstant(InstantFromSeconds(kEpoch2024)), "2024-01-01T00:00:00.000000000Z");
    EXPECT_EQ(FormatInstant(InstantFromSeconds(kEpoch2000) + std::chrono::microseconds(1500)),
              "2000-01-01T00:00:00.001500000Z");
    EXPECT_EQ(FormatInstant(Instant(std::chrono::nanoseconds(-1))), "1969-12-31T23:59:59.999999999Z");
}

TEST(GeneratorConfigTest, Defaults) {
    GeneratorConfig config = DefaultConfig();
    EXPECT_EQ(config.alphabet.size(), 64u);
    EXPECT_EQ(config.total_length, 32u);
    EXPECT_EQ(config.timestamp_start, InstantFromSeconds(kEpoch2024));
    EXPECT_FALSE(config.timestamp_end.has_value());
    EXPECT_EQ(config.timestamp_length, 0u);
    EXPECT_EQ(config.timestamp_level, TimeLevel::MICROSECOND);
    EXPECT_EQ(config.max_sortable_rate, SortableRate::MICRO_100);
    EXPECT_FALSE(config.allow_insecure_fallback);
    EXPECT_EQ(config.exhaustion_retries, 0u);
}
