#include <limits>
#include <vector>

#include <pgchrono/literal>
#include <pgchrono/zone>

#include "helpers.hxx"

namespace
{
using namespace std::literals;
using pgchrono::instant;
using pgchrono::local_date;
using pgchrono::to_code_literal;


void test_code_date_and_time()
{
  PGCHRONO_CHECK_EQUAL(
    to_code_literal(local_date{2018, 4, 20}),
    "pgchrono::local_date{2018, 4, 20}");
  PGCHRONO_CHECK_EQUAL(
    to_code_literal(local_date{-4712, 1, 1}),
    "pgchrono::local_date{-4712, 1, 1}");
  PGCHRONO_CHECK_EQUAL(
    to_code_literal(local_date::max()), "pgchrono::local_date::max()");

  PGCHRONO_CHECK_EQUAL(
    to_code_literal(pgchrono::local_time{10, 31}),
    "pgchrono::local_time{10, 31}");
  PGCHRONO_CHECK_EQUAL(
    to_code_literal(pgchrono::local_time{10, 31, 33}),
    "pgchrono::local_time{10, 31, 33}");
  PGCHRONO_CHECK_EQUAL(
    to_code_literal(pgchrono::local_time{10, 31, 0, 5}),
    "pgchrono::local_time{10, 31, 0, 5}");
  PGCHRONO_CHECK_EQUAL(
    to_code_literal(pgchrono::local_time::from_hour_minute_second_nanosecond(
      10, 31, 33, 666'666'000)),
    "pgchrono::local_time::from_hour_minute_second_nanosecond(10, 31, 33, "
    "666666000)");
}


void test_code_local_date_time()
{
  auto const value{pgchrono::local_date_time{2018, 4, 20, 10, 31, 33, 666}
                     .plus_nanoseconds(666'000)};
  PGCHRONO_CHECK_EQUAL(
    to_code_literal(value),
    "pgchrono::local_date_time{2018, 4, 20, 10, 31, 33}"
    ".plus_nanoseconds(666666000)");

  PGCHRONO_CHECK_EQUAL(
    to_code_literal(pgchrono::local_date_time{2018, 4, 20, 10, 31, 33, 666}),
    "pgchrono::local_date_time{2018, 4, 20, 10, 31, 33, 666}");
  PGCHRONO_CHECK_EQUAL(
    to_code_literal(pgchrono::local_date_time{2018, 4, 20, 0, 0}),
    "pgchrono::local_date_time{2018, 4, 20, 0, 0}");
  PGCHRONO_CHECK_EQUAL(
    to_code_literal(pgchrono::local_date_time::min()),
    "pgchrono::local_date_time::min()");
}


void test_code_offsets()
{
  PGCHRONO_CHECK_EQUAL(
    to_code_literal(pgchrono::offset::zero()), "pgchrono::offset::zero()");
  PGCHRONO_CHECK_EQUAL(
    to_code_literal(pgchrono::offset::from_hours(-3)),
    "pgchrono::offset::from_hours(-3)");
  PGCHRONO_CHECK_EQUAL(
    to_code_literal(pgchrono::offset::from_hours_and_minutes(-2, -30)),
    "pgchrono::offset::from_hours_and_minutes(-2, -30)");
  PGCHRONO_CHECK_EQUAL(
    to_code_literal(pgchrono::offset::from_seconds(3723)),
    "pgchrono::offset::from_seconds(3723)");

  pgchrono::offset_date_time const odt{
    pgchrono::local_date_time{2018, 4, 20, 10, 31},
    pgchrono::offset::from_hours(2)};
  PGCHRONO_CHECK_EQUAL(
    to_code_literal(odt),
    "pgchrono::offset_date_time{pgchrono::local_date_time{2018, 4, 20, 10, "
    "31}, pgchrono::offset::from_hours(2)}");

  pgchrono::offset_time const ot{
    pgchrono::local_time{10, 31}, pgchrono::offset::zero()};
  PGCHRONO_CHECK_EQUAL(
    to_code_literal(ot),
    "pgchrono::offset_time{pgchrono::local_time{10, 31}, "
    "pgchrono::offset::zero()}");
}


void test_code_instant()
{
  PGCHRONO_CHECK_EQUAL(to_code_literal(instant::min()), "pgchrono::instant::min()");
  PGCHRONO_CHECK_EQUAL(to_code_literal(instant::max()), "pgchrono::instant::max()");

  auto const when{instant::from_unix_time_ticks(15242130936666660)};
  PGCHRONO_CHECK_EQUAL(
    to_code_literal(when),
    "pgchrono::instant::from_unix_time_ticks(15242130936666660)");
  PGCHRONO_CHECK_EQUAL(
    to_code_literal(when.plus_nanoseconds(7)),
    "pgchrono::instant::from_unix_time_ticks(15242130936666660)"
    ".plus_nanoseconds(7)");

  // Before the epoch, ticks round down and the remainder stays positive.
  PGCHRONO_CHECK_EQUAL(
    to_code_literal(instant{}.plus_nanoseconds(-1)),
    "pgchrono::instant::from_unix_time_ticks(-1).plus_nanoseconds(99)");
}


void test_code_zoned_date_time()
{
  auto const when{instant::from_unix_time_ticks(15242130936666660)};
  pgchrono::zoned_date_time const zoned{
    when, pgchrono::time_zone_source::standard().for_id("UTC+02")};
  PGCHRONO_CHECK_EQUAL(
    to_code_literal(zoned),
    "pgchrono::zoned_date_time{"
    "pgchrono::instant::from_unix_time_ticks(15242130936666660), "
    "pgchrono::time_zone_source::standard().for_id(\"UTC+02\")}");
}


void test_code_period_and_duration()
{
  auto const p{
    pgchrono::period::from_hours(4) + pgchrono::period::from_minutes(3) +
    pgchrono::period::from_seconds(2) + pgchrono::period::from_ticks(6660)};
  PGCHRONO_CHECK_EQUAL(
    to_code_literal(p),
    "pgchrono::period::from_hours(4) + pgchrono::period::from_minutes(3) + "
    "pgchrono::period::from_seconds(2) + "
    "pgchrono::period::from_nanoseconds(666000)");
  PGCHRONO_CHECK_EQUAL(
    to_code_literal(pgchrono::period::zero()), "pgchrono::period::zero()");
  PGCHRONO_CHECK_EQUAL(
    to_code_literal(
      pgchrono::period::from_weeks(2) + pgchrono::period::from_days(-1)),
    "pgchrono::period::from_weeks(2) + pgchrono::period::from_days(-1)");

  PGCHRONO_CHECK_THROWS(
    std::ignore = to_code_literal(pgchrono::period::from_nanoseconds(
      std::numeric_limits<std::int64_t>::min())),
    pgchrono::unrepresentable_value);

  PGCHRONO_CHECK_EQUAL(
    to_code_literal(pgchrono::duration::from_hours(-25)),
    "pgchrono::duration::from_days(-1) + pgchrono::duration::from_hours(-1)");
  PGCHRONO_CHECK_EQUAL(
    to_code_literal(pgchrono::duration::from_nanoseconds(1'500'000)),
    "pgchrono::duration::from_milliseconds(1) + "
    "pgchrono::duration::from_nanoseconds(500000)");
  PGCHRONO_CHECK_EQUAL(
    to_code_literal(pgchrono::duration::zero()), "pgchrono::duration::zero()");
}


void test_code_intervals()
{
  auto const start{instant::from_utc(2020, 1, 1, 12, 0)};
  auto const end{instant::from_utc(2020, 1, 2, 12, 0)};

  PGCHRONO_CHECK_EQUAL(
    to_code_literal(pgchrono::interval{start, std::nullopt}),
    "pgchrono::interval{std::optional<pgchrono::instant>{"
    "pgchrono::instant::from_unix_time_ticks(15778800000000000)}, "
    "std::nullopt}");
  PGCHRONO_CHECK_EQUAL(
    to_code_literal(pgchrono::interval{std::nullopt, end}),
    "pgchrono::interval{std::nullopt, std::optional<pgchrono::instant>{"
    "pgchrono::instant::from_unix_time_ticks(15779664000000000)}}");
  PGCHRONO_CHECK_EQUAL(
    to_code_literal(pgchrono::interval{start, end}),
    "pgchrono::interval{"
    "pgchrono::instant::from_unix_time_ticks(15778800000000000), "
    "pgchrono::instant::from_unix_time_ticks(15779664000000000)}");

  local_date const jan1{2020, 1, 1}, jan5{2020, 1, 5};
  PGCHRONO_CHECK_EQUAL(
    to_code_literal(pgchrono::date_interval{jan1, jan5}),
    "pgchrono::date_interval{pgchrono::local_date{2020, 1, 1}, "
    "pgchrono::local_date{2020, 1, 5}}");

  std::vector<pgchrono::date_interval> const dates{
    pgchrono::date_interval{jan1, jan5}};
  PGCHRONO_CHECK_EQUAL(
    to_code_literal(dates),
    "std::vector<pgchrono::date_interval>{pgchrono::date_interval{"
    "pgchrono::local_date{2020, 1, 1}, pgchrono::local_date{2020, 1, 5}}}");
  PGCHRONO_CHECK_EQUAL(
    to_code_literal(std::vector<pgchrono::interval>{}),
    "std::vector<pgchrono::interval>{}");
}


void test_code_ranges()
{
  local_date const jan1{2020, 1, 1};
  PGCHRONO_CHECK_EQUAL(
    to_code_literal(pgchrono::range<local_date>{}),
    "pgchrono::range<pgchrono::local_date>{}");

  pgchrono::range<local_date> const from_jan1{
    pgchrono::inclusive_bound<local_date>{jan1}, pgchrono::no_bound{}};
  PGCHRONO_CHECK_EQUAL(
    to_code_literal(from_jan1),
    "pgchrono::range<pgchrono::local_date>{"
    "pgchrono::inclusive_bound<pgchrono::local_date>{"
    "pgchrono::local_date{2020, 1, 1}}, pgchrono::no_bound{}}");

  pgchrono::range<instant> const until{
    pgchrono::no_bound{}, pgchrono::exclusive_bound<instant>{instant::max()}};
  PGCHRONO_CHECK_EQUAL(
    to_code_literal(until),
    "pgchrono::range<pgchrono::instant>{pgchrono::no_bound{}, "
    "pgchrono::exclusive_bound<pgchrono::instant>{pgchrono::instant::max()}}");
}


void test_code_temporal_value()
{
  pgchrono::temporal_value const value{pgchrono::period::from_days(3)};
  PGCHRONO_CHECK_EQUAL(to_code_literal(value), "pgchrono::period::from_days(3)");
}


void test_quote_code_string()
{
  PGCHRONO_CHECK_EQUAL(pgchrono::quote_code_string(""), "\"\"");
  PGCHRONO_CHECK_EQUAL(
    pgchrono::quote_code_string("Europe/Amsterdam"), "\"Europe/Amsterdam\"");
  PGCHRONO_CHECK_EQUAL(
    pgchrono::quote_code_string("a\"b\\c\n\td"), "\"a\\\"b\\\\c\\n\\td\"");
  PGCHRONO_CHECK_EQUAL(
    pgchrono::quote_code_string("\x01""9\x7f"), "\"\\0019\\177\"");
}


PGCHRONO_REGISTER_TEST(test_code_date_and_time);
PGCHRONO_REGISTER_TEST(test_code_local_date_time);
PGCHRONO_REGISTER_TEST(test_code_offsets);
PGCHRONO_REGISTER_TEST(test_code_instant);
PGCHRONO_REGISTER_TEST(test_code_zoned_date_time);
PGCHRONO_REGISTER_TEST(test_code_period_and_duration);
PGCHRONO_REGISTER_TEST(test_code_intervals);
PGCHRONO_REGISTER_TEST(test_code_ranges);
PGCHRONO_REGISTER_TEST(test_code_temporal_value);
PGCHRONO_REGISTER_TEST(test_quote_code_string);
} // namespace
