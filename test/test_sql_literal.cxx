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
using pgchrono::local_date_time;
using pgchrono::to_sql_literal;


/// 2018-04-20T10:31:33.666666, as a local date and time.
local_date_time release_time()
{
  return local_date_time{2018, 4, 20, 10, 31, 33, 666}.plus_nanoseconds(
    666'000);
}


void test_sql_date_and_time()
{
  local_date const date{2018, 4, 20};
  PGCHRONO_CHECK_EQUAL(to_sql_literal(date), "DATE '2018-04-20'");
  PGCHRONO_CHECK_EQUAL(to_sql_literal(local_date::min()), "DATE '-infinity'");
  PGCHRONO_CHECK_EQUAL(to_sql_literal(local_date::max()), "DATE 'infinity'");

  local_date const bc{-4712, 1, 1};
  PGCHRONO_CHECK_EQUAL(to_sql_literal(bc), "DATE '4713-01-01 BC'");

  auto const time{pgchrono::local_time::from_hour_minute_second_nanosecond(
    10, 31, 33, 666'666'000)};
  PGCHRONO_CHECK_EQUAL(to_sql_literal(time), "TIME '10:31:33.666666'");
  PGCHRONO_CHECK_EQUAL(
    to_sql_literal(pgchrono::local_time{10, 31}), "TIME '10:31:00'");

  pgchrono::offset_time const timetz{
    pgchrono::local_time{10, 31}, pgchrono::offset::from_hours(2)};
  PGCHRONO_CHECK_EQUAL(to_sql_literal(timetz), "TIMETZ '10:31:00+02'");
}


void test_sql_timestamp()
{
  PGCHRONO_CHECK_EQUAL(
    to_sql_literal(release_time()),
    "TIMESTAMP '2018-04-20T10:31:33.666666'");
  PGCHRONO_CHECK_EQUAL(
    to_sql_literal(local_date_time::min()), "TIMESTAMP '-infinity'");
  PGCHRONO_CHECK_EQUAL(
    to_sql_literal(local_date_time::max()), "TIMESTAMP 'infinity'");
}


void test_sql_instant()
{
  PGCHRONO_CHECK_EQUAL(
    to_sql_literal(instant::min()), "TIMESTAMPTZ '-infinity'");
  PGCHRONO_CHECK_EQUAL(to_sql_literal(instant::max()), "TIMESTAMPTZ 'infinity'");

  auto const when{instant::from_unix_time_ticks(15242202936666660)};
  PGCHRONO_CHECK_EQUAL(
    to_sql_literal(when), "TIMESTAMPTZ '2018-04-20T10:31:33.666666Z'");
}


void test_sql_zoned_and_offset()
{
  auto const when{instant::from_unix_time_ticks(15242130936666660)};
  pgchrono::zoned_date_time const zoned{
    when, pgchrono::time_zone_source::standard().for_id("UTC+02")};
  PGCHRONO_CHECK_EQUAL(
    to_sql_literal(zoned), "TIMESTAMPTZ '2018-04-20T10:31:33.666666+02'");

  pgchrono::offset_date_time const odt{
    release_time(), pgchrono::offset::from_hours_and_minutes(5, 30)};
  PGCHRONO_CHECK_EQUAL(
    to_sql_literal(odt), "TIMESTAMPTZ '2018-04-20T10:31:33.666666+05:30'");

  pgchrono::zoned_date_time const never{
    instant::max(), pgchrono::time_zone_source::standard().utc()};
  PGCHRONO_CHECK_EQUAL(to_sql_literal(never), "TIMESTAMPTZ 'infinity'");

  // Sentinels stay infinite in zones on either side of UTC.
  auto const &zones{pgchrono::time_zone_source::standard()};
  PGCHRONO_CHECK_EQUAL(
    to_sql_literal(instant::max().in_zone(zones.for_id("UTC+02"))),
    "TIMESTAMPTZ 'infinity'");
  PGCHRONO_CHECK_EQUAL(
    to_sql_literal(instant::min().in_zone(zones.for_id("UTC-05"))),
    "TIMESTAMPTZ '-infinity'");
  pgchrono::range<pgchrono::zoned_date_time> const open_ended{
    pgchrono::inclusive_bound<pgchrono::zoned_date_time>{
      when.in_zone(zones.for_id("UTC+02"))},
    pgchrono::exclusive_bound<pgchrono::zoned_date_time>{
      instant::max().in_zone(zones.for_id("UTC+02"))}};
  PGCHRONO_CHECK_EQUAL(
    to_sql_literal(open_ended),
    "'[\"2018-04-20T08:31:33.666666Z\",\"infinity\")'::tstzrange");

  pgchrono::offset_date_time const long_ago{
    local_date_time::min(), pgchrono::offset::zero()};
  PGCHRONO_CHECK_EQUAL(to_sql_literal(long_ago), "TIMESTAMPTZ '-infinity'");
}


void test_sql_period_and_duration()
{
  auto const p{
    pgchrono::period::from_hours(4) + pgchrono::period::from_minutes(3) +
    pgchrono::period::from_seconds(2) + pgchrono::period::from_ticks(6660)};
  PGCHRONO_CHECK_EQUAL(to_sql_literal(p), "INTERVAL 'PT4H3M2.000666S'");
  PGCHRONO_CHECK_EQUAL(
    to_sql_literal(pgchrono::period::zero()), "INTERVAL 'P0D'");
  PGCHRONO_CHECK_EQUAL(
    to_sql_literal(
      pgchrono::period::from_years(1) + pgchrono::period::from_weeks(2)),
    "INTERVAL 'P1Y14D'");

  auto const d{
    pgchrono::duration::from_days(1) + pgchrono::duration::from_minutes(1)};
  PGCHRONO_CHECK_EQUAL(to_sql_literal(d), "INTERVAL 'PT24H1M'");
}


void test_sql_ranges()
{
  auto const start{instant::from_utc(2020, 1, 1, 12, 0)};
  auto const end{instant::from_utc(2020, 1, 2, 12, 0)};
  PGCHRONO_CHECK_EQUAL(
    to_sql_literal(pgchrono::interval{start, end}),
    "'[2020-01-01T12:00:00Z,2020-01-02T12:00:00Z)'::tstzrange");
  PGCHRONO_CHECK_EQUAL(
    to_sql_literal(pgchrono::interval{start, std::nullopt}),
    "'[2020-01-01T12:00:00Z,)'::tstzrange");

  local_date const jan1{2020, 1, 1}, dec25{2020, 12, 25};
  PGCHRONO_CHECK_EQUAL(
    to_sql_literal(pgchrono::date_interval{jan1, dec25}),
    "'[2020-01-01,2020-12-25]'::daterange");
  PGCHRONO_CHECK_EQUAL(
    to_sql_literal(pgchrono::range<local_date>{}), "'empty'::daterange");

  local_date_time const morning{2020, 1, 1, 9, 0}, evening{2020, 1, 1, 17, 0};
  pgchrono::range<local_date_time> const work_day{
    pgchrono::inclusive_bound<local_date_time>{morning},
    pgchrono::exclusive_bound<local_date_time>{evening}};
  PGCHRONO_CHECK_EQUAL(
    to_sql_literal(work_day),
    "'[\"2020-01-01T09:00:00\",\"2020-01-01T17:00:00\")'::tsrange");

  pgchrono::range<instant> const from_start{
    pgchrono::exclusive_bound<instant>{start}, pgchrono::no_bound{}};
  PGCHRONO_CHECK_EQUAL(
    to_sql_literal(from_start), "'(\"2020-01-01T12:00:00Z\",)'::tstzrange");

  // Zoned and offset values go into the range as UTC instants.
  auto const &zones{pgchrono::time_zone_source::standard()};
  pgchrono::range<pgchrono::zoned_date_time> const zoned{
    pgchrono::inclusive_bound<pgchrono::zoned_date_time>{
      pgchrono::zoned_date_time{start, zones.for_id("UTC+02")}},
    pgchrono::inclusive_bound<pgchrono::zoned_date_time>{
      pgchrono::zoned_date_time{end, zones.for_id("UTC-05")}}};
  PGCHRONO_CHECK_EQUAL(
    to_sql_literal(zoned),
    "'[\"2020-01-01T12:00:00Z\",\"2020-01-02T12:00:00Z\"]'::tstzrange");

  pgchrono::offset_date_time const local_noon{
    local_date_time{2020, 1, 1, 14, 0}, pgchrono::offset::from_hours(2)};
  pgchrono::range<pgchrono::offset_date_time> const offsets{
    pgchrono::inclusive_bound<pgchrono::offset_date_time>{local_noon},
    pgchrono::exclusive_bound<pgchrono::offset_date_time>{
      pgchrono::offset_date_time{
        local_date_time::max(), pgchrono::offset::zero()}}};
  PGCHRONO_CHECK_EQUAL(
    to_sql_literal(offsets),
    "'[\"2020-01-01T12:00:00Z\",\"infinity\")'::tstzrange");
}


void test_sql_multiranges()
{
  auto const a{instant::from_utc(2020, 1, 1, 0, 0)};
  auto const b{instant::from_utc(2020, 1, 2, 0, 0)};
  auto const c{instant::from_utc(2020, 1, 3, 0, 0)};
  std::vector<pgchrono::interval> const intervals{
    pgchrono::interval{a, b}, pgchrono::interval{c, std::nullopt}};
  PGCHRONO_CHECK_EQUAL(
    to_sql_literal(intervals),
    "'{[2020-01-01T00:00:00Z,2020-01-02T00:00:00Z),"
    "[2020-01-03T00:00:00Z,)}'::tstzmultirange");

  std::vector<pgchrono::date_interval> const dates{
    pgchrono::date_interval{local_date{2020, 1, 1}, local_date{2020, 1, 5}},
    pgchrono::date_interval{local_date{2020, 2, 1}, local_date{2020, 2, 1}}};
  PGCHRONO_CHECK_EQUAL(
    to_sql_literal(dates),
    "'{[2020-01-01,2020-01-05],[2020-02-01,2020-02-01]}'::datemultirange");

  PGCHRONO_CHECK_EQUAL(
    to_sql_literal(std::vector<pgchrono::date_interval>{}),
    "'{}'::datemultirange");
}


void test_sql_unrepresentable()
{
  // Sub-microsecond precision.
  auto const nanos{release_time().plus_nanoseconds(1)};
  PGCHRONO_CHECK_THROWS(
    std::ignore = to_sql_literal(nanos), pgchrono::unrepresentable_value);
  PGCHRONO_CHECK_THROWS(
    std::ignore = to_sql_literal(instant{}.plus_nanoseconds(1)),
    pgchrono::unrepresentable_value);
  PGCHRONO_CHECK_THROWS(
    std::ignore = to_sql_literal(pgchrono::period::from_nanoseconds(1)),
    pgchrono::unrepresentable_value);
  PGCHRONO_CHECK_THROWS(
    std::ignore = to_sql_literal(pgchrono::duration::from_nanoseconds(-1)),
    pgchrono::unrepresentable_value);

  // Before PostgreSQL's earliest date.
  local_date const too_early{-4713, 11, 23};
  local_date const earliest{-4713, 11, 24};
  PGCHRONO_CHECK_THROWS(
    std::ignore = to_sql_literal(too_early), pgchrono::unrepresentable_value);
  PGCHRONO_CHECK_EQUAL(to_sql_literal(earliest), "DATE '4714-11-24 BC'");

  // Offsets of 16 hours or more.
  pgchrono::offset_date_time const far_east{
    release_time(), pgchrono::offset::from_hours(16)};
  PGCHRONO_CHECK_THROWS(
    std::ignore = to_sql_literal(far_east), pgchrono::unrepresentable_value);
  pgchrono::offset_date_time const almost{
    local_date_time{2018, 4, 20, 10, 31}, pgchrono::offset::from_seconds(57599)};
  PGCHRONO_CHECK_EQUAL(
    to_sql_literal(almost), "TIMESTAMPTZ '2018-04-20T10:31:00+15:59:59'");

  // Periods whose fields overflow PostgreSQL's interval.
  auto const many_months{
    pgchrono::period::from_years(std::numeric_limits<std::int32_t>::max())};
  PGCHRONO_CHECK_THROWS(
    std::ignore = to_sql_literal(many_months), pgchrono::unrepresentable_value);
}


void test_sql_temporal_value()
{
  pgchrono::temporal_value const value{local_date{2018, 4, 20}};
  PGCHRONO_CHECK_EQUAL(pgchrono::kind_of(value), pgchrono::value_kind::local_date);
  PGCHRONO_CHECK_EQUAL(to_sql_literal(value), "DATE '2018-04-20'");

  pgchrono::temporal_value const when{instant::max()};
  PGCHRONO_CHECK_EQUAL(to_sql_literal(when), "TIMESTAMPTZ 'infinity'");
}


void test_timestamp_literal()
{
  auto const when{instant::from_unix_time_ticks(15242202936666660)};
  PGCHRONO_CHECK_EQUAL(
    pgchrono::to_timestamp_literal(when),
    "TIMESTAMP '2018-04-20T10:31:33.666666'");
  PGCHRONO_CHECK_EQUAL(
    pgchrono::to_timestamp_literal(instant::min()), "TIMESTAMP '-infinity'");
  PGCHRONO_CHECK_EQUAL(
    pgchrono::to_timestamp_literal(instant::max()), "TIMESTAMP 'infinity'");
}


PGCHRONO_REGISTER_TEST(test_sql_date_and_time);
PGCHRONO_REGISTER_TEST(test_sql_timestamp);
PGCHRONO_REGISTER_TEST(test_sql_instant);
PGCHRONO_REGISTER_TEST(test_sql_zoned_and_offset);
PGCHRONO_REGISTER_TEST(test_sql_period_and_duration);
PGCHRONO_REGISTER_TEST(test_sql_ranges);
PGCHRONO_REGISTER_TEST(test_sql_multiranges);
PGCHRONO_REGISTER_TEST(test_sql_unrepresentable);
PGCHRONO_REGISTER_TEST(test_sql_temporal_value);
PGCHRONO_REGISTER_TEST(test_timestamp_literal);
} // namespace
