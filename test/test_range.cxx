#include <pgchrono/range>
#include <pgchrono/time>

#include "helpers.hxx"

namespace
{
using namespace std::literals;
using pgchrono::exclusive_bound;
using pgchrono::inclusive_bound;
using pgchrono::instant;
using pgchrono::local_date;
using pgchrono::no_bound;


void test_date_range()
{
  local_date const jan1{2020, 1, 1}, feb1{2020, 2, 1}, jan15{2020, 1, 15};
  pgchrono::range<local_date> const january{
    inclusive_bound<local_date>{jan1}, exclusive_bound<local_date>{feb1}};

  PGCHRONO_CHECK(january.contains(jan1));
  PGCHRONO_CHECK(january.contains(jan15));
  PGCHRONO_CHECK(not january.contains(feb1));
  PGCHRONO_CHECK(not january.empty());
  PGCHRONO_CHECK_EQUAL(pgchrono::to_string(january), "[2020-01-01,2020-02-01)");
  PGCHRONO_CHECK(
    pgchrono::from_string<pgchrono::range<local_date>>(
      "[2020-01-01,2020-02-01)") == january);

  PGCHRONO_CHECK_THROWS(
    (pgchrono::range<local_date>{
      inclusive_bound<local_date>{feb1}, inclusive_bound<local_date>{jan1}}),
    pgchrono::range_error);
}


void test_empty_range()
{
  pgchrono::range<local_date> const nothing;
  PGCHRONO_CHECK(nothing.empty());
  PGCHRONO_CHECK_EQUAL(pgchrono::to_string(nothing), "empty");
  PGCHRONO_CHECK(
    pgchrono::from_string<pgchrono::range<local_date>>("empty").empty());
  PGCHRONO_CHECK(
    pgchrono::from_string<pgchrono::range<local_date>>("EMPTY").empty());

  local_date const day{2020, 1, 1};
  pgchrono::range<local_date> const point{
    exclusive_bound<local_date>{day}, exclusive_bound<local_date>{day}};
  PGCHRONO_CHECK(point.empty());
  PGCHRONO_CHECK(point == nothing);
}


void test_unbounded_range()
{
  auto const noon{instant::from_utc(2020, 1, 1, 12, 0)};
  auto const parsed{pgchrono::from_string<pgchrono::range<instant>>(
    "[\"2020-01-01 12:00:00+00\",)")};
  PGCHRONO_CHECK(parsed.lower_bound().is_inclusive());
  PGCHRONO_CHECK_EQUAL(*parsed.lower_bound().value(), noon);
  PGCHRONO_CHECK(not parsed.upper_bound().is_limited());
  PGCHRONO_CHECK(parsed.contains(instant::max()));
  PGCHRONO_CHECK(not parsed.contains(instant::min()));

  pgchrono::range<instant> const everything{no_bound{}, no_bound{}};
  PGCHRONO_CHECK_EQUAL(pgchrono::to_string(everything), "(,)");

  std::string_view const invalid[]{
    ""sv, "[,"sv, "(,]x"sv, "<,>"sv, "[\"2020-01-01 12:00:00+00,)"sv,
    "emptiness"sv,
  };
  for (auto const text : invalid)
    PGCHRONO_CHECK_THROWS(
      std::ignore = pgchrono::from_string<pgchrono::range<instant>>(text),
      pgchrono::conversion_error);
}


void test_interval()
{
  auto const start{instant::from_utc(2020, 1, 1, 12, 0)};
  auto const end{instant::from_utc(2020, 1, 2, 12, 0)};
  pgchrono::interval const day{start, end};

  PGCHRONO_CHECK(day.contains(start));
  PGCHRONO_CHECK(not day.contains(end));
  PGCHRONO_CHECK_EQUAL(
    pgchrono::to_string(day), "[2020-01-01T12:00:00Z,2020-01-02T12:00:00Z)");
  PGCHRONO_CHECK(
    pgchrono::from_string<pgchrono::interval>(
      "[\"2020-01-01 12:00:00+00\",\"2020-01-02 12:00:00+00\")") == day);

  pgchrono::interval const open_ended{start, std::nullopt};
  PGCHRONO_CHECK(open_ended.contains(instant::max()));
  PGCHRONO_CHECK(not open_ended.contains(instant::min()));
  PGCHRONO_CHECK(
    pgchrono::from_string<pgchrono::interval>("[2020-01-01T12:00:00Z,)") ==
    open_ended);

  pgchrono::interval const always;
  PGCHRONO_CHECK(always.contains(instant::min()));
  PGCHRONO_CHECK_EQUAL(pgchrono::to_string(always), "(,)");

  PGCHRONO_CHECK_THROWS(
    (pgchrono::interval{end, start}), pgchrono::argument_error);
  PGCHRONO_CHECK_THROWS(
    std::ignore =
      pgchrono::from_string<pgchrono::interval>("(2020-01-01T12:00:00Z,)"),
    pgchrono::conversion_error);
  PGCHRONO_CHECK_THROWS(
    std::ignore = pgchrono::from_string<pgchrono::interval>(
      "[2020-01-01T12:00:00Z,2020-01-02T12:00:00Z]"),
    pgchrono::conversion_error);
}


void test_date_interval()
{
  local_date const jan1{2020, 1, 1}, dec25{2020, 12, 25}, dec26{2020, 12, 26};
  pgchrono::date_interval const year{jan1, dec25};

  PGCHRONO_CHECK_EQUAL(year.length(), 360);
  PGCHRONO_CHECK(year.contains(dec25));
  PGCHRONO_CHECK(not year.contains(dec26));
  PGCHRONO_CHECK_EQUAL(pgchrono::to_string(year), "[2020-01-01,2020-12-25]");

  // PostgreSQL normalises date ranges to half-open form.
  PGCHRONO_CHECK(
    pgchrono::from_string<pgchrono::date_interval>("[2020-01-01,2020-12-26)") ==
    year);
  PGCHRONO_CHECK(
    pgchrono::from_string<pgchrono::date_interval>("(2019-12-31,2020-12-25]") ==
    year);

  pgchrono::date_interval const single_day{jan1, jan1};
  PGCHRONO_CHECK_EQUAL(single_day.length(), 1);

  PGCHRONO_CHECK_THROWS(
    (pgchrono::date_interval{dec25, jan1}), pgchrono::argument_error);
  PGCHRONO_CHECK_THROWS(
    std::ignore = pgchrono::from_string<pgchrono::date_interval>("empty"),
    pgchrono::conversion_error);
  PGCHRONO_CHECK_THROWS(
    std::ignore = pgchrono::from_string<pgchrono::date_interval>(
      "[2020-01-01,2020-01-01)"),
    pgchrono::conversion_error);
}


PGCHRONO_REGISTER_TEST(test_date_range);
PGCHRONO_REGISTER_TEST(test_empty_range);
PGCHRONO_REGISTER_TEST(test_unbounded_range);
PGCHRONO_REGISTER_TEST(test_interval);
PGCHRONO_REGISTER_TEST(test_date_interval);
} // namespace
