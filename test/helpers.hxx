#if !defined(PGCHRONO_H_TEST_HELPERS)
#  define PGCHRONO_H_TEST_HELPERS

#  include <array>
#  include <concepts>
#  include <cstddef>
#  include <map>
#  include <optional>
#  include <stdexcept>
#  include <string>
#  include <string_view>
#  include <tuple>
#  include <type_traits>

#  include <pgchrono/except>
#  include <pgchrono/strconv>
#  include <pgchrono/value>

namespace pgchrono::test
{
/// Exception: A test does not satisfy expected condition.
class test_failure : public std::logic_error
{
public:
  test_failure(std::string const &desc, sl loc = sl::current());
  ~test_failure() noexcept override;

  sl const location;

private:
  test_failure &operator=(test_failure const &) = delete;
};


/// Exception: A test can't run in this environment, e.g. there's no server.
/** The runner reports these, but they don't count as failures.
 */
class test_skipped : public std::runtime_error
{
public:
  explicit test_skipped(std::string const &why);
  ~test_skipped() noexcept override;
};


using testfunc = void (*)();


/// Maximum number of tests in the test suite.
/** If this should prove insufficient, increase it.
 */
constexpr inline std::size_t max_tests{1000};


/// The test suite.
/** This is where the tests get registered at initialisation time.
 *
 * This gets a bit hacky.  It relies on an internal counter being
 * zero-initialised before the test registrations get constructed.
 */
class suite
{
public:
  /// Register a test function.
  static void register_test(char const name[], testfunc func) noexcept;

  /// Collect all tests into a map: test name to test function.
  static std::map<std::string_view, testfunc> gather();

private:
  /// Number of registered tests.
  static constinit std::size_t s_num_tests;

  static constinit std::array<std::string_view, max_tests> s_names;
  static constinit std::array<testfunc, max_tests> s_funcs;
};


// Register a test function, so the runner will run it.
#  define PGCHRONO_REGISTER_TEST(func)                                        \
    [[maybe_unused]] pgchrono::test::registrar const tst_##func               \
    {                                                                         \
      #func, func                                                             \
    }


/// Register a test while not inside a function.
struct registrar
{
  registrar(char const name[], testfunc func) noexcept
  {
    pgchrono::test::suite::register_test(name, func);
  }
};


/// Represent a value as text, for failure messages.
template<typename TYPE> inline std::string describe(TYPE const &value)
{
  if constexpr (std::is_same_v<TYPE, bool>)
    return value ? "true" : "false";
  else if constexpr (std::is_same_v<TYPE, value_kind>)
    return std::string{name_of(value)};
  else if constexpr (std::is_convertible_v<TYPE, std::string_view>)
    return std::string{std::string_view{value}};
  else if constexpr (std::is_arithmetic_v<TYPE>)
    return pgchrono::internal::concat(value);
  else if constexpr (string_traits<TYPE>::converts_to_string)
    return pgchrono::to_string(value);
  else
    return "<value>";
}


template<typename TYPE>
inline std::string describe(std::optional<TYPE> const &value)
{
  if (not value.has_value())
    return "nullopt";
  return describe(*value);
}


// Unconditional test failure.
[[noreturn]] void check_notreached(
  std::string const &desc =
    "Execution was never supposed to reach this point.",
  sl loc = sl::current());

// Verify that a condition is met, similar to assert().
// Takes an optional failure description as a second argument.
#  define PGCHRONO_CHECK(condition, ...)                                      \
    pgchrono::test::check((condition), #condition __VA_OPT__(, ) __VA_ARGS__)

void check(
  bool condition, char const text[],
  std::string const &desc = "Condition check failed,", sl loc = sl::current());

// Verify that variable has the expected value.
// Takes an optional failure description as a third argument.
#  define PGCHRONO_CHECK_EQUAL(actual, expected, ...)                         \
    pgchrono::test::check_equal(                                              \
      (actual), #actual, (expected), #expected __VA_OPT__(, ) __VA_ARGS__)

template<typename ACTUAL, typename EXPECTED>
inline void check_equal(
  ACTUAL const &actual, char const actual_text[], EXPECTED const &expected,
  char const expected_text[],
  std::string const &desc = "Equality check failed.", sl loc = sl::current())
{
  if (expected == actual)
    return;
  throw test_failure{
    pgchrono::internal::concat(
      desc, " (", actual_text, " <> ", expected_text,
      ": actual=", describe(actual), ", expected=", describe(expected), ")"),
    loc};
}

// Verify that two values are not equal.
// Takes an optional failure description as a third argument.
#  define PGCHRONO_CHECK_NOT_EQUAL(value1, value2, ...)                       \
    pgchrono::test::check_not_equal(                                          \
      (value1), #value1, (value2), #value2 __VA_OPT__(, ) __VA_ARGS__)

template<typename VALUE1, typename VALUE2>
inline void check_not_equal(
  VALUE1 const &value1, char const text1[], VALUE2 const &value2,
  char const text2[], std::string const &desc = "Inequality check failed.",
  sl loc = sl::current())
{
  if (value1 != value2)
    return;
  throw test_failure{
    pgchrono::internal::concat(
      desc, " (", text1, " == ", text2, ": both are ", describe(value2), ")"),
    loc};
}


// Verify that value1 is less/greater than value2.
// Takes an optional failure description as a third argument.
#  define PGCHRONO_CHECK_LESS(value1, value2, ...)                            \
    pgchrono::test::check_less(                                               \
      (value1), #value1, (value2), #value2 __VA_OPT__(, ) __VA_ARGS__)
#  define PGCHRONO_CHECK_GREATER(value2, value1, ...)                         \
    pgchrono::test::check_less(                                               \
      (value1), #value1, (value2), #value2 __VA_OPT__(, ) __VA_ARGS__)

template<typename VALUE1, typename VALUE2>
inline void check_less(
  VALUE1 const &value1, char const text1[], VALUE2 const &value2,
  char const text2[], std::string const &desc = "Less/greater check failed.",
  sl loc = sl::current())
{
  if (value1 < value2)
    return;
  throw test_failure{
    pgchrono::internal::concat(
      desc, " (", text1, " >= ", text2, ": \"lower\"=", describe(value1),
      ", \"upper\"=", describe(value2), ")"),
    loc};
}


/// A special exception type not derived from `std::exception`.
struct failure_to_fail
{};


// Verify that "action" does not throw an exception.
// Takes an optional failure description as a second argument.
#  define PGCHRONO_CHECK_SUCCEEDS(action, ...)                                \
    pgchrono::test::check_succeeds(                                           \
      ([&]() { action; }), #action __VA_OPT__(, ) __VA_ARGS__)

template<std::invocable F>
inline void check_succeeds(
  F &&f, char const text[], std::string desc = "Expected this to succeed.",
  sl loc = sl::current())
{
  try
  {
    f();
  }
  catch (std::exception const &e)
  {
    pgchrono::test::check_notreached(
      pgchrono::internal::concat(
        desc, " - \"", text, "\" threw exception: ", e.what()),
      loc);
  }
  catch (...)
  {
    pgchrono::test::check_notreached(
      pgchrono::internal::concat(
        desc, " - \"", text, "\" threw a non-exception!"),
      loc);
  }
}


template<typename EXC, std::invocable F>
inline void check_throws(
  F &&f, char const text[],
  std::string desc = "This code did not thow the expected exception.",
  sl loc = sl::current())
{
  try
  {
    f();
    throw failure_to_fail{};
  }
  catch (failure_to_fail const &)
  {
    check_notreached(
      pgchrono::internal::concat(desc, " (\"", text, "\" did not throw)."),
      loc);
  }
  catch (EXC const &)
  {}
  catch (std::exception const &e)
  {
    check_notreached(
      pgchrono::internal::concat(
        desc, " (\"", text, "\" threw the wrong exception type: ", e.what(),
        ")."),
      loc);
  }
  catch (...)
  {
    check_notreached(
      pgchrono::internal::concat(
        desc, " (\"", text, "\" threw a non-exception type!)"),
      loc);
  }
}


// Verify that "action" throws "exception_type" (which is not std::exception).
// Takes an optional failure description as an 2nd argument.
#  define PGCHRONO_CHECK_THROWS(action, exception_type, ...)                  \
    pgchrono::test::check_throws<exception_type>(                             \
      ([&] { return action, 0; }), #action __VA_OPT__(, ) __VA_ARGS__)
} // namespace pgchrono::test

#endif
