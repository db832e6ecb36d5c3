// Minimal EXPECT_* harness shared by the test executables.
#pragma once

#include <cmath>
#include <iostream>
#include <string>

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                          \
  do {                                                                                             \
    if (!(cond)) {                                                                                 \
      ++g_failures;                                                                                \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";        \
    }                                                                                              \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                            \
  do {                                                                                             \
    const auto _a = (a);                                                                           \
    const auto _b = (b);                                                                           \
    if (!(_a == _b)) {                                                                             \
      ++g_failures;                                                                                \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b      \
                << "\n";                                                                           \
    }                                                                                              \
  } while (0)

#define EXPECT_NE(a, b)                                                                            \
  do {                                                                                             \
    const auto _a = (a);                                                                           \
    const auto _b = (b);                                                                           \
    if (!(_a != _b)) {                                                                             \
      ++g_failures;                                                                                \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NE failed: " << #a << " != " << #b      \
                << "\n";                                                                           \
    }                                                                                              \
  } while (0)

#define EXPECT_NEAR(a, b, tol)                                                                   \
  do {                                                                                             \
    const double _a = (a);                                                                         \
    const double _b = (b);                                                                         \
    if (!(std::abs(_a - _b) <= (tol))) {                                                           \
      ++g_failures;                                                                                \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NEAR failed: " << #a << " (" << _a     \
                << ") vs " << #b << " (" << _b << ")\n";                                           \
    }                                                                                              \
  } while (0)

#define EXPECT_THROW(stmt, ex)                                                                     \
  do {                                                                                             \
    bool _thrown = false;                                                                          \
    try {                                                                                          \
      stmt;                                                                                        \
    } catch (const ex&) {                                                                          \
      _thrown = true;                                                                              \
    }                                                                                              \
    if (!_thrown) {                                                                                \
      ++g_failures;                                                                                \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_THROW failed: " << #stmt << "\n";       \
    }                                                                                              \
  } while (0)

#define ASSERT_TRUE(cond)                                                                          \
  do {                                                                                             \
    if (!(cond)) {                                                                                 \
      ++g_failures;                                                                                \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";        \
      return;                                                                                      \
    }                                                                                              \
  } while (0)

static int FinishTests(const std::string& name)
{
  if (g_failures == 0) {
    std::cout << name << ": OK\n";
    return 0;
  }
  std::cerr << name << ": FAILED (" << g_failures << ")\n";
  return 1;
}
