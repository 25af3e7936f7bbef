#pragma once

#include <e521/core/error.h>

#define ASSERT_OK(rv) ASSERT_EQ(rv, SUCCESS)
#define EXPECT_OK(rv) EXPECT_EQ(rv, SUCCESS)
#define EXPECT_ER(er) EXPECT_NE(er, SUCCESS)

// Turns on test storing mode, then checks that `er` fails and that `msg` was logged.
#define EXPECT_ER_MSG(er, msg)             \
  e521::set_test_error_storing_mode(true); \
  EXPECT_ER(er);                           \
  EXPECT_NE(std::string::npos, e521::g_test_log_str.find(msg))

#define EXPECT_THROW_MSG(statement, expected_exception, expected_what)                                   \
  try {                                                                                                  \
    statement;                                                                                           \
    ADD_FAILURE() << "Expected: " #statement " throws " #expected_exception ", but it throws nothing.";  \
  } catch (const expected_exception& e) {                                                                \
    if (std::string(e.what()).find(expected_what) == std::string::npos)                                  \
      ADD_FAILURE() << "Expected the exception text to contain '" << expected_what << "', got '"         \
                    << e.what() << "'.";                                                                 \
  } catch (...) {                                                                                        \
    ADD_FAILURE() << "Expected: " #statement " throws " #expected_exception ", but it throws another type."; \
  }

#define EXPECT_E521_ASSERT(statement, msg) EXPECT_THROW_MSG(statement, e521::assertion_failed_t, msg)
