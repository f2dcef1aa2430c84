#include <gtest/gtest.h>
#include <procura/schema/primitives.hpp>

TEST(primitives, format_amount_groups_thousands) {
  EXPECT_EQ(procura::schema::format_amount(123456), "$1,234.56");
  EXPECT_EQ(procura::schema::format_amount(100000000), "$1,000,000.00");
  EXPECT_EQ(procura::schema::format_amount(99999), "$999.99");
}

TEST(primitives, format_amount_pads_cents) {
  EXPECT_EQ(procura::schema::format_amount(0), "$0.00");
  EXPECT_EQ(procura::schema::format_amount(5), "$0.05");
  EXPECT_EQ(procura::schema::format_amount(100), "$1.00");
}

TEST(primitives, bytes_and_strings_convert_both_ways) {
  auto bytes = procura::schema::make_bytes(std::string_view{"PO-1"});
  EXPECT_EQ(bytes.size(), 4u);
  EXPECT_EQ(procura::schema::make_string(bytes), "PO-1");
  EXPECT_EQ(procura::schema::make_string_view(
                procura::schema::make_bytes_view(bytes)),
            "PO-1");
}

TEST(primitives, now_milliseconds_is_monotonic_enough) {
  auto first = procura::schema::now_milliseconds();
  auto second = procura::schema::now_milliseconds();
  EXPECT_GT(first, 0u);
  EXPECT_LE(first, second);
}
