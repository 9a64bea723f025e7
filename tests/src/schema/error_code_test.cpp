#include <gtest/gtest.h>
#include <warden/schema/error_code.hpp>

TEST(error_code, names_round_trip) {
  for (const auto& [name, value] : warden::schema::kErrorCodeMappings) {
    EXPECT_EQ(warden::schema::to_string(value), name);
    EXPECT_EQ(warden::schema::try_from_string<warden::schema::error_code>(name),
              value);
  }
}

TEST(error_code, numeric_values_are_stable) {
  EXPECT_EQ(static_cast<uint32_t>(warden::schema::error_code::ok), 0u);
  EXPECT_EQ(static_cast<uint32_t>(warden::schema::error_code::replay_rejected),
            1u);
  EXPECT_EQ(
      static_cast<uint32_t>(warden::schema::error_code::authorization_denied),
      9u);
  EXPECT_EQ(static_cast<uint32_t>(warden::schema::error_code::transfer_failed),
            10u);
}

TEST(error_code, unknown_names_do_not_parse) {
  EXPECT_FALSE(warden::schema::try_from_string<warden::schema::error_code>(
                   "not_a_code")
                   .has_value());
}
