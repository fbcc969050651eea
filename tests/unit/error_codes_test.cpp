#include <spillway/error.hpp>
#include <catch2/catch_all.hpp>

#include <string_view>

TEST_CASE("error codes stable subset", "[errors]") {
  using spillway::core::error_code;
  REQUIRE(static_cast<unsigned>(error_code::ok) == 0u);
  REQUIRE(static_cast<unsigned>(error_code::io_failed) == 1001u);
  REQUIRE(static_cast<unsigned>(error_code::config_invalid) == 2001u);
  REQUIRE(static_cast<unsigned>(error_code::data_integrity) == 3001u);
  REQUIRE(static_cast<unsigned>(error_code::precondition_failed) == 4001u);
  REQUIRE(static_cast<unsigned>(error_code::internal) == 9001u);
}

TEST_CASE("error codes have names", "[errors]") {
  using spillway::core::error_code;
  using spillway::core::to_string;
  REQUIRE(std::string_view(to_string(error_code::io_failed)) == "io_failed");
  REQUIRE(std::string_view(to_string(error_code::precondition_failed)) == "precondition_failed");
  REQUIRE(std::string_view(to_string(error_code::out_of_range)) == "out_of_range");
}
