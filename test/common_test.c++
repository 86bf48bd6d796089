#include "test_common.h++"

TEST_CASE("parse ISO 8601 timestamps", "[common]") {
  CHECK(parse_iso8601("2023-01-01T00:00:00Z") == ms_to_timestamp(1'672'531'200'000));
  CHECK(parse_iso8601("2023-01-01T00:00:00") == ms_to_timestamp(1'672'531'200'000));
  CHECK(parse_iso8601("2023-01-01 00:00:00") == ms_to_timestamp(1'672'531'200'000));
  CHECK(parse_iso8601("2023-12-26T20:13:13.348Z") == SAMPLE_INSTANT);
  CHECK(parse_iso8601("2023-12-26T20:13:13.3Z") == SAMPLE_INSTANT - 48ms);
  CHECK(parse_iso8601("1970-01-01T00:00:00.001Z") == ms_to_timestamp(1));
  CHECK(parse_iso8601("2024-02-29T00:00:00Z"));
}

TEST_CASE("reject invalid ISO 8601 timestamps", "[common]") {
  CHECK_FALSE(parse_iso8601(""));
  CHECK_FALSE(parse_iso8601("2023-01-01"));
  CHECK_FALSE(parse_iso8601("2023-13-01T00:00:00Z"));
  CHECK_FALSE(parse_iso8601("2023-02-30T00:00:00Z"));
  CHECK_FALSE(parse_iso8601("2023-02-29T00:00:00Z"));
  CHECK_FALSE(parse_iso8601("2023-01-01T24:00:00Z"));
  CHECK_FALSE(parse_iso8601("2023-01-01T00:60:00Z"));
  CHECK_FALSE(parse_iso8601("2023-01-01T00:00:00.1234Z"));
  CHECK_FALSE(parse_iso8601("2023-01-01T00:00:00+01:00"));
}

TEST_CASE("format ISO 8601 timestamps", "[common]") {
  CHECK(format_iso8601(SAMPLE_INSTANT) == "2023-12-26T20:13:13.348");
  CHECK(format_iso8601(ms_to_timestamp(0)) == "1970-01-01T00:00:00.000");
  CHECK(format_iso8601(ms_to_timestamp(-1)) == "1969-12-31T23:59:59.999");
  CHECK(format_iso8601(*parse_iso8601("2024-02-29T23:59:59.5")) == "2024-02-29T23:59:59.500");
}

TEST_CASE("IdError carries its code and message", "[common]") {
  const IdError e(IdErrorCode::ClockRegression, "clock moved backwards by 3 ms");
  CHECK(e.code == IdErrorCode::ClockRegression);
  CHECK(e.message == "clock moved backwards by 3 ms");
  CHECK(string(e.what()) == "Clock regression: clock moved backwards by 3 ms");
}

TEST_CASE("every IdErrorCode has a name", "[common]") {
  for (const auto code : {
    IdErrorCode::InvalidMachineId, IdErrorCode::InvalidEpoch, IdErrorCode::ClockRegression,
    IdErrorCode::FieldOverflow, IdErrorCode::InvalidCharacter, IdErrorCode::MalformedId
  }) {
    CHECK(id_error_name(code) != "Unknown error");
  }
  STATIC_REQUIRE(id_error_name(IdErrorCode::MalformedId) == "Malformed ID");
}

TEST_CASE("parse unsigned option values", "[common]") {
  CHECK(parse_uint("0") == 0U);
  CHECK(parse_uint("42") == 42U);
  CHECK(parse_uint("18446744073709551615") == std::numeric_limits<uint64_t>::max());
}

TEST_CASE("reject negative or malformed option values", "[common]") {
  CHECK_FALSE(parse_uint("-1"));
  CHECK_FALSE(parse_uint("+1"));
  CHECK_FALSE(parse_uint(""));
  CHECK_FALSE(parse_uint(" 1"));
  CHECK_FALSE(parse_uint("1x"));
  CHECK_FALSE(parse_uint("18446744073709551616"));
}
