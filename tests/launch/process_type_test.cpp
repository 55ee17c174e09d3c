#include "launch/process_type.hpp"

#include <catch2/catch.hpp>

#include <optional>
#include <string_view>

using rolelaunch::launch::ParseProcessType;
using rolelaunch::launch::ProcessType;

TEST_CASE("Known process types parse to their role", "[launch][process_type]") {
  REQUIRE(ParseProcessType(std::string_view("web")) == ProcessType::kWeb);
  REQUIRE(ParseProcessType(std::string_view("worker")) == ProcessType::kWorker);
}

TEST_CASE("Unset and empty process types are unrecognized", "[launch][process_type]") {
  REQUIRE(ParseProcessType(std::nullopt) == ProcessType::kUnrecognized);
  REQUIRE(ParseProcessType(std::string_view("")) == ProcessType::kUnrecognized);
}

TEST_CASE("Process type matching is exact and case-sensitive", "[launch][process_type]") {
  REQUIRE(ParseProcessType(std::string_view("staging")) == ProcessType::kUnrecognized);
  REQUIRE(ParseProcessType(std::string_view("Web")) == ProcessType::kUnrecognized);
  REQUIRE(ParseProcessType(std::string_view("WORKER")) == ProcessType::kUnrecognized);
  REQUIRE(ParseProcessType(std::string_view(" web")) == ProcessType::kUnrecognized);
  REQUIRE(ParseProcessType(std::string_view("worker\n")) == ProcessType::kUnrecognized);
  REQUIRE(ParseProcessType(std::string_view("web,worker")) == ProcessType::kUnrecognized);
}

TEST_CASE("ProcessType maps to stable string values", "[launch][process_type]") {
  REQUIRE(rolelaunch::launch::ToString(ProcessType::kWeb) == "web");
  REQUIRE(rolelaunch::launch::ToString(ProcessType::kWorker) == "worker");
  REQUIRE(rolelaunch::launch::ToString(ProcessType::kUnrecognized) == "unrecognized");
  REQUIRE(rolelaunch::launch::kProcessTypeEnvVar == "PROCESS_TYPE");
}
