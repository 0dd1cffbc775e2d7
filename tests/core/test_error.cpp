// prism_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <prism/core/error.hpp>
#include <string>

using namespace prism_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err("Test error");
        REQUIRE(err.message() == "Test error");
        REQUIRE(err.code() == ErrorCode::Unknown);
        REQUIRE(err.is<std::string>());
    }

    SECTION("from code and message") {
        Error err(ErrorCode::InvalidArgument, "Bad argument");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.message() == "Bad argument");
    }

    SECTION("with context") {
        Error err = Error("Base error").with_context("key", "value");
        auto* ctx = err.get_context("key");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == "value");
        REQUIRE(err.get_context("missing") == nullptr);
        REQUIRE(err.context().size() == 1);
    }
}

TEST_CASE("QueryError factories", "[core][error]") {
    SECTION("no_such_entity") {
        Error err = QueryError::no_such_entity(42);
        REQUIRE(err.code() == ErrorCode::NotFound);
        REQUIRE(err.is<QueryError>());
        REQUIRE(err.as<QueryError>()->kind == QueryError::Kind::NoSuchEntity);
        REQUIRE(err.as<QueryError>()->entity_bits == 42);
    }

    SECTION("query_does_not_match") {
        Error err = QueryError::query_does_not_match(7);
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.as<QueryError>()->kind == QueryError::Kind::QueryDoesNotMatch);
    }

    SECTION("single lookups") {
        Error none = QueryError::no_entities("Position");
        Error many = QueryError::multiple_entities("Position");
        REQUIRE(none.code() == ErrorCode::NotFound);
        REQUIRE(many.code() == ErrorCode::InvalidState);
        REQUIRE(none.message().find("Position") != std::string::npos);
        REQUIRE(many.as<QueryError>()->query == "Position");
    }

    SECTION("conflicting_access") {
        Error err = QueryError::conflicting_access("Q", "3, 5");
        REQUIRE(err.code() == ErrorCode::Conflict);
        REQUIRE(err.message().find("3, 5") != std::string::npos);
    }

    SECTION("already_borrowed") {
        Error err = QueryError::already_borrowed(42);
        REQUIRE(err.code() == ErrorCode::Conflict);
        REQUIRE(err.as<QueryError>()->kind == QueryError::Kind::AlreadyBorrowed);
        REQUIRE(err.as<QueryError>()->entity_bits == 42);
    }
}

TEST_CASE("ConfigError factories", "[core][error]") {
    Error missing = ConfigError::file_not_found("world.json");
    Error broken = ConfigError::parse_failed("unexpected token");
    Error invalid = ConfigError::invalid_value("log_level", "unknown level");

    REQUIRE(missing.code() == ErrorCode::IOError);
    REQUIRE(broken.code() == ErrorCode::ParseError);
    REQUIRE(invalid.code() == ErrorCode::InvalidArgument);
    REQUIRE(invalid.as<ConfigError>()->key == "log_level");
    REQUIRE(missing.as<QueryError>() == nullptr);
}

TEST_CASE("build_error_chain", "[core][error]") {
    Error err = QueryError::no_such_entity(9);
    err.with_context("query", "Read<Position>");

    std::string chain = build_error_chain(err);
    REQUIRE(chain.find("[NotFound]") != std::string::npos);
    REQUIRE(chain.find("QueryError::NoSuchEntity") != std::string::npos);
    REQUIRE(chain.find("entity bits: 9") != std::string::npos);
    REQUIRE(chain.find("query: Read<Position>") != std::string::npos);
}

// =============================================================================
// Result Tests
// =============================================================================

TEST_CASE("Result with value", "[core][result]") {
    Result<int> result = Ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(static_cast<bool>(result));
    REQUIRE(result.value() == 42);
    REQUIRE(*result == 42);
    REQUIRE(result.value_or(0) == 42);
    REQUIRE(result.unwrap() == 42);
}

TEST_CASE("Result with error", "[core][result]") {
    Result<int> result = Err<int>(std::string("failed"));

    REQUIRE(result.is_err());
    REQUIRE(result.error().message() == "failed");
    REQUIRE(result.value_or(-1) == -1);
    REQUIRE_THROWS(result.unwrap());
}

TEST_CASE("Result map and and_then", "[core][result]") {
    SECTION("map transforms value") {
        auto mapped = Result<int>(20).map([](int v) { return v + 1; });
        REQUIRE(mapped.value() == 21);
    }

    SECTION("map propagates error") {
        auto mapped = Result<int>(Error("nope")).map([](int v) { return v + 1; });
        REQUIRE(mapped.is_err());
        REQUIRE(mapped.error().message() == "nope");
    }

    SECTION("and_then chains") {
        auto chained = Result<int>(4).and_then([](int v) -> Result<std::string> {
            return std::to_string(v * 2);
        });
        REQUIRE(chained.value() == "8");
    }
}

TEST_CASE("Result<void>", "[core][result]") {
    Result<void> ok = Ok();
    REQUIRE(ok.is_ok());
    REQUIRE_NOTHROW(ok.unwrap());

    Result<void> err = Err(std::string("broken"));
    REQUIRE(err.is_err());
    REQUIRE_THROWS(err.unwrap());
}
