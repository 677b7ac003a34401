#include <catch2/catch_test_macros.hpp>
#include "utils/ErrorReporter.hpp"

#include <nlohmann/json.hpp>

using utils::ErrorCategory;
using utils::ErrorReporter;
using utils::ErrorSeverity;

TEST_CASE("ErrorReporter - Reports are queued and tallied", "[error_reporter]")
{
    ErrorReporter::Reset();

    ErrorReporter::ReportWarning(ErrorCategory::Session, "Enumeration did not finish in time", "timeout 5s");
    ErrorReporter::ReportError(ErrorCategory::Store, "Write rejected");
    ErrorReporter::ReportFatal(ErrorCategory::Configuration, "Nothing to enumerate");

    const auto tally = ErrorReporter::Tally();
    REQUIRE(tally.warnings == 1);
    REQUIRE(tally.errors == 1);
    REQUIRE(tally.fatals == 1);
    REQUIRE(tally.ToJSON()["fatals"] == 1);

    auto pending = ErrorReporter::GetPendingErrors();
    REQUIRE(pending.size() == 3);
    REQUIRE(pending[0].severity == ErrorSeverity::Warning);
    REQUIRE(pending[0].details == "timeout 5s");
    REQUIRE_FALSE(pending[0].timestamp.empty());
    REQUIRE(pending[2].category == ErrorCategory::Configuration);

    SECTION("Draining empties the queue but keeps the tally")
    {
        REQUIRE(ErrorReporter::GetPendingErrors().empty());
        REQUIRE(ErrorReporter::Tally().errors == 1);
    }

    SECTION("Reset clears everything")
    {
        ErrorReporter::Reset();
        REQUIRE(ErrorReporter::Tally().warnings == 0);
    }
}

TEST_CASE("ErrorReporter - Engine errors map to categories", "[error_reporter]")
{
    ErrorReporter::Reset();

    ErrorReporter::ReportEngineError({ surveyor::ErrorKind::Store, "injected close failure", "session-1" },
                                     "Session did not shut down cleanly");
    ErrorReporter::ReportEngineError({ surveyor::ErrorKind::Cancelled, "session is cancelled" }, "Dispatch refused");

    auto pending = ErrorReporter::GetPendingErrors();
    REQUIRE(pending.size() == 2);
    REQUIRE(pending[0].category == ErrorCategory::Store);
    REQUIRE(pending[0].severity == ErrorSeverity::Error);
    REQUIRE(pending[0].details.find("injected close failure (session-1)") != std::string::npos);
    REQUIRE(pending[1].category == ErrorCategory::Session);
    REQUIRE(pending[1].severity == ErrorSeverity::Warning);

    REQUIRE(ErrorReporter::CategoryFor(surveyor::ErrorKind::DuplicateHandler) == ErrorCategory::Registry);
    REQUIRE(ErrorReporter::CategoryFor(surveyor::ErrorKind::TraversalBound) == ErrorCategory::Dispatch);
    REQUIRE(std::string(ErrorReporter::CategoryToString(ErrorCategory::Store)) == "Store");

    ErrorReporter::Reset();
}
