#include "ibshrink/orchestrator/confirmation.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>

using ibshrink::orchestrator::StreamConfirmation;

TEST_CASE("StreamConfirmation accepts yes in any case")
{
    std::istringstream input{"  YES \n"};
    std::ostringstream output;
    StreamConfirmation confirmation{input, output};

    CHECK(confirmation.confirm("plan text"));
    CHECK(output.str().find("plan text\n") == 0U);
    CHECK(output.str().find("Do you want to proceed? Type yes or no: ") != std::string::npos);
}

TEST_CASE("StreamConfirmation declines on no")
{
    std::istringstream input{"no\n"};
    std::ostringstream output;
    StreamConfirmation confirmation{input, output};

    CHECK_FALSE(confirmation.confirm("plan\n"));
}

TEST_CASE("StreamConfirmation asks again until the answer is yes or no")
{
    std::istringstream input{"y\nmaybe\nyes\n"};
    std::ostringstream output;
    StreamConfirmation confirmation{input, output};

    CHECK(confirmation.confirm("plan\n"));

    const auto text = output.str();
    std::size_t reprompts = 0U;
    for (auto pos = text.find("Please type yes or no."); pos != std::string::npos;
         pos = text.find("Please type yes or no.", pos + 1U)) {
        ++reprompts;
    }
    CHECK(reprompts == 2U);
}

TEST_CASE("StreamConfirmation treats end of input as a decline")
{
    std::istringstream input{""};
    std::ostringstream output;
    StreamConfirmation confirmation{input, output};

    CHECK_FALSE(confirmation.confirm("plan\n"));
}
