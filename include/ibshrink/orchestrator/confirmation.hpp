#pragma once

#include <istream>
#include <ostream>
#include <string_view>

namespace ibshrink::orchestrator {

// Gate between planning and the first mutating statement.
class Confirmation {
public:
    virtual ~Confirmation() = default;

    [[nodiscard]] virtual bool confirm(std::string_view plan_text) = 0;
};

// Prints the plan and asks until the operator types yes or no. End of input declines.
class StreamConfirmation final : public Confirmation {
public:
    StreamConfirmation(std::istream& input, std::ostream& output) noexcept
        : input_{&input}
        , output_{&output}
    {
    }

    [[nodiscard]] bool confirm(std::string_view plan_text) override;

private:
    std::istream* input_ = nullptr;
    std::ostream* output_ = nullptr;
};

}  // namespace ibshrink::orchestrator
