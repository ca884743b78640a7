#include "ibshrink/orchestrator/confirmation.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace ibshrink::orchestrator {

namespace {

std::string normalize_answer(std::string_view text)
{
    std::size_t start = 0U;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start])) != 0) {
        ++start;
    }
    std::size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1U])) != 0) {
        --end;
    }
    std::string answer{text.substr(start, end - start)};
    std::transform(answer.begin(), answer.end(), answer.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return answer;
}

}  // namespace

bool StreamConfirmation::confirm(std::string_view plan_text)
{
    *output_ << plan_text;
    if (!plan_text.empty() && plan_text.back() != '\n') {
        *output_ << '\n';
    }

    std::string line;
    while (true) {
        *output_ << "Do you want to proceed? Type yes or no: " << std::flush;
        if (!std::getline(*input_, line)) {
            *output_ << '\n';
            return false;
        }
        const auto answer = normalize_answer(line);
        if (answer == "yes") {
            return true;
        }
        if (answer == "no") {
            return false;
        }
        *output_ << "Please type yes or no." << '\n';
    }
}

}  // namespace ibshrink::orchestrator
