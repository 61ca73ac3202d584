#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace ss::policy {

class UnknownMachineError : public std::runtime_error {
public:
    UnknownMachineError(std::string requested, std::vector<std::string> suggestions);

    [[nodiscard]] const std::string& requested() const { return requested_; }
    [[nodiscard]] const std::vector<std::string>& suggestions() const { return suggestions_; }

private:
    std::string requested_;
    std::vector<std::string> suggestions_;
};

class UnknownFormatError : public std::runtime_error {
public:
    explicit UnknownFormatError(std::string requested);

    [[nodiscard]] const std::string& requested() const { return requested_; }

private:
    std::string requested_;
};

}
