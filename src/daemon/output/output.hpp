#pragma once

#include <expected>
#include <stop_token>
#include <string>

class OutputMethod {
public:
    virtual ~OutputMethod() = default;
    // Must return promptly once `stop` is requested, leaving any helper process killed.
    virtual std::expected<void, std::string> deliver(const std::string& text, std::stop_token stop) = 0;
    virtual std::string name() const = 0;
};
