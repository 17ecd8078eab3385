#pragma once
#include <string_view>
#include <string>
#include <vector>

struct Command {
    std::string name;
    std::vector<std::string> args;
};

// Splits one batch line into an upper-cased command name and its arguments.
class Parser {
public:
    Command parse(std::string_view input);
private:
    std::vector<std::string_view> splitWords(std::string_view line);
};
