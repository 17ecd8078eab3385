#include "Parser.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

std::vector<std::string_view> Parser::splitWords(std::string_view line) {
    std::vector<std::string_view> words;
    size_t pos = 0;
    while (pos < line.size()) {
        while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) ++pos;
        size_t start = pos;
        while (pos < line.size() && !std::isspace(static_cast<unsigned char>(line[pos]))) ++pos;
        if (pos > start) words.push_back(line.substr(start, pos - start));
    }
    return words;
}

Command Parser::parse(std::string_view input) {
    auto words = splitWords(input);
    if (words.empty()) {
        throw std::runtime_error("Empty command line");
    }
    std::string name(words[0]);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return { name, std::vector<std::string>(words.begin() + 1, words.end()) };
}
