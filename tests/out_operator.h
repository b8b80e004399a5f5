#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "shellwords_options.hpp"

using namespace std::string_literals;

namespace shwords {

inline std::ostream& operator<<(std::ostream& out, SplitError e) {
    return out << error_message(e);
}

}

template <typename Container>
void Print(std::ostream& out, const Container& container) {
    bool first = true;
    for (const auto& element : container) {
        if (!first) {
            out << ", "s;
        }
        out << '"' << element << '"';
        first = false;
    }
}

template <typename Element>
std::ostream& operator<<(std::ostream& out, const std::vector<Element>& container) {
    out << '[';
    Print(out, container);
    out << ']';
    return out;
}

template <typename Value>
std::ostream& operator<<(std::ostream& out, const std::optional<Value>& value) {
    if (!value) {
        return out << "none"s;
    }
    return out << *value;
}
