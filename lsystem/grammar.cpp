#include "grammar.hpp"
#include <common/error.hpp>
#include <cctype>
#include <fmt/format.h>
#include <sstream>

namespace geomill::lsystem {

namespace {

std::string strip(const std::string& text) {
    std::string out;
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            out.push_back(c);
        }
    }
    return out;
}

}  // namespace

Grammar parse_grammar(const std::string& axiom, const std::string& rules) {
    Grammar grammar;
    grammar.axiom = strip(axiom);
    if (grammar.axiom.empty()) {
        throw ValidationError("grammar", "grammar: axiom must not be empty");
    }

    std::string normalized = rules;
    for (char& c : normalized) {
        if (c == '\n') c = ';';
    }
    std::istringstream stream(normalized);
    std::string entry;
    while (std::getline(stream, entry, ';')) {
        entry = strip(entry);
        if (entry.empty()) {
            continue;
        }
        size_t arrow = entry.find("->");
        size_t eq = entry.find('=');
        size_t split = arrow != std::string::npos ? arrow : eq;
        size_t skip = arrow != std::string::npos ? 2 : 1;
        if (split == std::string::npos || split != 1) {
            throw ValidationError("rules", fmt::format("rules: malformed rule '{}'", entry));
        }
        char predecessor = entry[0];
        if (!grammar.rules.emplace(predecessor, entry.substr(split + skip)).second) {
            throw ValidationError("rules", fmt::format("rules: duplicate rule for '{}'", predecessor));
        }
    }
    return grammar;
}

std::string expand(const Grammar& grammar, int iterations, size_t max_symbols) {
    std::string current = grammar.axiom;
    if (current.size() > max_symbols) {
        throw ExecutionError(fmt::format("lsystem: axiom exceeds {} symbols", max_symbols));
    }
    for (int i = 0; i < iterations; ++i) {
        std::string next;
        next.reserve(current.size() * 2);
        for (char c : current) {
            auto it = grammar.rules.find(c);
            if (it != grammar.rules.end()) {
                next += it->second;
            } else {
                next.push_back(c);
            }
            if (next.size() > max_symbols) {
                throw ExecutionError(fmt::format(
                    "lsystem: expansion exceeds {} symbols at iteration {}", max_symbols, i + 1));
            }
        }
        current = std::move(next);
    }
    return current;
}

}  // namespace geomill::lsystem
