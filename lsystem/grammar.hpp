#ifndef GEOMILL_LSYSTEM_GRAMMAR_HPP
#define GEOMILL_LSYSTEM_GRAMMAR_HPP

#include <map>
#include <string>

namespace geomill::lsystem {

// Deterministic context-free L-system: one replacement per symbol
struct Grammar {
    std::string axiom;
    std::map<char, std::string> rules;
};

// Parses rules written as "F=F+F-F;X=F[+X]" (';' or newline separated,
// "->" accepted in place of '='). Throws ValidationError on "rules".
Grammar parse_grammar(const std::string& axiom, const std::string& rules);

// Rewrites the axiom `iterations` times. Throws ExecutionError as soon as
// the string would grow beyond `max_symbols`.
std::string expand(const Grammar& grammar, int iterations, size_t max_symbols);

}  // namespace geomill::lsystem

#endif // GEOMILL_LSYSTEM_GRAMMAR_HPP
