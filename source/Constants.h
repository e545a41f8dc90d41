#ifndef TOKENMATCHER_CONSTANTS_H
#define TOKENMATCHER_CONSTANTS_H

#include <cstdint>
#include <string>

// Wildcards match code points 0..wildcard_max_codepoint. Latin Extended-B ends at 0x024f.
extern uint32_t wildcard_max_codepoint;

// RE2 memory budget for the automaton backend. The DFA gets most of it.
extern int64_t automaton_max_mem;

// Expected tokens per compile from which choose_backend prefers the automaton over the regex.
extern uint64_t automaton_token_threshold;

constexpr inline uint32_t DEFAULT_WILDCARD_MAX_CODEPOINT = 0x024f;
constexpr inline int64_t DEFAULT_AUTOMATON_MAX_MEM = 256LL << 20;
constexpr inline uint64_t DEFAULT_AUTOMATON_TOKEN_THRESHOLD = 10000;

void initialize_matcher_variables();

void reset_matcher_variables();

// Regex syntax for one wildcard, e.g. [\x{0000}-\x{024f}]*
std::string wildcard_expr();

#endif //TOKENMATCHER_CONSTANTS_H
