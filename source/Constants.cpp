#include "Constants.h"
#include <cstdlib>
#include <stdexcept>
#include <string_view>
#include <fmt/format.h>
#include "logger.h"

uint32_t wildcard_max_codepoint = DEFAULT_WILDCARD_MAX_CODEPOINT;
int64_t automaton_max_mem = DEFAULT_AUTOMATON_MAX_MEM;
uint64_t automaton_token_threshold = DEFAULT_AUTOMATON_TOKEN_THRESHOLD;

static uint64_t read_env_number(const char *name, uint64_t fallback, uint64_t max) {
    const char *env = std::getenv(name);
    if (env == nullptr || *env == '\0') return fallback;

    // stoull would wrap "-1" around to the maximum.
    std::string_view text(env);
    auto first = text.find_first_not_of(" \t\n\v\f\r");
    if (first != std::string_view::npos && text[first] == '-') {
        throw std::runtime_error(fmt::format("{} must not be negative: {}", name, env));
    }

    std::size_t consumed = 0;
    uint64_t value;
    try {
        // Base 0 accepts both "591" and "0x24f".
        value = std::stoull(env, &consumed, 0);
    } catch (const std::logic_error &) {
        throw std::runtime_error(fmt::format("{} is not a number: {}", name, env));
    }
    if (env[consumed] != '\0') {
        throw std::runtime_error(fmt::format("{} is not a number: {}", name, env));
    }
    if (value > max) {
        throw std::runtime_error(fmt::format("{} out of range: {} > {}", name, value, max));
    }
    return value;
}

void initialize_matcher_variables() {
    wildcard_max_codepoint = read_env_number("TOKEN_MATCHER_WILDCARD_MAX_CODEPOINT", DEFAULT_WILDCARD_MAX_CODEPOINT,
                                             0x10ffff);
    automaton_max_mem = static_cast<int64_t>(read_env_number("TOKEN_MATCHER_AUTOMATON_MAX_MEM",
                                                             DEFAULT_AUTOMATON_MAX_MEM, INT64_MAX));
    automaton_token_threshold = read_env_number("TOKEN_MATCHER_AUTOMATON_THRESHOLD",
                                                DEFAULT_AUTOMATON_TOKEN_THRESHOLD, UINT64_MAX);

    log(fmt::format("Using wildcard range 0-{:#x}, automaton max mem {}, automaton threshold {}",
                    wildcard_max_codepoint, automaton_max_mem, automaton_token_threshold));
}

void reset_matcher_variables() {
    wildcard_max_codepoint = DEFAULT_WILDCARD_MAX_CODEPOINT;
    automaton_max_mem = DEFAULT_AUTOMATON_MAX_MEM;
    automaton_token_threshold = DEFAULT_AUTOMATON_TOKEN_THRESHOLD;
}

std::string wildcard_expr() {
    return fmt::format("[\\x{{0000}}-\\x{{{:04x}}}]*", wildcard_max_codepoint);
}
