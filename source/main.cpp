#include <iostream>
#include <fstream>
#include <span>
#include <string>
#include <vector>
#include <cstring>
#include <optional>
#include <algorithm>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include "Constants.h"
#include "MatcherFactory.h"
#include "DocFreqSource.h"
#include "PerfTimer.h"
#include "logger.h"

static void usage(const char *name) {
    fmt::print(std::cerr, "Usage: {} [--backend hash|regex|automaton|auto] [--freqs FILE] [--repeat N] PATTERN...\n"
                          "Reads tokens from stdin and prints the score of each.\n", name);
}

struct Arguments {
    std::optional<MatcherBackend> backend;
    std::string freqs_file;
    int repeat = 0;
    std::vector<std::string> patterns;
};

static std::optional<Arguments> parse_arguments(std::span<char *> argvs) {
    Arguments args;

    for (auto c = argvs.begin() + 1; c != argvs.end(); c++) {
        auto has_value = c + 1 != argvs.end();

        if (std::strcmp(*c, "--backend") == 0 && has_value) {
            std::string_view name = *++c;
            if (name == "auto") continue;
            args.backend = parse_backend(name);
            if (!args.backend) {
                fmt::print(std::cerr, "Unknown backend: {}\n", name);
                return std::nullopt;
            }
        } else if (std::strcmp(*c, "--freqs") == 0 && has_value) {
            args.freqs_file = *++c;
        } else if (std::strcmp(*c, "--repeat") == 0 && has_value) {
            args.repeat = std::stoi(*++c);
        } else if (std::strncmp(*c, "--", 2) == 0) {
            fmt::print(std::cerr, "Unknown option: {}\n", *c);
            return std::nullopt;
        } else {
            args.patterns.emplace_back(*c);
        }
    }

    if (args.patterns.empty()) return std::nullopt;
    return args;
}

int main(int argc, char *argv[]) {
    try {
        initialize_matcher_variables();

        auto args = parse_arguments(std::span(argv, argc));
        if (!args) {
            usage(argv[0]);
            return 2;
        }

        MapDocFreqSource source;
        if (!args->freqs_file.empty()) {
            std::ifstream freqs(args->freqs_file);
            if (!freqs) {
                fmt::print(std::cerr, "Cannot open doc freqs file: {}\n", args->freqs_file);
                return 1;
            }
            source.load(freqs);
        }

        std::vector<std::string> tokens;
        std::string token;
        while (std::cin >> token) tokens.push_back(token);

        auto predicate_set = make_predicate_set(args->patterns);
        auto repeat = std::max(args->repeat, 1);
        auto backend = args->backend.value_or(choose_backend(predicate_set, tokens.size() * repeat));

        PerfTimer perf_timer;
        CompiledMatcherFactory factory(backend, std::move(predicate_set), source);
        auto matcher = factory.new_matcher();
        perf_timer.add_milestone(fmt::format("{}::comp", backend_name(backend)));

        std::vector<LookupResult> results(tokens.size());
        for (int i = 0; i < repeat; i++) {
            for (std::size_t t = 0; t < tokens.size(); t++) {
                results[t] = matcher->lookup_doc_freq_reciprocal(tokens[t], source);
            }
        }
        perf_timer.add_milestone(fmt::format("{}::match", backend_name(backend)));

        for (std::size_t t = 0; t < tokens.size(); t++) {
            fmt::print("{}\t{}\n", tokens[t], results[t].as_string());
        }

        if (args->repeat > 0) {
            fmt::print(std::cerr, "{} tokens x {}: {}\n", tokens.size(), repeat, perf_timer.as_string());
        }
    } catch (const std::exception &e) {
        log_error(e.what());
        fmt::print(std::cerr, "error: {}\n", e.what());
        return 1;
    }
    return 0;
}
