#ifndef CHROMA_PROGRAM_OPTIONS
#define CHROMA_PROGRAM_OPTIONS

#include <Chroma/options.hpp>
#include <Chroma/token/token.hpp>
#include <data/io/arg_parser.hpp>

using arg_parser = data::io::arg_parser;
using filepath = std::filesystem::path;

// program options are read from the command line first and then from the environment.
struct options : arg_parser {
    options (const arg_parser &ap) : arg_parser {ap} {}

    // path to a JSON wallet snapshot. --snapshot or CHROMA_SNAPSHOT
    filepath snapshot () const;

    // --token
    Chroma::token_id token () const;

    // --amount, a decimal number.
    std::string amount () const;

    // --to, the receiver's address.
    std::string to () const;

    // --dust_limit or CHROMA_DUST_LIMIT and
    // --propagation_slack or CHROMA_PROPAGATION_SLACK
    Chroma::token_send_options send_options () const;
};

#endif
