#ifndef CHROMA_TOKEN_AMOUNT
#define CHROMA_TOKEN_AMOUNT

#include <Chroma/token/token.hpp>
#include <Chroma/error.hpp>

namespace Chroma {

    // convert a decimal amount such as "1.5" into the token's smallest unit.
    // throws invalid_amount, precision_exceeded, or amount_overflow.
    // Trailing zeros after the point are not counted against the
    // token's precision.
    raw_amount to_raw_amount (const std::string &decimal, const token_descriptor &);

    // write a raw amount as a decimal with no trailing zeros after the point.
    // A sum of raw amounts may be larger than 8 bytes, so this takes any N.
    std::string from_raw_amount (const N &, byte decimals);

    std::string inline from_raw_amount (raw_amount r, byte decimals) {
        return from_raw_amount (N {r}, decimals);
    }

    std::string inline from_raw_amount (const N &r, const token_descriptor &d) {
        return from_raw_amount (r, d.Decimals);
    }

    std::string inline from_raw_amount (raw_amount r, const token_descriptor &d) {
        return from_raw_amount (N {r}, d.Decimals);
    }

}

#endif
