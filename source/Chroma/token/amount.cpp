#include <Chroma/token/amount.hpp>

#include <limits>

namespace Chroma {

    namespace {

        // a canonical decimal string has no leading zeros.
        std::string trim_leading_zeros (const std::string &x) {
            size_t first = x.find_first_not_of ('0');
            return first == std::string::npos ? std::string {"0"} : x.substr (first);
        }

        bool digits (const std::string &x) {
            return x.size () == 0 || encoding::decimal::valid (trim_leading_zeros (x));
        }

    }

    raw_amount to_raw_amount (const std::string &decimal, const token_descriptor &token) {

        size_t point = decimal.find ('.');
        std::string whole = decimal.substr (0, point);
        std::string fraction = point == std::string::npos ? std::string {} : decimal.substr (point + 1);

        if (whole.size () + fraction.size () == 0 || !digits (whole) || !digits (fraction))
            throw invalid_amount {decimal};

        while (fraction.size () > 0 && fraction.back () == '0') fraction.pop_back ();

        if (fraction.size () > token.Decimals)
            throw precision_exceeded {decimal, token.Ticker, token.Decimals};

        // shift left by the number of decimals.
        N shifted {trim_leading_zeros (whole + fraction + std::string (token.Decimals - fraction.size (), '0'))};

        if (shifted > N {std::numeric_limits<raw_amount>::max ()}) throw amount_overflow {decimal, token.Decimals};

        return raw_amount (shifted);
    }

    std::string from_raw_amount (const N &r, byte decimals) {
        std::string digits = encoding::decimal::write (r);

        if (decimals == 0) return digits;

        if (digits.size () <= decimals) digits = std::string (decimals - digits.size () + 1, '0') + digits;

        std::string whole = digits.substr (0, digits.size () - decimals);
        std::string fraction = digits.substr (digits.size () - decimals);

        while (fraction.size () > 0 && fraction.back () == '0') fraction.pop_back ();

        if (fraction.size () == 0) return whole;
        return whole + "." + fraction;
    }

}
