#ifndef CHROMA_ERROR
#define CHROMA_ERROR

#include <Chroma/types.hpp>

namespace Chroma {

    // everything that can go wrong when a token transfer is requested.
    struct transfer_error : data::exception {
        enum class kind {
            invalid_amount = 2,
            precision_exceeded,
            amount_overflow,
            unknown_token,
            insufficient_token_balance,
            insufficient_currency_balance,
            address_decode_failure
        };

        kind Kind;

        transfer_error (kind k, const std::string &message) : data::exception {static_cast<int> (k)}, Kind {k} {
            *this << message;
        }
    };

    std::ostream &operator << (std::ostream &, transfer_error::kind);

    struct invalid_amount : transfer_error {
        std::string Amount;

        invalid_amount (const std::string &amount) :
            transfer_error {kind::invalid_amount, data::string::write ("could not read \"", amount, "\" as a decimal amount")},
            Amount {amount} {}
    };

    // the amount has more digits after the point than the token supports.
    struct precision_exceeded : transfer_error {
        std::string Amount;
        uint32 Decimals;

        precision_exceeded (const std::string &amount, const std::string &ticker, uint32 decimals) :
            transfer_error {kind::precision_exceeded,
                data::string::write (ticker, " supports maximum ", decimals, " decimals but amount is ", amount)},
            Amount {amount}, Decimals {decimals} {}
    };

    // the amount does not fit in 8 unsigned bytes once it is scaled.
    struct amount_overflow : transfer_error {
        std::string Amount;
        uint32 Decimals;

        amount_overflow (const std::string &amount, uint32 decimals) :
            transfer_error {kind::amount_overflow,
                data::string::write ("amount ", amount, " with ", decimals, " decimals is larger than 8 unsigned bytes")},
            Amount {amount}, Decimals {decimals} {}
    };

    struct unknown_token : transfer_error {
        token_id Token;

        unknown_token (const token_id &id) :
            transfer_error {kind::unknown_token, data::string::write ("unknown token ", static_cast<const std::string &> (id))},
            Token {id} {}
    };

    struct insufficient_token_balance : transfer_error {
        raw_amount Available;
        raw_amount Required;

        insufficient_token_balance (raw_amount available, raw_amount required) :
            transfer_error {kind::insufficient_token_balance,
                data::string::write ("insufficient token balance=", available, " required ", required)},
            Available {available}, Required {required} {}
    };

    struct insufficient_currency_balance : transfer_error {
        // value of the inputs after the cost of the inputs is deducted.
        int64 Available;
        int64 Required;

        insufficient_currency_balance (int64 available, int64 required) :
            transfer_error {kind::insufficient_currency_balance,
                data::string::write ("insufficient balance=", available, " required ", required, " including fees")},
            Available {available}, Required {required} {}
    };

    struct address_decode_failure : transfer_error {
        std::string Address;

        address_decode_failure (const std::string &address) :
            transfer_error {kind::address_decode_failure, data::string::write ("could not decode address \"", address, "\"")},
            Address {address} {}
    };

    // thrown when a selection comes out unbalanced. This means there is a bug.
    struct selection_error : std::logic_error {
        using std::logic_error::logic_error;
    };

}

#endif
