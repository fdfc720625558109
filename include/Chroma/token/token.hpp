#ifndef CHROMA_TOKEN_TOKEN
#define CHROMA_TOKEN_TOKEN

#include <data/net/JSON.hpp>
#include <Chroma/types.hpp>

namespace Chroma {

    // what we need to know about a token in order to send it.
    struct token_descriptor {
        token_id ID;

        // the number of digits after the decimal point, fixed at genesis.
        byte Decimals;

        // for display only.
        std::string Ticker;
        std::string Name;

        token_descriptor () : ID {}, Decimals {0}, Ticker {}, Name {} {}
        token_descriptor (const token_id &id, byte decimals, const std::string &ticker, const std::string &name = {}) :
            ID {id}, Decimals {decimals}, Ticker {ticker}, Name {name} {}

        bool valid () const {
            return ID.valid ();
        }

        explicit token_descriptor (const JSON &);
        explicit operator JSON () const;
    };

    // a spendable output may carry some amount of a token.
    struct token_annotation {
        token_id ID;
        raw_amount Amount;

        token_annotation () : ID {}, Amount {0} {}
        token_annotation (const token_id &id, raw_amount amount) : ID {id}, Amount {amount} {}

        bool operator == (const token_annotation &) const = default;

        explicit token_annotation (const JSON &);
        explicit operator JSON () const;
    };

    std::ostream inline &operator << (std::ostream &o, const token_descriptor &d) {
        return o << "token {" << static_cast<const std::string &> (d.ID) << ", " << d.Ticker << ", decimals: " << uint32 (d.Decimals) << "}";
    }

    std::ostream inline &operator << (std::ostream &o, const token_annotation &t) {
        return o << "{" << static_cast<const std::string &> (t.ID) << ": " << t.Amount << "}";
    }

}

#endif
