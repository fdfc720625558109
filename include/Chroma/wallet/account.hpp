#ifndef CHROMA_WALLET_ACCOUNT
#define CHROMA_WALLET_ACCOUNT

#include <Chroma/token/token.hpp>
#include <Chroma/write.hpp>

namespace Chroma {

    // an output in the utxo set that this wallet can spend.
    struct spendable {
        Bitcoin::outpoint Point;

        // the output to be redeemed.
        Bitcoin::output Prevout;

        // if this output carries a token.
        maybe<token_annotation> Token;

        spendable () : Point {}, Prevout {}, Token {} {}
        spendable (const Bitcoin::outpoint &p, const Bitcoin::output &o, maybe<token_annotation> t = {}) :
            Point {p}, Prevout {o}, Token {t} {}

        bool carries (const token_id &id) const {
            return bool (Token) && Token->ID == id;
        }

        explicit spendable (const JSON &);
        explicit operator JSON () const;
    };

    std::ostream &operator << (std::ostream &, const spendable &);

    // a snapshot of the utxo set of a wallet.
    struct account {
        list<spendable> Outputs;

        account () : Outputs {} {}
        account (list<spendable> o) : Outputs {o} {}

        // value of outputs that carry no token.
        Bitcoin::satoshi value () const;

        // total amount of the given token. This can be more than
        // a single output is able to hold.
        N token_value (const token_id &) const;

        // outputs that carry the given token.
        list<spendable> token_outputs (const token_id &) const;

        // outputs that carry no token.
        list<spendable> plain_outputs () const;

        explicit account (const JSON &);
        explicit operator JSON () const;
    };

}

#endif
