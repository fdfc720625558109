#ifndef CHROMA_WALLET_SELECT
#define CHROMA_WALLET_SELECT

#include <Chroma/wallet/account.hpp>
#include <Chroma/token/fee.hpp>
#include <Chroma/error.hpp>

namespace Chroma {

    struct token_selection {
        token_id Token;

        // outputs to spend in the order they were selected.
        list<spendable> Selected;

        // the first quantity is what goes to the receiver. If there is
        // a second, it is the token change.
        list<raw_amount> Quantities;

        // satoshis going back to the sender. If this is less than the
        // dust limit, it is left to the miners.
        Bitcoin::satoshi Change;

        // value of the outputs that must be created (receiver and token change).
        Bitcoin::satoshi Required;

        Bitcoin::satoshi Fee;

        bool token_change () const {
            return Quantities.size () == 2;
        }

        raw_amount sent () const {
            return Quantities[0];
        }

        // throw selection_error if the selection does not balance.
        void check (const token_send_options &) const;
    };

    std::ostream &operator << (std::ostream &, const token_selection &);

    // select outputs sufficient to send the given raw amount of a token.
    using select = data::function<token_selection (const token_id &, raw_amount, const account &)>;

    // default select function. Select token outputs and then
    // plain outputs, smallest first, until we have enough.
    struct select_smallest_first {
        token_send_options Options;

        select_smallest_first (const token_send_options &o = {}) : Options {o} {}

        // throws insufficient_token_balance or insufficient_currency_balance.
        token_selection operator () (const token_id &, raw_amount, const account &) const;
    };
}

#endif
