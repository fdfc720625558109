#ifndef CHROMA_WALLET_CHANGE
#define CHROMA_WALLET_CHANGE

#include <Chroma/wallet/select.hpp>

namespace Chroma {

    // a source of new addresses belonging to the sender. An address
    // that has been returned is never returned again.
    struct address_source {
        virtual ~address_source () {}

        // for bitcoin change.
        virtual Bitcoin::address fresh_change () = 0;

        // for token change.
        virtual Bitcoin::address fresh_token_receive () = 0;

        // whether this many fresh addresses of each kind can still be given out.
        virtual bool available (uint32 change, uint32 token_receive) const {
            return true;
        }
    };

    // hands out addresses from two fixed lists.
    struct fixed_addresses final : address_source {
        list<Bitcoin::address> Change;
        list<Bitcoin::address> TokenReceive;

        fixed_addresses (list<Bitcoin::address> change, list<Bitcoin::address> token) :
            Change {change}, TokenReceive {token} {}

        // throws if there are none left.
        Bitcoin::address fresh_change () final override;
        Bitcoin::address fresh_token_receive () final override;

        bool available (uint32 change, uint32 token_receive) const final override {
            return Change.size () >= change && TokenReceive.size () >= token_receive;
        }
    };

    // change outputs for a token send.
    struct change {
        // carries the token change, if there is any.
        maybe<Bitcoin::output> Token;

        // carries the bitcoin change, if there is enough to be worth an output.
        maybe<Bitcoin::output> Satoshis;

        list<Bitcoin::output> outputs () const {
            list<Bitcoin::output> o;
            if (bool (Token)) o <<= *Token;
            if (bool (Satoshis)) o <<= *Satoshis;
            return o;
        }
    };

    // construct change outputs for a selection. An address is drawn
    // only for an output that will be created, and none are drawn
    // unless all of them are available. Bitcoin change below the dust
    // limit goes to the fee.
    change make_change (const token_selection &, address_source &, const token_send_options & = {});

}

#endif
