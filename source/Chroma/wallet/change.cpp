#include <Chroma/wallet/change.hpp>

namespace Chroma {

    Bitcoin::address fixed_addresses::fresh_change () {
        if (data::empty (Change)) throw data::exception {} << "no more change addresses";
        Bitcoin::address next = Change.first ();
        Change = Change.rest ();
        return next;
    }

    Bitcoin::address fixed_addresses::fresh_token_receive () {
        if (data::empty (TokenReceive)) throw data::exception {} << "no more token addresses";
        Bitcoin::address next = TokenReceive.first ();
        TokenReceive = TokenReceive.rest ();
        return next;
    }

    change make_change (const token_selection &x, address_source &addresses, const token_send_options &options) {
        change ch {};

        bool satoshi_change = int64 (x.Change) >= int64 (options.DustLimit);

        if (!addresses.available (satoshi_change ? 1 : 0, x.token_change () ? 1 : 0))
            throw data::exception {} << "not enough fresh addresses for change outputs";

        // Send our token change back to a token address.
        if (x.token_change ())
            ch.Token = Bitcoin::output {options.DustLimit, pay_to_address::script (addresses.fresh_token_receive ().digest ())};

        if (satoshi_change)
            ch.Satoshis = Bitcoin::output {x.Change, pay_to_address::script (addresses.fresh_change ().digest ())};
        else if (int64 (x.Change) > 0) {
            DATA_LOG (warning) << "change of " << int64 (x.Change) << " satoshis is below the dust limit and goes to the fee";
        }

        return ch;
    }

}
