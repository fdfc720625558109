#include <Chroma/wallet/spend.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace Chroma {

    Bitcoin::satoshi unsigned_transaction::spent () const {
        Bitcoin::satoshi v {0};
        for (const spendable &s : Inputs) v += s.Prevout.Value;
        return v;
    }

    Bitcoin::satoshi unsigned_transaction::sent () const {
        Bitcoin::satoshi v {0};
        for (const Bitcoin::output &o : Outputs) v += o.Value;
        return v;
    }

    unsigned_transaction::operator JSON () const {
        JSON::array_t inputs;
        for (const spendable &s : Inputs) inputs.push_back (JSON (s));

        JSON::array_t outputs;
        for (const Bitcoin::output &o : Outputs) outputs.push_back (write (o));

        return JSON::object_t {
            {"inputs", inputs},
            {"outputs", outputs},
            {"fee", write (fee ())}};
    }

    Bitcoin::address read_address (const std::string &x) {
        Bitcoin::address a {x};
        if (!a.valid ()) throw address_decode_failure {x};
        return a;
    }

    void assemble (draft_transaction &draft, const token_selection &x, const Bitcoin::address &to,
        address_source &addresses, const token_send_options &options) {

        // the metadata always has two quantities, even if the second is zero.
        send_metadata metadata {x.Token, {x.Quantities[0], x.token_change () ? x.Quantities[1] : raw_amount {0}}};

        DATA_LOG (debug) << "token metadata " << metadata;

        draft.add_output (Bitcoin::output {Bitcoin::satoshi {0}, metadata.script ()});
        draft.add_output (Bitcoin::output {options.DustLimit, pay_to_address::script (to.digest ())});

        for (const Bitcoin::output &o : make_change (x, addresses, options).outputs ()) draft.add_output (o);

        for (const spendable &s : x.Selected) draft.add_input (s);
    }

    build_transfer::designed build_transfer::design (token_wallet &w, address_source &addresses,
        const token_id &id, const std::string &amount, const std::string &to) const {

        token_descriptor token = w.descriptor (id);

        raw_amount requested = to_raw_amount (amount, token);

        Bitcoin::address receiver = read_address (to);

        token_selection selection = Select (id, requested, w.spendable_outputs ());

        std::unique_ptr<draft_transaction> draft = w.create_unsigned_transaction ();
        assemble (*draft, selection, receiver, addresses, Options);

        DATA_LOG (debug) << "transaction design is complete. Sending " << amount << " " << token.Ticker
            << " with " << selection.Selected.size () << " inputs and fee " << int64 (selection.Fee);

        return designed {token, selection, std::move (draft)};
    }

    Bitcoin::transaction build_transfer::operator () (token_wallet &w, address_source &addresses,
        const token_id &id, const std::string &amount, const std::string &to) const {
        return w.sign_offline (design (w, addresses, id, amount, to).Draft);
    }

    awaitable<Bitcoin::transaction> build_transfer_async (boost::asio::any_io_executor worker, build_transfer b,
        token_wallet &w, address_source &addresses, token_id id, std::string amount, std::string to) {
        co_return co_await boost::asio::co_spawn (worker,
            [b = std::move (b), &w, &addresses, id = std::move (id), amount = std::move (amount), to = std::move (to)]
            () -> awaitable<Bitcoin::transaction> {
                co_return b (w, addresses, id, amount, to);
            }, boost::asio::use_awaitable);
    }

}
