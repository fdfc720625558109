#include <Chroma/wallet/select.hpp>

namespace Chroma {

    namespace {

        // candidate outputs, sorted by the given key. Equal keys keep
        // the order of the account.
        template <typename key>
        std::vector<const spendable *> sorted_by (const account &acc, auto include, key k) {
            std::vector<const spendable *> candidates;
            for (const spendable &s : acc.Outputs) if (include (s)) candidates.push_back (&s);
            std::stable_sort (candidates.begin (), candidates.end (),
                [k] (const spendable *a, const spendable *b) -> bool {
                    return k (*a) < k (*b);
                });
            return candidates;
        }

    }

    token_selection select_smallest_first::operator ()
        (const token_id &id, raw_amount requested, const account &acc) const {

        fee_estimator fees {Options};

        list<spendable> selected {};

        // value of selected inputs after the cost of the inputs is deducted.
        int64 input_satoshis = 0;

        // at least one dust output goes to the receiver.
        int64 send_satoshis = int64 (Options.DustLimit);

        // first select enough token outputs and take whatever satoshis come with them.
        raw_amount input_tokens = 0;
        raw_amount token_change = 0;
        bool enough_tokens = requested == 0;

        for (const spendable *s : sorted_by (acc,
            [&id] (const spendable &s) -> bool {
                return s.carries (id);
            }, [] (const spendable &s) -> raw_amount {
                return s.Token->Amount;
            })) {

            if (enough_tokens) break;

            raw_amount amount = s->Token->Amount;

            if (amount >= requested - input_tokens) {
                token_change = amount - (requested - input_tokens);
                enough_tokens = true;
            }

            input_tokens += amount;
            input_satoshis += int64 (s->Prevout.Value) - fees.input_cost ();
            selected <<= *s;
        }

        if (!enough_tokens) throw insufficient_token_balance {input_tokens, requested};

        // if there is token change we need another dust output to hold it.
        if (token_change > 0) send_satoshis += int64 (Options.DustLimit);

        uint32 quantities = token_change > 0 ? 2 : 1;
        int64 fee = fees.total_fee (Options.AssumedOutputs, quantities);

        DATA_LOG (debug) << "selected " << selected.size () << " token outputs with " << input_tokens
            << " tokens and " << input_satoshis << " spendable satoshis; " << send_satoshis << " + " << fee << " satoshis required";

        // If we can not yet afford the fee + dust to send, use plain outputs.
        for (const spendable *s : sorted_by (acc,
            [] (const spendable &s) -> bool {
                return !bool (s.Token);
            }, [] (const spendable &s) -> int64 {
                return int64 (s.Prevout.Value);
            })) {

            if (input_satoshis > send_satoshis + fee) break;

            input_satoshis += int64 (s->Prevout.Value) - fees.input_cost ();
            selected <<= *s;
        }

        int64 change = input_satoshis - send_satoshis - fee;
        if (change < 0) throw insufficient_currency_balance {input_satoshis, send_satoshis + fee};

        list<raw_amount> q {requested};
        if (token_change > 0) q <<= token_change;

        token_selection result {id, selected, q,
            Bitcoin::satoshi {change}, Bitcoin::satoshi {send_satoshis}, Bitcoin::satoshi {fee}};

        result.check (Options);

        DATA_LOG (debug) << "selection complete: " << result;

        return result;
    }

    void token_selection::check (const token_send_options &options) const {
        if (Quantities.size () < 1 || Quantities.size () > 2)
            throw selection_error {"a selection must have one or two quantities"};

        if (Quantities.size () == 2 && Quantities[1] == 0)
            throw selection_error {"token change quantity is zero"};

        // unsigned arithmetic, so this is checked modulo 2^64.
        raw_amount input_tokens = 0;
        int64 input_satoshis = 0;
        for (const spendable &s : Selected) {
            if (bool (s.Token) && !s.carries (Token))
                throw selection_error {"selected an output that carries a different token"};

            if (bool (s.Token)) input_tokens += s.Token->Amount;
            input_satoshis += int64 (s.Prevout.Value) - options.InputSize;
        }

        raw_amount output_tokens = Quantities[0] + (token_change () ? Quantities[1] : 0);
        if (input_tokens != output_tokens)
            throw selection_error {data::string::write ("token inputs ", input_tokens, " != token outputs ", output_tokens)};

        if (int64 (Change) < 0) throw selection_error {"negative change"};

        if (input_satoshis != int64 (Required) + int64 (Fee) + int64 (Change))
            throw selection_error {data::string::write ("satoshi inputs ", input_satoshis, " != ",
                int64 (Required), " + ", int64 (Fee), " + ", int64 (Change))};
    }

    std::ostream &operator << (std::ostream &o, const token_selection &x) {
        o << "selection {" << static_cast<const std::string &> (x.Token) << ", inputs: " << x.Selected.size () << ", quantities: [";
        bool first = true;
        for (const raw_amount &q : x.Quantities) {
            if (!first) o << ", ";
            o << q;
            first = false;
        }
        return o << "], required: " << int64 (x.Required) << ", fee: " << int64 (x.Fee) << ", change: " << int64 (x.Change) << "}";
    }

}
