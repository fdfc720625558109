#ifndef CHROMA_WALLET_SPEND
#define CHROMA_WALLET_SPEND

#include <Chroma/wallet/change.hpp>
#include <Chroma/token/amount.hpp>
#include <Chroma/token/send.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <memory>

namespace Chroma {

    template <typename X> using awaitable = boost::asio::awaitable<X>;

    // a transaction under construction, provided by the wallet.
    struct draft_transaction {
        virtual ~draft_transaction () {}
        virtual void add_output (const Bitcoin::output &) = 0;
        virtual void add_input (const spendable &) = 0;
    };

    // a draft that just remembers what was added to it.
    struct unsigned_transaction final : draft_transaction {
        list<spendable> Inputs;
        list<Bitcoin::output> Outputs;

        unsigned_transaction () : Inputs {}, Outputs {} {}

        void add_output (const Bitcoin::output &o) final override {
            Outputs <<= o;
        }

        void add_input (const spendable &s) final override {
            Inputs <<= s;
        }

        Bitcoin::satoshi spent () const;
        Bitcoin::satoshi sent () const;

        Bitcoin::satoshi fee () const {
            return Bitcoin::satoshi {int64 (spent ()) - int64 (sent ())};
        }

        explicit operator JSON () const;
    };

    // what we need from the wallet in order to send tokens.
    struct token_wallet {
        virtual ~token_wallet () {}

        // a snapshot of the utxo set. Must not change while we select from it.
        virtual account spendable_outputs () = 0;

        // throws unknown_token.
        virtual token_descriptor descriptor (const token_id &) = 0;

        virtual std::unique_ptr<draft_transaction> create_unsigned_transaction () = 0;

        // sign without broadcasting.
        virtual Bitcoin::transaction sign_offline (std::unique_ptr<draft_transaction>) = 0;
    };

    // write the outputs and inputs of a token send into a draft, in this order:
    //   metadata, receiver, token change (if any), bitcoin change (if not dust).
    // the inputs follow the order of the selection.
    void assemble (draft_transaction &, const token_selection &, const Bitcoin::address &to,
        address_source &, const token_send_options & = {});

    // construct and sign a transaction sending tokens.
    struct build_transfer {
        // function that selects outputs from the account.
        select Select;

        token_send_options Options;

        build_transfer (const token_send_options &o = {}) : Select {select_smallest_first {o}}, Options {o} {}
        build_transfer (select s, const token_send_options &o = {}) : Select {s}, Options {o} {}

        // amount is a decimal. Throws transfer_error.
        Bitcoin::transaction operator () (token_wallet &, address_source &,
            const token_id &, const std::string &amount, const std::string &to) const;

        struct designed {
            token_descriptor Token;
            token_selection Selection;
            std::unique_ptr<draft_transaction> Draft;
        };

        // everything up to signing.
        designed design (token_wallet &, address_source &,
            const token_id &, const std::string &amount, const std::string &to) const;
    };

    // the same thing as build_transfer, delivered once to whoever awaits it.
    // The work is done on the given executor so that the awaiting one is
    // not held up. The wallet and the address source must outlive the call.
    awaitable<Bitcoin::transaction> build_transfer_async (boost::asio::any_io_executor, build_transfer,
        token_wallet &, address_source &, token_id, std::string amount, std::string to);

    // throws address_decode_failure.
    Bitcoin::address read_address (const std::string &);

}

#endif
