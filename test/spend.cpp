#include "outputs.hpp"
#include <Chroma/wallet/snapshot.hpp>
#include "gtest/gtest.h"

#include <boost/asio/thread_pool.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>

#include <thread>

namespace Chroma {

    using namespace test;

    // a snapshot wallet that signs with nothing.
    struct test_wallet : snapshot_wallet {
        using snapshot_wallet::snapshot_wallet;

        int Signed {0};
        std::thread::id SignedOn {};

        Bitcoin::transaction sign_offline (std::unique_ptr<draft_transaction> d) override {
            Signed++;
            SignedOn = std::this_thread::get_id ();
            const auto &u = static_cast<const unsigned_transaction &> (*d);

            list<Bitcoin::input> inputs;
            for (const spendable &s : u.Inputs) inputs <<= Bitcoin::input {s.Point, bytes {}, 0xffffffff};

            return Bitcoin::transaction {1, inputs, u.Outputs, 0};
        }
    };

    fixed_addresses test_addresses () {
        return fixed_addresses {
            list<Bitcoin::address> {read_address (ChangeAddress), read_address (OtherAddress)},
            list<Bitcoin::address> {read_address (TokenAddress)}};
    }

    test_wallet make_wallet (list<spendable> outputs) {
        return test_wallet {account {outputs}, list<token_descriptor> {descriptor ()}, test_addresses ()};
    }

    bytes pay_to (const std::string &address) {
        return pay_to_address::script (read_address (address).digest ());
    }

    TEST (Spend, ReadAddress) {
        EXPECT_TRUE (read_address (Receiver).valid ());
        EXPECT_THROW (read_address ("1A1zP1eP5QGefi2DMPTfTL5SLmv7DivfNb"), address_decode_failure);
        EXPECT_THROW (read_address (""), address_decode_failure);

        try {
            read_address ("not an address");
            FAIL () << "expected address_decode_failure";
        } catch (const address_decode_failure &x) {
            EXPECT_EQ (x.Address, "not an address");
            EXPECT_EQ (x.Kind, transfer_error::kind::address_decode_failure);
        }
    }

    TEST (Spend, Design) {
        test_wallet w = make_wallet ({colored (1, 546, Token, 200000000), plain (2, 5000)});

        build_transfer::designed d = build_transfer {}.design (w, w.Addresses, Token, "1.5", Receiver);
        const auto &tx = static_cast<const unsigned_transaction &> (*d.Draft);

        EXPECT_EQ (d.Token.Ticker, "SPICE");
        EXPECT_EQ (int64 (d.Selection.Change), 3933);

        ASSERT_EQ (tx.Outputs.size (), 4);

        // metadata
        EXPECT_EQ (int64 (tx.Outputs[0].Value), 0);
        maybe<send_metadata> meta = send_metadata::read (tx.Outputs[0].Script);
        ASSERT_TRUE (bool (meta));
        EXPECT_EQ (meta->Token, Token);
        ASSERT_EQ (meta->Quantities.size (), 2);
        EXPECT_EQ (meta->Quantities[0], 150000000);
        EXPECT_EQ (meta->Quantities[1], 50000000);

        // receiver
        EXPECT_EQ (int64 (tx.Outputs[1].Value), 546);
        EXPECT_EQ (tx.Outputs[1].Script, pay_to (Receiver));

        // token change
        EXPECT_EQ (int64 (tx.Outputs[2].Value), 546);
        EXPECT_EQ (tx.Outputs[2].Script, pay_to (TokenAddress));

        // bitcoin change
        EXPECT_EQ (int64 (tx.Outputs[3].Value), 3933);
        EXPECT_EQ (tx.Outputs[3].Script, pay_to (ChangeAddress));

        ASSERT_EQ (tx.Inputs.size (), 2);
        EXPECT_EQ (tx.Inputs[0].Point, outpoint (1));
        EXPECT_EQ (tx.Inputs[1].Point, outpoint (2));

        EXPECT_EQ (int64 (tx.spent ()), 5546);
        EXPECT_EQ (int64 (tx.sent ()), 5025);
        EXPECT_EQ (int64 (tx.fee ()), 225 + 2 * 148);

        // one of each kind of address was used.
        EXPECT_EQ (w.Addresses.Change.size (), 1);
        EXPECT_EQ (w.Addresses.TokenReceive.size (), 0);

        EXPECT_EQ (w.Signed, 0);
    }

    TEST (Spend, NoTokenChange) {
        test_wallet w = make_wallet ({colored (1, 546, Token, 150000000), plain (2, 5000)});

        build_transfer::designed d = build_transfer {}.design (w, w.Addresses, Token, "1.5", Receiver);
        const auto &tx = static_cast<const unsigned_transaction &> (*d.Draft);

        ASSERT_EQ (tx.Outputs.size (), 3);

        // the metadata still has two quantities.
        maybe<send_metadata> meta = send_metadata::read (tx.Outputs[0].Script);
        ASSERT_TRUE (bool (meta));
        ASSERT_EQ (meta->Quantities.size (), 2);
        EXPECT_EQ (meta->Quantities[0], 150000000);
        EXPECT_EQ (meta->Quantities[1], 0);

        EXPECT_EQ (tx.Outputs[1].Script, pay_to (Receiver));
        EXPECT_EQ (int64 (tx.Outputs[2].Value), 4488);
        EXPECT_EQ (tx.Outputs[2].Script, pay_to (ChangeAddress));

        EXPECT_EQ (w.Addresses.Change.size (), 1);
        EXPECT_EQ (w.Addresses.TokenReceive.size (), 1);
    }

    TEST (Spend, DustChange) {
        test_wallet w = make_wallet ({colored (1, 546, Token, 10), plain (2, 700)});

        build_transfer::designed d = build_transfer {}.design (w, w.Addresses, Token, "0.0000001", Receiver);
        const auto &tx = static_cast<const unsigned_transaction &> (*d.Draft);

        EXPECT_EQ (int64 (d.Selection.Change), 188);

        // change below the dust limit goes to the miners.
        ASSERT_EQ (tx.Outputs.size (), 2);
        EXPECT_EQ (int64 (tx.fee ()), 700);

        EXPECT_EQ (w.Addresses.Change.size (), 2);
        EXPECT_EQ (w.Addresses.TokenReceive.size (), 1);
    }

    TEST (Spend, ChangeAtDustLimit) {
        token_selection x = select_smallest_first {} (Token, 10,
            account {{colored (1, 546, Token, 10), plain (2, 1058)}});

        EXPECT_EQ (int64 (x.Change), 546);

        fixed_addresses addresses = test_addresses ();
        change ch = make_change (x, addresses);
        EXPECT_FALSE (bool (ch.Token));
        ASSERT_TRUE (bool (ch.Satoshis));
        EXPECT_EQ (int64 (ch.Satoshis->Value), 546);
        EXPECT_EQ (ch.outputs ().size (), 1);

        // no addresses left.
        fixed_addresses none {{}, {}};
        EXPECT_THROW (make_change (x, none), data::exception);
    }

    TEST (Spend, ChangeAddressesRunOut) {
        token_selection x = select_smallest_first {} (Token, 150000000,
            account {{colored (1, 10000, Token, 200000000)}});

        ASSERT_TRUE (x.token_change ());
        ASSERT_EQ (int64 (x.Change), 8535);

        // there is a token address but no change address.
        fixed_addresses token_only {{}, list<Bitcoin::address> {read_address (TokenAddress)}};
        EXPECT_FALSE (token_only.available (1, 1));
        EXPECT_THROW (make_change (x, token_only), data::exception);
        EXPECT_EQ (token_only.TokenReceive.size (), 1);

        // and the other way around.
        fixed_addresses change_only {list<Bitcoin::address> {read_address (ChangeAddress)}, {}};
        EXPECT_THROW (make_change (x, change_only), data::exception);
        EXPECT_EQ (change_only.Change.size (), 1);

        fixed_addresses both = test_addresses ();
        EXPECT_TRUE (both.available (2, 1));
        EXPECT_FALSE (both.available (3, 0));
        EXPECT_EQ (make_change (x, both).outputs ().size (), 2);
    }

    TEST (Spend, Errors) {
        test_wallet w = make_wallet ({colored (1, 546, Token, 10), plain (2, 300)});

        EXPECT_THROW (build_transfer {}.design (w, w.Addresses, OtherToken, "1", Receiver), unknown_token);
        EXPECT_THROW (build_transfer {}.design (w, w.Addresses, Token, "1.000000001", Receiver), precision_exceeded);
        EXPECT_THROW (build_transfer {}.design (w, w.Addresses, Token, "one", Receiver), invalid_amount);
        EXPECT_THROW (build_transfer {}.design (w, w.Addresses, Token, "0.0000001", "nowhere"), address_decode_failure);
        EXPECT_THROW (build_transfer {}.design (w, w.Addresses, Token, "0.0000002", Receiver), insufficient_token_balance);
        EXPECT_THROW (build_transfer {}.design (w, w.Addresses, Token, "0.0000001", Receiver), insufficient_currency_balance);

        // all of these are transfer errors.
        EXPECT_THROW (build_transfer {} (w, w.Addresses, Token, "0.0000001", Receiver), transfer_error);

        // nothing was used up.
        EXPECT_EQ (w.Addresses.Change.size (), 2);
        EXPECT_EQ (w.Addresses.TokenReceive.size (), 1);
        EXPECT_EQ (w.Signed, 0);
    }

    TEST (Spend, Sign) {
        test_wallet w = make_wallet ({plain (3, 20000), colored (1, 546, Token, 200000000), plain (2, 5000)});

        Bitcoin::transaction tx = build_transfer {} (w, w.Addresses, Token, "1.5", Receiver);

        EXPECT_EQ (w.Signed, 1);
        ASSERT_EQ (tx.Inputs.size (), 2);
        EXPECT_EQ (tx.Inputs[0].Reference, outpoint (1));
        EXPECT_EQ (tx.Inputs[1].Reference, outpoint (2));
        ASSERT_EQ (tx.Outputs.size (), 4);
        EXPECT_EQ (int64 (tx.Outputs[3].Value), 3933);
    }

    TEST (Spend, SelectFunction) {
        test_wallet w = make_wallet ({colored (1, 546, Token, 10), plain (2, 5000)});

        int calls = 0;
        build_transfer b {[&calls] (const token_id &id, raw_amount requested, const account &acc) -> token_selection {
            calls++;
            EXPECT_EQ (requested, 10);
            EXPECT_EQ (acc.Outputs.size (), 2);
            return select_smallest_first {} (id, requested, acc);
        }};

        b.design (w, w.Addresses, Token, "0.0000001", Receiver);
        EXPECT_EQ (calls, 1);
    }

    TEST (Spend, Async) {
        test_wallet w = make_wallet ({colored (1, 546, Token, 200000000), plain (2, 5000)});

        // the awaiting coroutines run on one pool and the work on another.
        boost::asio::thread_pool callers {1};
        boost::asio::thread_pool workers {1};

        std::future<Bitcoin::transaction> result = boost::asio::co_spawn (callers,
            build_transfer_async (workers.get_executor (), build_transfer {}, w, w.Addresses, Token, "1.5", Receiver),
            boost::asio::use_future);

        Bitcoin::transaction tx = result.get ();
        EXPECT_EQ (tx.Outputs.size (), 4);
        EXPECT_EQ (w.Signed, 1);
        EXPECT_NE (w.SignedOn, std::this_thread::get_id ());

        std::future<Bitcoin::transaction> failure = boost::asio::co_spawn (callers,
            build_transfer_async (workers.get_executor (), build_transfer {}, w, w.Addresses, OtherToken, "1.5", Receiver),
            boost::asio::use_future);

        EXPECT_THROW (failure.get (), unknown_token);
        EXPECT_EQ (w.Signed, 1);

        callers.join ();
        workers.join ();
    }

    TEST (Spend, Snapshot) {
        JSON j = JSON::object_t {
            {"tokens", JSON::array_t {JSON (descriptor ())}},
            {"outputs", JSON (account {{colored (1, 546, Token, 200000000), plain (2, 5000), colored (3, 546, OtherToken, 7)}})},
            {"change_addresses", JSON::array_t {ChangeAddress}},
            {"token_addresses", JSON::array_t {TokenAddress}}};

        snapshot_wallet w {j};

        EXPECT_EQ (w.descriptor (Token).Decimals, 8);
        EXPECT_THROW (w.descriptor (OtherToken), unknown_token);

        account acc = w.spendable_outputs ();
        EXPECT_EQ (acc.Outputs.size (), 3);
        EXPECT_EQ (int64 (acc.value ()), 5000);
        EXPECT_EQ (acc.token_value (Token), N {200000000});
        EXPECT_EQ (acc.token_value (OtherToken), N {7});
        EXPECT_EQ (acc.token_outputs (Token).size (), 1);
        EXPECT_EQ (acc.plain_outputs ().size (), 1);
        EXPECT_EQ (JSON (acc), j["outputs"]);

        build_transfer::designed d = build_transfer {}.design (w, w.Addresses, Token, "1.5", Receiver);
        EXPECT_EQ (static_cast<const unsigned_transaction &> (*d.Draft).Outputs.size (), 4);

        // a snapshot has no keys.
        EXPECT_THROW (w.sign_offline (std::move (d.Draft)), data::exception);

        EXPECT_THROW (snapshot_wallet {JSON::array_t {}}, data::exception);
        EXPECT_THROW (snapshot_wallet {(JSON::object_t {{"change_addresses", JSON::array_t {"xyz"}}})}, address_decode_failure);
    }

}
