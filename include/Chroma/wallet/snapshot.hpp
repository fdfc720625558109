#ifndef CHROMA_WALLET_SNAPSHOT
#define CHROMA_WALLET_SNAPSHOT

#include <Chroma/wallet/spend.hpp>

#include <map>

namespace Chroma {

    // a wallet read from a JSON document. It holds no keys so it can
    // design transactions but it cannot sign them.
    struct snapshot_wallet : token_wallet {
        account Account;
        std::map<token_id, token_descriptor> Tokens;
        fixed_addresses Addresses;

        snapshot_wallet (const account &acc, list<token_descriptor> tokens, const fixed_addresses &addresses);

        // format:
        //   {"tokens": [...], "outputs": [...], "change_addresses": [...], "token_addresses": [...]}
        explicit snapshot_wallet (const JSON &);

        account spendable_outputs () override {
            return Account;
        }

        token_descriptor descriptor (const token_id &) override;

        std::unique_ptr<draft_transaction> create_unsigned_transaction () override {
            return std::make_unique<unsigned_transaction> ();
        }

        Bitcoin::transaction sign_offline (std::unique_ptr<draft_transaction>) override;
    };

}

#endif
