#include <Chroma/wallet/snapshot.hpp>

namespace Chroma {

    namespace {

        list<Bitcoin::address> read_addresses (const JSON &j) {
            list<Bitcoin::address> a;
            if (j == nullptr) return a;
            if (!j.is_array ()) throw data::exception {} << "invalid address list " << j;
            for (const JSON &x : j) a <<= read_address (std::string (x));
            return a;
        }

        const JSON &member (const JSON &j, const char *name) {
            static const JSON null {};
            auto x = j.find (name);
            return x == j.end () ? null : *x;
        }

    }

    snapshot_wallet::snapshot_wallet (const account &acc, list<token_descriptor> tokens, const fixed_addresses &addresses) :
        Account {acc}, Tokens {}, Addresses {addresses} {
        for (const token_descriptor &d : tokens) Tokens[d.ID] = d;
    }

    snapshot_wallet::snapshot_wallet (const JSON &j) : Account {}, Tokens {}, Addresses {{}, {}} {
        if (!j.is_object ()) throw data::exception {} << "invalid wallet snapshot format";

        Account = account {member (j, "outputs")};

        const JSON &tokens = member (j, "tokens");
        if (tokens != nullptr) {
            if (!tokens.is_array ()) throw data::exception {} << "invalid token list " << tokens;
            for (const JSON &t : tokens) {
                token_descriptor d {t};
                Tokens[d.ID] = d;
            }
        }

        Addresses = fixed_addresses {
            read_addresses (member (j, "change_addresses")),
            read_addresses (member (j, "token_addresses"))};
    }

    token_descriptor snapshot_wallet::descriptor (const token_id &id) {
        auto d = Tokens.find (id);
        if (d == Tokens.end ()) throw unknown_token {id};
        return d->second;
    }

    Bitcoin::transaction snapshot_wallet::sign_offline (std::unique_ptr<draft_transaction>) {
        throw data::exception {} << "a wallet snapshot has no keys to sign with";
    }

}
