#ifndef CHROMA_WRITE
#define CHROMA_WRITE

#include <data/net/JSON.hpp>

#include <gigamonkey/timechain.hpp>

#include <Chroma/types.hpp>

// the forms in which outputs appear in a wallet snapshot.
namespace Chroma {

    // "<txid>:<index>", with the txid as a block explorer shows it.
    std::string write (const Bitcoin::outpoint &);
    Bitcoin::outpoint read_outpoint (const std::string &);

    JSON inline write (const Bitcoin::satoshi &x) {
        return JSON (int64 (x));
    }

    // must be a non-negative integer.
    Bitcoin::satoshi read_satoshi (const JSON &);

    // {"value": <satoshis>, "script": <hex>}
    JSON write (const Bitcoin::output &);
    Bitcoin::output read_output (const JSON &);

    // null if there is no such file.
    JSON read_from_file (const filepath &);

}

#endif
