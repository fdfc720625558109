#ifndef CHROMA_TYPES
#define CHROMA_TYPES

#include <data/tools.hpp>
#include <data/math.hpp>
#include <data/numbers.hpp>
#include <data/maybe.hpp>
#include <data/io/exception.hpp>
#include <Gigamonkey.hpp>
#include <gigamonkey/script/pattern/pay_to_address.hpp>

namespace Chroma {
    using namespace data;
    namespace Bitcoin = Gigamonkey::Bitcoin;
    using pay_to_address = Gigamonkey::pay_to_address;
    using filepath = std::filesystem::path;

    // a raw token amount is a quantity in the smallest unit of the token.
    using raw_amount = uint64;

    // a token is identified by the txid of its genesis transaction,
    // written as 64 hex characters in the order that a block explorer
    // displays it. This is also the order in which it is written
    // into the metadata of a send transaction.
    struct token_id : std::string {
        using std::string::string;
        token_id (const std::string &x) : std::string {x} {}

        bool valid () const;

        // throws if invalid.
        bytes write () const;
    };
}

#endif
