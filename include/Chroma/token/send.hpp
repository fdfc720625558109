#ifndef CHROMA_TOKEN_SEND
#define CHROMA_TOKEN_SEND

#include <Chroma/token/token.hpp>

namespace Chroma {

    // The metadata of a token send transaction, as it appears in a
    // zero-value OP_RETURN output. The ith quantity is the amount of
    // the token that goes to output i + 1.
    struct send_metadata {
        token_id Token;
        list<raw_amount> Quantities;

        // OP_RETURN <"SLP\0"> <token type> <"SEND"> <token id> <quantity>...
        // every quantity is written as 8 bytes big endian.
        // throws if the token id is not 64 hex characters.
        bytes script () const;

        // nothing if the script is not a well-formed send.
        static maybe<send_metadata> read (const bytes &script);

        constexpr static byte TokenType {0x01};
    };

    std::ostream &operator << (std::ostream &, const send_metadata &);

}

#endif
