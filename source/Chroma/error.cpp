#include <Chroma/error.hpp>

namespace Chroma {

    std::ostream &operator << (std::ostream &o, transfer_error::kind k) {
        switch (k) {
            case transfer_error::kind::invalid_amount: return o << "invalid amount";
            case transfer_error::kind::precision_exceeded: return o << "precision exceeded";
            case transfer_error::kind::amount_overflow: return o << "amount overflow";
            case transfer_error::kind::unknown_token: return o << "unknown token";
            case transfer_error::kind::insufficient_token_balance: return o << "insufficient token balance";
            case transfer_error::kind::insufficient_currency_balance: return o << "insufficient currency balance";
            case transfer_error::kind::address_decode_failure: return o << "address decode failure";
            default: return o << "unknown transfer error";
        }
    }

}
