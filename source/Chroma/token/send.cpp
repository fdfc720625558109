#include <Chroma/token/send.hpp>

#include <algorithm>

namespace Chroma {

    namespace {

        const bytes LokadID {'S', 'L', 'P', 0x00};
        const bytes SendTransactionType {'S', 'E', 'N', 'D'};

        constexpr size_t TokenIDSize = 32;
        constexpr size_t QuantitySize = 8;

        bytes write_quantity (raw_amount q) {
            bytes be {};
            be.resize (QuantitySize);
            for (int i = QuantitySize - 1; i >= 0; i--) {
                be[i] = static_cast<byte> (q & 0xff);
                q >>= 8;
            }
            return be;
        }

        raw_amount read_quantity (const bytes &be) {
            raw_amount q = 0;
            for (const byte &b : be) q = (q << 8) + b;
            return q;
        }

        // every push in the metadata is a direct push of a fixed size.
        // A single byte must not be minimally encoded as OP_1.
        Bitcoin::instruction push (const bytes &x) {
            return Bitcoin::instruction {static_cast<Bitcoin::op> (x.size ()), x};
        }

        maybe<bytes> read_push (const Bitcoin::instruction &i, size_t size) {
            if (i.Op != static_cast<Bitcoin::op> (size)) return {};
            bytes x = i.data ();
            if (x.size () != size) return {};
            return x;
        }

    }

    bytes send_metadata::script () const {
        if (!Token.valid ()) throw data::exception {} << "cannot write invalid token id \"" << static_cast<const std::string &> (Token) << "\"";

        Bitcoin::program p {Bitcoin::instruction {Bitcoin::OP_RETURN}, push (LokadID), push (bytes {TokenType}),
            push (SendTransactionType), push (Token.write ())};

        for (const raw_amount &q : Quantities) p <<= push (write_quantity (q));

        return Bitcoin::compile (p);
    }

    maybe<send_metadata> send_metadata::read (const bytes &script) {
        if (script.size () == 0 || script[0] != Bitcoin::OP_RETURN) return {};

        // to the interpreter everything after OP_RETURN is data, so it is decompiled on its own.
        bytes payload {};
        payload.resize (script.size () - 1);
        std::copy (script.begin () + 1, script.end (), payload.begin ());
        Bitcoin::program p = Bitcoin::decompile (payload);

        // lokad id, token type, transaction type, token id and at least one quantity.
        if (p.size () < 5 || p.size () > 23) return {};

        maybe<bytes> lokad = read_push (p[0], LokadID.size ());
        if (!bool (lokad) || *lokad != LokadID) return {};

        maybe<bytes> token_type = read_push (p[1], 1);
        if (!bool (token_type) || (*token_type)[0] != TokenType) return {};

        maybe<bytes> tx_type = read_push (p[2], SendTransactionType.size ());
        if (!bool (tx_type) || *tx_type != SendTransactionType) return {};

        maybe<bytes> token = read_push (p[3], TokenIDSize);
        if (!bool (token)) return {};

        send_metadata m {token_id {encoding::hex::write (*token)}, {}};

        for (const Bitcoin::instruction &i : p.rest ().rest ().rest ().rest ()) {
            maybe<bytes> q = read_push (i, QuantitySize);
            if (!bool (q)) return {};
            m.Quantities <<= read_quantity (*q);
        }

        return m;
    }

    std::ostream &operator << (std::ostream &o, const send_metadata &m) {
        o << "send {" << static_cast<const std::string &> (m.Token) << ", [";
        bool first = true;
        for (const raw_amount &q : m.Quantities) {
            if (!first) o << ", ";
            o << q;
            first = false;
        }
        return o << "]}";
    }

}
