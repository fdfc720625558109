#include <Chroma/token/token.hpp>

namespace Chroma {

    bool token_id::valid () const {
        return size () == 64 && bool (encoding::hex::read (static_cast<const std::string &> (*this)));
    }

    bytes token_id::write () const {
        maybe<bytes> b = encoding::hex::read (static_cast<const std::string &> (*this));
        if (size () != 64 || !bool (b)) throw data::exception {} << "invalid token id \"" << static_cast<const std::string &> (*this) << "\"";
        return *b;
    }

    token_descriptor::token_descriptor (const JSON &j) : token_descriptor {} {
        if (!j.is_object () || !j.contains ("id") || !j.contains ("decimals"))
            throw data::exception {} << "invalid token descriptor format";

        ID = token_id {std::string (j["id"])};
        if (!ID.valid ()) throw data::exception {} << "invalid token id in " << j;

        uint32 decimals = uint32 (j["decimals"]);
        if (decimals > 255) throw data::exception {} << "invalid token decimals " << decimals;
        Decimals = static_cast<byte> (decimals);

        if (j.contains ("ticker")) Ticker = std::string (j["ticker"]);
        if (j.contains ("name")) Name = std::string (j["name"]);
    }

    token_descriptor::operator JSON () const {
        return JSON::object_t {
            {"id", static_cast<const std::string &> (ID)},
            {"decimals", uint32 (Decimals)},
            {"ticker", Ticker},
            {"name", Name}};
    }

    token_annotation::token_annotation (const JSON &j) : token_annotation {} {
        if (!j.is_object () || !j.contains ("id") || !j.contains ("amount") || !j["amount"].is_number_unsigned ())
            throw data::exception {} << "invalid token annotation format " << j;

        ID = token_id {std::string (j["id"])};
        if (!ID.valid ()) throw data::exception {} << "invalid token id in " << j;

        Amount = raw_amount (j["amount"]);
    }

    token_annotation::operator JSON () const {
        return JSON::object_t {
            {"id", static_cast<const std::string &> (ID)},
            {"amount", Amount}};
    }

}
