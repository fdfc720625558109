#include <Chroma/wallet/account.hpp>

namespace Chroma {

    spendable::spendable (const JSON &j) : spendable {} {
        if (!j.is_object () || !j.contains ("outpoint") || !j.contains ("value") || !j.contains ("script"))
            throw data::exception {} << "invalid spendable output format " << j;

        Point = read_outpoint (std::string (j["outpoint"]));
        Prevout = read_output (j);

        if (auto t = j.find ("token"); t != j.end () && !t->is_null ()) Token = token_annotation {*t};
    }

    spendable::operator JSON () const {
        JSON::object_t j;
        j["outpoint"] = write (Point);
        j["value"] = write (Prevout.Value);
        j["script"] = encoding::hex::write (Prevout.Script);
        if (bool (Token)) j["token"] = JSON (*Token);
        return j;
    }

    std::ostream &operator << (std::ostream &o, const spendable &s) {
        o << "spendable {" << write (s.Point) << ", " << int64 (s.Prevout.Value);
        if (bool (s.Token)) o << ", " << *s.Token;
        return o << "}";
    }

    Bitcoin::satoshi account::value () const {
        Bitcoin::satoshi v {0};
        for (const spendable &s : Outputs) if (!bool (s.Token)) v += s.Prevout.Value;
        return v;
    }

    N account::token_value (const token_id &id) const {
        N v {0};
        for (const spendable &s : Outputs) if (s.carries (id)) v += N {s.Token->Amount};
        return v;
    }

    list<spendable> account::token_outputs (const token_id &id) const {
        list<spendable> x;
        for (const spendable &s : Outputs) if (s.carries (id)) x <<= s;
        return x;
    }

    list<spendable> account::plain_outputs () const {
        list<spendable> x;
        for (const spendable &s : Outputs) if (!bool (s.Token)) x <<= s;
        return x;
    }

    account::account (const JSON &j) : Outputs {} {
        if (j == nullptr) return;

        if (!j.is_array ()) throw data::exception {} << "invalid account JSON format";

        for (const JSON &o : j) Outputs <<= spendable {o};
    }

    account::operator JSON () const {
        JSON::array_t a;
        for (const spendable &s : Outputs) a.push_back (JSON (s));
        return a;
    }

}
