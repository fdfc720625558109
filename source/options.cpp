#include "options.hpp"

#include <charconv>
#include <cstdlib>
#include <cstring>

using int64 = data::int64;

namespace {

    // read a number from the given argument or environment variable.
    data::maybe<int64> read_int64 (const options &o, const std::string &arg, const char *env) {
        data::maybe<int64> x;
        o.get (arg, x);
        if (bool (x)) return x;

        const char *val = std::getenv (env);
        if (!bool (val)) return x;

        int64 v;
        auto [_, ec] = std::from_chars (val, val + std::strlen (val), v);
        if (ec != std::errc ()) throw data::exception {} << "could not read " << env << " = " << val;
        return v;
    }

    std::string required (const options &o, const std::string &arg) {
        data::maybe<std::string> x;
        o.get (arg, x);
        if (!bool (x)) throw data::exception {} << "missing argument --" << arg;
        return *x;
    }

}

filepath options::snapshot () const {
    data::maybe<filepath> path;
    this->get ("snapshot", path);
    if (bool (path)) return *path;

    const char *val = std::getenv ("CHROMA_SNAPSHOT");
    if (bool (val)) return filepath {val};

    throw data::exception {} << "No wallet snapshot provided";
}

Chroma::token_id options::token () const {
    Chroma::token_id id {required (*this, "token")};
    if (!id.valid ()) throw data::exception {} << "invalid token id " << static_cast<const std::string &> (id);
    return id;
}

std::string options::amount () const {
    return required (*this, "amount");
}

std::string options::to () const {
    return required (*this, "to");
}

Chroma::token_send_options options::send_options () const {
    Chroma::token_send_options o {};

    if (data::maybe<int64> dust = read_int64 (*this, "dust_limit", "CHROMA_DUST_LIMIT"); bool (dust)) {
        if (*dust <= 0) throw data::exception {} << "dust limit must be positive";
        o.DustLimit = Chroma::Bitcoin::satoshi {*dust};
    }

    if (data::maybe<int64> slack = read_int64 (*this, "propagation_slack", "CHROMA_PROPAGATION_SLACK"); bool (slack)) {
        if (*slack < 0) throw data::exception {} << "propagation slack cannot be negative";
        o.PropagationSlack = *slack;
    }

    return o;
}
