#include <Chroma/write.hpp>

#include <charconv>
#include <filesystem>
#include <fstream>

namespace Chroma {

    std::string write (const Bitcoin::outpoint &o) {
        return data::string::write (encoding::hexidecimal::write (o.Digest), ":", uint32 (o.Index));
    }

    Bitcoin::outpoint read_outpoint (const std::string &x) {
        auto colon = x.find (':');
        if (colon == std::string::npos || x.find (':', colon + 1) != std::string::npos)
            throw exception {} << "invalid outpoint format: " << x;

        Bitcoin::TXID txid {x.substr (0, colon)};
        if (!txid.valid ()) throw exception {} << "invalid txid in outpoint " << x;

        uint32 index;
        const char *begin = x.data () + colon + 1;
        const char *end = x.data () + x.size ();
        auto [last, ec] = std::from_chars (begin, end, index);
        if (begin == end || ec != std::errc () || last != end)
            throw exception {} << "invalid index in outpoint " << x;

        Bitcoin::outpoint o;
        o.Digest = txid;
        o.Index = index;
        return o;
    }

    Bitcoin::satoshi read_satoshi (const JSON &j) {
        if (!j.is_number_integer () || int64 (j) < 0) throw exception {} << "invalid satoshi value " << j;
        return Bitcoin::satoshi {int64 (j)};
    }

    JSON write (const Bitcoin::output &o) {
        return JSON::object_t {
            {"value", write (o.Value)},
            {"script", encoding::hex::write (o.Script)}};
    }

    Bitcoin::output read_output (const JSON &j) {
        if (!j.is_object () || !j.contains ("value") || !j.contains ("script") || !j["script"].is_string ())
            throw exception {} << "invalid output format " << j;

        maybe<bytes> script = encoding::hex::read (std::string (j["script"]));
        if (!bool (script)) throw exception {} << "invalid script " << j["script"];

        return Bitcoin::output {read_satoshi (j["value"]), *script};
    }

    JSON read_from_file (const filepath &p) {
        if (!std::filesystem::exists (p)) return JSON (nullptr);

        std::ifstream file {p};
        if (!file) throw exception {} << "could not open file " << p.string ();

        return JSON::parse (file);
    }

}
