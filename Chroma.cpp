#include <data/io/exception.hpp>

#include <algorithm>
#include <iostream>
#include <sstream>

#include <Chroma/wallet/snapshot.hpp>
#include <Chroma/write.hpp>

#include "source/options.hpp"

using namespace data;

namespace Chroma {
    struct error {
        int Code;
        maybe<std::string> Message;
        error () : Code {0}, Message {} {}
        error (int code) : Code {code}, Message {} {}
        error (int code, const string &err): Code {code}, Message {err} {}
        error (const string &err): Code {1}, Message {err} {}
    };
}

Chroma::error run (const options &);

enum class method {
    UNSET,
    HELP,     // print help messages
    VERSION,  // print a version message
    BALANCE,  // token and bitcoin balance of a snapshot.
    DESIGN    // design an unsigned token transfer.
};

int main (int arg_count, char **arg_values) {

    auto err = run (options {arg_parser {arg_count, arg_values}});

    if (err.Message) std::cout << "Error: " << static_cast<std::string> (*err.Message) << std::endl;
    else if (err.Code) std::cout << "Error: unknown." << std::endl;

    return err.Code;
}

void version ();

void help (method meth = method::UNSET);

void command_balance (const options &); // offline
void command_design (const options &);  // offline

method read_method (const arg_parser &, uint32 index = 1);

Chroma::error run (const options &p) {

    try {

        if (p.has ("version")) version ();

        else if (p.has ("help")) help ();

        else {

            method cmd = read_method (p);

            switch (cmd) {
                case method::VERSION: {
                    version ();
                    break;
                }

                case method::HELP: {
                    help (read_method (p, 2));
                    break;
                }

                case method::BALANCE: {
                    command_balance (p);
                    break;
                }

                case method::DESIGN: {
                    command_design (p);
                    break;
                }

                default: {
                    std::cout << "Error: could not read user's command." << std::endl;
                    help ();
                }
            }
        }

    } catch (const Chroma::transfer_error &x) {
        std::stringstream ss;
        ss << x.Kind << ": " << x.what ();
        return Chroma::error {x.Code, ss.str ()};
    } catch (const data::exception &x) {
        return Chroma::error {x.Code, std::string {x.what ()}};
    } catch (const std::exception &x) {
        return Chroma::error {1, std::string {x.what ()}};
    }

    return {};
}

method read_method (const arg_parser &p, uint32 index) {
    maybe<std::string> m;
    p.get (index, m);
    if (!bool (m)) return method::UNSET;

    std::transform (m->begin (), m->end (), m->begin (),
        [] (unsigned char c) {
            return std::tolower (c);
        });

    if (*m == "help") return method::HELP;
    if (*m == "version") return method::VERSION;
    if (*m == "balance") return method::BALANCE;
    if (*m == "design") return method::DESIGN;

    return method::UNSET;
}

void version () {
    std::cout << "Chroma token wallet tools, version 0.1" << std::endl;
}

void help (method meth) {
    switch (meth) {
        default : {
            version ();
            std::cout << "input should be <method> <args>... where method is "
                "\n\tbalance    -- print the token balance of a wallet snapshot."
                "\n\tdesign     -- design an unsigned transaction that sends tokens."
                "\nuse help \"method\" for information on a specific method" << std::endl;
        } break;
        case method::BALANCE : {
            std::cout << "Print the balance of a token in a wallet snapshot."
                "\narguments for method balance:"
                "\n\t--snapshot=<path to JSON file> (or CHROMA_SNAPSHOT)"
                "\n\t--token=<token id>" << std::endl;
        } break;
        case method::DESIGN : {
            std::cout << "Design an unsigned transaction sending tokens from a wallet snapshot."
                "\narguments for method design:"
                "\n\t--snapshot=<path to JSON file> (or CHROMA_SNAPSHOT)"
                "\n\t--token=<token id>"
                "\n\t--amount=<decimal>"
                "\n\t--to=<address>"
                "\n\t(--dust_limit=<satoshis> (=546)) (or CHROMA_DUST_LIMIT)"
                "\n\t(--propagation_slack=<satoshis> (=50)) (or CHROMA_PROPAGATION_SLACK)" << std::endl;
        } break;
    }
}

Chroma::snapshot_wallet read_snapshot (const options &p) {
    filepath path = p.snapshot ();
    JSON j = Chroma::read_from_file (path);
    if (j == nullptr) throw data::exception {} << "could not find " << path.string ();
    return Chroma::snapshot_wallet {j};
}

void command_balance (const options &p) {
    Chroma::snapshot_wallet w = read_snapshot (p);
    Chroma::token_id id = p.token ();
    Chroma::token_descriptor token = w.descriptor (id);

    Chroma::account acc = w.spendable_outputs ();

    std::cout << Chroma::from_raw_amount (acc.token_value (id), token) << " " << token.Ticker << " in "
        << acc.token_outputs (id).size () << " outputs" << std::endl;
    std::cout << int64 (acc.value ()) << " satoshis in "
        << acc.plain_outputs ().size () << " outputs without tokens" << std::endl;
}

void command_design (const options &p) {
    Chroma::snapshot_wallet w = read_snapshot (p);

    Chroma::build_transfer::designed d = Chroma::build_transfer {p.send_options ()}.design (
        w, w.Addresses, p.token (), p.amount (), p.to ());

    const auto &tx = static_cast<const Chroma::unsigned_transaction &> (*d.Draft);

    std::cout << JSON (tx).dump (2) << std::endl;
}
