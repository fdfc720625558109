#ifndef CHROMA_OPTIONS
#define CHROMA_OPTIONS

#include <gigamonkey/satoshi.hpp>
#include <Chroma/types.hpp>

namespace Chroma {

    // sizes are in bytes and are charged at one satoshi per byte.
    struct token_send_options {
        // the smallest output value that is relayed.
        constexpr static int64 DefaultDustLimit {546};

        // the size of a standard p2pkh input with its signature.
        constexpr static int64 DefaultInputSize {148};

        // the size of a standard p2pkh output.
        constexpr static int64 DefaultOutputSize {34};

        // size of the metadata output with no quantities in it and
        // the size that each quantity adds.
        constexpr static int64 DefaultMetadataBaseSize {55};
        constexpr static int64 DefaultQuantitySize {9};

        // transactions paying exactly one sat per byte don't propagate well.
        constexpr static int64 DefaultPropagationSlack {50};

        // metadata output excluded. Receiver, token change, currency change.
        constexpr static uint32 DefaultAssumedOutputs {3};

        Bitcoin::satoshi DustLimit {DefaultDustLimit};

        int64 InputSize {DefaultInputSize};
        int64 OutputSize {DefaultOutputSize};

        int64 MetadataBaseSize {DefaultMetadataBaseSize};
        int64 QuantitySize {DefaultQuantitySize};

        int64 PropagationSlack {DefaultPropagationSlack};

        uint32 AssumedOutputs {DefaultAssumedOutputs};
    };
}

#endif
