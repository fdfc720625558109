#ifndef CHROMA_TOKEN_FEE
#define CHROMA_TOKEN_FEE

#include <Chroma/options.hpp>

namespace Chroma {

    // estimates the size of a token send transaction piece by piece.
    // Everything is charged at one satoshi per byte.
    struct fee_estimator {
        int64 InputSize;
        int64 OutputSize;
        int64 MetadataBaseSize;
        int64 QuantitySize;
        int64 PropagationSlack;

        fee_estimator (const token_send_options &o = {}) :
            InputSize {o.InputSize}, OutputSize {o.OutputSize},
            MetadataBaseSize {o.MetadataBaseSize}, QuantitySize {o.QuantitySize},
            PropagationSlack {o.PropagationSlack} {}

        // charged against the value of every input that is selected.
        int64 input_cost () const {
            return InputSize;
        }

        int64 output_cost (uint32 outputs) const {
            return int64 (outputs) * OutputSize;
        }

        // size of the metadata output, which grows with the number of quantities.
        int64 metadata_size (uint32 quantities) const {
            return MetadataBaseSize + int64 (quantities) * QuantitySize;
        }

        int64 total_fee (uint32 outputs, uint32 quantities) const;
    };

    int64 inline fee_estimator::total_fee (uint32 outputs, uint32 quantities) const {
        return output_cost (outputs) + metadata_size (quantities) + PropagationSlack;
    }

}

#endif
