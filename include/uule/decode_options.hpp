#pragma once

namespace uule {

/**
 * Options controlling how strictly tokens are decoded
 */
struct DecodeOptions {
    bool requirePrefix = true;     // Reject tokens missing "w+" / "a+"
    bool strictFieldOrder = true;  // Fields must appear in the order the encoder writes them

    static DecodeOptions strict() {
        return DecodeOptions{};
    }

    static DecodeOptions lenient() {
        DecodeOptions opts;
        opts.requirePrefix = false;
        opts.strictFieldOrder = false;
        return opts;
    }
};

} // namespace uule
