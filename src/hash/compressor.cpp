#include "compressor.hpp"

namespace sha256 {

namespace {

struct WorkingVariables {
    Word a, b, c, d, e, f, g, h;
};

}  // namespace

State compress(const State& state, const Schedule& schedule) {
    WorkingVariables v{state[0], state[1], state[2], state[3],
                       state[4], state[5], state[6], state[7]};

    for (std::size_t t = 0; t < kScheduleLength; ++t) {
        const Word t1 = v.h + bigSigma1(v.e) + ch(v.e, v.f, v.g) +
                        kRoundConstants[t] + schedule[t];
        const Word t2 = bigSigma0(v.a) + maj(v.a, v.b, v.c);
        v.h = v.g;
        v.g = v.f;
        v.f = v.e;
        v.e = v.d + t1;
        v.d = v.c;
        v.c = v.b;
        v.b = v.a;
        v.a = t1 + t2;
    }

    return State{state[0] + v.a, state[1] + v.b, state[2] + v.c,
                 state[3] + v.d, state[4] + v.e, state[5] + v.f,
                 state[6] + v.g, state[7] + v.h};
}

State fold(std::span<const Block> blocks, State initial) {
    State state = initial;
    for (const auto& block : blocks) {
        state = compress(state, expand(block));
    }
    return state;
}

}  // namespace sha256
