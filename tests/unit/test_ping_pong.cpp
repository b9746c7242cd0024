#include <layerfx/frame_plan.hpp>

#include <cassert>
#include <cstdio>

using namespace layerfx;

int main() {
    // Starts with slot 0 as input
    {
        PingPong p;
        assert(p.input() == 0);
        assert(p.output() == 1);
    }

    // Input and output always differ
    {
        PingPong p;
        for (int i = 0; i < 7; ++i) {
            assert(p.input() != p.output());
            assert(p.input() < 2 && p.output() < 2);
            p.swap();
        }
    }

    // swap(); swap(); restores identity
    {
        PingPong p;
        auto in  = p.input();
        auto out = p.output();
        p.swap();
        assert(p.input() == out);
        assert(p.output() == in);
        p.swap();
        assert(p.input() == in);
        assert(p.output() == out);
    }

    std::printf("ping-pong tests passed\n");
    return 0;
}
