#include <pathex/execution_tree.hpp>
#include <pathex/explorer.hpp>

#include <cstddef>

#include <celero/Celero.h>


// Every benchmark enumerates the same number of paths so that the cost of
// wide and deep trees can be compared directly.


using namespace pathex;


static constexpr size_t num_paths = 4096;


static void uniform(choice_port& port, size_t width, size_t depth) {
    for (size_t level = 0; level < depth; ++level) {
        celero::DoNotOptimizeAway(port(width));
    }
}


BASELINE(explore, tree_only, 30, 1) {
    // Drives the execution tree directly without the session around it.
    execution_tree tree;
    while (!tree.is_done()) {
        node_id cursor = execution_tree::root_id;
        for (size_t level = 0; level < 12; ++level) {
            cursor = tree.observe_choice(cursor, 2).first;
        }
        tree.mark_done(cursor);
        tree.prune();
    }
}


BENCHMARK(explore, binary_depth_12, 30, 1) {
    explorer session;
    session.explore([](choice_port& port) { uniform(port, 2, 12); });
}


BENCHMARK(explore, quaternary_depth_6, 30, 1) {
    explorer session;
    session.explore([](choice_port& port) { uniform(port, 4, 6); });
}


BENCHMARK(explore, flat_4096, 30, 1) {
    explorer session;
    session.explore([](choice_port& port) { uniform(port, num_paths, 1); });
}


BENCHMARK(explore, binary_with_single_options, 30, 1) {
    explorer session;
    session.explore([](choice_port& port) {
        for (size_t level = 0; level < 12; ++level) {
            port(1);
            celero::DoNotOptimizeAway(port(2));
        }
    });
}
