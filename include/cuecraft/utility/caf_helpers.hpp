// SPDX-License-Identifier: Apache-2.0
#pragma once

#define ACTOR_TEST_SETUP(...)                                                                  \
    struct fixture {                                                                           \
        actor_system_config cfg;                                                               \
        actor_system system;                                                                   \
        scoped_actor self;                                                                     \
        fixture() : system(cfg), self(system) {}                                               \
    };                                                                                         \
                                                                                               \
    int main(int argc, char *argv[]) {                                                         \
        ::testing::InitGoogleTest(&argc, argv);                                                \
        ACTOR_INIT_GLOBAL_META()                                                               \
        core::init_global_meta_objects();                                                      \
                                                                                               \
        return RUN_ALL_TESTS();                                                                \
    }
