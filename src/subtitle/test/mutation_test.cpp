// SPDX-License-Identifier: Apache-2.0
#include <gtest/gtest.h>

#include "cuecraft/subtitle/mutation.hpp"

using namespace cuecraft::subtitle;

TEST(MutationTest, Kind) {
    EXPECT_EQ(mutation_kind(Mutation()), MK_NONE);
    EXPECT_EQ(mutation_kind(Mutation(InsertMutation())), MK_INSERT);
    EXPECT_EQ(mutation_kind(Mutation(UpdateMutation())), MK_UPDATE);

    EXPECT_EQ(to_string(MK_NONE), "none");
    EXPECT_EQ(to_string(MK_INSERT), "insert");
    EXPECT_EQ(to_string(MK_UPDATE), "update");
}

TEST(MutationTest, StyleChange) {
    StyleChange change;
    EXPECT_TRUE(change.empty());
    EXPECT_EQ(change.applied_to(Style()), Style());

    change.font_color = "red";
    change.position   = SP_TOP;
    change.italic     = true;
    EXPECT_FALSE(change.empty());

    auto base = Style("Helvetica", 48, "white", SP_BOTTOM, true);
    auto s    = change.applied_to(base);

    EXPECT_EQ(s.font_family(), "Helvetica");
    EXPECT_EQ(s.font_size(), 48);
    EXPECT_EQ(s.font_color(), "red");
    EXPECT_EQ(s.position(), SP_TOP);
    EXPECT_TRUE(s.bold());
    EXPECT_TRUE(s.italic());
}

TEST(MutationTest, UpdateEmpty) {
    UpdateMutation update;
    EXPECT_TRUE(update.empty());
    EXPECT_EQ(update.index, -1);

    update.style.bold = false;
    EXPECT_FALSE(update.empty());
}
