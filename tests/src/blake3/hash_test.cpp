#include <gtest/gtest.h>
#include <syndicate/blake3/hash.hpp>

TEST(blake3, fold_depends_on_every_input) {
  const auto material = syndicate::schema::bytes_t{0x01, 0x02};
  const auto zero = syndicate::schema::hash32_t{};
  const auto root = syndicate::blake3::fold(zero, 1, material);
  EXPECT_EQ(root, syndicate::blake3::fold(zero, 1, material));
  EXPECT_NE(root, syndicate::blake3::fold(zero, 2, material));
  EXPECT_NE(root, syndicate::blake3::fold(root, 1, material));
  EXPECT_NE(root, syndicate::blake3::fold(
                      zero, 1, syndicate::schema::bytes_t{0x01, 0x03}));
}

TEST(blake3, fold_of_empty_material_is_not_the_zero_root) {
  const auto zero = syndicate::schema::hash32_t{};
  const auto root = syndicate::blake3::fold(zero, 0, {});
  EXPECT_NE(root, zero);
  EXPECT_EQ(syndicate::schema::to_hex(root).size(), 64u);
}
