#include "model/player.hpp"

#include <gtest/gtest.h>

namespace monopoly::gtest {

TEST(PlayerAccount, StartingState) {
	const PlayerAccount player{3u};
	EXPECT_EQ(player.id, 3u);
	EXPECT_EQ(player.cash, STARTING_MONEY);
	EXPECT_EQ(player.position, GO_POSITION);
	EXPECT_TRUE(player.properties.empty());
	EXPECT_FALSE(player.inJail);
	EXPECT_FALSE(player.bankrupt);
	EXPECT_FALSE(player.move.active);
}

TEST(PlayerAccount, PropertiesKeepAcquisitionOrder) {
	PlayerAccount player{0u};
	player.addProperty(39u);
	player.addProperty(1u);
	player.addProperty(39u);
	player.addProperty(5u);

	EXPECT_EQ(player.properties, (std::vector<SpaceIndex>{39u, 1u, 5u}));
	EXPECT_TRUE(player.owns(1u));

	player.removeProperty(1u);
	EXPECT_EQ(player.properties, (std::vector<SpaceIndex>{39u, 5u}));
	EXPECT_FALSE(player.owns(1u));
}

TEST(PlayerAccount, Reset) {
	PlayerAccount player{2u};
	player.cash     = 10;
	player.position = 30u;
	player.inJail   = true;
	player.addProperty(3u);

	player.reset();
	EXPECT_EQ(player.id, 2u);
	EXPECT_EQ(player.cash, STARTING_MONEY);
	EXPECT_EQ(player.position, GO_POSITION);
	EXPECT_FALSE(player.inJail);
	EXPECT_TRUE(player.properties.empty());
}

} // namespace monopoly::gtest
